#pragma once

#include <knotview/render_mode.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace knotview
{

class Error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// A toolkit could not build its minimal context. Thrown by Toolkit::acquire();
// the resolver treats the toolkit as unusable.
class ToolkitUnavailable : public Error
{
   public:
    ToolkitUnavailable(RenderMode backend, const std::string& reason);

    RenderMode         backend() const { return backend_; }
    const std::string& reason() const { return reason_; }

   private:
    RenderMode  backend_;
    std::string reason_;
};

// Auto mode tried every candidate and none could be acquired.
class NoBackendAvailable : public Error
{
   public:
    struct Attempt
    {
        RenderMode  backend;
        std::string reason;
    };

    explicit NoBackendAvailable(std::vector<Attempt> attempts);

    const std::vector<Attempt>& attempts() const { return attempts_; }

   private:
    std::vector<Attempt> attempts_;
};

class UnknownMode : public Error
{
   public:
    explicit UnknownMode(std::string requested);

    const std::string& requested() const { return requested_; }

   private:
    std::string requested_;
};

// A resolved backend failed while acquiring its context or drawing. Never
// retried on another backend.
class RenderFailure : public Error
{
   public:
    RenderFailure(RenderMode backend, const std::string& reason);

    RenderMode backend() const { return backend_; }

   private:
    RenderMode backend_;
};

}   // namespace knotview
