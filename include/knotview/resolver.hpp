#pragma once

#include <knotview/render_mode.hpp>
#include <knotview/toolkit.hpp>
#include <string_view>

namespace knotview
{

// Turns a requested mode into a concrete backend.
class BackendResolver
{
   public:
    explicit BackendResolver(const ToolkitRegistry& registry) : registry_(registry) {}

    // Concrete modes are returned unchanged without acquiring. Auto tries the
    // registry's candidates in order and returns the first whose acquire()
    // succeeds; later candidates are not touched. Throws NoBackendAvailable
    // when every candidate fails.
    RenderMode resolve(RenderMode mode = RenderMode::Auto) const;

    // Parses first; throws UnknownMode for an unrecognised name.
    RenderMode resolve(std::string_view mode) const;

   private:
    const ToolkitRegistry& registry_;
};

}   // namespace knotview
