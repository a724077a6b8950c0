#pragma once

#include <knotview/color.hpp>
#include <knotview/fwd.hpp>
#include <span>
#include <string>
#include <vector>

namespace knotview
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

enum class MarkerStyle
{
    None,
    Circle,
    Square,
    Cross,
};

// Style shared by every series. Setters return the base so they chain in any
// order after a type-specific setter.
class Series
{
   public:
    virtual ~Series() = default;

    Series& label(const std::string& lbl)
    {
        label_ = lbl;
        return *this;
    }
    Series& color(const Color& c)
    {
        color_ = c;
        return *this;
    }
    Series& opacity(float o)
    {
        opacity_ = o;
        return *this;
    }

    const std::string& label() const { return label_; }
    const Color&       color() const { return color_; }
    float              opacity() const { return opacity_; }

    void set_color(const Color& c) { color_ = c; }

   protected:
    std::string label_;
    Color       color_   = colors::blue;
    float       opacity_ = 1.0f;
};

// Planar samples held as parallel x and y arrays.
class XYSeries : public Series
{
   public:
    XYSeries() = default;
    XYSeries(std::span<const float> x, std::span<const float> y);

    void append(float x, float y);

    std::span<const float> x_data() const { return x_; }
    std::span<const float> y_data() const { return y_; }
    size_t                 point_count() const { return x_.size(); }

   protected:
    std::vector<float> x_;
    std::vector<float> y_;
};

// Connected polyline, optionally with a marker at each vertex.
class LineSeries : public XYSeries
{
   public:
    using XYSeries::XYSeries;

    LineSeries& width(float w)
    {
        line_width_ = w;
        return *this;
    }
    LineSeries& marker(MarkerStyle m)
    {
        marker_ = m;
        return *this;
    }

    float       width() const { return line_width_; }
    MarkerStyle marker() const { return marker_; }

   private:
    float       line_width_ = 2.0f;
    MarkerStyle marker_     = MarkerStyle::None;
};

// Unconnected markers; crossings and start points in projections.
class ScatterSeries : public XYSeries
{
   public:
    using XYSeries::XYSeries;

    ScatterSeries& size(float s)
    {
        point_size_ = s;
        return *this;
    }
    ScatterSeries& marker(MarkerStyle m)
    {
        marker_ = m;
        return *this;
    }

    float       size() const { return point_size_; }
    MarkerStyle marker() const { return marker_; }

   private:
    float       point_size_ = 6.0f;
    MarkerStyle marker_     = MarkerStyle::Circle;
};

}   // namespace knotview
