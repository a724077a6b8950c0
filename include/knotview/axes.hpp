#pragma once

#include <knotview/color.hpp>
#include <knotview/fwd.hpp>
#include <knotview/series.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace knotview
{

struct AxisStyle
{
    Color tick_color  = colors::black;
    Color label_color = colors::black;
    Color grid_color  = {0.85f, 0.85f, 0.85f};
    float tick_length = 5.0f;
    float label_size  = 12.0f;
    float title_size  = 14.0f;
};

struct AxisLimits
{
    float min = 0.0f;
    float max = 1.0f;
};

struct TickResult
{
    std::vector<float>       positions;
    std::vector<std::string> labels;
};

// "Nice" tick positions (1/2/5 × 10^k steps) covering [min, max].
TickResult compute_ticks_for_range(float min, float max);

class AxesBase
{
   public:
    virtual ~AxesBase() = default;

    virtual void auto_fit() = 0;

    const std::vector<std::unique_ptr<Series>>& series() const { return series_; }

    void clear_series() { series_.clear(); }

    void        set_viewport(const Rect& r) { viewport_ = r; }
    const Rect& viewport() const { return viewport_; }

    const std::string& title() const { return title_; }
    void               title(const std::string& t) { title_ = t; }

    bool grid_enabled() const { return grid_enabled_; }
    void grid(bool enabled) { grid_enabled_ = enabled; }

    bool border_enabled() const { return border_enabled_; }
    void show_border(bool enabled) { border_enabled_ = enabled; }

    AxisStyle&       axis_style() { return axis_style_; }
    const AxisStyle& axis_style() const { return axis_style_; }

   protected:
    std::vector<std::unique_ptr<Series>> series_;
    std::string                          title_;
    bool                                 grid_enabled_   = true;
    bool                                 border_enabled_ = true;
    AxisStyle                            axis_style_;
    Rect                                 viewport_;
};

class Axes : public AxesBase
{
   public:
    Axes() = default;

    LineSeries& line(std::span<const float> x, std::span<const float> y);

    ScatterSeries& scatter(std::span<const float> x, std::span<const float> y);
    ScatterSeries& scatter();

    void xlim(float min, float max);
    void ylim(float min, float max);
    void xlabel(const std::string& lbl);
    void ylabel(const std::string& lbl);

    // Explicit tick positions; an empty set hides ticks and tick labels.
    void xticks(std::span<const float> positions);
    void yticks(std::span<const float> positions);
    void clear_xticks() { xticks_.reset(); }
    void clear_yticks() { yticks_.reset(); }

    AxisLimits         x_limits() const;
    AxisLimits         y_limits() const;
    const std::string& xlabel() const { return xlabel_; }
    const std::string& ylabel() const { return ylabel_; }

    using AxesBase::title;

    TickResult compute_x_ticks() const;
    TickResult compute_y_ticks() const;

    // Sets limits to the data extent plus 5% padding.
    void auto_fit() override;

   private:
    std::optional<AxisLimits>         xlim_;
    std::optional<AxisLimits>         ylim_;
    std::optional<std::vector<float>> xticks_;
    std::optional<std::vector<float>> yticks_;

    std::string xlabel_;
    std::string ylabel_;
};

}   // namespace knotview
