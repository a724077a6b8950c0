#include <algorithm>
#include <cmath>
#include <cstdio>
#include <knotview/axes.hpp>
#include <limits>

namespace knotview
{

TickResult compute_ticks_for_range(float min, float max)
{
    TickResult result;

    if (max <= min)
    {
        result.positions = {min};
        result.labels    = {std::to_string(min)};
        return result;
    }

    float range      = max - min;
    float rough_step = range / 5.0f;

    float magnitude  = std::pow(10.0f, std::floor(std::log10(rough_step)));
    float normalized = rough_step / magnitude;

    float nice_step;
    if (normalized < 1.5f)
        nice_step = 1.0f;
    else if (normalized < 3.0f)
        nice_step = 2.0f;
    else if (normalized < 7.0f)
        nice_step = 5.0f;
    else
        nice_step = 10.0f;

    nice_step *= magnitude;

    float start = std::ceil(min / nice_step) * nice_step;

    for (float val = start; val <= max + nice_step * 1e-4f; val += nice_step)
    {
        result.positions.push_back(val);

        char buf[32];
        if (std::abs(val) < nice_step * 1e-6f)
        {
            result.labels.push_back("0");
        }
        else if (std::abs(val) >= 1000.0f || std::abs(val) < 0.01f)
        {
            std::snprintf(buf, sizeof(buf), "%.2e", static_cast<double>(val));
            result.labels.push_back(buf);
        }
        else
        {
            std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(val));
            std::string str(buf);
            while (str.back() == '0')
                str.pop_back();
            if (str.back() == '.')
                str.pop_back();
            result.labels.push_back(str);
        }
    }

    return result;
}

// --- Series creation ---

LineSeries& Axes::line(std::span<const float> x, std::span<const float> y)
{
    auto  s   = std::make_unique<LineSeries>(x, y);
    auto& ref = *s;
    ref.set_color(palette::default_cycle[series_.size() % palette::default_cycle_size]);
    series_.push_back(std::move(s));
    return ref;
}

ScatterSeries& Axes::scatter(std::span<const float> x, std::span<const float> y)
{
    auto  s   = std::make_unique<ScatterSeries>(x, y);
    auto& ref = *s;
    ref.set_color(palette::default_cycle[series_.size() % palette::default_cycle_size]);
    series_.push_back(std::move(s));
    return ref;
}

ScatterSeries& Axes::scatter()
{
    auto  s   = std::make_unique<ScatterSeries>();
    auto& ref = *s;
    ref.set_color(palette::default_cycle[series_.size() % palette::default_cycle_size]);
    series_.push_back(std::move(s));
    return ref;
}

// --- Axis configuration ---

void Axes::xlim(float min, float max)
{
    xlim_ = AxisLimits{min, max};
}

void Axes::ylim(float min, float max)
{
    ylim_ = AxisLimits{min, max};
}

void Axes::xlabel(const std::string& lbl)
{
    xlabel_ = lbl;
}

void Axes::ylabel(const std::string& lbl)
{
    ylabel_ = lbl;
}

void Axes::xticks(std::span<const float> positions)
{
    xticks_ = std::vector<float>(positions.begin(), positions.end());
}

void Axes::yticks(std::span<const float> positions)
{
    yticks_ = std::vector<float>(positions.begin(), positions.end());
}

// --- Limits ---

namespace
{

void data_extent(const std::vector<std::unique_ptr<Series>>& series,
                 float&                                      x_min,
                 float&                                      x_max,
                 float&                                      y_min,
                 float&                                      y_max)
{
    x_min = std::numeric_limits<float>::max();
    x_max = -std::numeric_limits<float>::max();
    y_min = std::numeric_limits<float>::max();
    y_max = -std::numeric_limits<float>::max();

    auto accumulate = [&](std::span<const float> xd, std::span<const float> yd)
    {
        for (auto v : xd)
        {
            x_min = std::min(x_min, v);
            x_max = std::max(x_max, v);
        }
        for (auto v : yd)
        {
            y_min = std::min(y_min, v);
            y_max = std::max(y_max, v);
        }
    };

    for (const auto& s : series)
    {
        if (auto* xy = dynamic_cast<const XYSeries*>(s.get()))
            accumulate(xy->x_data(), xy->y_data());
    }

    // Fallback if no data
    if (x_min > x_max)
    {
        x_min = 0.0f;
        x_max = 1.0f;
    }
    if (y_min > y_max)
    {
        y_min = 0.0f;
        y_max = 1.0f;
    }

    // Add 5% padding
    float x_pad = (x_max - x_min) * 0.05f;
    float y_pad = (y_max - y_min) * 0.05f;
    if (x_pad == 0.0f)
        x_pad = 0.5f;
    if (y_pad == 0.0f)
        y_pad = 0.5f;
    x_min -= x_pad;
    x_max += x_pad;
    y_min -= y_pad;
    y_max += y_pad;
}

TickResult explicit_ticks(const std::vector<float>& positions)
{
    TickResult result;
    result.positions = positions;
    for (float v : positions)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(v));
        result.labels.emplace_back(buf);
    }
    return result;
}

}   // anonymous namespace

AxisLimits Axes::x_limits() const
{
    if (xlim_)
        return *xlim_;
    float x_min, x_max, y_min, y_max;
    data_extent(series_, x_min, x_max, y_min, y_max);
    return {x_min, x_max};
}

AxisLimits Axes::y_limits() const
{
    if (ylim_)
        return *ylim_;
    float x_min, x_max, y_min, y_max;
    data_extent(series_, x_min, x_max, y_min, y_max);
    return {y_min, y_max};
}

TickResult Axes::compute_x_ticks() const
{
    if (xticks_)
        return explicit_ticks(*xticks_);
    auto lim = x_limits();
    return compute_ticks_for_range(lim.min, lim.max);
}

TickResult Axes::compute_y_ticks() const
{
    if (yticks_)
        return explicit_ticks(*yticks_);
    auto lim = y_limits();
    return compute_ticks_for_range(lim.min, lim.max);
}

void Axes::auto_fit()
{
    float x_min, x_max, y_min, y_max;
    data_extent(series_, x_min, x_max, y_min, y_max);
    xlim_ = AxisLimits{x_min, x_max};
    ylim_ = AxisLimits{y_min, y_max};
}

}   // namespace knotview
