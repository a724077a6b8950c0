#include <algorithm>
#include <knotview/logger.hpp>
#include <knotview/plot.hpp>
#include <stdexcept>

namespace knotview
{

ProjectionResult plot_projection(std::span<const vec3> points, const ProjectionOptions& options)
{
    if (points.empty())
    {
        throw std::invalid_argument("projection needs at least 1 point");
    }
    if ((options.figure == nullptr) != (options.axes == nullptr))
    {
        throw std::invalid_argument("figure and axes must be supplied together");
    }

    ProjectionResult result;
    if (options.figure)
    {
        result.figure = options.figure;
        result.axes   = options.axes;
    }
    else
    {
        result.owned_figure = std::make_unique<Figure>();
        result.figure       = result.owned_figure.get();
        result.axes         = &result.figure->subplot(1, 1, 1);
    }
    Axes& ax = *result.axes;

    std::vector<float> xs;
    std::vector<float> ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& p : points)
    {
        xs.push_back(static_cast<float>(p.x));
        ys.push_back(static_cast<float>(p.y));
    }
    result.curve = &ax.line(xs, ys);

    // Schematic plot: no ticks.
    ax.xticks({});
    ax.yticks({});

    // Limits are computed on the double input; only the result is narrowed.
    double xmin = points[0].x, xmax = points[0].x;
    double ymin = points[0].y, ymax = points[0].y;
    for (const auto& p : points)
    {
        xmin = std::min(xmin, p.x);
        xmax = std::max(xmax, p.x);
        ymin = std::min(ymin, p.y);
        ymax = std::max(ymax, p.y);
    }
    double dx = (xmax - xmin) / 10.0;
    double dy = (ymax - ymin) / 10.0;
    ax.xlim(static_cast<float>(xmin - dx), static_cast<float>(xmax + dx));
    ax.ylim(static_cast<float>(ymin - dy), static_cast<float>(ymax + dy));

    if (options.mark_start)
    {
        float sx[] = {xs.front()};
        float sy[] = {ys.front()};
        result.start_marker = &ax.scatter(sx, sy);
        result.start_marker->color(colors::blue);
    }

    if (options.crossings)
    {
        std::vector<float> cx;
        std::vector<float> cy;
        for (const auto& c : *options.crossings)
        {
            cx.push_back(static_cast<float>(c.x));
            cy.push_back(static_cast<float>(c.y));
        }
        result.crossing_markers = &ax.scatter(cx, cy);
        result.crossing_markers->color(colors::red).opacity(0.5f);
        KNOTVIEW_LOG_DEBUG("projection", "{} crossing markers", cx.size());
    }

    if (options.show)
    {
        RenderConfig config = options.config ? *options.config : RenderConfig::from_env();
        result.output_path  = result.figure->show(config);
    }

    return result;
}

}   // namespace knotview
