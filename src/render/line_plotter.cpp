#include <algorithm>
#include <cmath>
#include <knotview/errors.hpp>
#include <knotview/logger.hpp>
#include <knotview/plot.hpp>
#include <knotview/resolver.hpp>
#include <stdexcept>

namespace knotview
{

namespace
{

void validate_line(std::span<const vec3> points, const LineOptions& options)
{
    if (points.size() < 2)
    {
        throw std::invalid_argument("a line needs at least 2 points, got "
                                    + std::to_string(points.size()));
    }
    if (!options.mus.empty() && options.mus.size() != points.size())
    {
        throw std::invalid_argument("mus has " + std::to_string(options.mus.size())
                                    + " entries for " + std::to_string(points.size()) + " points");
    }
    if (!(options.tube_radius > 0.0))
    {
        throw std::invalid_argument("tube radius must be positive");
    }
    if (options.tube_points != 0 && options.tube_points < 3)
    {
        throw std::invalid_argument("tube_points must be 0 or at least 3, got "
                                    + std::to_string(options.tube_points));
    }
}

// One color per point from the colormap, or the single uniform color.
std::vector<Color> line_colors(std::span<const vec3> points, const LineOptions& options)
{
    if (options.color)
        return {*options.color};

    std::vector<double> mus = options.mus.empty() ? default_mus(points.size()) : options.mus;
    ColormapType        cm  = options.colormap == ColormapType::None ? ColormapType::Hsv
                                                                     : options.colormap;

    std::vector<Color> colors;
    colors.reserve(mus.size());
    for (double mu : mus)
    {
        colors.push_back(sample_colormap(cm, static_cast<float>(mu)));
    }
    return colors;
}

// ─── Adapters ────────────────────────────────────────────────────────────────

// Tube geometry colored through the colormap.
void draw_tube_line(RenderContext& ctx, std::span<const vec3> points, const LineOptions& options)
{
    if (options.clear)
        ctx.clear();
    auto colors = line_colors(points, options);
    ctx.draw_tube(points, colors, options.tube_radius, options.tube_points);
}

// Single-color centre line; no tube and no per-point colors.
void draw_generic_line(RenderContext& ctx, std::span<const vec3> points, const LineOptions& options)
{
    if (options.clear)
        ctx.clear();
    ctx.draw_polyline_3d(points, options.color.value_or(palette::default_cycle[0]));
}

// Tube visual recentred on its frame. A standalone line also places the
// turntable camera; a scene line leaves that to the scene.
void draw_mesh_line(RenderContext& ctx, std::span<const vec3> points, const LineOptions& options)
{
    if (options.clear)
        ctx.clear();
    auto colors = line_colors(points, options);
    ctx.draw_tube(points, colors, options.tube_radius, options.tube_points);

    if (options.frame)
    {
        ctx.set_translation(-options.frame->center);
        return;
    }
    SceneFrame own = frame_points(points);
    ctx.set_translation(-own.center);
    ctx.set_camera({CameraMode::Turntable, 1.5 * own.extent, UpAxis::Z});
}

void adapt_line(RenderContext& ctx, std::span<const vec3> points, const LineOptions& options)
{
    switch (ctx.backend())
    {
        case RenderMode::OpenGL:
            draw_tube_line(ctx, points, options);
            return;
        case RenderMode::Svg:
            draw_generic_line(ctx, points, options);
            return;
        case RenderMode::Raster:
            draw_mesh_line(ctx, points, options);
            return;
        case RenderMode::Auto:
            break;
    }
    throw std::logic_error("render context reports no concrete backend");
}

}   // anonymous namespace

SceneFrame frame_points(std::span<const vec3> points)
{
    SceneFrame frame;
    frame.extent = 0.0;
    for (const auto& p : points)
    {
        frame.center += p;
        frame.extent = std::max({frame.extent, std::abs(p.x), std::abs(p.y), std::abs(p.z)});
    }
    if (!points.empty())
        frame.center = frame.center / static_cast<double>(points.size());
    if (frame.extent <= 0.0)
        frame.extent = 1.0;
    return frame;
}

std::vector<double> default_mus(size_t count)
{
    std::vector<double> mus(count, 0.0);
    if (count < 2)
        return mus;
    for (size_t i = 0; i < count; ++i)
    {
        mus[i] = static_cast<double>(i) / static_cast<double>(count - 1);
    }
    return mus;
}

std::unique_ptr<RenderContext> Plotter::acquire(RenderMode mode)
{
    Toolkit* toolkit = registry_.find(mode);
    if (!toolkit)
    {
        KNOTVIEW_LOG_ERROR("plot", "No {} toolkit registered", render_mode_name(mode));
        throw RenderFailure(mode, "no toolkit registered");
    }

    try
    {
        return toolkit->acquire(registry_.config());
    }
    catch (const ToolkitUnavailable& e)
    {
        KNOTVIEW_LOG_ERROR("plot", "Cannot acquire {} context: {}", render_mode_name(mode), e.reason());
        throw RenderFailure(mode, e.reason());
    }
    catch (const std::exception& e)
    {
        KNOTVIEW_LOG_ERROR("plot", "Cannot acquire {} context: {}", render_mode_name(mode), e.what());
        throw RenderFailure(mode, e.what());
    }
}

std::string Plotter::line(std::span<const vec3> points, RenderMode mode, const LineOptions& options)
{
    validate_line(points, options);

    RenderMode backend = BackendResolver(registry_).resolve(mode);
    auto       context = acquire(backend);

    KNOTVIEW_LOG_DEBUG("plot", "Drawing {} points with {}", points.size(), render_mode_name(backend));
    line(*context, points, options);

    try
    {
        return context->show();
    }
    catch (const std::exception& e)
    {
        KNOTVIEW_LOG_ERROR("plot", "{} show failed: {}", render_mode_name(backend), e.what());
        throw RenderFailure(backend, e.what());
    }
}

void Plotter::line(RenderContext& context, std::span<const vec3> points, const LineOptions& options)
{
    validate_line(points, options);

    try
    {
        adapt_line(context, points, options);
    }
    catch (const RenderFailure&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        KNOTVIEW_LOG_ERROR("plot", "{} draw failed: {}", render_mode_name(context.backend()), e.what());
        throw RenderFailure(context.backend(), e.what());
    }
}

std::string plot_line(std::span<const vec3> points, RenderMode mode, const LineOptions& options)
{
    return Plotter(ToolkitRegistry::default_registry()).line(points, mode, options);
}

}   // namespace knotview
