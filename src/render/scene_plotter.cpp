#include <knotview/errors.hpp>
#include <knotview/logger.hpp>
#include <knotview/plot.hpp>
#include <knotview/resolver.hpp>

namespace knotview
{

namespace
{

// One frame over every segment that will be drawn.
SceneFrame frame_scene(std::span<const CurveSegments> curves)
{
    std::vector<vec3> all;
    for (const auto& segments : curves)
    {
        for (const auto& segment : segments)
        {
            if (segment.size() >= 2)
                all.insert(all.end(), segment.begin(), segment.end());
        }
    }
    return frame_points(all);
}

}   // anonymous namespace

std::string Plotter::cell(std::span<const CurveSegments> curves, const CellOptions& options)
{
    // Bad boundaries fail before anything is drawn.
    std::optional<BoundingBox> box;
    if (options.boundary)
    {
        box = normalize_boundary(*options.boundary);
    }

    std::vector<Color> curve_colors;
    if (options.colors)
    {
        curve_colors = options.colors->assign(curves.size());
    }
    else
    {
        ColorAssigner assigner;
        curve_colors = assigner.assign(curves.size());
    }

    RenderMode backend = BackendResolver(registry_).resolve(options.mode);
    auto       context = acquire(backend);

    KNOTVIEW_LOG_DEBUG("scene", "Composing {} curves with {}", curves.size(), render_mode_name(backend));

    // Mesh backends recentre visuals; a scene shares one centre and one camera.
    std::optional<SceneFrame> frame;
    if (backend == RenderMode::Raster)
        frame = frame_scene(curves);

    bool first_draw = true;
    for (size_t i = 0; i < curves.size(); ++i)
    {
        const auto& segments = curves[i];
        for (size_t s = 0; s < segments.size(); ++s)
        {
            const auto& segment = segments[s];
            if (segment.size() < 2)
            {
                KNOTVIEW_LOG_WARN("scene",
                                  "Skipping segment {} of curve {}: {} points",
                                  s,
                                  i,
                                  segment.size());
                continue;
            }

            LineOptions seg_options = options.line;
            seg_options.color       = curve_colors[i];
            seg_options.clear       = first_draw && options.clear;
            seg_options.mus.clear();
            seg_options.frame       = frame;

            line(*context, segment, seg_options);
            first_draw = false;
        }
    }

    if (first_draw && options.clear)
    {
        // Nothing was drawn; still honour the clear request.
        context->clear();
    }

    try
    {
        if (box)
        {
            context->draw_box(*box, options.boundary_color);
            if (frame)
                context->set_translation(-frame->center);
        }
        if (frame)
            context->set_camera({CameraMode::Turntable, 1.5 * frame->extent, UpAxis::Z});
    }
    catch (const std::exception& e)
    {
        KNOTVIEW_LOG_ERROR("scene", "{} scene framing failed: {}", render_mode_name(backend), e.what());
        throw RenderFailure(backend, e.what());
    }

    try
    {
        return context->show();
    }
    catch (const std::exception& e)
    {
        KNOTVIEW_LOG_ERROR("scene", "{} show failed: {}", render_mode_name(backend), e.what());
        throw RenderFailure(backend, e.what());
    }
}

std::string plot_cell(std::span<const CurveSegments> curves, const CellOptions& options)
{
    return Plotter(ToolkitRegistry::default_registry()).cell(curves, options);
}

}   // namespace knotview
