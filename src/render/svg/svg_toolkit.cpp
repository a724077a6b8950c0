#include <knotview/axes3d.hpp>
#include <knotview/errors.hpp>
#include <knotview/figure.hpp>
#include <knotview/logger.hpp>
#include <knotview/series3d.hpp>
#include <knotview/toolkit.hpp>
#include <optional>

namespace knotview
{

namespace
{

// Figure with a single 3D subplot, written out as SVG on show().
class SvgContext : public RenderContext
{
   public:
    explicit SvgContext(const RenderConfig& config) : config_(config) { reset_figure(); }

    RenderMode backend() const override { return RenderMode::Svg; }

    Capabilities capabilities() const override
    {
        Capabilities caps;
        caps.camera = true;
        return caps;
    }

    void clear() override
    {
        reset_figure();
        camera_setup_.reset();
    }

    // Reduced fidelity: centre line in the first color.
    void draw_tube(std::span<const vec3>  points,
                   std::span<const Color> colors,
                   double /*radius*/,
                   int /*sides*/) override
    {
        draw_polyline_3d(points, colors.empty() ? palette::default_cycle[0] : colors[0]);
    }

    void draw_polyline_3d(std::span<const vec3> points, const Color& color) override
    {
        last_visual_.clear();
        auto& series = axes_->line3d(points);
        series.color(color);
        last_visual_.push_back(&series);
    }

    void set_camera(const CameraSetup& setup) override { camera_setup_ = setup; }

    void set_translation(vec3 offset) override
    {
        for (LineSeries3D* series : last_visual_)
        {
            series->translate(offset);
        }
    }

    void draw_box(const BoundingBox& box, const Color& color) override
    {
        last_visual_.clear();
        for (const auto& edge : box.edges())
        {
            auto& series = axes_->line3d(edge);
            series.width(1.0f).color(color);
            last_visual_.push_back(&series);
        }
    }

    std::string show() override
    {
        axes_->auto_fit();
        if (camera_setup_)
        {
            axes_->camera()
                .set_up_axis(camera_setup_->up_axis)
                .set_distance(static_cast<float>(camera_setup_->distance));
        }

        std::string path = figure_->show(config_);
        KNOTVIEW_LOG_INFO("svg", "Scene written to {}", path);
        return path;
    }

   private:
    void reset_figure()
    {
        FigureConfig fc;
        fc.width  = config_.width;
        fc.height = config_.height;
        figure_   = std::make_unique<Figure>(fc);
        axes_     = &figure_->subplot3d(1, 1, 1);
        last_visual_.clear();
    }

    RenderConfig               config_;
    std::unique_ptr<Figure>    figure_;
    Axes3D*                    axes_ = nullptr;
    std::vector<LineSeries3D*> last_visual_;
    std::optional<CameraSetup> camera_setup_;
};

class SvgToolkit : public Toolkit
{
   public:
    RenderMode mode() const override { return RenderMode::Svg; }

    std::unique_ptr<RenderContext> acquire(const RenderConfig& config) override
    {
        try
        {
            return std::make_unique<SvgContext>(config);
        }
        catch (const std::exception& e)
        {
            // A figure or 3D subplot that cannot be built means no 3D support.
            throw ToolkitUnavailable(RenderMode::Svg, e.what());
        }
    }
};

}   // anonymous namespace

std::unique_ptr<Toolkit> make_svg_toolkit()
{
    return std::make_unique<SvgToolkit>();
}

}   // namespace knotview
