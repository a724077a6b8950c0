#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <knotview/errors.hpp>
#include <knotview/export.hpp>
#include <knotview/logger.hpp>
#include <knotview/toolkit.hpp>
#include <knotview/tube.hpp>
#include <optional>

#include "rasterizer.hpp"

namespace knotview
{

namespace
{

#ifdef KNOTVIEW_USE_STB

// Either a shaded tube or a set of line segments, plus its own translation.
struct Visual
{
    std::optional<TubeMesh>          mesh;
    std::vector<std::array<vec3, 2>> segments;
    Color                            line_color = colors::black;
    vec3                             translation;
};

class RasterContext : public RenderContext
{
   public:
    explicit RasterContext(const RenderConfig& config)
        : config_(config), target_(config.width, config.height)
    {
    }

    RenderMode backend() const override { return RenderMode::Raster; }

    Capabilities capabilities() const override
    {
        Capabilities caps;
        caps.tube             = true;
        caps.per_point_colors = true;
        caps.camera           = true;
        return caps;
    }

    void clear() override
    {
        visuals_.clear();
        camera_setup_.reset();
    }

    void draw_tube(std::span<const vec3>  points,
                   std::span<const Color> colors,
                   double                 radius,
                   int                    sides) override
    {
        Visual v;
        v.mesh = build_tube(points, colors, radius, sides > 0 ? sides : config_.tube_points);
        visuals_.push_back(std::move(v));
    }

    void draw_polyline_3d(std::span<const vec3> points, const Color& color) override
    {
        Visual v;
        v.line_color = color;
        for (size_t i = 0; i + 1 < points.size(); ++i)
        {
            v.segments.push_back({points[i], points[i + 1]});
        }
        visuals_.push_back(std::move(v));
    }

    void set_camera(const CameraSetup& setup) override { camera_setup_ = setup; }

    void set_translation(vec3 offset) override
    {
        if (!visuals_.empty())
            visuals_.back().translation = offset;
    }

    void draw_box(const BoundingBox& box, const Color& color) override
    {
        Visual v;
        v.line_color = color;
        for (const auto& e : box.edges())
        {
            v.segments.push_back(e);
        }
        visuals_.push_back(std::move(v));
    }

    std::string show() override
    {
        render();

        std::string path = config_.next_output_path("png");
        if (!ImageExporter::write_png(path, target_.pixels().data(), target_.width(), target_.height()))
        {
            throw std::runtime_error("failed to write " + path);
        }
        KNOTVIEW_LOG_INFO("raster", "Scene written to {}", path);
        return path;
    }

   private:
    Camera make_camera() const
    {
        Camera cam;
        cam.up_axis   = UpAxis::Z;
        cam.azimuth   = 30.0f;
        cam.elevation = 30.0f;
        cam.target    = {0.0, 0.0, 0.0};

        if (camera_setup_)
        {
            cam.up_axis  = camera_setup_->up_axis;
            cam.distance = static_cast<float>(camera_setup_->distance);
            if (camera_setup_->mode == CameraMode::Fixed)
                cam.azimuth = cam.elevation = 0.0f;
            cam.near_clip = std::max(1e-3f, cam.distance * 0.01f);
            cam.far_clip  = cam.distance * 100.0f;
            cam.update_position_from_orbit();
        }
        else
        {
            bool first = true;
            vec3 lo, hi;
            for (const auto& v : visuals_)
            {
                auto extend = [&](vec3 p)
                {
                    p += v.translation;
                    lo    = first ? p : vec3_min(lo, p);
                    hi    = first ? p : vec3_max(hi, p);
                    first = false;
                };
                if (v.mesh)
                    for (const auto& p : v.mesh->positions)
                        extend(p);
                for (const auto& s : v.segments)
                {
                    extend(s[0]);
                    extend(s[1]);
                }
            }
            cam.fit_to_bounds(lo, hi);
        }
        return cam;
    }

    void render()
    {
        Camera cam       = make_camera();
        float  aspect    = static_cast<float>(target_.width()) / static_cast<float>(target_.height());
        mat4   view_proj = mat4_mul(cam.projection_matrix(aspect), cam.view_matrix());
        vec3   light     = vec3_normalize(cam.position - cam.target);

        target_.clear(colors::white);

        for (const auto& v : visuals_)
        {
            auto project = [&](vec3 p, const Color& c)
            { return target_.to_screen(mat4_mul_vec4(view_proj, vec4{p + v.translation, 1.0}), c); };

            if (v.mesh)
            {
                const TubeMesh& m = *v.mesh;
                std::vector<std::optional<Rasterizer::Vertex>> screen;
                screen.reserve(m.positions.size());
                for (size_t i = 0; i < m.positions.size(); ++i)
                {
                    // Headlight, two-sided
                    float diffuse = static_cast<float>(std::abs(vec3_dot(m.normals[i], light)));
                    float shade   = 0.35f + 0.65f * diffuse;
                    const Color& c = m.colors[i];
                    screen.push_back(project(m.positions[i], {c.r * shade, c.g * shade, c.b * shade, c.a}));
                }
                for (size_t t = 0; t + 2 < m.indices.size(); t += 3)
                {
                    const auto& a = screen[m.indices[t]];
                    const auto& b = screen[m.indices[t + 1]];
                    const auto& c = screen[m.indices[t + 2]];
                    if (a && b && c)
                        target_.fill_triangle(*a, *b, *c);
                }
            }

            for (const auto& s : v.segments)
            {
                auto a = project(s[0], v.line_color);
                auto b = project(s[1], v.line_color);
                if (a && b)
                    target_.draw_line(*a, *b);
            }
        }
    }

    RenderConfig               config_;
    Rasterizer                 target_;
    std::vector<Visual>        visuals_;
    std::optional<CameraSetup> camera_setup_;
};

#endif   // KNOTVIEW_USE_STB

class RasterToolkit : public Toolkit
{
   public:
    RenderMode mode() const override { return RenderMode::Raster; }

    std::unique_ptr<RenderContext> acquire(const RenderConfig& config) override
    {
#ifndef KNOTVIEW_USE_STB
        (void)config;
        throw ToolkitUnavailable(RenderMode::Raster, "built without PNG support");
#else
        std::error_code ec;
        if (!std::filesystem::is_directory(config.output_dir, ec))
        {
            throw ToolkitUnavailable(RenderMode::Raster,
                                     "output directory '" + config.output_dir + "' does not exist");
        }
        try
        {
            return std::make_unique<RasterContext>(config);
        }
        catch (const std::exception& e)
        {
            throw ToolkitUnavailable(RenderMode::Raster, e.what());
        }
#endif
    }
};

}   // anonymous namespace

std::unique_ptr<Toolkit> make_raster_toolkit()
{
    return std::make_unique<RasterToolkit>();
}

}   // namespace knotview
