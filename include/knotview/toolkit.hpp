#pragma once

#include <knotview/boundary.hpp>
#include <knotview/camera.hpp>
#include <knotview/color.hpp>
#include <knotview/config.hpp>
#include <knotview/math3d.hpp>
#include <knotview/render_mode.hpp>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace knotview
{

struct Capabilities
{
    bool tube             = false;   // true tube geometry with a radius
    bool per_point_colors = false;   // draw_tube honours one color per point
    bool camera           = false;   // set_camera has an effect
};

enum class CameraMode
{
    Fixed,
    Turntable,
};

struct CameraSetup
{
    CameraMode mode     = CameraMode::Turntable;
    double     distance = 10.0;
    UpAxis     up_axis  = UpAxis::Z;
};

// A live rendering session of one toolkit: a window, a figure or a
// framebuffer. Released on destruction.
class RenderContext
{
   public:
    virtual ~RenderContext() = default;

    virtual RenderMode   backend() const      = 0;
    virtual Capabilities capabilities() const = 0;

    // Drops everything drawn so far.
    virtual void clear() = 0;

    // `colors` has one entry (uniform) or one per point. `sides` of 0 uses
    // the context's configured tessellation. Contexts without tube support
    // draw the centre line.
    virtual void draw_tube(std::span<const vec3>  points,
                           std::span<const Color> colors,
                           double                 radius,
                           int                    sides = 0) = 0;

    virtual void draw_polyline_3d(std::span<const vec3> points, const Color& color) = 0;

    virtual void set_camera(const CameraSetup& setup) = 0;

    // Translates the most recently drawn visual.
    virtual void set_translation(vec3 offset) = 0;

    virtual void draw_box(const BoundingBox& box, const Color& color) = 0;

    // Presents the scene. Returns the artifact path for file-producing
    // toolkits and an empty string for interactive ones.
    virtual std::string show() = 0;
};

class Toolkit
{
   public:
    virtual ~Toolkit() = default;

    virtual RenderMode mode() const = 0;

    // Builds the toolkit's minimal context. Throws ToolkitUnavailable when
    // the toolkit cannot run in this process.
    virtual std::unique_ptr<RenderContext> acquire(const RenderConfig& config) = 0;
};

// Built-in toolkits. Toolkits compiled out of this build still exist and
// fail every acquire() with ToolkitUnavailable.
std::unique_ptr<Toolkit> make_opengl_toolkit();
std::unique_ptr<Toolkit> make_svg_toolkit();
std::unique_ptr<Toolkit> make_raster_toolkit();

// Ordered candidates plus the configuration contexts are acquired with.
class ToolkitRegistry
{
   public:
    ToolkitRegistry() = default;
    explicit ToolkitRegistry(RenderConfig config) : config_(std::move(config)) {}

    ToolkitRegistry(const ToolkitRegistry&)            = delete;
    ToolkitRegistry& operator=(const ToolkitRegistry&) = delete;

    // Appends a candidate; auto mode tries them in insertion order. A second toolkit
    // for the same mode replaces the first in place.
    ToolkitRegistry& add(std::unique_ptr<Toolkit> toolkit);

    Toolkit* find(RenderMode mode) const;

    const std::vector<std::unique_ptr<Toolkit>>& candidates() const { return toolkits_; }

    RenderConfig&       config() { return config_; }
    const RenderConfig& config() const { return config_; }

    // opengl, svg, raster, configured from the environment on first use.
    static ToolkitRegistry& default_registry();

   private:
    std::vector<std::unique_ptr<Toolkit>> toolkits_;
    RenderConfig                          config_;
};

}   // namespace knotview
