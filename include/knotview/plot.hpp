#pragma once

#include <knotview/axes.hpp>
#include <knotview/boundary.hpp>
#include <knotview/color.hpp>
#include <knotview/color_assigner.hpp>
#include <knotview/config.hpp>
#include <knotview/figure.hpp>
#include <knotview/math3d.hpp>
#include <knotview/render_mode.hpp>
#include <knotview/series.hpp>
#include <knotview/toolkit.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace knotview
{

// Centre and largest |coordinate| of everything a mesh backend draws in one
// scene. Every visual is translated by -center; the camera sits at
// 1.5 * extent.
struct SceneFrame
{
    vec3   center;
    double extent = 1.0;
};

// Frame of the given points; extent falls back to 1 when all points are at
// the origin.
SceneFrame frame_points(std::span<const vec3> points);

struct LineOptions
{
    bool                 clear = true;   // drop the context's previous drawing first
    std::optional<Color> color;          // uniform color; unset = colormap over mu
    std::vector<double>  mus;            // per-point colormap position; empty = evenly over [0,1]
    double               tube_radius = 1.0;
    ColormapType         colormap    = ColormapType::Hsv;
    int                  tube_points = 0;   // sides of the cross-section; 0 = RenderConfig::tube_points, else >= 3

    // Mesh backends only. When set the line is translated by -frame->center
    // and the camera is left to the caller; unset frames the line on its own.
    std::optional<SceneFrame> frame;
};

struct ProjectionOptions
{
    // nullopt disables crossing markers entirely. An engaged empty span still
    // creates the (empty) crossing series.
    std::optional<std::span<const vec2>> crossings;

    bool mark_start = false;
    bool show       = true;

    // Draw into an existing figure/axes instead of a fresh one.
    Figure* figure = nullptr;
    Axes*   axes   = nullptr;

    // Where show() writes; unset = RenderConfig::from_env().
    std::optional<RenderConfig> config;
};

struct ProjectionResult
{
    std::unique_ptr<Figure> owned_figure;   // null when drawing into a caller's figure
    Figure*                 figure           = nullptr;
    Axes*                   axes             = nullptr;
    LineSeries*             curve            = nullptr;
    ScatterSeries*          start_marker     = nullptr;
    ScatterSeries*          crossing_markers = nullptr;
    std::string             output_path;   // set when shown
};

// One curve made of disjoint segments.
using CurveSegments = std::vector<std::vector<vec3>>;

struct CellOptions
{
    RenderMode                  mode  = RenderMode::Auto;
    bool                        clear = true;
    std::optional<BoundarySpec> boundary;
    Color                       boundary_color = colors::gray;
    LineOptions                 line;   // color and clear are set per segment
    ColorAssigner*              colors = nullptr;   // null = a freshly seeded assigner
};

// Curve rendering over a toolkit registry.
class Plotter
{
   public:
    explicit Plotter(ToolkitRegistry& registry) : registry_(registry) {}

    // Resolves `mode`, acquires a fresh context, draws and shows it. Returns
    // the artifact path reported by the context.
    std::string line(std::span<const vec3> points,
                     RenderMode            mode    = RenderMode::Auto,
                     const LineOptions&    options = {});

    // Draws into a context the caller already holds. Nothing is resolved or
    // shown.
    void line(RenderContext& context, std::span<const vec3> points, const LineOptions& options = {});

    // Every segment of every curve, one color per curve, plus the optional
    // boundary box, in a single context shown once.
    std::string cell(std::span<const CurveSegments> curves, const CellOptions& options = {});

    // Acquires a context for a concrete mode. Any failure becomes RenderFailure.
    std::unique_ptr<RenderContext> acquire(RenderMode mode);

    ToolkitRegistry& registry() { return registry_; }

   private:
    ToolkitRegistry& registry_;
};

// 2D projection of the first two coordinates. Never goes through a toolkit.
ProjectionResult plot_projection(std::span<const vec3> points, const ProjectionOptions& options = {});

// Same as Plotter on the default registry.
std::string plot_line(std::span<const vec3> points,
                      RenderMode            mode    = RenderMode::Auto,
                      const LineOptions&    options = {});
std::string plot_cell(std::span<const CurveSegments> curves, const CellOptions& options = {});

// Colormap positions used when LineOptions::mus is empty.
std::vector<double> default_mus(size_t count);

}   // namespace knotview
