#pragma once

#include <array>
#include <string_view>

namespace knotview
{

// Which toolkit renders a 3D line. Auto is resolved by probing on every
// top-level call and is never stored.
enum class RenderMode
{
    Auto,
    OpenGL,   // GLFW window, tube geometry, continuous colormaps
    Svg,      // Figure/Axes3D exported as SVG, single-color polylines
    Raster,   // software tube rasterizer, PNG output, turntable camera
};

// Fixed fallback order used by auto mode.
inline constexpr std::array<RenderMode, 3> default_fallback_order = {
    RenderMode::OpenGL,
    RenderMode::Svg,
    RenderMode::Raster,
};

const char* render_mode_name(RenderMode mode);

// Case-insensitive. Throws UnknownMode for anything that is not "auto" or a
// known backend name.
RenderMode parse_render_mode(std::string_view name);

}   // namespace knotview
