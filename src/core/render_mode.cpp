#include <algorithm>
#include <cctype>
#include <knotview/errors.hpp>
#include <knotview/render_mode.hpp>
#include <string>

namespace knotview
{

const char* render_mode_name(RenderMode mode)
{
    switch (mode)
    {
        case RenderMode::Auto:
            return "auto";
        case RenderMode::OpenGL:
            return "opengl";
        case RenderMode::Svg:
            return "svg";
        case RenderMode::Raster:
            return "raster";
    }
    return "unknown";
}

RenderMode parse_render_mode(std::string_view name)
{
    std::string key(name);
    std::transform(key.begin(),
                   key.end(),
                   key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "auto")
        return RenderMode::Auto;
    for (RenderMode mode : default_fallback_order)
    {
        if (key == render_mode_name(mode))
            return mode;
    }
    throw UnknownMode(std::string(name));
}

// ─── Errors ──────────────────────────────────────────────────────────────────

ToolkitUnavailable::ToolkitUnavailable(RenderMode backend, const std::string& reason)
    : Error(std::string(render_mode_name(backend)) + " toolkit unavailable: " + reason),
      backend_(backend),
      reason_(reason)
{
}

namespace
{

std::string describe_attempts(const std::vector<NoBackendAvailable::Attempt>& attempts)
{
    std::string msg = "no rendering backend available; tried";
    for (size_t i = 0; i < attempts.size(); ++i)
    {
        msg += i == 0 ? " " : ", ";
        msg += render_mode_name(attempts[i].backend);
        msg += " (" + attempts[i].reason + ")";
    }
    return msg;
}

}   // anonymous namespace

NoBackendAvailable::NoBackendAvailable(std::vector<Attempt> attempts)
    : Error(describe_attempts(attempts)), attempts_(std::move(attempts))
{
}

UnknownMode::UnknownMode(std::string requested)
    : Error("unknown render mode '" + requested + "' (expected auto, opengl, svg or raster)"),
      requested_(std::move(requested))
{
}

RenderFailure::RenderFailure(RenderMode backend, const std::string& reason)
    : Error(std::string(render_mode_name(backend)) + " backend failed: " + reason),
      backend_(backend)
{
}

}   // namespace knotview
