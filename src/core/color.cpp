#include <algorithm>
#include <cctype>
#include <cmath>
#include <knotview/color.hpp>
#include <string>

namespace knotview
{

// ─── HSV ─────────────────────────────────────────────────────────────────────

Color hsv_to_rgb(float h, float s, float v)
{
    if (s <= 0.0f)
        return {v, v, v, 1.0f};

    h = h - std::floor(h);
    float sector = h * 6.0f;
    int   i      = static_cast<int>(sector);
    float f      = sector - static_cast<float>(i);
    float p      = v * (1.0f - s);
    float q      = v * (1.0f - s * f);
    float t      = v * (1.0f - s * (1.0f - f));

    switch (i % 6)
    {
        case 0:
            return {v, t, p, 1.0f};
        case 1:
            return {q, v, p, 1.0f};
        case 2:
            return {p, v, t, 1.0f};
        case 3:
            return {p, q, v, 1.0f};
        case 4:
            return {t, p, v, 1.0f};
        default:
            return {v, p, q, 1.0f};
    }
}

float rgb_to_hue(const Color& c)
{
    float maxc  = std::max({c.r, c.g, c.b});
    float minc  = std::min({c.r, c.g, c.b});
    float delta = maxc - minc;
    if (delta <= 0.0f)
        return 0.0f;

    float h;
    if (maxc == c.r)
        h = (c.g - c.b) / delta;
    else if (maxc == c.g)
        h = 2.0f + (c.b - c.r) / delta;
    else
        h = 4.0f + (c.r - c.g) / delta;

    h /= 6.0f;
    h = h - std::floor(h);
    return h;
}

std::optional<Color> color_from_name(std::string_view name)
{
    std::string key(name);
    std::transform(key.begin(),
                   key.end(),
                   key.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (key == "r" || key == "red")
        return colors::red;
    if (key == "g" || key == "green")
        return colors::green;
    if (key == "b" || key == "blue")
        return colors::blue;
    if (key == "c" || key == "cyan")
        return colors::cyan;
    if (key == "m" || key == "magenta")
        return colors::magenta;
    if (key == "y" || key == "yellow")
        return colors::yellow;
    if (key == "k" || key == "black")
        return colors::black;
    if (key == "w" || key == "white")
        return colors::white;
    if (key == "orange")
        return colors::orange;
    if (key == "gray" || key == "grey")
        return colors::gray;
    if (key == "light_gray")
        return colors::light_gray;
    if (key == "dark_gray")
        return colors::dark_gray;
    return std::nullopt;
}

// ─── Colormaps ───────────────────────────────────────────────────────────────

ColormapType colormap_from_name(std::string_view name)
{
    if (name == "hsv")
        return ColormapType::Hsv;
    if (name == "viridis")
        return ColormapType::Viridis;
    if (name == "plasma")
        return ColormapType::Plasma;
    if (name == "inferno")
        return ColormapType::Inferno;
    if (name == "magma")
        return ColormapType::Magma;
    if (name == "jet")
        return ColormapType::Jet;
    if (name == "coolwarm")
        return ColormapType::Coolwarm;
    if (name == "grayscale")
        return ColormapType::Grayscale;
    return ColormapType::None;
}

const char* colormap_name(ColormapType cm)
{
    switch (cm)
    {
        case ColormapType::Hsv:
            return "hsv";
        case ColormapType::Viridis:
            return "viridis";
        case ColormapType::Plasma:
            return "plasma";
        case ColormapType::Inferno:
            return "inferno";
        case ColormapType::Magma:
            return "magma";
        case ColormapType::Jet:
            return "jet";
        case ColormapType::Coolwarm:
            return "coolwarm";
        case ColormapType::Grayscale:
            return "grayscale";
        case ColormapType::None:
        default:
            return "none";
    }
}

Color sample_colormap(ColormapType cm, float t)
{
    t = std::fmax(0.0f, std::fmin(1.0f, t));

    switch (cm)
    {
        case ColormapType::Hsv:
            // Cyclic: t = 0 and t = 1 are both red.
            return hsv_to_rgb(t, 1.0f, 1.0f);
        case ColormapType::Viridis:
        {
            // Simplified viridis: dark purple → teal → yellow
            float r =
                std::fmax(0.0f,
                          std::fmin(1.0f, -0.35f + 1.7f * t - 0.9f * t * t + 0.55f * t * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, -0.05f + 0.7f * t + 0.3f * t * t));
            float b =
                std::fmax(0.0f,
                          std::fmin(1.0f, 0.33f + 0.7f * t - 1.6f * t * t + 0.6f * t * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Plasma:
        {
            float r = std::fmax(0.0f, std::fmin(1.0f, 0.05f + 2.2f * t - 1.3f * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, -0.2f + 1.2f * t));
            float b =
                std::fmax(0.0f,
                          std::fmin(1.0f, 0.53f + 0.5f * t - 2.0f * t * t + 1.0f * t * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Inferno:
        {
            float r = std::fmax(0.0f, std::fmin(1.0f, -0.1f + 2.5f * t - 1.5f * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, -0.3f + 1.5f * t));
            float b =
                std::fmax(0.0f, std::fmin(1.0f, 0.1f + 2.0f * t - 3.5f * t * t + 1.5f * t * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Magma:
        {
            float r = std::fmax(0.0f, std::fmin(1.0f, -0.05f + 2.0f * t - 0.8f * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, -0.3f + 1.3f * t + 0.1f * t * t));
            float b =
                std::fmax(0.0f,
                          std::fmin(1.0f, 0.15f + 1.5f * t - 2.5f * t * t + 1.5f * t * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Jet:
        {
            // Classic jet: blue → cyan → green → yellow → red
            float r = std::fmax(0.0f, std::fmin(1.0f, 1.5f - std::fabs(t - 0.75f) * 4.0f));
            float g = std::fmax(0.0f, std::fmin(1.0f, 1.5f - std::fabs(t - 0.5f) * 4.0f));
            float b = std::fmax(0.0f, std::fmin(1.0f, 1.5f - std::fabs(t - 0.25f) * 4.0f));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Coolwarm:
        {
            float r = std::fmax(0.0f, std::fmin(1.0f, 0.23f + 1.5f * t - 0.7f * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, 0.3f + 1.2f * t - 1.5f * t * t));
            float b = std::fmax(0.0f, std::fmin(1.0f, 0.75f - 0.5f * t - 0.2f * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Grayscale:
            return {t, t, t, 1.0f};
        case ColormapType::None:
        default:
            return {0.5f, 0.5f, 0.5f, 1.0f};
    }
}

}   // namespace knotview
