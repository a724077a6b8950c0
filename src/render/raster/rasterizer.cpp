#include "rasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace knotview
{

namespace
{

uint8_t to_byte(float v)
{
    return static_cast<uint8_t>(std::lround(clampf(v, 0.0f, 1.0f) * 255.0f));
}

Color lerp(const Color& a, const Color& b, float t)
{
    return {a.r + (b.r - a.r) * t,
            a.g + (b.g - a.g) * t,
            a.b + (b.b - a.b) * t,
            a.a + (b.a - a.a) * t};
}

float edge(float ax, float ay, float bx, float by, float px, float py)
{
    return (bx - ax) * (py - ay) - (by - ay) * (px - ax);
}

}   // anonymous namespace

Rasterizer::Rasterizer(uint32_t width, uint32_t height) : width_(width), height_(height)
{
    if (width == 0 || height == 0)
    {
        throw std::invalid_argument("rasterizer target must be non-empty");
    }
    pixels_.resize(static_cast<size_t>(width) * height * 4);
    depth_.resize(static_cast<size_t>(width) * height);
    clear(colors::white);
}

void Rasterizer::clear(const Color& background)
{
    const uint8_t r = to_byte(background.r);
    const uint8_t g = to_byte(background.g);
    const uint8_t b = to_byte(background.b);
    const uint8_t a = to_byte(background.a);
    for (size_t i = 0; i < depth_.size(); ++i)
    {
        pixels_[i * 4 + 0] = r;
        pixels_[i * 4 + 1] = g;
        pixels_[i * 4 + 2] = b;
        pixels_[i * 4 + 3] = a;
    }
    std::fill(depth_.begin(), depth_.end(), 1.0f);
    covered_ = 0;
}

void Rasterizer::plot(int x, int y, float z, const Color& c)
{
    if (x < 0 || y < 0 || x >= static_cast<int>(width_) || y >= static_cast<int>(height_))
        return;
    if (z < 0.0f || z > 1.0f)
        return;

    size_t i = index(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
    if (z >= depth_[i])
        return;

    if (depth_[i] == 1.0f)
        ++covered_;
    depth_[i]          = z;
    pixels_[i * 4 + 0] = to_byte(c.r);
    pixels_[i * 4 + 1] = to_byte(c.g);
    pixels_[i * 4 + 2] = to_byte(c.b);
    pixels_[i * 4 + 3] = 255;
}

void Rasterizer::fill_triangle(const Vertex& a, const Vertex& b, const Vertex& c)
{
    float area = edge(a.x, a.y, b.x, b.y, c.x, c.y);
    if (std::abs(area) < 1e-8f)
        return;

    int min_x = std::max(0, static_cast<int>(std::floor(std::min({a.x, b.x, c.x}))));
    int max_x = std::min(static_cast<int>(width_) - 1,
                         static_cast<int>(std::ceil(std::max({a.x, b.x, c.x}))));
    int min_y = std::max(0, static_cast<int>(std::floor(std::min({a.y, b.y, c.y}))));
    int max_y = std::min(static_cast<int>(height_) - 1,
                         static_cast<int>(std::ceil(std::max({a.y, b.y, c.y}))));

    for (int y = min_y; y <= max_y; ++y)
    {
        for (int x = min_x; x <= max_x; ++x)
        {
            // Sample at the pixel centre
            float px = static_cast<float>(x) + 0.5f;
            float py = static_cast<float>(y) + 0.5f;
            float w0 = edge(b.x, b.y, c.x, c.y, px, py) / area;
            float w1 = edge(c.x, c.y, a.x, a.y, px, py) / area;
            float w2 = 1.0f - w0 - w1;
            if (w0 < 0.0f || w1 < 0.0f || w2 < 0.0f)
                continue;

            float z = w0 * a.z + w1 * b.z + w2 * c.z;
            Color col{w0 * a.color.r + w1 * b.color.r + w2 * c.color.r,
                      w0 * a.color.g + w1 * b.color.g + w2 * c.color.g,
                      w0 * a.color.b + w1 * b.color.b + w2 * c.color.b,
                      1.0f};
            plot(x, y, z, col);
        }
    }
}

void Rasterizer::draw_line(const Vertex& a, const Vertex& b)
{
    float dx    = b.x - a.x;
    float dy    = b.y - a.y;
    int   steps = static_cast<int>(std::ceil(std::max(std::abs(dx), std::abs(dy))));
    if (steps == 0)
    {
        plot(static_cast<int>(a.x), static_cast<int>(a.y), a.z, a.color);
        return;
    }

    for (int i = 0; i <= steps; ++i)
    {
        float t = static_cast<float>(i) / static_cast<float>(steps);
        plot(static_cast<int>(std::floor(a.x + dx * t)),
             static_cast<int>(std::floor(a.y + dy * t)),
             a.z + (b.z - a.z) * t,
             lerp(a.color, b.color, t));
    }
}

std::optional<Rasterizer::Vertex> Rasterizer::to_screen(const vec4& clip, const Color& color) const
{
    if (clip.w <= 1e-9)
        return std::nullopt;

    double nx = clip.x / clip.w;
    double ny = clip.y / clip.w;
    double nz = clip.z / clip.w;
    if (nz < 0.0 || nz > 1.0)
        return std::nullopt;

    // Clip space is Y-down, matching image rows.
    Vertex v;
    v.x     = static_cast<float>((nx * 0.5 + 0.5) * width_);
    v.y     = static_cast<float>((ny * 0.5 + 0.5) * height_);
    v.z     = static_cast<float>(nz);
    v.color = color;
    return v;
}

Color Rasterizer::pixel(uint32_t x, uint32_t y) const
{
    size_t i = index(x, y) * 4;
    return {pixels_[i] / 255.0f, pixels_[i + 1] / 255.0f, pixels_[i + 2] / 255.0f, pixels_[i + 3] / 255.0f};
}

}   // namespace knotview
