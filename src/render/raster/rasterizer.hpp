#pragma once

#include <cstdint>
#include <knotview/color.hpp>
#include <knotview/math3d.hpp>
#include <optional>
#include <vector>

namespace knotview
{

// Z-buffered software rasterizer over an RGBA8 framebuffer. Row 0 is the top
// of the image; smaller depth is nearer.
class Rasterizer
{
   public:
    struct Vertex
    {
        float x = 0.0f;   // pixels
        float y = 0.0f;
        float z = 0.0f;   // depth in [0,1]
        Color color;
    };

    // Throws std::invalid_argument for a zero-sized target.
    Rasterizer(uint32_t width, uint32_t height);

    void clear(const Color& background);

    // Gouraud-interpolated triangle; either winding.
    void fill_triangle(const Vertex& a, const Vertex& b, const Vertex& c);

    // One pixel wide, depth tested, color interpolated.
    void draw_line(const Vertex& a, const Vertex& b);

    // Clip space to screen space for a viewport covering the whole target.
    // Returns nullopt behind the eye or outside the depth range.
    std::optional<Vertex> to_screen(const vec4& clip, const Color& color) const;

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }

    const std::vector<uint8_t>& pixels() const { return pixels_; }

    Color pixel(uint32_t x, uint32_t y) const;
    float depth(uint32_t x, uint32_t y) const { return depth_[index(x, y)]; }

    // Pixels written since the last clear().
    size_t covered() const { return covered_; }

   private:
    size_t index(uint32_t x, uint32_t y) const
    {
        return static_cast<size_t>(y) * width_ + x;
    }
    void plot(int x, int y, float z, const Color& c);

    uint32_t             width_;
    uint32_t             height_;
    std::vector<uint8_t> pixels_;
    std::vector<float>   depth_;
    size_t               covered_ = 0;
};

}   // namespace knotview
