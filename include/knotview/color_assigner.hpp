#pragma once

#include <cstdint>
#include <knotview/color.hpp>
#include <random>
#include <vector>

namespace knotview
{

// Produces one fully saturated color per curve. Hues are spaced evenly around
// the hue circle (i / K for K curves, so hue 1 never duplicates hue 0) and then
// shuffled so that draw order does not follow hue order.
class ColorAssigner
{
   public:
    // Seeded from std::random_device.
    ColorAssigner();
    explicit ColorAssigner(uint32_t seed);
    explicit ColorAssigner(std::mt19937 engine);

    // K evenly spaced hues in [0,1), unshuffled.
    static std::vector<float> sample_hues(size_t count);

    std::vector<Color> assign(size_t count);

    std::mt19937& engine() { return engine_; }

   private:
    std::mt19937 engine_;
};

}   // namespace knotview
