#include <algorithm>
#include <knotview/color_assigner.hpp>

namespace knotview
{

ColorAssigner::ColorAssigner() : engine_(std::random_device{}()) {}

ColorAssigner::ColorAssigner(uint32_t seed) : engine_(seed) {}

ColorAssigner::ColorAssigner(std::mt19937 engine) : engine_(std::move(engine)) {}

std::vector<float> ColorAssigner::sample_hues(size_t count)
{
    // count + 1 points over [0, 1] with the endpoint dropped.
    std::vector<float> hues;
    hues.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        hues.push_back(static_cast<float>(static_cast<double>(i) / static_cast<double>(count)));
    }
    return hues;
}

std::vector<Color> ColorAssigner::assign(size_t count)
{
    std::vector<Color> result;
    result.reserve(count);
    for (float hue : sample_hues(count))
    {
        result.push_back(hsv_to_rgb(hue, 1.0f, 1.0f));
    }
    std::shuffle(result.begin(), result.end(), engine_);
    return result;
}

}   // namespace knotview
