#pragma once

#include <knotview/series.hpp>
#include <vector>

namespace knotview
{

// Margins in pixels around each subplot's plot area.
struct Margins
{
    float left   = 60.0f;
    float right  = 40.0f;
    float bottom = 50.0f;
    float top    = 40.0f;
};

// Viewport rectangles for a grid of subplots, row-major, in pixels.
std::vector<Rect> compute_subplot_layout(float          figure_width,
                                         float          figure_height,
                                         int            rows,
                                         int            cols,
                                         const Margins& margins = {});

}   // namespace knotview
