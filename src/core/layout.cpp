#include "layout.hpp"

namespace knotview
{

std::vector<Rect> compute_subplot_layout(
    float figure_width, float figure_height, int rows, int cols, const Margins& margins)
{
    std::vector<Rect> rects;
    rects.reserve(static_cast<size_t>(rows * cols));

    // Each cell gets an equal share of the figure, then margins are applied inside each cell.
    float cell_width  = figure_width / static_cast<float>(cols);
    float cell_height = figure_height / static_cast<float>(rows);

    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            Rect plot_area;
            plot_area.x = static_cast<float>(c) * cell_width + margins.left;
            plot_area.y = static_cast<float>(r) * cell_height + margins.top;
            plot_area.w = cell_width - margins.left - margins.right;
            plot_area.h = cell_height - margins.top - margins.bottom;

            if (plot_area.w < 0.0f)
                plot_area.w = 0.0f;
            if (plot_area.h < 0.0f)
                plot_area.h = 0.0f;

            rects.push_back(plot_area);
        }
    }

    return rects;
}

}   // namespace knotview
