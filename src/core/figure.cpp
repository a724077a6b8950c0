#include <knotview/axes3d.hpp>
#include <knotview/config.hpp>
#include <knotview/export.hpp>
#include <knotview/figure.hpp>
#include <knotview/logger.hpp>
#include <stdexcept>

#include "layout.hpp"

namespace knotview
{

Figure::Figure(const FigureConfig& config) : config_(config)
{
    if (config_.width == 0 || config_.height == 0)
    {
        throw std::invalid_argument("figure size must be non-zero");
    }
}

template <typename T>
T& Figure::slot(int rows, int cols, int index)
{
    if (rows <= 0 || cols <= 0 || index < 1 || index > rows * cols)
    {
        throw std::out_of_range("subplot index out of range");
    }

    // Update grid dimensions to the maximum seen
    if (rows > grid_rows_)
        grid_rows_ = rows;
    if (cols > grid_cols_)
        grid_cols_ = cols;

    size_t idx = static_cast<size_t>(index - 1);
    if (idx >= axes_.size())
    {
        axes_.resize(idx + 1);
    }

    if (!axes_[idx])
    {
        axes_[idx] = std::make_unique<T>();
    }

    auto* typed = dynamic_cast<T*>(axes_[idx].get());
    if (!typed)
    {
        throw std::logic_error("subplot slot already holds a different kind of axes");
    }
    return *typed;
}

Axes& Figure::subplot(int rows, int cols, int index)
{
    return slot<Axes>(rows, cols, index);
}

Axes3D& Figure::subplot3d(int rows, int cols, int index)
{
    return slot<Axes3D>(rows, cols, index);
}

std::string Figure::show(const RenderConfig& config)
{
    std::string path = config.next_output_path("svg");
    if (!save_svg(path))
    {
        throw std::runtime_error("failed to write " + path);
    }
    KNOTVIEW_LOG_INFO("figure", "Wrote {}", path);
    return path;
}

bool Figure::save_svg(const std::string& path)
{
    compute_layout();
    return SvgExporter::write_svg(path, *this);
}

void Figure::clear()
{
    axes_.clear();
    grid_rows_ = 1;
    grid_cols_ = 1;
}

void Figure::compute_layout()
{
    Margins fig_margins;
    fig_margins.left   = style_.margin_left;
    fig_margins.right  = style_.margin_right;
    fig_margins.top    = style_.margin_top;
    fig_margins.bottom = style_.margin_bottom;

    auto rects = compute_subplot_layout(static_cast<float>(config_.width),
                                        static_cast<float>(config_.height),
                                        grid_rows_,
                                        grid_cols_,
                                        fig_margins);

    for (size_t i = 0; i < axes_.size() && i < rects.size(); ++i)
    {
        if (axes_[i])
        {
            axes_[i]->set_viewport(rects[i]);
        }
    }
}

}   // namespace knotview
