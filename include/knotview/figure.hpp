#pragma once

#include <cstdint>
#include <knotview/axes.hpp>
#include <knotview/fwd.hpp>
#include <memory>
#include <string>
#include <vector>

namespace knotview
{

struct FigureConfig
{
    uint32_t width  = 1280;
    uint32_t height = 720;
};

struct FigureStyle
{
    Color background    = colors::white;
    float margin_top    = 40.0f;
    float margin_bottom = 60.0f;
    float margin_left   = 70.0f;
    float margin_right  = 20.0f;
};

class Figure
{
   public:
    // Throws std::invalid_argument for a zero-sized figure.
    explicit Figure(const FigureConfig& config = {});

    // 1-based, row-major. Returns the existing axes when the slot is taken;
    // throws std::logic_error if the slot holds the other kind of axes.
    Axes&   subplot(int rows, int cols, int index);
    Axes3D& subplot3d(int rows, int cols, int index);

    // Writes the figure as SVG to the next output path of `config` and
    // returns that path. Throws std::runtime_error when the file cannot be
    // written.
    std::string show(const RenderConfig& config);

    bool save_svg(const std::string& path);

    uint32_t width() const { return config_.width; }
    uint32_t height() const { return config_.height; }

    const std::vector<std::unique_ptr<AxesBase>>& axes() const { return axes_; }

    FigureStyle&       style() { return style_; }
    const FigureStyle& style() const { return style_; }

    void clear();

    // Layout: called by exporters before drawing
    void compute_layout();

    int grid_rows() const { return grid_rows_; }
    int grid_cols() const { return grid_cols_; }

   private:
    template <typename T>
    T& slot(int rows, int cols, int index);

    FigureConfig                           config_;
    FigureStyle                            style_;
    std::vector<std::unique_ptr<AxesBase>> axes_;
    int                                    grid_rows_ = 1;
    int                                    grid_cols_ = 1;
};

}   // namespace knotview
