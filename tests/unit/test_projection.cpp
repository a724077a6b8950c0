#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <knotview/figure.hpp>
#include <knotview/plot.hpp>
#include <sstream>
#include <vector>

using namespace knotview;

namespace
{

std::vector<vec3> zigzag()
{
    // x spans [0, 10], y spans [-2, 3]
    return {{0.0, 0.0, 5.0}, {2.5, 3.0, -1.0}, {5.0, -2.0, 0.0}, {10.0, 1.0, 2.0}};
}

ProjectionOptions hidden()
{
    ProjectionOptions opts;
    opts.show = false;
    return opts;
}

}   // namespace

TEST(ProjectionPlotter, PadsLimitsByTenthOfRange)
{
    auto points = zigzag();
    auto result = plot_projection(points, hidden());

    AxisLimits x = result.axes->x_limits();
    AxisLimits y = result.axes->y_limits();
    EXPECT_FLOAT_EQ(x.min, -1.0f);
    EXPECT_FLOAT_EQ(x.max, 11.0f);
    EXPECT_FLOAT_EQ(y.min, -2.5f);
    EXPECT_FLOAT_EQ(y.max, 3.5f);
}

TEST(ProjectionPlotter, ZeroRangeGetsNoPadding)
{
    std::vector<vec3> flat   = {{1.0, 4.0, 0.0}, {3.0, 4.0, 0.0}};
    auto              result = plot_projection(flat, hidden());

    AxisLimits y = result.axes->y_limits();
    EXPECT_FLOAT_EQ(y.min, 4.0f);
    EXPECT_FLOAT_EQ(y.max, 4.0f);
}

TEST(ProjectionPlotter, PaddingUsesFullPrecisionInput)
{
    // Float spacing near 1e8 is 8; the 10-unit range must survive until the
    // limits are narrowed.
    std::vector<vec3> far    = {{1e8 + 1.0, 0.0, 0.0}, {1e8 + 11.0, 10.0, 0.0}};
    auto              result = plot_projection(far, hidden());

    AxisLimits x = result.axes->x_limits();
    EXPECT_EQ(x.min, static_cast<float>(1e8));
    EXPECT_EQ(x.max, static_cast<float>(1e8 + 12.0));
    EXPECT_NE(x.max, static_cast<float>(1e8 + 8.0));
}

TEST(ProjectionPlotter, PlotsFirstTwoCoordinates)
{
    auto points = zigzag();
    auto result = plot_projection(points, hidden());

    ASSERT_NE(result.curve, nullptr);
    ASSERT_EQ(result.curve->point_count(), 4u);
    EXPECT_FLOAT_EQ(result.curve->x_data()[1], 2.5f);
    EXPECT_FLOAT_EQ(result.curve->y_data()[2], -2.0f);
}

TEST(ProjectionPlotter, TicksAreSuppressed)
{
    auto points = zigzag();
    auto result = plot_projection(points, hidden());

    EXPECT_TRUE(result.axes->compute_x_ticks().positions.empty());
    EXPECT_TRUE(result.axes->compute_y_ticks().positions.empty());
}

TEST(ProjectionPlotter, AbsentCrossingsCreateNoSeries)
{
    auto points = zigzag();
    auto result = plot_projection(points, hidden());

    EXPECT_EQ(result.crossing_markers, nullptr);
    EXPECT_EQ(result.start_marker, nullptr);
    EXPECT_EQ(result.axes->series().size(), 1u);
}

TEST(ProjectionPlotter, EmptyCrossingsCreateEmptySeries)
{
    auto              points = zigzag();
    std::vector<vec2> none;
    auto              opts = hidden();
    opts.crossings         = std::span<const vec2>(none);

    auto result = plot_projection(points, opts);

    ASSERT_NE(result.crossing_markers, nullptr);
    EXPECT_EQ(result.crossing_markers->point_count(), 0u);
    EXPECT_EQ(result.axes->series().size(), 2u);

    // Limits still come from the curve alone
    EXPECT_FLOAT_EQ(result.axes->x_limits().min, -1.0f);

    // Streaming callers can fill it later
    result.crossing_markers->append(1.0f, 1.0f);
    EXPECT_EQ(result.crossing_markers->point_count(), 1u);
}

TEST(ProjectionPlotter, CrossingsAreTranslucentRed)
{
    auto              points    = zigzag();
    std::vector<vec2> crossings = {{1.0, 1.0}, {4.0, 0.5}};
    auto              opts      = hidden();
    opts.crossings              = std::span<const vec2>(crossings);

    auto result = plot_projection(points, opts);

    ASSERT_NE(result.crossing_markers, nullptr);
    EXPECT_EQ(result.crossing_markers->point_count(), 2u);
    EXPECT_EQ(result.crossing_markers->color(), colors::red);
    EXPECT_FLOAT_EQ(result.crossing_markers->opacity(), 0.5f);
    EXPECT_NE(result.crossing_markers->color(), result.curve->color());
}

TEST(ProjectionPlotter, StartMarkerAtFirstPoint)
{
    auto points     = zigzag();
    auto opts       = hidden();
    opts.mark_start = true;

    auto result = plot_projection(points, opts);

    ASSERT_NE(result.start_marker, nullptr);
    ASSERT_EQ(result.start_marker->point_count(), 1u);
    EXPECT_FLOAT_EQ(result.start_marker->x_data()[0], 0.0f);
    EXPECT_FLOAT_EQ(result.start_marker->y_data()[0], 0.0f);
    EXPECT_EQ(result.start_marker->color(), colors::blue);
}

TEST(ProjectionPlotter, DrawsIntoCallerAxes)
{
    Figure fig({.width = 400, .height = 300});
    Axes&  ax = fig.subplot(1, 2, 2);

    auto points = zigzag();
    auto opts   = hidden();
    opts.figure = &fig;
    opts.axes   = &ax;

    auto result = plot_projection(points, opts);

    EXPECT_EQ(result.owned_figure, nullptr);
    EXPECT_EQ(result.figure, &fig);
    EXPECT_EQ(result.axes, &ax);
    EXPECT_EQ(ax.series().size(), 1u);
}

TEST(ProjectionPlotter, FigureWithoutAxesIsInvalid)
{
    Figure fig;
    auto   points = zigzag();
    auto   opts   = hidden();
    opts.figure   = &fig;

    EXPECT_THROW(plot_projection(points, opts), std::invalid_argument);
}

TEST(ProjectionPlotter, NoPointsIsInvalid)
{
    std::vector<vec3> none;
    EXPECT_THROW(plot_projection(none, hidden()), std::invalid_argument);
}

TEST(ProjectionPlotter, ShowWritesSvg)
{
    auto dir = std::filesystem::temp_directory_path() / "knotview_projection_test";
    std::filesystem::create_directories(dir);

    RenderConfig config;
    config.output_dir    = dir.string();
    config.output_prefix = "projection";

    auto              points    = zigzag();
    std::vector<vec2> crossings = {{1.0, 1.0}};
    ProjectionOptions opts;
    opts.crossings = std::span<const vec2>(crossings);
    opts.config    = config;

    auto result = plot_projection(points, opts);

    ASSERT_FALSE(result.output_path.empty());
    ASSERT_TRUE(std::filesystem::exists(result.output_path));

    std::ifstream     in(result.output_path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("<polyline"), std::string::npos);
    EXPECT_NE(content.str().find("rgb(255,0,0)"), std::string::npos);

    std::filesystem::remove_all(dir);
}
