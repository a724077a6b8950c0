#include <cmath>
#include <gtest/gtest.h>
#include <knotview/axes.hpp>
#include <vector>

using namespace knotview;

// --- Automatic ticks ---

TEST(TickGeneration, PositiveRange)
{
    Axes ax;
    ax.xlim(0.0f, 10.0f);
    auto ticks = ax.compute_x_ticks();
    ASSERT_EQ(ticks.positions.size(), 6u);
    EXPECT_EQ(ticks.positions.size(), ticks.labels.size());
    EXPECT_FLOAT_EQ(ticks.positions.front(), 0.0f);
    EXPECT_FLOAT_EQ(ticks.positions.back(), 10.0f);
    EXPECT_EQ(ticks.labels.front(), "0");
    EXPECT_EQ(ticks.labels.back(), "10");
}

TEST(TickGeneration, NegativeRange)
{
    Axes ax;
    ax.xlim(-100.0f, -10.0f);
    auto ticks = ax.compute_x_ticks();
    EXPECT_GE(ticks.positions.size(), 2u);
    for (float v : ticks.positions)
    {
        EXPECT_GE(v, -100.1f);
        EXPECT_LE(v, -9.9f);
    }
}

TEST(TickGeneration, CrossingZeroHasPlainZeroLabel)
{
    Axes ax;
    ax.xlim(-1.0f, 1.0f);
    auto ticks = ax.compute_x_ticks();
    std::vector<std::string> expected = {"-1", "-0.5", "0", "0.5", "1"};
    EXPECT_EQ(ticks.labels, expected);
}

TEST(TickGeneration, ZeroRangeGivesSingleTick)
{
    Axes ax;
    ax.xlim(5.0f, 5.0f);
    auto ticks = ax.compute_x_ticks();
    ASSERT_EQ(ticks.positions.size(), 1u);
    EXPECT_FLOAT_EQ(ticks.positions[0], 5.0f);
    EXPECT_EQ(ticks.labels.size(), 1u);
}

TEST(TickGeneration, LargeValuesUseScientificLabels)
{
    Axes ax;
    ax.xlim(0.0f, 1e6f);
    auto ticks = ax.compute_x_ticks();
    ASSERT_GE(ticks.labels.size(), 2u);
    EXPECT_NE(ticks.labels[1].find('e'), std::string::npos);
}

TEST(TickGeneration, YTicksFollowYLimits)
{
    Axes ax;
    ax.ylim(0.0f, 100.0f);
    auto ticks = ax.compute_y_ticks();
    EXPECT_GE(ticks.positions.size(), 3u);
    EXPECT_LE(ticks.positions.back(), 100.0f + 1e-3f);
}

// --- Explicit ticks ---

TEST(ExplicitTicks, PositionsAndLabels)
{
    Axes ax;
    ax.xlim(0.0f, 10.0f);
    std::vector<float> pos = {1.0f, 2.5f};
    ax.xticks(pos);
    auto ticks = ax.compute_x_ticks();
    EXPECT_EQ(ticks.positions, pos);
    std::vector<std::string> expected = {"1", "2.5"};
    EXPECT_EQ(ticks.labels, expected);
}

TEST(ExplicitTicks, EmptySetHidesTicks)
{
    Axes ax;
    ax.xticks({});
    ax.yticks({});
    EXPECT_TRUE(ax.compute_x_ticks().positions.empty());
    EXPECT_TRUE(ax.compute_y_ticks().labels.empty());
}

TEST(ExplicitTicks, ClearRestoresAutomatic)
{
    Axes ax;
    ax.xlim(0.0f, 10.0f);
    ax.xticks({});
    ax.clear_xticks();
    EXPECT_FALSE(ax.compute_x_ticks().positions.empty());
}

// --- Limits ---

TEST(AxesLimits, ExplicitLimitsWin)
{
    Axes  ax;
    float x[] = {0.0f, 100.0f};
    float y[] = {0.0f, 100.0f};
    ax.line(x, y);
    ax.xlim(-1.0f, 11.0f);
    EXPECT_FLOAT_EQ(ax.x_limits().min, -1.0f);
    EXPECT_FLOAT_EQ(ax.x_limits().max, 11.0f);
}

TEST(AxesLimits, AutoFitPadsDataExtent)
{
    Axes  ax;
    float x[] = {0.0f, 10.0f};
    float y[] = {-1.0f, 1.0f};
    ax.line(x, y);
    ax.auto_fit();
    EXPECT_FLOAT_EQ(ax.x_limits().min, -0.5f);
    EXPECT_FLOAT_EQ(ax.x_limits().max, 10.5f);
    EXPECT_NEAR(ax.y_limits().min, -1.1f, 1e-6f);
    EXPECT_NEAR(ax.y_limits().max, 1.1f, 1e-6f);
}

TEST(AxesLimits, SinglePointGetsUnitWindow)
{
    Axes  ax;
    float x[] = {3.0f};
    float y[] = {3.0f};
    ax.scatter(x, y);
    EXPECT_FLOAT_EQ(ax.x_limits().min, 2.5f);
    EXPECT_FLOAT_EQ(ax.x_limits().max, 3.5f);
}

TEST(AxesLimits, EmptyAxesDefaultRange)
{
    Axes ax;
    EXPECT_NEAR(ax.x_limits().min, -0.05f, 1e-6f);
    EXPECT_NEAR(ax.x_limits().max, 1.05f, 1e-6f);
}

// --- Series ---

TEST(AxesSeries, ColorsCycleThroughPalette)
{
    Axes  ax;
    float x[] = {0.0f, 1.0f};
    auto& a   = ax.line(x, x);
    auto& b   = ax.scatter(x, x);
    EXPECT_EQ(a.color(), palette::default_cycle[0]);
    EXPECT_EQ(b.color(), palette::default_cycle[1]);
    EXPECT_EQ(ax.series().size(), 2u);

    ax.clear_series();
    EXPECT_TRUE(ax.series().empty());
}
