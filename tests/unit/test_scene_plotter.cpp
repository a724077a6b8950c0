#include <algorithm>
#include <array>
#include <gtest/gtest.h>
#include <knotview/errors.hpp>
#include <knotview/plot.hpp>
#include <set>
#include <tuple>
#include <vector>

#include "../util/mock_toolkit.hpp"

using namespace knotview;
using namespace knotview::test;

namespace
{

// `count` curves, each cut into two straight segments.
std::vector<CurveSegments> split_curves(int count)
{
    std::vector<CurveSegments> curves;
    for (int i = 0; i < count; ++i)
    {
        double        z = static_cast<double>(i);
        CurveSegments c;
        c.push_back({{0.0, 0.0, z}, {1.0, 0.0, z}, {1.0, 1.0, z}});
        c.push_back({{2.0, 1.0, z}, {2.0, 2.0, z}});
        curves.push_back(std::move(c));
    }
    return curves;
}

}   // namespace

TEST(ScenePlotter, ThreeCurvesTwoSegmentsEach)
{
    MockRegistry  mocks(true, false, false);
    Plotter       plotter(mocks.registry);
    ColorAssigner assigner(42u);
    auto          curves = split_curves(3);

    CellOptions opts;
    opts.colors = &assigner;
    plotter.cell(curves, opts);

    auto draws = mocks.opengl->draws();
    ASSERT_EQ(draws.size(), 6u);

    // Each curve's two segments share one uniform color; curves differ.
    std::set<std::tuple<float, float, float>> distinct;
    for (size_t i = 0; i < 6; i += 2)
    {
        ASSERT_EQ(draws[i].colors.size(), 1u);
        ASSERT_EQ(draws[i + 1].colors.size(), 1u);
        EXPECT_EQ(draws[i].colors[0], draws[i + 1].colors[0]);
        const Color& c = draws[i].colors[0];
        distinct.insert({c.r, c.g, c.b});
    }
    EXPECT_EQ(distinct.size(), 3u);

    // Only the very first draw is preceded by a clear.
    EXPECT_EQ(mocks.opengl->count(CallKind::Clear), 1u);
    ASSERT_GE(mocks.opengl->calls.size(), 2u);
    EXPECT_EQ(mocks.opengl->calls[0].kind, CallKind::Clear);
    EXPECT_EQ(mocks.opengl->calls[1].kind, CallKind::Tube);

    EXPECT_EQ(mocks.opengl->count(CallKind::Show), 1u);
    EXPECT_EQ(mocks.opengl->calls.back().kind, CallKind::Show);
}

TEST(ScenePlotter, ResolvesAndAcquiresOnce)
{
    MockRegistry mocks(false, true, true);
    Plotter      plotter(mocks.registry);
    auto         curves = split_curves(3);

    plotter.cell(curves);

    EXPECT_EQ(mocks.opengl->acquires, 1);
    EXPECT_EQ(mocks.svg->acquires, 2);   // availability check + scene context
    EXPECT_EQ(mocks.raster->acquires, 0);
    EXPECT_EQ(mocks.svg->count(CallKind::Polyline), 6u);
}

TEST(ScenePlotter, ColorsFollowSeededAssigner)
{
    MockRegistry  mocks(true, false, false);
    Plotter       plotter(mocks.registry);
    auto          curves = split_curves(4);
    ColorAssigner assigner(7u);
    ColorAssigner reference(7u);

    CellOptions opts;
    opts.colors = &assigner;
    plotter.cell(curves, opts);

    auto expected = reference.assign(4);
    auto draws    = mocks.opengl->draws();
    ASSERT_EQ(draws.size(), 8u);
    for (size_t i = 0; i < 4; ++i)
    {
        EXPECT_EQ(draws[2 * i].colors[0], expected[i]);
    }
}

TEST(ScenePlotter, NoClearAtAllWhenNotRequested)
{
    MockRegistry mocks(true, false, false);
    Plotter      plotter(mocks.registry);
    auto         curves = split_curves(2);

    CellOptions opts;
    opts.clear = false;
    plotter.cell(curves, opts);

    EXPECT_EQ(mocks.opengl->count(CallKind::Clear), 0u);
    EXPECT_EQ(mocks.opengl->draws().size(), 4u);
}

TEST(ScenePlotter, ScalarBoundaryDrawsCube)
{
    MockRegistry mocks(true, false, false);
    Plotter      plotter(mocks.registry);
    auto         curves = split_curves(1);

    CellOptions opts;
    opts.boundary = 5.0;
    plotter.cell(curves, opts);

    ASSERT_EQ(mocks.opengl->count(CallKind::Box), 1u);
    const auto& calls = mocks.opengl->calls;
    // Box after every segment, before show
    const auto& box_call = calls[calls.size() - 2];
    ASSERT_EQ(box_call.kind, CallKind::Box);
    EXPECT_EQ(box_call.box, (BoundingBox{0.0, 5.0, 0.0, 5.0, 0.0, 5.0}));
}

TEST(ScenePlotter, TripleBoundary)
{
    MockRegistry mocks(true, false, false);
    Plotter      plotter(mocks.registry);
    auto         curves = split_curves(1);

    CellOptions opts;
    opts.boundary = std::array<double, 3>{1.0, 2.0, 3.0};
    plotter.cell(curves, opts);

    auto it = std::find_if(mocks.opengl->calls.begin(),
                           mocks.opengl->calls.end(),
                           [](const Call& c) { return c.kind == CallKind::Box; });
    ASSERT_NE(it, mocks.opengl->calls.end());
    EXPECT_EQ(it->box, (BoundingBox{0.0, 1.0, 0.0, 2.0, 0.0, 3.0}));
}

TEST(ScenePlotter, InvalidBoundaryFailsBeforeDrawing)
{
    MockRegistry mocks(true, false, false);
    Plotter      plotter(mocks.registry);
    auto         curves = split_curves(2);

    CellOptions opts;
    opts.boundary = -1.0;
    EXPECT_THROW(plotter.cell(curves, opts), std::invalid_argument);
    EXPECT_EQ(mocks.opengl->acquires, 0);
}

TEST(ScenePlotter, ShortSegmentsAreSkipped)
{
    MockRegistry  mocks(true, false, false);
    Plotter       plotter(mocks.registry);
    CurveSegments curve;
    curve.push_back({{0.0, 0.0, 0.0}});
    curve.push_back({{0.0, 0.0, 0.0}, {1.0, 1.0, 1.0}});
    std::vector<CurveSegments> curves = {curve};

    plotter.cell(curves);

    auto draws = mocks.opengl->draws();
    ASSERT_EQ(draws.size(), 1u);
    EXPECT_EQ(draws[0].points, 2u);
    // The clear still lands on the first draw that happens.
    EXPECT_EQ(mocks.opengl->calls[0].kind, CallKind::Clear);
    EXPECT_EQ(mocks.opengl->count(CallKind::Clear), 1u);
}

TEST(ScenePlotter, EmptySceneStillClearsAndShows)
{
    MockRegistry               mocks(true, false, false);
    Plotter                    plotter(mocks.registry);
    std::vector<CurveSegments> curves;

    plotter.cell(curves);

    EXPECT_EQ(mocks.opengl->count(CallKind::Clear), 1u);
    EXPECT_EQ(mocks.opengl->count(CallKind::Show), 1u);
    EXPECT_TRUE(mocks.opengl->draws().empty());
}

TEST(ScenePlotter, DrawFailureAbortsScene)
{
    MockRegistry mocks(true, false, false);
    mocks.opengl_toolkit->set_fail_draws(true);
    Plotter plotter(mocks.registry);
    auto    curves = split_curves(2);

    EXPECT_THROW(plotter.cell(curves), RenderFailure);
    EXPECT_EQ(mocks.opengl->count(CallKind::Show), 0u);
}

TEST(ScenePlotter, MeshBackendSharesOneFrame)
{
    MockRegistry  mocks(false, false, true);
    Plotter       plotter(mocks.registry);
    CurveSegments a;
    a.push_back({{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}});
    CurveSegments b;
    b.push_back({{10.0, 0.0, 0.0}, {11.0, 0.0, 0.0}});
    std::vector<CurveSegments> curves = {a, b};

    CellOptions opts;
    opts.mode     = RenderMode::Raster;
    opts.boundary = 12.0;
    plotter.cell(curves, opts);

    // Tube, tube and box are each followed by the same scene-wide translation.
    const auto&       calls = mocks.raster->calls;
    std::vector<vec3> offsets;
    for (size_t i = 0; i + 1 < calls.size(); ++i)
    {
        if (calls[i].kind == CallKind::Tube || calls[i].kind == CallKind::Box)
        {
            ASSERT_EQ(calls[i + 1].kind, CallKind::Translation);
            offsets.push_back(calls[i + 1].translation);
        }
    }
    ASSERT_EQ(offsets.size(), 3u);
    for (const auto& o : offsets)
    {
        EXPECT_DOUBLE_EQ(o.x, -5.5);
        EXPECT_DOUBLE_EQ(o.y, 0.0);
        EXPECT_DOUBLE_EQ(o.z, 0.0);
    }

    // Curves keep their separation after recentring.
    double a_center = 0.5 + offsets[0].x;
    double b_center = 10.5 + offsets[1].x;
    EXPECT_DOUBLE_EQ(a_center, -5.0);
    EXPECT_DOUBLE_EQ(b_center, 5.0);

    // One camera, framed on the largest coordinate of any curve.
    ASSERT_EQ(mocks.raster->count(CallKind::Camera), 1u);
    const auto& camera = calls[calls.size() - 2];
    ASSERT_EQ(camera.kind, CallKind::Camera);
    EXPECT_DOUBLE_EQ(camera.camera.distance, 16.5);
    EXPECT_EQ(camera.camera.up_axis, UpAxis::Z);
    EXPECT_EQ(calls.back().kind, CallKind::Show);
}

TEST(ScenePlotter, TubeBackendIsNotRecentred)
{
    MockRegistry mocks(true, false, false);
    Plotter      plotter(mocks.registry);
    auto         curves = split_curves(2);

    CellOptions opts;
    opts.boundary = 3.0;
    plotter.cell(curves, opts);

    EXPECT_EQ(mocks.opengl->count(CallKind::Translation), 0u);
    EXPECT_EQ(mocks.opengl->count(CallKind::Camera), 0u);
}
