#include <gtest/gtest.h>
#include <knotview/camera.hpp>

#include "../../src/render/raster/rasterizer.hpp"

using namespace knotview;

namespace
{

Rasterizer::Vertex v(float x, float y, float z, Color c = colors::red)
{
    Rasterizer::Vertex out;
    out.x     = x;
    out.y     = y;
    out.z     = z;
    out.color = c;
    return out;
}

}   // namespace

TEST(Rasterizer, ZeroSizeThrows)
{
    EXPECT_THROW(Rasterizer(0, 10), std::invalid_argument);
    EXPECT_THROW(Rasterizer(10, 0), std::invalid_argument);
}

TEST(Rasterizer, ClearResetsColorAndDepth)
{
    Rasterizer r(4, 3);
    r.clear(colors::black);
    EXPECT_EQ(r.pixels().size(), 4u * 3u * 4u);
    EXPECT_EQ(r.pixel(2, 1), colors::black);
    EXPECT_FLOAT_EQ(r.depth(2, 1), 1.0f);
    EXPECT_EQ(r.covered(), 0u);
}

TEST(Rasterizer, FillsTriangleInterior)
{
    Rasterizer r(16, 16);
    r.clear(colors::white);
    r.fill_triangle(v(0, 0, 0.5f), v(16, 0, 0.5f), v(0, 16, 0.5f));

    EXPECT_EQ(r.pixel(2, 2), colors::red);
    EXPECT_EQ(r.pixel(14, 14), colors::white);
    EXPECT_GT(r.covered(), 100u);
    EXPECT_LT(r.covered(), 256u);
}

TEST(Rasterizer, EitherWindingFills)
{
    Rasterizer cw(8, 8);
    Rasterizer ccw(8, 8);
    // No pixel centre lies on an edge.
    cw.fill_triangle(v(0.25f, 0.25f, 0.5f), v(8.1f, 0.25f, 0.5f), v(0.25f, 8.1f, 0.5f));
    ccw.fill_triangle(v(0.25f, 0.25f, 0.5f), v(0.25f, 8.1f, 0.5f), v(8.1f, 0.25f, 0.5f));
    EXPECT_GT(cw.covered(), 0u);
    EXPECT_EQ(cw.covered(), ccw.covered());
    EXPECT_EQ(cw.pixels(), ccw.pixels());
}

TEST(Rasterizer, DegenerateTriangleDrawsNothing)
{
    Rasterizer r(8, 8);
    r.fill_triangle(v(0, 0, 0.5f), v(4, 4, 0.5f), v(8, 8, 0.5f));
    EXPECT_EQ(r.covered(), 0u);
}

TEST(Rasterizer, NearerFragmentWins)
{
    Rasterizer r(8, 8);
    r.fill_triangle(v(0, 0, 0.2f, colors::blue), v(8, 0, 0.2f, colors::blue), v(0, 8, 0.2f, colors::blue));
    r.fill_triangle(v(0, 0, 0.7f, colors::red), v(8, 0, 0.7f, colors::red), v(0, 8, 0.7f, colors::red));
    EXPECT_EQ(r.pixel(1, 1), colors::blue);
    EXPECT_FLOAT_EQ(r.depth(1, 1), 0.2f);

    r.fill_triangle(v(0, 0, 0.1f, colors::green), v(8, 0, 0.1f, colors::green), v(0, 8, 0.1f, colors::green));
    EXPECT_EQ(r.pixel(1, 1), colors::green);
}

TEST(Rasterizer, GouraudInterpolatesColor)
{
    Rasterizer r(64, 64);
    r.fill_triangle(v(0, 0, 0.5f, colors::red), v(64, 0, 0.5f, colors::red), v(0, 64, 0.5f, colors::blue));
    Color top    = r.pixel(5, 1);
    Color bottom = r.pixel(1, 58);
    EXPECT_GT(top.r, top.b);
    EXPECT_GT(bottom.b, bottom.r);
}

TEST(Rasterizer, LineCoversEndpoints)
{
    Rasterizer r(10, 10);
    r.draw_line(v(0.5f, 0.5f, 0.5f), v(9.5f, 0.5f, 0.5f));
    EXPECT_EQ(r.pixel(0, 0), colors::red);
    EXPECT_EQ(r.pixel(9, 0), colors::red);
    EXPECT_EQ(r.covered(), 10u);
}

TEST(Rasterizer, LineIsClippedToTarget)
{
    Rasterizer r(4, 4);
    r.draw_line(v(-10.0f, 1.5f, 0.5f), v(20.0f, 1.5f, 0.5f));
    EXPECT_EQ(r.covered(), 4u);
}

TEST(Rasterizer, OutOfRangeDepthIsDropped)
{
    Rasterizer r(4, 4);
    r.draw_line(v(0.5f, 0.5f, 1.5f), v(3.5f, 0.5f, 1.5f));
    r.draw_line(v(0.5f, 1.5f, -0.5f), v(3.5f, 1.5f, -0.5f));
    EXPECT_EQ(r.covered(), 0u);
}

TEST(Rasterizer, ToScreenMapsNdcToPixels)
{
    Rasterizer r(200, 100);

    auto centre = r.to_screen({0.0, 0.0, 0.5, 1.0}, colors::red);
    ASSERT_TRUE(centre.has_value());
    EXPECT_FLOAT_EQ(centre->x, 100.0f);
    EXPECT_FLOAT_EQ(centre->y, 50.0f);
    EXPECT_FLOAT_EQ(centre->z, 0.5f);

    // Homogeneous divide, Y down.
    auto corner = r.to_screen({2.0, 2.0, 0.0, 2.0}, colors::red);
    ASSERT_TRUE(corner.has_value());
    EXPECT_FLOAT_EQ(corner->x, 200.0f);
    EXPECT_FLOAT_EQ(corner->y, 100.0f);
}

TEST(Rasterizer, ToScreenRejectsBehindEyeAndFarPlane)
{
    Rasterizer r(10, 10);
    EXPECT_FALSE(r.to_screen({0.0, 0.0, 0.5, 0.0}, colors::red).has_value());
    EXPECT_FALSE(r.to_screen({0.0, 0.0, 0.5, -1.0}, colors::red).has_value());
    EXPECT_FALSE(r.to_screen({0.0, 0.0, 2.0, 1.0}, colors::red).has_value());
    EXPECT_FALSE(r.to_screen({0.0, 0.0, -0.1, 1.0}, colors::red).has_value());
}

TEST(Rasterizer, CameraTargetProjectsToCentre)
{
    Camera cam;
    cam.set_target({1.0, 2.0, 3.0});
    cam.set_distance(5.0f);
    cam.update_position_from_orbit();

    Rasterizer r(100, 80);
    mat4       vp = mat4_mul(cam.projection_matrix(100.0f / 80.0f), cam.view_matrix());
    auto       s  = r.to_screen(mat4_mul_vec4(vp, vec4(cam.target, 1.0)), colors::red);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(s->x, 50.0f, 1e-3f);
    EXPECT_NEAR(s->y, 40.0f, 1e-3f);
}
