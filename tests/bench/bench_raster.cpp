#include <benchmark/benchmark.h>
#include <cmath>
#include <knotview/camera.hpp>
#include <knotview/tube.hpp>
#include <vector>

#include "../../src/render/raster/rasterizer.hpp"

using namespace knotview;

namespace
{

std::vector<vec3> trefoil(size_t n)
{
    std::vector<vec3> pts(n);
    for (size_t i = 0; i < n; ++i)
    {
        double t = static_cast<double>(i) / static_cast<double>(n) * 2.0 * 3.14159265358979323846;
        pts[i]   = {std::sin(t) + 2.0 * std::sin(2.0 * t),
                    std::cos(t) - 2.0 * std::cos(2.0 * t),
                    -std::sin(3.0 * t)};
    }
    return pts;
}

}   // namespace

static void BM_ParallelTransportFrames(benchmark::State& state)
{
    auto pts = trefoil(static_cast<size_t>(state.range(0)));
    for (auto _ : state)
    {
        auto frames = compute_parallel_transport_frames(pts);
        benchmark::DoNotOptimize(frames.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ParallelTransportFrames)->Arg(1000)->Arg(10000);

static void BM_BuildTube(benchmark::State& state)
{
    auto  pts   = trefoil(static_cast<size_t>(state.range(0)));
    Color one[] = {colors::red};
    for (auto _ : state)
    {
        auto mesh = build_tube(pts, one, 0.1, 8);
        benchmark::DoNotOptimize(mesh.indices.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_BuildTube)->Arg(1000)->Arg(10000);

static void BM_RasterizeTube(benchmark::State& state)
{
    auto  pts   = trefoil(2000);
    Color one[] = {colors::red};
    auto  mesh  = build_tube(pts, one, 0.15, 8);

    Camera cam;
    cam.set_up_axis(UpAxis::Z);
    cam.fit_to_bounds({-3, -3, -1}, {3, 3, 1});

    const auto side = static_cast<uint32_t>(state.range(0));
    Rasterizer target(side, side);
    mat4       view_proj = mat4_mul(cam.projection_matrix(1.0f), cam.view_matrix());

    std::vector<Rasterizer::Vertex> screen;
    screen.reserve(mesh.positions.size());
    for (size_t i = 0; i < mesh.positions.size(); ++i)
    {
        auto v = target.to_screen(mat4_mul_vec4(view_proj, vec4{mesh.positions[i], 1.0}), mesh.colors[i]);
        screen.push_back(v.value_or(Rasterizer::Vertex{}));
    }

    for (auto _ : state)
    {
        target.clear(colors::white);
        for (size_t t = 0; t + 2 < mesh.indices.size(); t += 3)
        {
            target.fill_triangle(screen[mesh.indices[t]], screen[mesh.indices[t + 1]], screen[mesh.indices[t + 2]]);
        }
        benchmark::DoNotOptimize(target.pixels().data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(mesh.triangle_count()));
}
BENCHMARK(BM_RasterizeTube)->Arg(256)->Arg(1024);

BENCHMARK_MAIN();
