#include <cmath>
#include <iostream>
#include <knotview/knotview.hpp>
#include <random>
#include <vector>

using namespace knotview;

// Random walks folded back into a periodic cell, split wherever they wrap.
int main()
{
    init_logging(RenderConfig::from_env());

    constexpr double side = 10.0;
    std::mt19937     rng(2024);
    std::normal_distribution<double> step(0.0, 0.4);

    std::vector<CurveSegments> curves(4);
    for (auto& curve : curves)
    {
        vec3              p{side / 2.0, side / 2.0, side / 2.0};
        std::vector<vec3> segment = {p};
        for (int i = 0; i < 300; ++i)
        {
            p += vec3{step(rng), step(rng), step(rng)};
            vec3 wrapped{std::fmod(p.x + 10 * side, side),
                         std::fmod(p.y + 10 * side, side),
                         std::fmod(p.z + 10 * side, side)};
            if (vec3_length(wrapped - segment.back()) > side / 2.0)
            {
                curve.push_back(std::move(segment));
                segment.clear();
            }
            segment.push_back(wrapped);
        }
        curve.push_back(std::move(segment));
    }

    CellOptions opts;
    opts.boundary         = BoundarySpec{side};
    opts.line.tube_radius = 0.08;

    try
    {
        std::cout << "Wrote " << plot_cell(curves, opts) << "\n";
    }
    catch (const Error& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
