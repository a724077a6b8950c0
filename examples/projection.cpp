#include <cmath>
#include <iostream>
#include <knotview/knotview.hpp>
#include <vector>

using namespace knotview;

int main()
{
    init_logging(RenderConfig::from_env());

    std::vector<vec3> points;
    for (int i = 0; i <= 300; ++i)
    {
        double t = static_cast<double>(i) / 300.0 * 2.0 * M_PI;
        points.push_back({std::sin(t) + 2.0 * std::sin(2.0 * t),
                          std::cos(t) - 2.0 * std::cos(2.0 * t),
                          -std::sin(3.0 * t)});
    }

    // Approximate crossing positions of the standard trefoil diagram
    std::vector<vec2> crossings;
    for (int k = 0; k < 3; ++k)
    {
        double a = M_PI / 2.0 + k * 2.0 * M_PI / 3.0;
        crossings.push_back({std::cos(a), std::sin(a)});
    }

    ProjectionOptions opts;
    opts.crossings  = std::span<const vec2>(crossings);
    opts.mark_start = true;

    auto result = plot_projection(points, opts);
    std::cout << "Wrote " << result.output_path << "\n";
    return 0;
}
