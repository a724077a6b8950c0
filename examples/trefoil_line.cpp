#include <cmath>
#include <iostream>
#include <knotview/knotview.hpp>
#include <vector>

using namespace knotview;

int main(int argc, char** argv)
{
    init_logging(RenderConfig::from_env());

    // Trefoil knot, sampled densely enough for a smooth tube
    std::vector<vec3> points;
    for (int i = 0; i < 400; ++i)
    {
        double t = static_cast<double>(i) / 400.0 * 2.0 * M_PI;
        points.push_back({std::sin(t) + 2.0 * std::sin(2.0 * t),
                          std::cos(t) - 2.0 * std::cos(2.0 * t),
                          -std::sin(3.0 * t)});
    }
    points.push_back(points.front());

    LineOptions opts;
    opts.tube_radius = 0.15;
    opts.colormap    = ColormapType::Hsv;

    try
    {
        RenderMode  mode = argc > 1 ? parse_render_mode(argv[1]) : RenderMode::Auto;
        std::string path = plot_line(points, mode, opts);
        if (!path.empty())
            std::cout << "Wrote " << path << "\n";
    }
    catch (const Error& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
