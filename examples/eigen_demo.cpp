// Eigen integration demo: pass N×3 and N×2 matrices straight to knotview.
// Build with: cmake -DKNOTVIEW_USE_EIGEN=ON ..

#include <cmath>
#include <eigen3/Eigen/Core>
#include <iostream>
#include <knotview/eigen.hpp>

int main()
{
    knotview::init_logging(knotview::RenderConfig::from_env());

    // (2,3) torus knot
    const int       N = 400;
    Eigen::VectorXd t = Eigen::VectorXd::LinSpaced(N, 0.0, 2.0 * M_PI);
    Eigen::ArrayXd  r = 2.0 + (3.0 * t.array()).cos();

    Eigen::MatrixX3d knot(N, 3);
    knot.col(0) = (r * (2.0 * t.array()).cos()).matrix();
    knot.col(1) = (r * (2.0 * t.array()).sin()).matrix();
    knot.col(2) = (-(3.0 * t.array()).sin()).matrix();

    try
    {
        knotview::LineOptions opts;
        opts.tube_radius = 0.2;
        opts.colormap    = knotview::ColormapType::Viridis;
        std::cout << "Line: " << knotview::plot_line(knot, knotview::RenderMode::Auto, opts) << "\n";

        auto projection = knotview::plot_projection(knot);
        std::cout << "Projection: " << projection.output_path << "\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
