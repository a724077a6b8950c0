#include <knotview/axes3d.hpp>

namespace knotview
{

Axes3D::Axes3D() : camera_(std::make_unique<Camera>())
{
    camera_->target    = {0.0, 0.0, 0.0};
    camera_->up_axis   = UpAxis::Z;
    camera_->azimuth   = -60.0f;
    camera_->elevation = 30.0f;
    camera_->distance  = 8.66f;
    camera_->update_position_from_orbit();
}

Axes3D::~Axes3D() = default;

void Axes3D::auto_fit()
{
    bool has_bounds = false;
    vec3 global_min;
    vec3 global_max;

    for (auto& s : series_)
    {
        auto* ls = dynamic_cast<LineSeries3D*>(s.get());
        if (!ls || ls->point_count() == 0)
            continue;

        vec3 s_min, s_max;
        ls->get_bounds(s_min, s_max);
        if (!has_bounds)
        {
            global_min = s_min;
            global_max = s_max;
            has_bounds = true;
        }
        else
        {
            global_min = vec3_min(global_min, s_min);
            global_max = vec3_max(global_max, s_max);
        }
    }

    if (!has_bounds)
    {
        for (auto& lim : limits_)
            lim = AxisLimits{-1.0f, 1.0f};
        return;
    }

    // Pad degenerate axes so every limit pair has non-zero width.
    auto set_axis = [](double lo, double hi)
    {
        if (hi - lo < 1e-9)
        {
            lo -= 0.5;
            hi += 0.5;
        }
        return AxisLimits{static_cast<float>(lo), static_cast<float>(hi)};
    };
    limits_[0] = set_axis(global_min.x, global_max.x);
    limits_[1] = set_axis(global_min.y, global_max.y);
    limits_[2] = set_axis(global_min.z, global_max.z);

    camera_->fit_to_bounds(global_min, global_max);
}

LineSeries3D& Axes3D::line3d(std::span<const vec3> points)
{
    auto  s   = std::make_unique<LineSeries3D>(points);
    auto& ref = *s;
    ref.set_color(palette::default_cycle[series_.size() % palette::default_cycle_size]);
    series_.push_back(std::move(s));
    return ref;
}

}   // namespace knotview
