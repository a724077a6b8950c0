#include <knotview/series3d.hpp>

namespace knotview
{

LineSeries3D::LineSeries3D(std::span<const vec3> points)
{
    x_.reserve(points.size());
    y_.reserve(points.size());
    z_.reserve(points.size());
    for (const vec3& p : points)
    {
        x_.push_back(static_cast<float>(p.x));
        y_.push_back(static_cast<float>(p.y));
        z_.push_back(static_cast<float>(p.z));
    }
}

void LineSeries3D::translate(vec3 offset)
{
    for (size_t i = 0; i < x_.size(); ++i)
    {
        x_[i] += static_cast<float>(offset.x);
        y_[i] += static_cast<float>(offset.y);
        z_[i] += static_cast<float>(offset.z);
    }
}

void LineSeries3D::get_bounds(vec3& min_out, vec3& max_out) const
{
    if (x_.empty())
    {
        min_out = max_out = vec3{};
        return;
    }

    min_out = {x_[0], y_[0], z_[0]};
    max_out = min_out;
    for (size_t i = 1; i < x_.size(); ++i)
    {
        vec3 p{x_[i], y_[i], z_[i]};
        min_out = vec3_min(min_out, p);
        max_out = vec3_max(max_out, p);
    }
}

}   // namespace knotview
