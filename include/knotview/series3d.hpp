#pragma once

#include <knotview/math3d.hpp>
#include <knotview/series.hpp>
#include <span>
#include <vector>

namespace knotview
{

// World-space polyline. Coordinates are narrowed to float on construction.
class LineSeries3D : public Series
{
   public:
    explicit LineSeries3D(std::span<const vec3> points);

    // Shifts every vertex by `offset`.
    void translate(vec3 offset);

    LineSeries3D& width(float w)
    {
        line_width_ = w;
        return *this;
    }
    float width() const { return line_width_; }

    std::span<const float> x_data() const { return x_; }
    std::span<const float> y_data() const { return y_; }
    std::span<const float> z_data() const { return z_; }
    size_t                 point_count() const { return x_.size(); }

    // Both corners are the origin for an empty series.
    void get_bounds(vec3& min_out, vec3& max_out) const;

   private:
    std::vector<float> x_;
    std::vector<float> y_;
    std::vector<float> z_;
    float              line_width_ = 2.0f;
};

}   // namespace knotview
