#pragma once

#include <knotview/axes.hpp>
#include <knotview/camera.hpp>
#include <knotview/math3d.hpp>
#include <knotview/series3d.hpp>
#include <memory>
#include <span>

namespace knotview
{

// 3D subplot: world-space polylines seen through a turntable camera, with an
// optional wireframe of the data bounds.
class Axes3D : public AxesBase
{
   public:
    Axes3D();
    ~Axes3D();

    LineSeries3D& line3d(std::span<const vec3> points);

    // Limits are the data bounds after auto_fit(); [0, 1] before it.
    AxisLimits x_limits() const { return limits_[0]; }
    AxisLimits y_limits() const { return limits_[1]; }
    AxisLimits z_limits() const { return limits_[2]; }

    // Fits limits to all series and points the camera at their center.
    void auto_fit() override;

    Camera&       camera() { return *camera_; }
    const Camera& camera() const { return *camera_; }

    bool show_bounding_box() const { return show_bounding_box_; }
    void show_bounding_box(bool enabled) { show_bounding_box_ = enabled; }

   private:
    AxisLimits              limits_[3];
    std::unique_ptr<Camera> camera_;
    bool                    show_bounding_box_ = true;
};

}   // namespace knotview
