#pragma once

#include <knotview/math3d.hpp>

namespace knotview
{

enum class UpAxis
{
    Y,
    Z,
};

// Orbiting (turntable) camera: position is derived from target, azimuth,
// elevation and distance around the configured up axis.
class Camera
{
   public:
    enum class ProjectionMode
    {
        Perspective,
        Orthographic
    };

    vec3   position{0.0, 0.0, 5.0};
    vec3   target{0.0, 0.0, 0.0};
    UpAxis up_axis = UpAxis::Y;

    ProjectionMode projection_mode = ProjectionMode::Perspective;
    float          fov             = 45.0f;
    float          near_clip       = 0.01f;
    float          far_clip        = 1000.0f;
    float          ortho_size      = 10.0f;

    float azimuth   = 45.0f;
    float elevation = 30.0f;
    float distance  = 5.0f;

    Camera() = default;

    Camera& set_azimuth(float a)
    {
        azimuth = a;
        update_position_from_orbit();
        return *this;
    }
    Camera& set_elevation(float e)
    {
        elevation = e;
        update_position_from_orbit();
        return *this;
    }
    Camera& set_distance(float d)
    {
        distance = d;
        update_position_from_orbit();
        return *this;
    }
    Camera& set_target(vec3 t)
    {
        target = t;
        update_position_from_orbit();
        return *this;
    }
    Camera& set_up_axis(UpAxis axis)
    {
        up_axis = axis;
        update_position_from_orbit();
        return *this;
    }
    Camera& set_projection(ProjectionMode m)
    {
        projection_mode = m;
        return *this;
    }

    vec3 up() const { return up_axis == UpAxis::Z ? vec3{0.0, 0.0, 1.0} : vec3{0.0, 1.0, 0.0}; }

    mat4 view_matrix() const;
    mat4 projection_matrix(float aspect_ratio) const;

    void orbit(float d_azimuth, float d_elevation);
    void zoom(float factor);

    void fit_to_bounds(vec3 min_bound, vec3 max_bound);
    void reset();

    void update_position_from_orbit();
};

}   // namespace knotview
