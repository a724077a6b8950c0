#include <algorithm>
#include <cmath>
#include <knotview/camera.hpp>

namespace knotview
{

mat4 Camera::view_matrix() const
{
    return mat4_look_at(position, target, up());
}

mat4 Camera::projection_matrix(float aspect_ratio) const
{
    if (projection_mode == ProjectionMode::Perspective)
    {
        return mat4_perspective(deg_to_rad(fov), aspect_ratio, near_clip, far_clip);
    }
    else
    {
        float half_w = ortho_size * aspect_ratio;
        float half_h = ortho_size;
        return mat4_ortho(-half_w, half_w, -half_h, half_h, near_clip, far_clip);
    }
}

void Camera::orbit(float d_azimuth, float d_elevation)
{
    azimuth += d_azimuth;
    elevation += d_elevation;

    while (azimuth < 0.0f)
        azimuth += 360.0f;
    while (azimuth >= 360.0f)
        azimuth -= 360.0f;

    elevation = clampf(elevation, -89.0f, 89.0f);

    update_position_from_orbit();
}

void Camera::zoom(float factor)
{
    if (projection_mode == ProjectionMode::Perspective)
    {
        distance *= factor;
        distance = clampf(distance, 0.1f, 10000.0f);
        update_position_from_orbit();
    }
    else
    {
        ortho_size *= factor;
        ortho_size = clampf(ortho_size, 0.1f, 10000.0f);
    }
}

void Camera::fit_to_bounds(vec3 min_bound, vec3 max_bound)
{
    vec3   center     = (min_bound + max_bound) * 0.5;
    vec3   extent     = max_bound - min_bound;
    double max_extent = std::max({extent.x, extent.y, extent.z});

    if (max_extent < 1e-6)
    {
        max_extent = 1.0;
    }

    target = center;

    if (projection_mode == ProjectionMode::Perspective)
    {
        float fov_rad = deg_to_rad(fov);
        distance = static_cast<float>(max_extent / (2.0 * std::tan(fov_rad * 0.5f)) * 1.5);
    }
    else
    {
        ortho_size = static_cast<float>(max_extent * 0.6);
        distance   = static_cast<float>(max_extent * 2.0);
    }

    far_clip = std::max(far_clip, distance * 4.0f);
    update_position_from_orbit();
}

void Camera::reset()
{
    position        = {0.0, 0.0, 5.0};
    target          = {0.0, 0.0, 0.0};
    up_axis         = UpAxis::Y;
    azimuth         = 45.0f;
    elevation       = 30.0f;
    distance        = 5.0f;
    fov             = 45.0f;
    ortho_size      = 10.0f;
    projection_mode = ProjectionMode::Perspective;
}

void Camera::update_position_from_orbit()
{
    double az_rad = deg_to_rad(azimuth);
    double el_rad = deg_to_rad(elevation);

    double cos_el = std::cos(el_rad);
    vec3   offset;
    if (up_axis == UpAxis::Z)
    {
        offset = {distance * cos_el * std::cos(az_rad),
                  distance * cos_el * std::sin(az_rad),
                  distance * std::sin(el_rad)};
    }
    else
    {
        offset = {distance * cos_el * std::cos(az_rad),
                  distance * std::sin(el_rad),
                  distance * cos_el * std::sin(az_rad)};
    }

    position = target + offset;
}

}   // namespace knotview
