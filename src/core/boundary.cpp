#include <cmath>
#include <knotview/boundary.hpp>
#include <stdexcept>
#include <string>

namespace knotview
{

std::array<std::array<vec3, 2>, 12> BoundingBox::edges() const
{
    const vec3 c[8] = {
        {xmin, ymin, zmin},
        {xmax, ymin, zmin},
        {xmax, ymax, zmin},
        {xmin, ymax, zmin},
        {xmin, ymin, zmax},
        {xmax, ymin, zmax},
        {xmax, ymax, zmax},
        {xmin, ymax, zmax},
    };

    return {{
        {c[0], c[1]},
        {c[1], c[2]},
        {c[2], c[3]},
        {c[3], c[0]},
        {c[4], c[5]},
        {c[5], c[6]},
        {c[6], c[7]},
        {c[7], c[4]},
        {c[0], c[4]},
        {c[1], c[5]},
        {c[2], c[6]},
        {c[3], c[7]},
    }};
}

namespace
{

std::array<double, 3> expand_side(double side)
{
    return {side, side, side};
}

BoundingBox from_sides(const std::array<double, 3>& sides)
{
    for (double s : sides)
    {
        if (!std::isfinite(s) || s < 0.0)
            throw std::invalid_argument("boundary side length must be finite and non-negative, got "
                                        + std::to_string(s));
    }
    return {0.0, sides[0], 0.0, sides[1], 0.0, sides[2]};
}

BoundingBox from_extents(const std::array<double, 6>& e)
{
    for (double v : e)
    {
        if (!std::isfinite(v))
            throw std::invalid_argument("boundary extents must be finite");
    }
    static constexpr const char* axis_names[] = {"x", "y", "z"};
    for (int axis = 0; axis < 3; ++axis)
    {
        if (e[axis * 2] > e[axis * 2 + 1])
            throw std::invalid_argument(std::string("boundary ") + axis_names[axis]
                                        + "min is greater than " + axis_names[axis] + "max");
    }
    return {e[0], e[1], e[2], e[3], e[4], e[5]};
}

}   // anonymous namespace

BoundingBox normalize_boundary(const BoundarySpec& boundary)
{
    if (const auto* side = std::get_if<double>(&boundary))
        return from_sides(expand_side(*side));
    if (const auto* sides = std::get_if<std::array<double, 3>>(&boundary))
        return from_sides(*sides);
    return from_extents(std::get<std::array<double, 6>>(boundary));
}

BoundingBox normalize_boundary(std::span<const double> values)
{
    switch (values.size())
    {
        case 1:
            return normalize_boundary(BoundarySpec{values[0]});
        case 3:
            return normalize_boundary(BoundarySpec{std::array<double, 3>{values[0], values[1], values[2]}});
        case 6:
            return normalize_boundary(BoundarySpec{std::array<double, 6>{
                values[0], values[1], values[2], values[3], values[4], values[5]}});
        default:
            throw std::invalid_argument("boundary must have 1, 3 or 6 values, got "
                                        + std::to_string(values.size()));
    }
}

}   // namespace knotview
