#pragma once

#include <array>
#include <knotview/math3d.hpp>
#include <span>
#include <variant>

namespace knotview
{

// Axis-aligned box, min <= max on every axis.
struct BoundingBox
{
    double xmin = 0.0, xmax = 0.0;
    double ymin = 0.0, ymax = 0.0;
    double zmin = 0.0, zmax = 0.0;

    vec3 min_corner() const { return {xmin, ymin, zmin}; }
    vec3 max_corner() const { return {xmax, ymax, zmax}; }

    std::array<double, 6> as_array() const { return {xmin, xmax, ymin, ymax, zmin, zmax}; }

    // The 12 edges as pairs of corners, in a fixed order.
    std::array<std::array<vec3, 2>, 12> edges() const;

    bool operator==(const BoundingBox& o) const { return as_array() == o.as_array(); }
};

// Cube side, per-axis side lengths (boxes anchored at the origin), or explicit
// (xmin, xmax, ymin, ymax, zmin, zmax).
using BoundarySpec = std::variant<double, std::array<double, 3>, std::array<double, 6>>;

// Throws std::invalid_argument for negative sides, non-finite values or
// min > max on any axis.
BoundingBox normalize_boundary(const BoundarySpec& boundary);

// Runtime-sized form: 1, 3 or 6 values. Other lengths throw
// std::invalid_argument.
BoundingBox normalize_boundary(std::span<const double> values);

}   // namespace knotview
