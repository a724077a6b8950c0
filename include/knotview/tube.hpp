#pragma once

#include <cstdint>
#include <knotview/color.hpp>
#include <knotview/math3d.hpp>
#include <span>
#include <vector>

namespace knotview
{

// Orthonormal frame carried along a polyline.
struct CurveFrame
{
    vec3 position;
    vec3 tangent;
    vec3 normal;
    vec3 binormal;
};

// Triangle mesh of a tube swept around a polyline. Vertex i*sides + j is
// corner j of the ring around point i.
struct TubeMesh
{
    std::vector<vec3>     positions;
    std::vector<vec3>     normals;
    std::vector<Color>    colors;
    std::vector<uint32_t> indices;   // triangles, counter-clockwise seen from outside
    int                   sides = 0;

    size_t ring_count() const { return sides > 0 ? positions.size() / sides : 0; }
    size_t triangle_count() const { return indices.size() / 3; }
};

// Rotation-minimizing frames: the normal is transported from point to point
// by the rotation between successive tangents. Zero-length steps reuse the
// previous tangent. Returns an empty vector for fewer than 2 points.
std::vector<CurveFrame> compute_parallel_transport_frames(std::span<const vec3> points);

// Builds the tube mesh. `colors` holds one color for the whole tube or one
// per point. Throws std::invalid_argument for fewer than 2 points, fewer than
// 3 sides, a non-positive radius or a color count that is neither 1 nor
// points.size().
TubeMesh build_tube(std::span<const vec3>  points,
                    std::span<const Color> colors,
                    double                 radius,
                    int                    sides);

}   // namespace knotview
