#include <algorithm>
#include <cmath>
#include <knotview/tube.hpp>
#include <stdexcept>

namespace knotview
{

namespace
{

constexpr double kPi = 3.14159265358979323846;

// Unit vector perpendicular to v, built from the world axis least aligned with it.
vec3 find_perpendicular(vec3 v)
{
    double ax = std::abs(v.x);
    double ay = std::abs(v.y);
    double az = std::abs(v.z);
    if (ax < ay && ax < az)
        return vec3_normalize(vec3_cross(v, {1.0, 0.0, 0.0}));
    if (ay < az)
        return vec3_normalize(vec3_cross(v, {0.0, 1.0, 0.0}));
    return vec3_normalize(vec3_cross(v, {0.0, 0.0, 1.0}));
}

// Rodrigues rotation of v about a unit axis.
vec3 rotate(vec3 v, vec3 axis, double c, double s)
{
    return v * c + vec3_cross(axis, v) * s + axis * (vec3_dot(axis, v) * (1.0 - c));
}

std::vector<vec3> polyline_tangents(std::span<const vec3> points)
{
    const size_t      n = points.size();
    std::vector<vec3> tangents(n);

    for (size_t i = 0; i < n; ++i)
    {
        vec3 prev = points[i == 0 ? 0 : i - 1];
        vec3 next = points[i + 1 == n ? n - 1 : i + 1];
        tangents[i] = vec3_normalize(next - prev);
    }

    // Fill gaps left by repeated points from the nearest valid neighbour.
    vec3 last{1.0, 0.0, 0.0};
    auto first_valid = std::find_if(tangents.begin(),
                                    tangents.end(),
                                    [](vec3 t) { return vec3_length(t) > 0.5; });
    if (first_valid != tangents.end())
        last = *first_valid;
    for (auto& t : tangents)
    {
        if (vec3_length(t) < 0.5)
            t = last;
        else
            last = t;
    }
    return tangents;
}

}   // anonymous namespace

std::vector<CurveFrame> compute_parallel_transport_frames(std::span<const vec3> points)
{
    std::vector<CurveFrame> frames;
    if (points.size() < 2)
        return frames;

    auto tangents = polyline_tangents(points);
    frames.reserve(points.size());

    CurveFrame first;
    first.position = points[0];
    first.tangent  = tangents[0];
    first.normal   = find_perpendicular(first.tangent);
    first.binormal = vec3_normalize(vec3_cross(first.tangent, first.normal));
    frames.push_back(first);

    for (size_t i = 1; i < points.size(); ++i)
    {
        const CurveFrame& prev = frames.back();

        CurveFrame frame;
        frame.position = points[i];
        frame.tangent  = tangents[i];

        vec3   axis     = vec3_cross(prev.tangent, frame.tangent);
        double axis_len = vec3_length(axis);
        if (axis_len > 1e-9)
        {
            axis          = axis / axis_len;
            double cos_a  = std::clamp(vec3_dot(prev.tangent, frame.tangent), -1.0, 1.0);
            double angle  = std::acos(cos_a);
            frame.normal  = rotate(prev.normal, axis, std::cos(angle), std::sin(angle));
        }
        else
        {
            frame.normal = prev.normal;
        }

        // Re-orthonormalize to prevent drift
        frame.binormal = vec3_normalize(vec3_cross(frame.tangent, frame.normal));
        frame.normal   = vec3_normalize(vec3_cross(frame.binormal, frame.tangent));
        frames.push_back(frame);
    }

    return frames;
}

TubeMesh build_tube(std::span<const vec3>  points,
                    std::span<const Color> colors,
                    double                 radius,
                    int                    sides)
{
    if (points.size() < 2)
        throw std::invalid_argument("tube needs at least 2 points");
    if (sides < 3)
        throw std::invalid_argument("tube needs at least 3 sides");
    if (!(radius > 0.0))
        throw std::invalid_argument("tube radius must be positive");
    if (colors.size() != 1 && colors.size() != points.size())
        throw std::invalid_argument("tube colors must have 1 or one-per-point entries");

    auto frames = compute_parallel_transport_frames(points);

    TubeMesh mesh;
    mesh.sides = sides;
    const size_t vertex_count = points.size() * static_cast<size_t>(sides);
    mesh.positions.reserve(vertex_count);
    mesh.normals.reserve(vertex_count);
    mesh.colors.reserve(vertex_count);

    for (size_t i = 0; i < frames.size(); ++i)
    {
        const auto& f = frames[i];
        const Color c = colors.size() == 1 ? colors[0] : colors[i];
        for (int j = 0; j < sides; ++j)
        {
            double angle  = 2.0 * kPi * static_cast<double>(j) / static_cast<double>(sides);
            vec3   offset = f.normal * std::cos(angle) + f.binormal * std::sin(angle);
            mesh.positions.push_back(f.position + offset * radius);
            mesh.normals.push_back(offset);
            mesh.colors.push_back(c);
        }
    }

    const auto s = static_cast<uint32_t>(sides);
    mesh.indices.reserve((points.size() - 1) * s * 6);
    for (uint32_t i = 0; i + 1 < static_cast<uint32_t>(points.size()); ++i)
    {
        uint32_t ring0 = i * s;
        uint32_t ring1 = (i + 1) * s;
        for (uint32_t j = 0; j < s; ++j)
        {
            uint32_t jn = (j + 1) % s;
            mesh.indices.insert(mesh.indices.end(), {ring0 + j, ring0 + jn, ring1 + j});
            mesh.indices.insert(mesh.indices.end(), {ring1 + j, ring0 + jn, ring1 + jn});
        }
    }

    return mesh;
}

}   // namespace knotview
