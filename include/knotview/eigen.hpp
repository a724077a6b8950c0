#pragma once

// ─── knotview ↔ Eigen ──────────────────────────────────────────────────────
//
// Include this header to pass N×3 (curves) and N×2 (crossings) Eigen
// matrices of any floating-point scalar wherever knotview takes points.
// Rows are copied into vec3/vec2 storage.
//
// Requirements:
//   - Eigen 3.x  (header-only)
//   - Build with -DKNOTVIEW_USE_EIGEN=ON
//
// Usage:
//
//   Eigen::MatrixX3d knot = ...;
//   knotview::plot_line(knot);
//   knotview::plot_projection(knot, crossings_nx2);
//
// ─────────────────────────────────────────────────────────────────────────────

#include <eigen3/Eigen/Core>
#include <knotview/math3d.hpp>
#include <knotview/plot.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace knotview
{

namespace eigen_detail
{

template <typename Derived>
void require_columns(const Eigen::MatrixBase<Derived>& m, Eigen::Index cols)
{
    static_assert(std::is_floating_point_v<typename Derived::Scalar>,
                  "knotview Eigen adapter requires a floating-point scalar type");
    if (m.cols() != cols)
    {
        throw std::invalid_argument("expected an N×" + std::to_string(cols) + " matrix, got "
                                    + std::to_string(m.rows()) + "×" + std::to_string(m.cols()));
    }
}

// Projections read the first two columns; a third (or more) is ignored.
template <typename Derived>
std::vector<vec3> projection_rows(const Eigen::MatrixBase<Derived>& m)
{
    if (m.cols() < 2)
    {
        throw std::invalid_argument("projection needs at least 2 columns");
    }
    std::vector<vec3> points;
    points.reserve(static_cast<size_t>(m.rows()));
    for (Eigen::Index i = 0; i < m.rows(); ++i)
    {
        points.emplace_back(static_cast<double>(m(i, 0)), static_cast<double>(m(i, 1)), 0.0);
    }
    return points;
}

}   // namespace eigen_detail

// Throws std::invalid_argument unless the matrix has exactly 3 columns.
template <typename Derived>
std::vector<vec3> to_points(const Eigen::MatrixBase<Derived>& m)
{
    eigen_detail::require_columns(m, 3);
    std::vector<vec3> points;
    points.reserve(static_cast<size_t>(m.rows()));
    for (Eigen::Index i = 0; i < m.rows(); ++i)
    {
        points.emplace_back(static_cast<double>(m(i, 0)),
                            static_cast<double>(m(i, 1)),
                            static_cast<double>(m(i, 2)));
    }
    return points;
}

// Throws std::invalid_argument unless the matrix has exactly 2 columns.
template <typename Derived>
std::vector<vec2> to_points2d(const Eigen::MatrixBase<Derived>& m)
{
    eigen_detail::require_columns(m, 2);
    std::vector<vec2> points;
    points.reserve(static_cast<size_t>(m.rows()));
    for (Eigen::Index i = 0; i < m.rows(); ++i)
    {
        points.emplace_back(static_cast<double>(m(i, 0)), static_cast<double>(m(i, 1)));
    }
    return points;
}

template <typename Derived>
std::string plot_line(const Eigen::MatrixBase<Derived>& points,
                      RenderMode                        mode    = RenderMode::Auto,
                      const LineOptions&                options = {})
{
    auto pts = to_points(points);
    return plot_line(std::span<const vec3>(pts), mode, options);
}

template <typename Derived>
ProjectionResult plot_projection(const Eigen::MatrixBase<Derived>& points,
                                 ProjectionOptions                 options = {})
{
    auto pts = eigen_detail::projection_rows(points);
    return plot_projection(std::span<const vec3>(pts), options);
}

template <typename Derived, typename CrossingDerived>
ProjectionResult plot_projection(const Eigen::MatrixBase<Derived>&         points,
                                 const Eigen::MatrixBase<CrossingDerived>& crossings,
                                 ProjectionOptions                         options = {})
{
    auto pts = eigen_detail::projection_rows(points);
    auto cr  = to_points2d(crossings);
    options.crossings = std::span<const vec2>(cr);
    return plot_projection(std::span<const vec3>(pts), options);
}

}   // namespace knotview
