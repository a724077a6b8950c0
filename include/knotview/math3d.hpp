#pragma once

#include <cmath>
#include <cstring>

namespace knotview
{

// ─── vec2 ────────────────────────────────────────────────────────────────────

struct vec2
{
    double x = 0.0, y = 0.0;

    constexpr vec2() = default;
    constexpr vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr vec2 operator+(vec2 b) const { return {x + b.x, y + b.y}; }
    constexpr vec2 operator-(vec2 b) const { return {x - b.x, y - b.y}; }
    constexpr vec2 operator*(double s) const { return {x * s, y * s}; }
    constexpr bool operator==(vec2 b) const { return x == b.x && y == b.y; }
    constexpr bool operator!=(vec2 b) const { return !(*this == b); }
};

// ─── vec3 ────────────────────────────────────────────────────────────────────

struct vec3
{
    double x = 0.0, y = 0.0, z = 0.0;

    constexpr vec3() = default;
    constexpr vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    constexpr vec3  operator+(vec3 b) const { return {x + b.x, y + b.y, z + b.z}; }
    constexpr vec3  operator-(vec3 b) const { return {x - b.x, y - b.y, z - b.z}; }
    constexpr vec3  operator*(double s) const { return {x * s, y * s, z * s}; }
    constexpr vec3  operator/(double s) const { return {x / s, y / s, z / s}; }
    constexpr vec3  operator-() const { return {-x, -y, -z}; }
    constexpr vec3& operator+=(vec3 b)
    {
        x += b.x;
        y += b.y;
        z += b.z;
        return *this;
    }
    constexpr vec3& operator-=(vec3 b)
    {
        x -= b.x;
        y -= b.y;
        z -= b.z;
        return *this;
    }
    constexpr vec3& operator*=(double s)
    {
        x *= s;
        y *= s;
        z *= s;
        return *this;
    }
    constexpr bool operator==(vec3 b) const { return x == b.x && y == b.y && z == b.z; }
    constexpr bool operator!=(vec3 b) const { return !(*this == b); }

    double&       operator[](int i) { return (&x)[i]; }
    const double& operator[](int i) const { return (&x)[i]; }
};

inline constexpr vec3 operator*(double s, vec3 v)
{
    return v * s;
}

inline constexpr double vec3_dot(vec3 a, vec3 b)
{
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline constexpr vec3 vec3_cross(vec3 a, vec3 b)
{
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

inline double vec3_length(vec3 v)
{
    return std::sqrt(vec3_dot(v, v));
}

inline vec3 vec3_normalize(vec3 v)
{
    double len = vec3_length(v);
    return len > 1e-12 ? v / len : vec3{0.0, 0.0, 0.0};
}

inline vec3 vec3_min(vec3 a, vec3 b)
{
    return {std::fmin(a.x, b.x), std::fmin(a.y, b.y), std::fmin(a.z, b.z)};
}

inline vec3 vec3_max(vec3 a, vec3 b)
{
    return {std::fmax(a.x, b.x), std::fmax(a.y, b.y), std::fmax(a.z, b.z)};
}

// ─── vec4 ────────────────────────────────────────────────────────────────────

struct vec4
{
    double x = 0.0, y = 0.0, z = 0.0, w = 0.0;

    constexpr vec4() = default;
    constexpr vec4(double x_, double y_, double z_, double w_) : x(x_), y(y_), z(z_), w(w_) {}
    constexpr vec4(vec3 v, double w_) : x(v.x), y(v.y), z(v.z), w(w_) {}

    constexpr vec3 xyz() const { return {x, y, z}; }
};

// ─── mat4 ────────────────────────────────────────────────────────────────────
// Column-major layout: m[col][row], stored as float[16].
// Element access: m[col * 4 + row]

struct mat4
{
    float m[16]{};

    constexpr mat4() = default;

    constexpr float&       operator()(int row, int col) { return m[col * 4 + row]; }
    constexpr const float& operator()(int row, int col) const { return m[col * 4 + row]; }
};

inline constexpr mat4 mat4_mul(const mat4& a, const mat4& b)
{
    mat4 r;
    for (int col = 0; col < 4; ++col)
    {
        for (int row = 0; row < 4; ++row)
        {
            float sum = 0.0f;
            for (int k = 0; k < 4; ++k)
            {
                sum += a.m[k * 4 + row] * b.m[col * 4 + k];
            }
            r.m[col * 4 + row] = sum;
        }
    }
    return r;
}

inline constexpr vec4 mat4_mul_vec4(const mat4& m, vec4 v)
{
    return {
        m.m[0] * v.x + m.m[4] * v.y + m.m[8] * v.z + m.m[12] * v.w,
        m.m[1] * v.x + m.m[5] * v.y + m.m[9] * v.z + m.m[13] * v.w,
        m.m[2] * v.x + m.m[6] * v.y + m.m[10] * v.z + m.m[14] * v.w,
        m.m[3] * v.x + m.m[7] * v.y + m.m[11] * v.z + m.m[15] * v.w,
    };
}

inline mat4 mat4_look_at(vec3 eye, vec3 target, vec3 up)
{
    vec3 f = vec3_normalize(target - eye);
    vec3 r = vec3_normalize(vec3_cross(f, up));
    vec3 u = vec3_cross(r, f);

    mat4 m;
    m.m[0]  = static_cast<float>(r.x);
    m.m[4]  = static_cast<float>(r.y);
    m.m[8]  = static_cast<float>(r.z);
    m.m[1]  = static_cast<float>(u.x);
    m.m[5]  = static_cast<float>(u.y);
    m.m[9]  = static_cast<float>(u.z);
    m.m[2]  = static_cast<float>(-f.x);
    m.m[6]  = static_cast<float>(-f.y);
    m.m[10] = static_cast<float>(-f.z);
    m.m[12] = static_cast<float>(-vec3_dot(r, eye));
    m.m[13] = static_cast<float>(-vec3_dot(u, eye));
    m.m[14] = static_cast<float>(vec3_dot(f, eye));
    m.m[15] = 1.0f;
    return m;
}

// Clip space follows the Vulkan convention: Y down, depth in [0,1].
inline mat4 mat4_perspective(float fov_y_rad, float aspect, float near, float far)
{
    float t = std::tan(fov_y_rad * 0.5f);
    mat4  m;
    m.m[0]  = 1.0f / (aspect * t);
    m.m[5]  = -1.0f / t;
    m.m[10] = far / (near - far);
    m.m[11] = -1.0f;
    m.m[14] = (near * far) / (near - far);
    return m;
}

inline mat4 mat4_ortho(float left, float right, float bottom, float top, float near, float far)
{
    mat4  m;
    float rl = right - left;
    float tb = top - bottom;
    float fn = far - near;
    if (rl == 0.0f)
        rl = 1.0f;
    if (tb == 0.0f)
        tb = 1.0f;
    if (fn == 0.0f)
        fn = 1.0f;

    m.m[0]  = 2.0f / rl;
    m.m[5]  = -2.0f / tb;
    m.m[10] = -1.0f / fn;
    m.m[12] = -(right + left) / rl;
    m.m[13] = (top + bottom) / tb;
    m.m[14] = -near / fn;
    m.m[15] = 1.0f;
    return m;
}

// ─── Utility ─────────────────────────────────────────────────────────────────

inline constexpr float deg_to_rad(float deg)
{
    return deg * 3.14159265358979323846f / 180.0f;
}

inline constexpr float clampf(float v, float lo, float hi)
{
    return v < lo ? lo : (v > hi ? hi : v);
}

}   // namespace knotview
