#ifndef HOVERTANK_MATH_H
#define HOVERTANK_MATH_H

#include <cmath>

// ─── Small value-type vector math ──────────────────────────
// Stack-allocated, no heap. Y is world up, +Z is chassis forward.

namespace hovertank {

constexpr float PI = 3.14159265358979323846f;

struct Vec3 {
  float x, y, z;
}; // 12 bytes

struct Quat {
  float x, y, z, w;
}; // 16 bytes

inline Vec3 operator+(Vec3 a, Vec3 b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(Vec3 a, Vec3 b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator-(Vec3 a) { return {-a.x, -a.y, -a.z}; }
inline Vec3 operator*(Vec3 a, float s) { return {a.x * s, a.y * s, a.z * s}; }
inline Vec3 operator*(float s, Vec3 a) { return {a.x * s, a.y * s, a.z * s}; }
inline Vec3 &operator+=(Vec3 &a, Vec3 b) {
  a.x += b.x;
  a.y += b.y;
  a.z += b.z;
  return a;
}

inline float dot(Vec3 a, Vec3 b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

inline Vec3 cross(Vec3 a, Vec3 b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

inline float length_sq(Vec3 a) { return dot(a, a); }
inline float length(Vec3 a) { return std::sqrt(dot(a, a)); }

inline float distance(Vec3 a, Vec3 b) { return length(a - b); }

// Returns the zero vector for degenerate input instead of NaN.
inline Vec3 normalize(Vec3 a) {
  float len = length(a);
  if (len < 1e-6f)
    return {0.0f, 0.0f, 0.0f};
  return a * (1.0f / len);
}

inline bool is_finite(float f) { return std::isfinite(f); }
inline bool is_finite(Vec3 a) {
  return std::isfinite(a.x) && std::isfinite(a.y) && std::isfinite(a.z);
}

// Reflect d about a unit normal n.
inline Vec3 reflect(Vec3 d, Vec3 n) { return d - n * (2.0f * dot(d, n)); }

inline Vec3 clamp_length(Vec3 a, float max_len) {
  float len_sq = length_sq(a);
  if (len_sq > max_len * max_len && len_sq > 0.0f)
    return a * (max_len / std::sqrt(len_sq));
  return a;
}

constexpr Vec3 WORLD_UP = {0.0f, 1.0f, 0.0f};
constexpr Quat QUAT_IDENTITY = {0.0f, 0.0f, 0.0f, 1.0f};

// q * v * q^-1 (unit quaternion assumed)
inline Vec3 rotate(Quat q, Vec3 v) {
  Vec3 u = {q.x, q.y, q.z};
  Vec3 t = cross(u, v) * 2.0f;
  return v + t * q.w + cross(u, t);
}

inline Quat quat_from_yaw(float yaw) {
  return {0.0f, std::sin(yaw * 0.5f), 0.0f, std::cos(yaw * 0.5f)};
}

// Axis-angle, axis must be unit length.
inline Quat quat_from_axis_angle(Vec3 axis, float angle) {
  float s = std::sin(angle * 0.5f);
  return {axis.x * s, axis.y * s, axis.z * s, std::cos(angle * 0.5f)};
}

inline Vec3 local_up(Quat q) { return rotate(q, {0.0f, 1.0f, 0.0f}); }
inline Vec3 local_forward(Quat q) { return rotate(q, {0.0f, 0.0f, 1.0f}); }
inline Vec3 local_right(Quat q) { return rotate(q, {1.0f, 0.0f, 0.0f}); }

// Heading of a direction on the XZ plane (0 = +Z).
inline float yaw_of(Vec3 dir) { return std::atan2(dir.x, dir.z); }

// Into [-PI, PI]. Constant time for any finite input.
inline float wrap_angle(float a) { return std::remainder(a, 2.0f * PI); }

inline float clampf(float v, float lo, float hi) {
  return v < lo ? lo : (v > hi ? hi : v);
}

} // namespace hovertank

#endif // HOVERTANK_MATH_H
