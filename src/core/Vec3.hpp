#pragma once

#include <cmath>

namespace gravsim {

struct DVec3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    friend bool operator==(const DVec3&, const DVec3&) = default;
};

inline DVec3 operator+(const DVec3& a, const DVec3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline DVec3 operator-(const DVec3& a, const DVec3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline DVec3 operator-(const DVec3& a) { return {-a.x, -a.y, -a.z}; }
inline DVec3 operator*(const DVec3& a, double s) { return {a.x * s, a.y * s, a.z * s}; }
inline DVec3 operator*(double s, const DVec3& a) { return {a.x * s, a.y * s, a.z * s}; }
inline DVec3 operator/(const DVec3& a, double s) { return {a.x / s, a.y / s, a.z / s}; }
inline DVec3& operator+=(DVec3& a, const DVec3& b) {
    a.x += b.x;
    a.y += b.y;
    a.z += b.z;
    return a;
}
inline DVec3& operator-=(DVec3& a, const DVec3& b) {
    a.x -= b.x;
    a.y -= b.y;
    a.z -= b.z;
    return a;
}
inline DVec3& operator*=(DVec3& a, double s) {
    a.x *= s;
    a.y *= s;
    a.z *= s;
    return a;
}

inline double dot(const DVec3& a, const DVec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline DVec3 cross(const DVec3& a, const DVec3& b) {
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}
inline double length2(const DVec3& a) { return dot(a, a); }
inline double length(const DVec3& a) { return std::sqrt(length2(a)); }
inline bool is_finite(const DVec3& a) { return std::isfinite(a.x) && std::isfinite(a.y) && std::isfinite(a.z); }

// Truncates every component to single precision and widens it back.
inline DVec3 round_trip_single(const DVec3& a) {
    return {static_cast<double>(static_cast<float>(a.x)), static_cast<double>(static_cast<float>(a.y)),
            static_cast<double>(static_cast<float>(a.z))};
}

}  // namespace gravsim
