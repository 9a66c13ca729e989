// rotation.hpp — velocity re-orientation for continuous random walks
#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <string>

#include "abm/core/errors.hpp"
#include "abm/core/rng.hpp"

namespace abm {
namespace sim {

using Vec2 = std::array<double, 2>;
using Vec3 = std::array<double, 3>;

// ---- angle distributions ----
// Any callable `double(Rng&)` can stand in for these in randomwalk.

// Continuous uniform on [a, b).
struct Uniform {
    double a;
    double b;

    Uniform(double lo, double hi) : a(lo), b(hi) {
        if (!(lo < hi) || !std::isfinite(lo) || !std::isfinite(hi))
            throw core::InvalidArgumentError("Uniform: need finite a < b, got a=" + std::to_string(lo) +
                                             ", b=" + std::to_string(hi));
    }

    template <class URBG>
    double operator()(URBG& rng) const noexcept {
        return a + (b - a) * core::uniform01(rng);
    }
};

// acos(U) with U ~ Uniform(a, b); Arccos(-1, 1) gives spherically uniform
// azimuthal angles.
struct Arccos {
    double a;
    double b;

    Arccos(double lo = -1.0, double hi = 1.0) : a(lo), b(hi) {
        if (!(lo < hi) || lo < -1.0 || hi > 1.0)
            throw core::InvalidArgumentError("Arccos: need -1 <= a < b <= 1, got a=" + std::to_string(lo) +
                                             ", b=" + std::to_string(hi));
    }

    template <class URBG>
    double operator()(URBG& rng) const noexcept {
        return std::acos(a + (b - a) * core::uniform01(rng));
    }
};

// ---- rotations ----

inline double norm(const Vec2& v) noexcept { return std::hypot(v[0], v[1]); }
inline double norm(const Vec3& v) noexcept { return std::sqrt(v[0] * v[0] + v[1] * v[1] + v[2] * v[2]); }

inline double dot(const Vec3& a, const Vec3& b) noexcept {
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

// Counter-clockwise rotation of w by theta radians.
inline Vec2 rotate(const Vec2& w, double theta) noexcept {
    const double c = std::cos(theta), s = std::sin(theta);
    return {c * w[0] - s * w[1], s * w[0] + c * w[1]};
}

// Rodrigues' formula: rotate v by angle about `axis` (any non-zero length).
inline Vec3 rotate_about(const Vec3& v, const Vec3& axis, double angle) noexcept {
    const double n = norm(axis);
    if (n == 0.0) return v;
    const Vec3 k{axis[0] / n, axis[1] / n, axis[2] / n};
    const double c = std::cos(angle), s = std::sin(angle);
    const Vec3 kxv{k[1] * v[2] - k[2] * v[1], k[2] * v[0] - k[0] * v[2], k[0] * v[1] - k[1] * v[0]};
    const double kv = dot(k, v) * (1.0 - c);
    return {v[0] * c + kxv[0] * s + k[0] * kv,
            v[1] * c + kxv[1] * s + k[1] * kv,
            v[2] * c + kxv[2] * s + k[2] * kv};
}

/**
 * @brief Rotate w by a polar angle theta and an azimuthal angle phi.
 *
 * w is first rotated by theta about a vector u normal to it, then the result
 * is rotated by phi about the original w. The angle between the result v and
 * w is theta for every phi: (v.w)/(|v||w|) = cos(theta).
 *
 * @throws InvalidArgumentError for the zero vector (no direction to rotate).
 */
inline Vec3 rotate(const Vec3& w, double theta, double phi) {
    std::size_t m = 3;
    for (std::size_t i = 0; i < 3; ++i) {
        if (w[i] != 0.0) { m = i; break; }
    }
    if (m == 3) throw core::InvalidArgumentError("cannot rotate the zero vector");
    const std::size_t n = (m + 1) % 3;
    Vec3 u{0.0, 0.0, 0.0};
    u[n] = w[m];
    u[m] = -w[n];
    return rotate_about(rotate_about(w, u, theta), w, phi);
}

} // namespace sim
} // namespace abm
