#pragma once

#include "starpath/core/types.h"

#include <cstdint>
#include <cstring>
#include <cmath>

namespace starpath {

// =============================================================================
// Geometry Helpers
// =============================================================================

inline double distance(const Vec2& a, const Vec2& b) noexcept {
    return std::hypot(b.x - a.x, b.y - a.y);
}

/**
 * Wrap an angle to [0, fullCircle).
 */
inline double normalizeAngle(double a, double fullCircle) noexcept {
    double x = std::fmod(a, fullCircle);
    if (x < 0.0) x += fullCircle;
    if (x >= fullCircle) x = 0.0;
    return x;
}

/**
 * Signed smallest difference b - a between two radian angles, in (-pi, pi].
 */
inline double angleDelta(double a, double b) noexcept {
    double d = std::fmod(b - a, kTau);
    if (d > kPi) d -= kTau;
    if (d <= -kPi) d += kTau;
    return d;
}

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t canonicalizeF64(double v) {
    if (std::isnan(v)) return 0x7ff8000000000000ull;
    if (v == 0.0) return 0u;
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF64(std::uint64_t h, double v) {
    const std::uint64_t bits = canonicalizeF64(v);
    h = hashU32(h, static_cast<std::uint32_t>(bits & 0xFFFFFFFFu));
    return hashU32(h, static_cast<std::uint32_t>(bits >> 32));
}

} // namespace starpath
