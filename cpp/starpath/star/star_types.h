#ifndef STARPATH_STAR_TYPES_H
#define STARPATH_STAR_TYPES_H

#include "starpath/core/types.h"

#include <cstdint>
#include <optional>

namespace starpath {

// Caller-facing parameters. Signs carry meaning: radius < 0 traces clockwise,
// step < 0 selects the hull-only figure.
struct StarSpec {
    double radius{0.0};
    std::int64_t vertices{0};
    std::optional<std::int64_t> step;
    std::optional<double> edgeLength;
};

enum class StarMode : std::uint8_t {
    Internal = 0,     // {n/m} with interior chords
    HullComputed = 1, // outer boundary, edge length derived from n, m, r
    HullGiven = 2,    // outer boundary with caller-supplied edge length
};

inline const char* starModeName(StarMode mode) {
    switch (mode) {
        case StarMode::Internal: return "Internal";
        case StarMode::HullComputed: return "HullComputed";
        case StarMode::HullGiven: return "HullGiven";
    }
    return "Unknown";
}

// StarSpec with the sign-encoded switches resolved: explicit mode and winding,
// non-negative magnitudes. step is unused in HullGiven, edgeLength only used there.
struct StarRequest {
    StarMode mode{StarMode::Internal};
    Direction direction{Direction::CounterClockwise};
    std::uint32_t vertices{0};
    std::uint32_t step{0};
    double radius{0.0};
    double edgeLength{0.0};
};

// Tracing constants in radians. Angles are signed by direction.
// Not every field is meaningful in every mode:
//   Internal:     alpha beta gamma delta s t
//   HullComputed: alpha gamma delta theta rho sigma u
//   HullGiven:    alpha delta theta rho sigma s u
struct ResolvedGeometry {
    StarMode mode{StarMode::Internal};
    Direction direction{Direction::CounterClockwise};
    std::uint32_t vertices{0};
    std::uint32_t step{0};
    std::uint32_t stellations{1};           // d = gcd(n, m)
    std::uint32_t verticesPerStellation{0}; // n / d
    double radius{0.0};

    double alpha{0.0};
    double beta{0.0};
    double gamma{0.0};
    double delta{0.0};
    double theta{0.0};
    double rho{0.0};
    double sigma{0.0};

    double s{0.0};
    double t{0.0};
    double u{0.0};
};

} // namespace starpath

#endif // STARPATH_STAR_TYPES_H
