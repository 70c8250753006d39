#ifndef STARPATH_CORE_TYPES_H
#define STARPATH_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared by the star path planner.

namespace starpath {

// Vertex count limits
static constexpr std::uint32_t kMinStarVertices = 3;
static constexpr std::uint32_t kMaxStarVertices = 65536;

// Closure checks compare the traced end pose against the start pose.
static constexpr double kDefaultClosureTolerance = 1e-9;

static constexpr double kPi = 3.14159265358979323846;
static constexpr double kTau = 2.0 * kPi;
static constexpr double kDefaultFullCircleDegrees = 360.0;

struct Vec2 { double x; double y; };

enum class AngleUnit : std::uint8_t {
    Radians = 0,
    Degrees = 1,
};

// Winding of the traced figure. CounterClockwise corresponds to a positive radius.
enum class Direction : std::uint8_t {
    CounterClockwise = 0,
    Clockwise = 1,
};

enum class StarError : std::uint32_t {
    Ok = 0,
    InvalidArguments = 1,   // both step and edge length supplied
    InvalidStep = 2,        // |step| outside [1, vertices - 1]
    EdgeTooShort = 3,       // edge length below the s/2 chord bound
    InvalidVertexCount = 4, // vertices outside [kMinStarVertices, maxVertices]
    InvalidRadius = 5,      // non-finite radius
};

inline const char* starErrorName(StarError err) {
    switch (err) {
        case StarError::Ok: return "Ok";
        case StarError::InvalidArguments: return "InvalidArguments";
        case StarError::InvalidStep: return "InvalidStep";
        case StarError::EdgeTooShort: return "EdgeTooShort";
        case StarError::InvalidVertexCount: return "InvalidVertexCount";
        case StarError::InvalidRadius: return "InvalidRadius";
    }
    return "Unknown";
}

inline double directionSign(Direction d) noexcept {
    return d == Direction::Clockwise ? -1.0 : 1.0;
}

} // namespace starpath

#endif // STARPATH_CORE_TYPES_H
