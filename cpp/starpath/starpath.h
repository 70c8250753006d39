#pragma once

#include "starpath/core/types.h"
#include "starpath/cursor/drawing_cursor.h"
#include "starpath/star/star_types.h"
#include "starpath/star/star_resolver.h"
#include "starpath/star/star_emitter.h"

#include <cstdint>
#include <optional>

namespace starpath {

struct PlannerOptions {
    // Relative to max(1, |radius|); a larger natural closure residual is logged.
    double closureTolerance{kDefaultClosureTolerance};
    bool reportClosureResidual{true};
    std::uint32_t maxVertices{kMaxStarVertices};
};

struct DrawStarResult {
    StarError error{StarError::Ok};
    // Smallest accepted edge length; set when error == EdgeTooShort.
    double minEdgeLength{0.0};

    bool ok() const { return error == StarError::Ok; }
};

/**
 * StarPathPlanner traces regular star polygons {n/m} (or their hull-only outline)
 * on a borrowed DrawingCursor.
 *
 * All validation runs before the cursor is touched: a failed call leaves the cursor
 * exactly as it was. A successful call leaves position, heading and angle unit as
 * they were before the call.
 */
class StarPathPlanner {
public:
    StarPathPlanner() = default;
    explicit StarPathPlanner(const PlannerOptions& options) : options_(options) {}

    DrawStarResult drawStar(
        DrawingCursor& cursor,
        double radius,
        std::int64_t vertices,
        std::optional<std::int64_t> step = std::nullopt,
        std::optional<double> edgeLength = std::nullopt);

    DrawStarResult drawStar(DrawingCursor& cursor, const StarSpec& spec);

    // Resolution only; never touches a cursor.
    StarError resolve(const StarSpec& spec, ResolvedGeometry& out, double* minEdgeLength = nullptr) const;

    const PlannerOptions& options() const { return options_; }
    StarError lastError() const { return lastResult_.error; }
    const DrawStarResult& lastResult() const { return lastResult_; }
    // Valid only after a successful drawStar.
    const ResolvedGeometry& lastGeometry() const { return lastGeometry_; }
    const EmitReport& lastReport() const { return lastReport_; }

private:
    PlannerOptions options_{};
    DrawStarResult lastResult_{};
    ResolvedGeometry lastGeometry_{};
    EmitReport lastReport_{};
};

// One-shot drawStar with default options.
DrawStarResult drawStar(
    DrawingCursor& cursor,
    double radius,
    std::int64_t vertices,
    std::optional<std::int64_t> step = std::nullopt,
    std::optional<double> edgeLength = std::nullopt);

} // namespace starpath
