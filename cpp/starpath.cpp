#include "starpath/starpath.h"
#include "starpath/core/logging.h"

#include <algorithm>
#include <cmath>

namespace starpath {

StarError StarPathPlanner::resolve(const StarSpec& spec, ResolvedGeometry& out, double* minEdgeLength) const {
    return resolveStar(spec, out, minEdgeLength, options_.maxVertices);
}

DrawStarResult StarPathPlanner::drawStar(
    DrawingCursor& cursor,
    double radius,
    std::int64_t vertices,
    std::optional<std::int64_t> step,
    std::optional<double> edgeLength
) {
    StarSpec spec;
    spec.radius = radius;
    spec.vertices = vertices;
    spec.step = step;
    spec.edgeLength = edgeLength;
    return drawStar(cursor, spec);
}

DrawStarResult StarPathPlanner::drawStar(DrawingCursor& cursor, const StarSpec& spec) {
    DrawStarResult result;
    ResolvedGeometry g;
    result.error = resolve(spec, g, &result.minEdgeLength);
    lastResult_ = result;
    if (result.error != StarError::Ok) {
        STARPATH_LOG_WARN(
            "drawStar rejected: %s (radius=%f vertices=%lld step=%s%lld edgeLength=%f min=%f)",
            starErrorName(result.error),
            spec.radius,
            static_cast<long long>(spec.vertices),
            spec.step ? "" : "none/",
            static_cast<long long>(spec.step.value_or(0)),
            spec.edgeLength.value_or(0.0),
            result.minEdgeLength);
        return result;
    }

    STARPATH_LOG_DEBUG(
        "drawStar %s {%u/%u} d=%u dir=%s alpha=%f gamma=%f theta=%f sigma=%f s=%f t=%f u=%f",
        starModeName(g.mode),
        g.vertices,
        g.step,
        g.stellations,
        g.direction == Direction::Clockwise ? "cw" : "ccw",
        g.alpha,
        g.gamma,
        g.theta,
        g.sigma,
        g.s,
        g.t,
        g.u);

    lastGeometry_ = g;
    lastReport_ = emitStar(g, cursor);

    if (options_.reportClosureResidual) {
        const double scale = std::max(1.0, std::abs(spec.radius));
        if (lastReport_.closureResidual > options_.closureTolerance * scale) {
            STARPATH_LOG_DEBUG("drawStar: trace ended %f away from start, cursor moved back", lastReport_.closureResidual);
        }
    }
    return result;
}

DrawStarResult drawStar(
    DrawingCursor& cursor,
    double radius,
    std::int64_t vertices,
    std::optional<std::int64_t> step,
    std::optional<double> edgeLength
) {
    StarPathPlanner planner;
    return planner.drawStar(cursor, radius, vertices, step, edgeLength);
}

} // namespace starpath
