#ifndef STARPATH_STAR_RESOLVER_H
#define STARPATH_STAR_RESOLVER_H

#include "starpath/core/types.h"
#include "starpath/star/star_types.h"

#include <cstdint>

namespace starpath {

// Default step when neither step nor edge length is given: max(1, (n - 1) / 2).
std::uint32_t defaultStarStep(std::uint32_t vertices) noexcept;

/**
 * Validates a StarSpec and resolves its sign-encoded switches into an explicit
 * StarRequest. A negative step whose magnitude exceeds n/2 is mirrored to n - m
 * with the winding inverted; a positive one is folded to n - m (same figure).
 * Does not check the edge length bound, which needs the derived chord.
 */
StarError classifyStar(const StarSpec& spec, StarRequest& out, std::uint32_t maxVertices = kMaxStarVertices);

/**
 * Derives the tracing constants for a classified request.
 * On EdgeTooShort, *minEdgeLength (when non-null) receives the smallest accepted edge length.
 * Pure; out is only written on success.
 */
StarError resolveStarGeometry(const StarRequest& request, ResolvedGeometry& out, double* minEdgeLength = nullptr);

// classifyStar followed by resolveStarGeometry.
StarError resolveStar(
    const StarSpec& spec,
    ResolvedGeometry& out,
    double* minEdgeLength = nullptr,
    std::uint32_t maxVertices = kMaxStarVertices);

} // namespace starpath

#endif // STARPATH_STAR_RESOLVER_H
