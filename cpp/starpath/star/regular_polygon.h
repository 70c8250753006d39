#pragma once

#include "starpath/core/types.h"
#include "starpath/cursor/drawing_cursor.h"

#include <cstdint>

namespace starpath {

/**
 * Traces the convex regular polygon inscribed in the circle of the given radius,
 * starting tangent to that circle at the cursor position (counterclockwise for a
 * positive radius). Its vertices coincide with those of any star drawn from the
 * same pose. The cursor ends on the start point with its heading advanced by a
 * full turn; the angle unit is restored.
 */
StarError traceRegularPolygon(DrawingCursor& cursor, double radius, std::int64_t sides);

// Center of the circle a figure of this radius, started at (position, headingRad), is inscribed in.
Vec2 inscribedCircleCenter(const Vec2& position, double headingRad, double radius) noexcept;

} // namespace starpath
