#include "starpath/star/regular_polygon.h"
#include "starpath/core/logging.h"

#include <cmath>

namespace starpath {

StarError traceRegularPolygon(DrawingCursor& cursor, double radius, std::int64_t sides) {
    if (!std::isfinite(radius)) return StarError::InvalidRadius;
    if (sides < static_cast<std::int64_t>(kMinStarVertices) || sides > static_cast<std::int64_t>(kMaxStarVertices)) {
        STARPATH_LOG_WARN("traceRegularPolygon: rejected sides=%lld", static_cast<long long>(sides));
        return StarError::InvalidVertexCount;
    }

    double w = kTau / static_cast<double>(sides);
    double w2 = 0.5 * w;
    double l = 2.0 * radius * std::sin(w2);
    if (radius < 0.0) {
        l = -l;
        w = -w;
        w2 = -w2;
    }

    const AngleUnit unit = cursor.angleUnit();
    cursor.setAngleUnit(AngleUnit::Radians);
    cursor.rotate(w2);
    for (std::int64_t i = 0; i < sides; i++) {
        cursor.forward(l);
        cursor.rotate(w);
    }
    cursor.rotate(-w2);
    cursor.setAngleUnit(unit);
    return StarError::Ok;
}

Vec2 inscribedCircleCenter(const Vec2& position, double headingRad, double radius) noexcept {
    return Vec2{
        position.x - radius * std::sin(headingRad),
        position.y + radius * std::cos(headingRad),
    };
}

} // namespace starpath
