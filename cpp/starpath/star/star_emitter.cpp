#include "starpath/star/star_emitter.h"
#include "starpath/core/util.h"

namespace starpath {

namespace {

void traceInternal(const ResolvedGeometry& g, DrawingCursor& cursor) {
    const std::uint32_t n = g.vertices;
    const std::uint32_t n1 = g.verticesPerStellation;

    cursor.rotate(-g.gamma / 2.0);
    for (std::uint32_t i = 0; i < n; i++) {
        if (i > 0 && i % n1 == 0) {
            // Stellation seam: hop to the next sub-polygon's first vertex without drawing.
            cursor.rotate(g.beta);
            cursor.penUp();
            cursor.forward(g.s);
            cursor.penDown();
            cursor.rotate(g.beta);
        } else {
            cursor.rotate(g.gamma);
        }
        cursor.forward(g.t);
    }

    if (cursor.isFilling()) {
        // Walk back along the hull so the fill contour ends on the start vertex.
        cursor.penUp();
        cursor.rotate(g.beta + g.delta);
        for (std::uint32_t i = 0; i + 1 < g.stellations; i++) {
            cursor.forward(g.s);
            cursor.rotate(-g.alpha);
        }
        cursor.penDown();
    }
}

void traceHull(const ResolvedGeometry& g, DrawingCursor& cursor) {
    cursor.rotate((kPi - g.theta) / 2.0);
    for (std::uint32_t i = 0; i < g.vertices; i++) {
        cursor.forward(g.u);
        cursor.rotate(g.sigma - kPi);
        cursor.forward(g.u);
        cursor.rotate(kPi - g.theta);
    }
}

} // namespace

void traceStar(const ResolvedGeometry& g, DrawingCursor& cursor) {
    switch (g.mode) {
        case StarMode::Internal:
            traceInternal(g, cursor);
            break;
        case StarMode::HullComputed:
        case StarMode::HullGiven:
            traceHull(g, cursor);
            break;
    }
}

EmitReport emitStar(const ResolvedGeometry& g, DrawingCursor& cursor) {
    const double orient = cursor.heading();
    const Vec2 posit = cursor.position();
    const AngleUnit unit = cursor.angleUnit();
    cursor.setAngleUnit(AngleUnit::Radians);

    traceStar(g, cursor);

    EmitReport report;
    report.closureResidual = distance(posit, cursor.position());

    // orient was read in the caller's unit, so the unit goes back first.
    cursor.setAngleUnit(unit);
    cursor.penUp();
    cursor.goTo(posit);
    cursor.penDown();
    cursor.setHeading(orient);
    return report;
}

} // namespace starpath
