#ifndef STARPATH_STAR_EMITTER_H
#define STARPATH_STAR_EMITTER_H

#include "starpath/core/types.h"
#include "starpath/cursor/drawing_cursor.h"
#include "starpath/star/star_types.h"

namespace starpath {

struct EmitReport {
    // Distance between the start position and where the trace itself ended,
    // before the cursor is moved back. Zero for a figure that closes on its own.
    double closureResidual{0.0};
};

/**
 * Issues the move/turn commands for a resolved figure. The cursor must already be
 * in radians; nothing is saved or restored here.
 */
void traceStar(const ResolvedGeometry& g, DrawingCursor& cursor);

/**
 * Draws the figure and leaves the cursor where it started: position, heading and
 * angle unit are restored, pen is down. Other cursor state (fill, colors) is untouched.
 */
EmitReport emitStar(const ResolvedGeometry& g, DrawingCursor& cursor);

} // namespace starpath

#endif // STARPATH_STAR_EMITTER_H
