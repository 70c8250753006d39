#pragma once

#include "starpath/core/types.h"

namespace starpath {

/**
 * Narrow pen interface the planner drives. Angles passed to rotate/setHeading and
 * returned by heading() are expressed in the cursor's current angleUnit().
 * rotate() is a relative turn, positive counterclockwise.
 *
 * The planner borrows a cursor for the duration of a single call and never keeps it.
 */
class DrawingCursor {
public:
    virtual ~DrawingCursor() = default;

    virtual void forward(double distance) = 0;
    virtual void rotate(double angle) = 0;

    virtual Vec2 position() const = 0;
    virtual double heading() const = 0;
    virtual void setHeading(double angle) = 0;
    virtual void goTo(const Vec2& p) = 0;

    virtual void penUp() = 0;
    virtual void penDown() = 0;
    virtual bool isFilling() const = 0;

    virtual AngleUnit angleUnit() const = 0;
    virtual void setAngleUnit(AngleUnit unit) = 0;
};

} // namespace starpath
