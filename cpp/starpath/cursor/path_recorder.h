#ifndef STARPATH_PATH_RECORDER_H
#define STARPATH_PATH_RECORDER_H

#include "starpath/core/types.h"
#include "starpath/cursor/drawing_cursor.h"
#include "starpath/render/vector_ir.h"

#include <cstdint>
#include <vector>

class PathRecorderTestAccessor;

namespace starpath {

struct RecorderOptions {
    Vec2 origin{0.0, 0.0};
    double heading{0.0};                                 // in angleUnit
    AngleUnit angleUnit{AngleUnit::Degrees};
    double fullCircleDegrees{kDefaultFullCircleDegrees}; // units per turn in Degrees mode
};

/**
 * In-memory cursor: keeps a pen pose and records every movement as vector IR segments.
 * Used by the wasm bindings to hand traced paths to the frontend and by tests to
 * inspect what the planner emitted.
 */
class PathRecorder final : public DrawingCursor {
    friend class ::PathRecorderTestAccessor;
public:
    PathRecorder() : PathRecorder(RecorderOptions{}) {}
    explicit PathRecorder(const RecorderOptions& opt);

    // DrawingCursor
    void forward(double distance) override;
    void rotate(double angle) override;
    Vec2 position() const override { return pos_; }
    double heading() const override;
    void setHeading(double angle) override;
    void goTo(const Vec2& p) override;
    void penUp() override { penDown_ = false; }
    void penDown() override { penDown_ = true; }
    bool isFilling() const override { return filling_; }
    AngleUnit angleUnit() const override { return unit_; }
    void setAngleUnit(AngleUnit unit) override { unit_ = unit; }

    // Degrees mode with a custom full circle (e.g. 400 for gradians).
    void setDegrees(double fullCircle);
    void setRadians() { unit_ = AngleUnit::Radians; }
    double fullCircleDegrees() const { return fullCircle_; }

    bool isPenDown() const { return penDown_; }

    // Starts collecting a fill contour at the current position.
    void beginFill();
    // Closes the current fill contour. No-op when not filling.
    void endFill();

    // Drops the recorded path, fills and counters; the pose is kept.
    void clear();

    const vector::StrokePath& path() const { return path_; }
    const std::vector<vector::FillContour>& fills() const { return fills_; }

    double headingRadians() const { return headingRad_; }
    // Sum of all rotate() turns in radians. setHeading() is not counted.
    double netRotation() const { return netRotation_; }
    double drawnLength() const { return drawnLength_; }
    double travelLength() const { return travelLength_; }
    std::uint32_t lineCount() const { return lineCount_; }
    std::uint32_t jumpCount() const { return jumpCount_; }

    struct BufferMeta {
        std::uint32_t generation;
        std::uint32_t segmentCount;
        std::uint32_t floatCount;
        std::uintptr_t ptr;
    };

    // Flattens the recorded segments (see vector::segmentFloats) and exposes the buffer.
    BufferMeta getSegmentBufferMeta();

private:
    double toRadians(double angle) const noexcept;
    double fromRadians(double rad) const noexcept;
    void moveTo(const Vec2& to);

    Vec2 pos_{0.0, 0.0};
    double headingRad_{0.0};
    AngleUnit unit_{AngleUnit::Degrees};
    double fullCircle_{kDefaultFullCircleDegrees};
    bool penDown_{true};
    bool filling_{false};

    vector::StrokePath path_;
    std::vector<vector::FillContour> fills_;
    vector::FillContour currentFill_;

    double netRotation_{0.0};
    double drawnLength_{0.0};
    double travelLength_{0.0};
    std::uint32_t lineCount_{0};
    std::uint32_t jumpCount_{0};

    std::uint32_t generation_{0};
    std::vector<float> segmentBuffer_;
};

} // namespace starpath

#endif // STARPATH_PATH_RECORDER_H
