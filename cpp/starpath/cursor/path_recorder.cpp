#include "starpath/cursor/path_recorder.h"
#include "starpath/core/logging.h"
#include "starpath/core/util.h"

#include <cmath>
#include <utility>

namespace starpath {

namespace {

// Pen-up travel shorter than this is closure noise, not a jump.
static constexpr double kJumpEpsilon = 1e-9;

} // namespace

PathRecorder::PathRecorder(const RecorderOptions& opt)
    : pos_(opt.origin),
      unit_(opt.angleUnit),
      fullCircle_(opt.fullCircleDegrees > 0.0 && std::isfinite(opt.fullCircleDegrees) ? opt.fullCircleDegrees : kDefaultFullCircleDegrees) {
    headingRad_ = toRadians(opt.heading);
}

double PathRecorder::toRadians(double angle) const noexcept {
    if (unit_ == AngleUnit::Radians) return angle;
    return angle * kTau / fullCircle_;
}

double PathRecorder::fromRadians(double rad) const noexcept {
    if (unit_ == AngleUnit::Radians) return rad;
    return rad * fullCircle_ / kTau;
}

void PathRecorder::setDegrees(double fullCircle) {
    if (!(fullCircle > 0.0) || !std::isfinite(fullCircle)) {
        STARPATH_LOG_WARN("PathRecorder: ignoring full circle %f", fullCircle);
        fullCircle = kDefaultFullCircleDegrees;
    }
    fullCircle_ = fullCircle;
    unit_ = AngleUnit::Degrees;
}

void PathRecorder::forward(double distance) {
    const Vec2 to{
        pos_.x + distance * std::cos(headingRad_),
        pos_.y + distance * std::sin(headingRad_),
    };
    moveTo(to);
}

void PathRecorder::rotate(double angle) {
    const double rad = toRadians(angle);
    headingRad_ += rad;
    netRotation_ += rad;
}

double PathRecorder::heading() const {
    const double full = unit_ == AngleUnit::Radians ? kTau : fullCircle_;
    return normalizeAngle(fromRadians(headingRad_), full);
}

void PathRecorder::setHeading(double angle) {
    headingRad_ = toRadians(angle);
}

void PathRecorder::goTo(const Vec2& p) {
    moveTo(p);
}

void PathRecorder::moveTo(const Vec2& to) {
    const double len = distance(pos_, to);
    if (penDown_) {
        path_.segments.push_back(vector::Segment::lineTo(pos_, to));
        drawnLength_ += len;
        lineCount_++;
    } else {
        path_.segments.push_back(vector::Segment::moveTo(pos_, to));
        travelLength_ += len;
        if (len > kJumpEpsilon) jumpCount_++;
    }
    pos_ = to;
    if (filling_) currentFill_.points.push_back(to);
}

void PathRecorder::beginFill() {
    if (filling_) endFill();
    filling_ = true;
    currentFill_.points.clear();
    currentFill_.points.push_back(pos_);
}

void PathRecorder::endFill() {
    if (!filling_) return;
    filling_ = false;
    fills_.push_back(std::move(currentFill_));
    currentFill_ = vector::FillContour{};
}

void PathRecorder::clear() {
    path_.segments.clear();
    fills_.clear();
    currentFill_.points.clear();
    if (filling_) currentFill_.points.push_back(pos_);
    netRotation_ = 0.0;
    drawnLength_ = 0.0;
    travelLength_ = 0.0;
    lineCount_ = 0;
    jumpCount_ = 0;
    generation_++;
}

PathRecorder::BufferMeta PathRecorder::getSegmentBufferMeta() {
    segmentBuffer_.clear();
    vector::flattenSegments(path_, segmentBuffer_);
    generation_++;
    return BufferMeta{
        generation_,
        static_cast<std::uint32_t>(path_.segments.size()),
        static_cast<std::uint32_t>(segmentBuffer_.size()),
        reinterpret_cast<std::uintptr_t>(segmentBuffer_.data()),
    };
}

} // namespace starpath
