#ifndef STARPATH_VECTOR_IR_H
#define STARPATH_VECTOR_IR_H

#include "starpath/core/types.h"

#include <cstdint>
#include <vector>

namespace starpath::vector {

// Pen movements emitted by a cursor. Move segments are pen-up travel, Line segments are drawn.

enum class SegmentKind : std::uint8_t { Move = 0, Line = 1 };

struct Segment {
    SegmentKind kind{SegmentKind::Move};
    Vec2 from{};
    Vec2 to{};

    static Segment moveTo(Vec2 start, Vec2 p) noexcept {
        Segment s;
        s.kind = SegmentKind::Move;
        s.from = start;
        s.to = p;
        return s;
    }
    static Segment lineTo(Vec2 start, Vec2 p) noexcept {
        Segment s;
        s.kind = SegmentKind::Line;
        s.from = start;
        s.to = p;
        return s;
    }
};

struct StrokePath {
    std::vector<Segment> segments;
};

// Closed polygon collected between beginFill/endFill.
struct FillContour {
    std::vector<Vec2> points;
};

// Floats per segment in the flattened buffer: kind, x0, y0, x1, y1.
static constexpr std::size_t segmentFloats = 5;

// FNV-1a digest over segment kinds and canonicalized coordinates.
std::uint64_t pathDigest(const StrokePath& path);

// Appends (kind, x0, y0, x1, y1) per segment to out.
void flattenSegments(const StrokePath& path, std::vector<float>& out);

} // namespace starpath::vector

#endif // STARPATH_VECTOR_IR_H
