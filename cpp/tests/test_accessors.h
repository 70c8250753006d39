#pragma once

#include "starpath/cursor/path_recorder.h"

#include <cstdint>
#include <vector>

class PathRecorderTestAccessor {
public:
    static const std::vector<starpath::Vec2>& currentFill(const starpath::PathRecorder& rec) {
        return rec.currentFill_.points;
    }

    static std::uint32_t generation(const starpath::PathRecorder& rec) {
        return rec.generation_;
    }

    static const std::vector<float>& segmentBuffer(const starpath::PathRecorder& rec) {
        return rec.segmentBuffer_;
    }
};
