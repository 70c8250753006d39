#include "starpath/render/vector_ir.h"
#include "starpath/core/util.h"

namespace starpath::vector {

std::uint64_t pathDigest(const StrokePath& path) {
    std::uint64_t h = kDigestOffset;
    h = hashU32(h, static_cast<std::uint32_t>(path.segments.size()));
    for (const Segment& s : path.segments) {
        h = hashU32(h, static_cast<std::uint32_t>(s.kind));
        h = hashF64(h, s.from.x);
        h = hashF64(h, s.from.y);
        h = hashF64(h, s.to.x);
        h = hashF64(h, s.to.y);
    }
    return h;
}

void flattenSegments(const StrokePath& path, std::vector<float>& out) {
    out.reserve(out.size() + path.segments.size() * segmentFloats);
    for (const Segment& s : path.segments) {
        out.push_back(static_cast<float>(s.kind));
        out.push_back(static_cast<float>(s.from.x));
        out.push_back(static_cast<float>(s.from.y));
        out.push_back(static_cast<float>(s.to.x));
        out.push_back(static_cast<float>(s.to.y));
    }
}

} // namespace starpath::vector
