#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#endif

// Include the planner public API header for bindings.
#include "starpath/starpath.h"
#include "starpath/cursor/path_recorder.h"
#include "starpath/star/regular_polygon.h"

#ifdef EMSCRIPTEN
namespace {

using starpath::PathRecorder;
using starpath::StarError;

StarError drawStarDefault(PathRecorder& recorder, double radius, int vertices) {
    return starpath::drawStar(recorder, radius, vertices).error;
}

StarError drawStarWithStep(PathRecorder& recorder, double radius, int vertices, int step) {
    return starpath::drawStar(recorder, radius, vertices, step).error;
}

// minEdgeLength is set on EdgeTooShort so the frontend can retry without a second round-trip.
starpath::DrawStarResult drawStarWithEdgeLength(PathRecorder& recorder, double radius, int vertices, double edgeLength) {
    return starpath::drawStar(recorder, radius, vertices, std::nullopt, edgeLength);
}

StarError drawRegularPolygon(PathRecorder& recorder, double radius, int sides) {
    return starpath::traceRegularPolygon(recorder, radius, sides);
}

double recorderX(const PathRecorder& recorder) { return recorder.position().x; }
double recorderY(const PathRecorder& recorder) { return recorder.position().y; }
void recorderGoTo(PathRecorder& recorder, double x, double y) { recorder.goTo(starpath::Vec2{x, y}); }

} // namespace

EMSCRIPTEN_BINDINGS(starpath_module) {
    emscripten::enum_<StarError>("StarError")
        .value("Ok", StarError::Ok)
        .value("InvalidArguments", StarError::InvalidArguments)
        .value("InvalidStep", StarError::InvalidStep)
        .value("EdgeTooShort", StarError::EdgeTooShort)
        .value("InvalidVertexCount", StarError::InvalidVertexCount)
        .value("InvalidRadius", StarError::InvalidRadius);

    emscripten::value_object<starpath::DrawStarResult>("DrawStarResult")
        .field("error", &starpath::DrawStarResult::error)
        .field("minEdgeLength", &starpath::DrawStarResult::minEdgeLength);

    emscripten::value_object<PathRecorder::BufferMeta>("SegmentBufferMeta")
        .field("generation", &PathRecorder::BufferMeta::generation)
        .field("segmentCount", &PathRecorder::BufferMeta::segmentCount)
        .field("floatCount", &PathRecorder::BufferMeta::floatCount)
        .field("ptr", &PathRecorder::BufferMeta::ptr);

    emscripten::class_<PathRecorder>("PathRecorder")
        .constructor<>()
        .function("forward", &PathRecorder::forward)
        .function("rotate", &PathRecorder::rotate)
        .function("heading", &PathRecorder::heading)
        .function("setHeading", &PathRecorder::setHeading)
        .function("penUp", &PathRecorder::penUp)
        .function("penDown", &PathRecorder::penDown)
        .function("setDegrees", &PathRecorder::setDegrees)
        .function("setRadians", &PathRecorder::setRadians)
        .function("beginFill", &PathRecorder::beginFill)
        .function("endFill", &PathRecorder::endFill)
        .function("clear", &PathRecorder::clear)
        .function("getSegmentBufferMeta", &PathRecorder::getSegmentBufferMeta)
        .function("x", &recorderX)
        .function("y", &recorderY)
        .function("goTo", &recorderGoTo);

    emscripten::function("drawStarDefault", &drawStarDefault);
    emscripten::function("drawStarWithStep", &drawStarWithStep);
    emscripten::function("drawStarWithEdgeLength", &drawStarWithEdgeLength);
    emscripten::function("drawRegularPolygon", &drawRegularPolygon);
}
#endif
