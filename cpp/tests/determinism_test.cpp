/**
 * Determinism Tests
 *
 * The same star parameters on the same start pose must emit the same path,
 * bit for bit, so frontends can cache traced figures by digest.
 */

#include <gtest/gtest.h>
#include "starpath/starpath.h"
#include "starpath/cursor/path_recorder.h"
#include "starpath/render/vector_ir.h"

using namespace starpath;

namespace {

std::uint64_t digestOf(double radius, std::int64_t vertices, std::optional<std::int64_t> step, std::optional<double> edgeLength) {
    PathRecorder rec;
    EXPECT_TRUE(drawStar(rec, radius, vertices, step, edgeLength).ok());
    return vector::pathDigest(rec.path());
}

} // namespace

TEST(DeterminismTest, SameInputsSameDigest) {
    EXPECT_EQ(digestOf(150.0, 5, std::nullopt, std::nullopt), digestOf(150.0, 5, std::nullopt, std::nullopt));
    EXPECT_EQ(digestOf(250.0, 12, 3, std::nullopt), digestOf(250.0, 12, 3, std::nullopt));
    EXPECT_EQ(digestOf(150.0, 7, std::nullopt, 120.0), digestOf(150.0, 7, std::nullopt, 120.0));
}

TEST(DeterminismTest, DifferentFiguresDiffer) {
    EXPECT_NE(digestOf(250.0, 7, 2, std::nullopt), digestOf(250.0, 7, 3, std::nullopt));
    EXPECT_NE(digestOf(250.0, 7, -3, std::nullopt), digestOf(250.0, 7, -4, std::nullopt));
    EXPECT_NE(digestOf(250.0, 7, 2, std::nullopt), digestOf(-250.0, 7, 2, std::nullopt));
}

TEST(DeterminismTest, DefaultStepMatchesExplicitStep) {
    EXPECT_EQ(digestOf(100.0, 36, std::nullopt, std::nullopt), digestOf(100.0, 36, 17, std::nullopt));
}

TEST(DeterminismTest, RepeatedDrawsOnOneCursorRepeatSegments) {
    PathRecorder rec;
    ASSERT_TRUE(drawStar(rec, 250.0, 6, 2).ok());
    const std::size_t first = rec.path().segments.size();
    ASSERT_TRUE(drawStar(rec, 250.0, 6, 2).ok());
    ASSERT_EQ(rec.path().segments.size(), 2 * first);

    vector::StrokePath a;
    vector::StrokePath b;
    a.segments.assign(rec.path().segments.begin(), rec.path().segments.begin() + first);
    b.segments.assign(rec.path().segments.begin() + first, rec.path().segments.end());
    EXPECT_EQ(vector::pathDigest(a), vector::pathDigest(b));
}

TEST(DeterminismTest, EmptyPathDigestIsStable) {
    vector::StrokePath empty;
    EXPECT_EQ(vector::pathDigest(empty), vector::pathDigest(vector::StrokePath{}));
}
