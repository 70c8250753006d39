#include <gtest/gtest.h>

#include "starpath/cursor/path_recorder.h"
#include "tests/test_accessors.h"

#include <cmath>

using namespace starpath;
using starpath::vector::SegmentKind;

TEST(PathRecorderTest, ForwardFollowsHeadingInDegrees) {
    PathRecorder rec;
    rec.forward(10.0);
    rec.rotate(90.0);
    rec.forward(5.0);

    EXPECT_NEAR(rec.position().x, 10.0, 1e-12);
    EXPECT_NEAR(rec.position().y, 5.0, 1e-12);
    EXPECT_NEAR(rec.heading(), 90.0, 1e-12);
    ASSERT_EQ(rec.path().segments.size(), 2u);
    EXPECT_EQ(rec.path().segments[0].kind, SegmentKind::Line);
    EXPECT_EQ(rec.lineCount(), 2u);
    EXPECT_NEAR(rec.drawnLength(), 15.0, 1e-12);
}

TEST(PathRecorderTest, PenUpRecordsMoves) {
    PathRecorder rec;
    rec.penUp();
    rec.forward(3.0);
    rec.goTo(Vec2{3.0, 4.0});
    rec.penDown();
    rec.goTo(Vec2{0.0, 0.0});

    const auto& segs = rec.path().segments;
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0].kind, SegmentKind::Move);
    EXPECT_EQ(segs[1].kind, SegmentKind::Move);
    EXPECT_EQ(segs[2].kind, SegmentKind::Line);
    EXPECT_EQ(rec.jumpCount(), 2u);
    EXPECT_NEAR(rec.travelLength(), 7.0, 1e-12);
    EXPECT_NEAR(rec.drawnLength(), 5.0, 1e-12);
}

TEST(PathRecorderTest, HeadingIsNormalizedPerUnit) {
    PathRecorder rec;
    rec.rotate(-90.0);
    EXPECT_NEAR(rec.heading(), 270.0, 1e-12);
    EXPECT_NEAR(rec.netRotation(), -kPi / 2.0, 1e-12);

    rec.setRadians();
    EXPECT_NEAR(rec.heading(), 1.5 * kPi, 1e-12);

    rec.setDegrees(400.0);
    EXPECT_NEAR(rec.heading(), 300.0, 1e-9);
}

TEST(PathRecorderTest, InvalidFullCircleFallsBackToDegrees) {
    PathRecorder rec;
    rec.setDegrees(0.0);
    EXPECT_DOUBLE_EQ(rec.fullCircleDegrees(), kDefaultFullCircleDegrees);
    EXPECT_EQ(rec.angleUnit(), AngleUnit::Degrees);
}

TEST(PathRecorderTest, OptionsSetInitialPose) {
    RecorderOptions opt;
    opt.origin = Vec2{1.0, 2.0};
    opt.heading = kPi;
    opt.angleUnit = AngleUnit::Radians;
    PathRecorder rec(opt);

    rec.forward(1.0);
    EXPECT_NEAR(rec.position().x, 0.0, 1e-12);
    EXPECT_NEAR(rec.position().y, 2.0, 1e-12);
}

TEST(PathRecorderTest, FillCollectsEveryPosition) {
    PathRecorder rec;
    rec.beginFill();
    EXPECT_TRUE(rec.isFilling());
    rec.forward(1.0);
    rec.penUp();
    rec.rotate(90.0);
    rec.forward(1.0);
    EXPECT_EQ(PathRecorderTestAccessor::currentFill(rec).size(), 3u);
    rec.endFill();

    EXPECT_FALSE(rec.isFilling());
    ASSERT_EQ(rec.fills().size(), 1u);
    EXPECT_EQ(rec.fills()[0].points.size(), 3u);
    EXPECT_TRUE(PathRecorderTestAccessor::currentFill(rec).empty());

    rec.endFill();
    EXPECT_EQ(rec.fills().size(), 1u);
}

TEST(PathRecorderTest, SegmentBufferMeta) {
    PathRecorder rec;
    rec.forward(2.0);
    rec.penUp();
    rec.forward(1.0);

    const PathRecorder::BufferMeta meta = rec.getSegmentBufferMeta();
    EXPECT_EQ(meta.segmentCount, 2u);
    EXPECT_EQ(meta.floatCount, 2u * vector::segmentFloats);
    EXPECT_EQ(meta.generation, PathRecorderTestAccessor::generation(rec));

    const std::vector<float>& buf = PathRecorderTestAccessor::segmentBuffer(rec);
    ASSERT_EQ(buf.size(), 10u);
    EXPECT_EQ(buf[0], static_cast<float>(SegmentKind::Line));
    EXPECT_FLOAT_EQ(buf[3], 2.0f);
    EXPECT_EQ(buf[5], static_cast<float>(SegmentKind::Move));
    EXPECT_FLOAT_EQ(buf[8], 3.0f);
}

TEST(PathRecorderTest, ClearKeepsPose) {
    PathRecorder rec;
    rec.forward(4.0);
    rec.rotate(30.0);
    const std::uint32_t gen = PathRecorderTestAccessor::generation(rec);
    rec.clear();

    EXPECT_TRUE(rec.path().segments.empty());
    EXPECT_EQ(rec.lineCount(), 0u);
    EXPECT_DOUBLE_EQ(rec.netRotation(), 0.0);
    EXPECT_NEAR(rec.position().x, 4.0, 1e-12);
    EXPECT_NEAR(rec.heading(), 30.0, 1e-12);
    EXPECT_GT(PathRecorderTestAccessor::generation(rec), gen);
}
