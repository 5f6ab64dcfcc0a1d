#include "cnclink/gcode_parser.hpp"
#include "cnclink/segment_generator.hpp"
#include <gtest/gtest.h>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

constexpr double kTol = 1e-9;

void expectVector(const Eigen::Vector3d& actual, double x, double y, double z, double tol = kTol) {
    EXPECT_NEAR(actual.x(), x, tol);
    EXPECT_NEAR(actual.y(), y, tol);
    EXPECT_NEAR(actual.z(), z, tol);
}

}

class SegmentGeneratorTest : public ::testing::Test {
protected:
    GCodeParser parser_;
    SegmentGenerator generator_;
    ParserState state_;
    std::optional<Segment> segment_;
    ParseError error_;
    size_t line_ = 0;

    // Parse and resolve one line, committing state only when both succeed
    bool run(const std::string& text) {
        ParserState next = state_;
        std::optional<ParsedCommand> command;
        segment_.reset();
        if (!parser_.parseLine(text, ++line_, next, command, error_)) {
            return false;
        }
        if (command && !generator_.generate(*command, next, segment_, error_)) {
            return false;
        }
        state_ = next;
        return true;
    }
};

TEST_F(SegmentGeneratorTest, LinearMoveFromOrigin) {
    ASSERT_TRUE(run("G1 X10 Y5 F300"));
    ASSERT_TRUE(segment_);
    EXPECT_EQ(segment_->type, SegmentType::LINEAR);
    expectVector(segment_->start, 0, 0, 0);
    expectVector(segment_->end, 10, 5, 0);
    EXPECT_DOUBLE_EQ(segment_->feedRate, 300.0);
    EXPECT_EQ(segment_->sourceLine, 1u);
}

TEST_F(SegmentGeneratorTest, UnspecifiedAxesKeepTheirPosition) {
    ASSERT_TRUE(run("G0 X1 Y2 Z3"));
    EXPECT_EQ(segment_->type, SegmentType::RAPID);
    ASSERT_TRUE(run("Z-1"));
    expectVector(segment_->start, 1, 2, 3);
    expectVector(segment_->end, 1, 2, -1);
}

TEST_F(SegmentGeneratorTest, RelativeMovesAccumulate) {
    ASSERT_TRUE(run("G91 G1 X5 F100"));
    expectVector(segment_->end, 5, 0, 0);
    ASSERT_TRUE(run("X5 Y-2"));
    expectVector(segment_->start, 5, 0, 0);
    expectVector(segment_->end, 10, -2, 0);
}

TEST_F(SegmentGeneratorTest, InchProgramsEmitInchSegments) {
    ASSERT_TRUE(run("G20 G1 X1 F10"));
    ASSERT_TRUE(segment_);
    EXPECT_EQ(segment_->units, UnitMode::INCH);
    expectVector(segment_->end, 1, 0, 0);
    expectVector(state_.position, 25.4, 0, 0);

    // Switching units keeps the physical position
    ASSERT_TRUE(run("G21 X30"));
    EXPECT_EQ(segment_->units, UnitMode::MM);
    expectVector(segment_->start, 25.4, 0, 0);
}

TEST_F(SegmentGeneratorTest, ClockwiseArcFromOffsets) {
    ASSERT_TRUE(run("G2 X5 Y5 I5 J0 F200"));
    ASSERT_TRUE(segment_);
    EXPECT_EQ(segment_->type, SegmentType::ARC_CW);
    expectVector(segment_->center, 5, 0, 0);
    expectVector(segment_->centerOffset, 5, 0, 0);
    EXPECT_NEAR(segment_->radius, 5.0, kTol);
    EXPECT_NEAR(arcSweepAngle(*segment_), -M_PI / 2.0, 1e-9);
    EXPECT_NEAR(segmentLength(*segment_), 5.0 * M_PI / 2.0, 1e-9);
}

TEST_F(SegmentGeneratorTest, RadiusFormatPicksMinorArc) {
    ASSERT_TRUE(run("G3 X10 Y10 R10 F200"));
    ASSERT_TRUE(segment_);
    EXPECT_EQ(segment_->type, SegmentType::ARC_CCW);
    expectVector(segment_->center, 0, 10, 0);
    EXPECT_NEAR(arcSweepAngle(*segment_), M_PI / 2.0, 1e-9);
}

TEST_F(SegmentGeneratorTest, RadiusFormatClockwise) {
    ASSERT_TRUE(run("G2 X10 Y10 R10 F200"));
    expectVector(segment_->center, 10, 0, 0);
    EXPECT_NEAR(arcSweepAngle(*segment_), -M_PI / 2.0, 1e-9);
}

TEST_F(SegmentGeneratorTest, NegativeRadiusSelectsMajorArc) {
    ASSERT_TRUE(run("G3 X10 Y10 R-10 F200"));
    expectVector(segment_->center, 10, 0, 0);
    EXPECT_NEAR(arcSweepAngle(*segment_), 3.0 * M_PI / 2.0, 1e-9);
    EXPECT_NEAR(segment_->radius, 10.0, kTol);
}

TEST_F(SegmentGeneratorTest, HalfCircleRadiusIsAccepted) {
    ASSERT_TRUE(run("G2 X10 Y0 R5 F200"));
    expectVector(segment_->center, 5, 0, 0, 1e-6);
}

TEST_F(SegmentGeneratorTest, RadiusTooSmallIsRejected) {
    ASSERT_FALSE(run("G2 X10 Y0 R2 F200"));
    EXPECT_EQ(error_.kind, ParseErrorKind::DOMAIN);
    EXPECT_NE(error_.message.find("smaller than half the chord"), std::string::npos);
    expectVector(state_.position, 0, 0, 0);
    EXPECT_EQ(state_.motionMode, MotionMode::NONE);
}

TEST_F(SegmentGeneratorTest, RadiusAndOffsetsTogetherAreRejected) {
    ASSERT_FALSE(run("G2 X10 Y0 R5 I5"));
    EXPECT_NE(error_.message.find("both R and IJK"), std::string::npos);
}

TEST_F(SegmentGeneratorTest, EndPointOffTheArcIsRejected) {
    ASSERT_FALSE(run("G2 X10 Y0 I3 J0"));
    EXPECT_EQ(error_.kind, ParseErrorKind::DOMAIN);
    EXPECT_NE(error_.message.find("not on the arc"), std::string::npos);
}

TEST_F(SegmentGeneratorTest, OffsetsOutsideThePlaneAreRejected) {
    ASSERT_FALSE(run("G2 X10 Y0 K5"));
    EXPECT_NE(error_.message.find("missing"), std::string::npos);
}

TEST_F(SegmentGeneratorTest, ArcInZXPlane) {
    ASSERT_TRUE(run("G18 G2 X10 Z0 I5 F100"));
    ASSERT_TRUE(segment_);
    EXPECT_EQ(segment_->plane, PlaneMode::ZX);
    expectVector(segment_->center, 5, 0, 0);
    EXPECT_NEAR(std::abs(arcSweepAngle(*segment_)), M_PI, 1e-9);
}

TEST_F(SegmentGeneratorTest, FullHelicalCircle) {
    ASSERT_TRUE(run("G3 X0 Y0 Z5 I5 J0 F100"));
    ASSERT_TRUE(segment_);
    EXPECT_NEAR(arcSweepAngle(*segment_), 2.0 * M_PI, 1e-9);
    const double planar = 2.0 * M_PI * 5.0;
    EXPECT_NEAR(segmentLength(*segment_), std::hypot(planar, 5.0), 1e-9);
}

TEST_F(SegmentGeneratorTest, CoordinateOffsetKeepsSegmentsContinuous) {
    ASSERT_TRUE(run("G1 X10 F100"));
    ASSERT_TRUE(run("G92 X0"));
    EXPECT_FALSE(segment_);
    expectVector(state_.position, 10, 0, 0);

    ASSERT_TRUE(run("X5"));
    expectVector(segment_->start, 10, 0, 0);
    expectVector(segment_->end, 15, 0, 0);

    ASSERT_TRUE(run("G92.1"));
    ASSERT_TRUE(run("X5"));
    expectVector(segment_->start, 15, 0, 0);
    expectVector(segment_->end, 5, 0, 0);
}

TEST_F(SegmentGeneratorTest, MachineCoordinatesIgnoreOffsetAndRelativeMode) {
    ASSERT_TRUE(run("G1 X10 F100"));
    ASSERT_TRUE(run("G92 X0"));
    ASSERT_TRUE(run("G91"));
    ASSERT_TRUE(run("G53 G0 X1"));
    expectVector(segment_->end, 1, 0, 0);
}

TEST_F(SegmentGeneratorTest, NonMotionCommandsProduceNoSegment) {
    ASSERT_TRUE(run("M3 S1000"));
    EXPECT_FALSE(segment_);
    ASSERT_TRUE(run("G4 P1"));
    EXPECT_FALSE(segment_);
}

TEST(PlaneDefinitionTest, AxisIndicesPerPlane) {
    const PlaneDefinition xy = getPlaneDefinition(PlaneMode::XY);
    EXPECT_EQ(xy.u_index, 0);
    EXPECT_EQ(xy.v_index, 1);
    EXPECT_EQ(xy.normal_index, 2);

    const PlaneDefinition zx = getPlaneDefinition(PlaneMode::ZX);
    EXPECT_EQ(zx.u_index, 2);
    EXPECT_EQ(zx.v_index, 0);
    EXPECT_EQ(zx.normal_index, 1);

    const PlaneDefinition yz = getPlaneDefinition(PlaneMode::YZ);
    EXPECT_EQ(yz.u_index, 1);
    EXPECT_EQ(yz.v_index, 2);
    EXPECT_EQ(yz.normal_index, 0);
}
