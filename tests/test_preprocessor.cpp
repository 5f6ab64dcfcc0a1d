#include "cnclink/gcode_program.hpp"
#include "cnclink/preprocessor.hpp"
#include <gtest/gtest.h>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

std::vector<Segment> load(const std::string& program) {
    GCodeProgram loader;
    ProgramLoadResult result = loader.loadFromString(program);
    EXPECT_FALSE(result.hasErrors());
    return result.segments;
}

double planarDistance(const Eigen::Vector3d& point, const Eigen::Vector3d& center) {
    return std::hypot(point.x() - center.x(), point.y() - center.y());
}

}

TEST(PreprocessorTest, ChordCountFollowsSagittaBound) {
    // 2 acos(1 - 0.1/10) = 0.28308 rad per chord
    EXPECT_EQ(Preprocessor::chordCount(10.0, M_PI / 2.0, 0.1), 6u);
    EXPECT_EQ(Preprocessor::chordCount(10.0, -M_PI / 2.0, 0.1), 6u);
    EXPECT_EQ(Preprocessor::chordCount(10.0, 1e-6, 0.1), 1u);
    EXPECT_EQ(Preprocessor::chordCount(5.0, M_PI, 0.1), 8u);
}

TEST(PreprocessorTest, ChordsStayWithinTolerance) {
    const auto segments = load("G2 X10 Y10 R10 F200");
    ASSERT_EQ(segments.size(), 1u);
    const Segment& arc = segments[0];

    Preprocessor preprocessor;
    const double tolerance = 0.01;
    std::vector<Segment> chords;
    ASSERT_TRUE(preprocessor.expandArc(arc, tolerance, chords));
    ASSERT_EQ(chords.size(), Preprocessor::chordCount(arc.radius, arcSweepAngle(arc), tolerance));

    EXPECT_EQ(chords.front().start, arc.start);
    EXPECT_EQ(chords.back().end, arc.end);

    for (size_t i = 0; i < chords.size(); ++i) {
        const Segment& chord = chords[i];
        EXPECT_EQ(chord.type, SegmentType::LINEAR);
        EXPECT_DOUBLE_EQ(chord.feedRate, 200.0);
        EXPECT_NEAR(planarDistance(chord.end, arc.center), arc.radius, 1e-9);

        // Largest deviation of a chord is at its midpoint
        const Eigen::Vector3d midpoint = 0.5 * (chord.start + chord.end);
        EXPECT_LE(arc.radius - planarDistance(midpoint, arc.center), tolerance + 1e-12);

        if (i > 0) {
            EXPECT_EQ(chord.start, chords[i - 1].end);
        }
    }
}

TEST(PreprocessorTest, HelicalArcInterpolatesNormalAxis) {
    const auto segments = load("G3 X0 Y0 Z6 I5 J0 F100");
    ASSERT_EQ(segments.size(), 1u);

    Preprocessor preprocessor;
    std::vector<Segment> chords;
    ASSERT_TRUE(preprocessor.expandArc(segments[0], 0.05, chords));
    ASSERT_GT(chords.size(), 4u);

    double previousZ = 0.0;
    for (const auto& chord : chords) {
        EXPECT_GT(chord.end.z(), previousZ);
        previousZ = chord.end.z();
    }
    EXPECT_DOUBLE_EQ(chords.back().end.z(), 6.0);
}

TEST(PreprocessorTest, DegenerateToleranceIsReported) {
    const auto segments = load("G2 X10 Y10 R10 F200");
    ASSERT_EQ(segments.size(), 1u);

    Preprocessor preprocessor;
    std::vector<Segment> chords;
    EXPECT_FALSE(preprocessor.expandArc(segments[0], 1e-18, chords));
    EXPECT_NE(preprocessor.getLastError().find("chords"), std::string::npos);
}

TEST(PreprocessorTest, ProcessExpandsEveryArc) {
    const auto segments = load("G0 X0 Y0\nG1 X10 F300\nG3 X20 Y10 I0 J10\nG1 Y20");
    ASSERT_EQ(segments.size(), 4u);

    Preprocessor preprocessor;
    std::vector<Segment> output;
    ASSERT_TRUE(preprocessor.process(segments, output));

    // The zero-length rapid is dropped as well
    EXPECT_EQ(output.front().type, SegmentType::LINEAR);
    for (size_t i = 0; i < output.size(); ++i) {
        EXPECT_FALSE(output[i].isArc());
        if (i > 0) {
            EXPECT_TRUE(output[i].start.isApprox(output[i - 1].end, 1e-12));
        }
    }
    EXPECT_TRUE(output.back().end.isApprox(Eigen::Vector3d(20, 20, 0)));
}

TEST(PreprocessorTest, InvalidToleranceFailsProcessing) {
    PreprocessorConfig config;
    config.arc_tolerance = 0.0;
    EXPECT_FALSE(config.isValid());

    Preprocessor preprocessor(config);
    std::vector<Segment> output;
    EXPECT_FALSE(preprocessor.process(load("G1 X1 F10"), output));
    EXPECT_FALSE(preprocessor.getLastError().empty());
}

TEST(PreprocessorTest, UnitConversionIsIdempotentAndInvertible) {
    const auto inches = load("G20\nG1 X1 Y2 Z3 F10\nG2 X2 Y3 I1 J0");
    ASSERT_EQ(inches.size(), 2u);

    Preprocessor preprocessor;
    const auto mm = preprocessor.convertUnits(inches, UnitMode::MM);
    ASSERT_EQ(mm.size(), 2u);
    EXPECT_EQ(mm[0].units, UnitMode::MM);
    EXPECT_TRUE(mm[0].end.isApprox(Eigen::Vector3d(25.4, 50.8, 76.2)));
    EXPECT_NEAR(mm[0].feedRate, 254.0, 1e-9);
    EXPECT_NEAR(mm[1].radius, 25.4, 1e-9);

    const auto twice = preprocessor.convertUnits(mm, UnitMode::MM);
    for (size_t i = 0; i < mm.size(); ++i) {
        EXPECT_EQ(twice[i].end, mm[i].end);
        EXPECT_EQ(twice[i].feedRate, mm[i].feedRate);
    }

    const auto back = preprocessor.convertUnits(mm, UnitMode::INCH);
    for (size_t i = 0; i < inches.size(); ++i) {
        EXPECT_EQ(back[i].units, UnitMode::INCH);
        EXPECT_LT((back[i].start - inches[i].start).norm(), 1e-12);
        EXPECT_LT((back[i].end - inches[i].end).norm(), 1e-12);
        EXPECT_NEAR(back[i].feedRate, inches[i].feedRate, 1e-12);
        EXPECT_NEAR(back[i].radius, inches[i].radius, 1e-12);
    }
}

TEST(PreprocessorTest, OnlyZeroLengthRapidsAreRemoved) {
    const auto segments = load("G0 X0\nG1 X0 F100\nG0 X5\nG0 X5");
    ASSERT_EQ(segments.size(), 4u);

    Preprocessor preprocessor;
    const auto optimized = preprocessor.optimizeRapids(segments);
    ASSERT_EQ(optimized.size(), 2u);
    EXPECT_EQ(optimized[0].type, SegmentType::LINEAR);
    EXPECT_EQ(optimized[1].type, SegmentType::RAPID);
    EXPECT_TRUE(optimized[1].end.isApprox(Eigen::Vector3d(5, 0, 0)));
}

TEST(PreprocessorTest, FormatsLinearProgram) {
    const auto segments = load("G1 X10 F500\nG1 Y10\nG0 X0 Y0");

    Preprocessor preprocessor;
    const auto lines = preprocessor.formatProgram(segments);
    const std::vector<std::string> expected = {
        "G90",
        "G21",
        "G1 X10.000 Y0.000 Z0.000 F500",
        "G1 X10.000 Y10.000 Z0.000",
        "G0 X0.000 Y0.000 Z0.000"
    };
    EXPECT_EQ(lines, expected);
}

TEST(PreprocessorTest, FormatsArcsWithPlaneAndOffsets) {
    const auto segments = load("M3 S1000\nG2 X5 Y5 I5 J0 F100");

    Preprocessor preprocessor;
    const auto lines = preprocessor.formatProgram(segments);
    const std::vector<std::string> expected = {
        "G90",
        "G21",
        "G17",
        "G2 X5.000 Y5.000 Z0.000 I5.0000 J0.0000 F100 S1000"
    };
    EXPECT_EQ(lines, expected);
}

TEST(PreprocessorTest, EmptyProgramFormatsToNothing) {
    Preprocessor preprocessor;
    EXPECT_TRUE(preprocessor.formatProgram({}).empty());
}
