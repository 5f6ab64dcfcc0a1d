#pragma once

#include "cnclink/gcode_types.hpp"
#include <Eigen/Dense>
#include <optional>
#include <string>

enum class SegmentType {
    RAPID,    // G0
    LINEAR,   // G1
    ARC_CW,   // G2
    ARC_CCW   // G3
};

/**
 * One motion primitive with absolute endpoints.
 * Coordinates, feed and arc geometry are expressed in `units`.
 */
struct Segment {
    SegmentType type = SegmentType::LINEAR;
    Eigen::Vector3d start = Eigen::Vector3d::Zero();
    Eigen::Vector3d end = Eigen::Vector3d::Zero();
    double feedRate = 0.0;
    double spindleSpeed = 0.0;
    UnitMode units = UnitMode::MM;
    PlaneMode plane = PlaneMode::XY;

    // Arc geometry (ARC_CW / ARC_CCW only)
    Eigen::Vector3d center = Eigen::Vector3d::Zero();        // Absolute
    Eigen::Vector3d centerOffset = Eigen::Vector3d::Zero();  // center - start, in-plane only
    double radius = 0.0;

    size_t sourceLine = 0;              // 1-based program line
    std::optional<int> lineNumber;      // N word

    bool isArc() const { return type == SegmentType::ARC_CW || type == SegmentType::ARC_CCW; }
    bool isClockwise() const { return type == SegmentType::ARC_CW; }
};

// Axis indices of an arc plane (u, v in-plane, normal out of plane)
struct PlaneDefinition {
    int u_index, v_index, normal_index;
};

PlaneDefinition getPlaneDefinition(PlaneMode plane);

/**
 * Signed angular travel of an arc segment [rad], negative for clockwise.
 * Coincident start and end describe a full circle.
 */
double arcSweepAngle(const Segment& arc);

/**
 * Length along the path (arc length for arcs, including the helical component)
 */
double segmentLength(const Segment& segment);

std::string segmentTypeToString(SegmentType type);
