#include "cnclink/segment_generator.hpp"
#include "cnclink/system_constants.hpp"
#include <cmath>
#include <sstream>

namespace {

const char OFFSET_LETTERS[3] = { 'I', 'J', 'K' };
const char AXIS_LETTERS[3] = { 'X', 'Y', 'Z' };

}

bool SegmentGenerator::generate(const ParsedCommand& command, ParserState& state,
    std::optional<Segment>& segment, ParseError& error) const {

    segment.reset();

    if (command.type == CommandType::NON_MODAL) {
        if (command.hasWord('G', 92) || command.hasWord('G', 92, 1)) {
            applyCoordinateOffset(command, state);
        }
        return true;
    }

    if (command.type != CommandType::MOTION || command.motion == MotionMode::NONE) {
        return true;
    }

    const Eigen::Vector3d target = resolveTarget(command, state);

    Segment seg;
    seg.start = fromMillimetres(state.position, state.unitMode);
    seg.end = fromMillimetres(target, state.unitMode);
    seg.feedRate = state.feedRate;
    seg.spindleSpeed = state.spindleSpeed;
    seg.units = state.unitMode;
    seg.plane = state.planeMode;
    seg.sourceLine = command.sourceLine;
    seg.lineNumber = command.lineNumber;

    switch (command.motion) {
    case MotionMode::G0:
        seg.type = SegmentType::RAPID;
        break;
    case MotionMode::G1:
        seg.type = SegmentType::LINEAR;
        break;
    case MotionMode::G2:
    case MotionMode::G3: {
        seg.type = command.motion == MotionMode::G2 ? SegmentType::ARC_CW : SegmentType::ARC_CCW;

        Eigen::Vector3d center_point;
        double radius = 0.0;
        std::string message;
        if (!calculateArcGeometry(command, state, target, center_point, radius, message)) {
            error.kind = ParseErrorKind::DOMAIN;
            error.line = command.sourceLine;
            error.column = 0;
            error.message = message;
            return false;
        }

        seg.center = fromMillimetres(center_point, state.unitMode);
        seg.centerOffset = fromMillimetres(center_point - state.position, state.unitMode);
        seg.radius = state.unitMode == UnitMode::INCH ? SystemConstants::Utils::mmToInch(radius) : radius;
        break;
    }
    case MotionMode::NONE:
        return true;
    }

    state.position = target;
    segment = seg;
    return true;
}

Eigen::Vector3d SegmentGenerator::resolveTarget(const ParsedCommand& command, const ParserState& state) const {
    Eigen::Vector3d target = state.position;

    // G53 moves are always absolute
    const bool relative = state.coordMode == CoordMode::RELATIVE && !command.machineCoordinates;

    for (int axis = 0; axis < 3; ++axis) {
        auto value = command.parameter(AXIS_LETTERS[axis]);
        if (!value) {
            continue;   // Unspecified axis stays where it is
        }
        const double mm = toMillimetres(*value, state.unitMode);
        if (relative) {
            target(axis) += mm;
        }
        else if (command.machineCoordinates) {
            target(axis) = mm;
        }
        else {
            target(axis) = mm + state.coordinateOffset(axis);
        }
    }
    return target;
}

bool SegmentGenerator::calculateArcGeometry(const ParsedCommand& command, const ParserState& state,
    const Eigen::Vector3d& target, Eigen::Vector3d& center_point, double& radius,
    std::string& message) const {

    const bool hasRadius = command.hasParameter('R');
    const bool hasOffsets = command.hasParameter('I') || command.hasParameter('J') || command.hasParameter('K');

    if (hasRadius && hasOffsets) {
        message = "Arc specifies both R and IJK";
        return false;
    }
    if (hasRadius) {
        return calculateCenterFromRadius(command, state, target, center_point, radius, message);
    }
    if (hasOffsets) {
        return calculateCenterFromOffsets(command, state, target, center_point, radius, message);
    }

    message = "Arc requires either R or IJK center words";
    return false;
}

bool SegmentGenerator::calculateCenterFromRadius(const ParsedCommand& command, const ParserState& state,
    const Eigen::Vector3d& target, Eigen::Vector3d& center_point, double& radius,
    std::string& message) const {

    const PlaneDefinition plane = getPlaneDefinition(state.planeMode);
    const Eigen::Vector3d& start = state.position;

    double r = toMillimetres(*command.parameter('R'), state.unitMode);
    const double x = target(plane.u_index) - start(plane.u_index);
    const double y = target(plane.v_index) - start(plane.v_index);
    const double chord = std::hypot(x, y);

    if (chord < SystemConstants::Geometry::POSITION_EPSILON) {
        message = "Radius format arc requires distinct start and end points";
        return false;
    }

    // Distance from the chord midpoint to the center, scaled by 1/chord:
    // h_x2_div_d = -sqrt(4r^2 - d^2) / d
    double h_x2_div_d = 4.0 * r * r - x * x - y * y;
    if (h_x2_div_d < 0.0) {
        // Exact half circles land a rounding error below zero
        if (h_x2_div_d > -1e-9 * 4.0 * r * r) {
            h_x2_div_d = 0.0;
        }
        else {
            std::ostringstream ss;
            ss << "Arc radius " << std::abs(r) << " mm is smaller than half the chord length "
                << chord / 2.0 << " mm";
            message = ss.str();
            return false;
        }
    }

    h_x2_div_d = -std::sqrt(h_x2_div_d) / chord;

    if (command.motion == MotionMode::G3) {
        h_x2_div_d = -h_x2_div_d;
    }

    // Negative R selects the arc longer than a half circle
    if (r < 0.0) {
        h_x2_div_d = -h_x2_div_d;
        r = -r;
    }

    center_point = start;
    center_point(plane.u_index) += 0.5 * (x - (y * h_x2_div_d));
    center_point(plane.v_index) += 0.5 * (y + (x * h_x2_div_d));
    radius = r;
    return true;
}

bool SegmentGenerator::calculateCenterFromOffsets(const ParsedCommand& command, const ParserState& state,
    const Eigen::Vector3d& target, Eigen::Vector3d& center_point, double& radius,
    std::string& message) const {

    const PlaneDefinition plane = getPlaneDefinition(state.planeMode);
    const Eigen::Vector3d& start = state.position;

    auto offsetU = command.parameter(OFFSET_LETTERS[plane.u_index]);
    auto offsetV = command.parameter(OFFSET_LETTERS[plane.v_index]);
    if (!offsetU && !offsetV) {
        message = std::string("Arc is missing ") + OFFSET_LETTERS[plane.u_index] + "/" +
            OFFSET_LETTERS[plane.v_index] + " offsets for plane " + planeModeToString(state.planeMode);
        return false;
    }

    const double du = offsetU ? toMillimetres(*offsetU, state.unitMode) : 0.0;
    const double dv = offsetV ? toMillimetres(*offsetV, state.unitMode) : 0.0;

    center_point = start;
    center_point(plane.u_index) += du;
    center_point(plane.v_index) += dv;

    const double startRadius = std::hypot(du, dv);
    if (startRadius < SystemConstants::Geometry::POSITION_EPSILON) {
        message = "Arc radius is zero";
        return false;
    }

    const double endRadius = std::hypot(target(plane.u_index) - center_point(plane.u_index),
        target(plane.v_index) - center_point(plane.v_index));

    const double deltaR = std::abs(endRadius - startRadius);
    if (deltaR > SystemConstants::Geometry::ARC_RADIUS_ERROR_MIN_MM &&
        (deltaR > SystemConstants::Geometry::ARC_RADIUS_ERROR_MAX_MM ||
            deltaR > SystemConstants::Geometry::ARC_RADIUS_ERROR_RELATIVE * startRadius)) {
        std::ostringstream ss;
        ss << "Arc end point is not on the arc: start radius " << startRadius
            << " mm, end radius " << endRadius << " mm";
        message = ss.str();
        return false;
    }

    radius = startRadius;
    return true;
}

void SegmentGenerator::applyCoordinateOffset(const ParsedCommand& command, ParserState& state) const {
    if (command.hasWord('G', 92, 1)) {
        state.coordinateOffset.setZero();
        return;
    }

    // G92 makes the current point read as the given coordinates without moving
    for (int axis = 0; axis < 3; ++axis) {
        if (auto value = command.parameter(AXIS_LETTERS[axis])) {
            state.coordinateOffset(axis) = state.position(axis) - toMillimetres(*value, state.unitMode);
        }
    }
}

double SegmentGenerator::toMillimetres(double value, UnitMode units) const {
    return units == UnitMode::MM ? value : SystemConstants::Utils::inchToMm(value);
}

Eigen::Vector3d SegmentGenerator::fromMillimetres(const Eigen::Vector3d& point, UnitMode units) const {
    return units == UnitMode::MM ? point : Eigen::Vector3d(point / SystemConstants::Geometry::MM_PER_INCH);
}
