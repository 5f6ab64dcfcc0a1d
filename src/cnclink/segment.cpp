#include "cnclink/segment.hpp"
#include "cnclink/system_constants.hpp"
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

PlaneDefinition getPlaneDefinition(PlaneMode plane) {
    PlaneDefinition def;

    switch (plane) {
    case PlaneMode::XY:  // G17, Z normal
        def.u_index = 0; def.v_index = 1; def.normal_index = 2;
        break;
    case PlaneMode::ZX:  // G18, Y normal
        def.u_index = 2; def.v_index = 0; def.normal_index = 1;
        break;
    case PlaneMode::YZ:  // G19, X normal
    default:
        def.u_index = 1; def.v_index = 2; def.normal_index = 0;
        break;
    }

    return def;
}

double arcSweepAngle(const Segment& arc) {
    const PlaneDefinition plane = getPlaneDefinition(arc.plane);

    // Radius vectors from the center to the start and end points
    const double r0u = arc.start(plane.u_index) - arc.center(plane.u_index);
    const double r0v = arc.start(plane.v_index) - arc.center(plane.v_index);
    const double r1u = arc.end(plane.u_index) - arc.center(plane.u_index);
    const double r1v = arc.end(plane.v_index) - arc.center(plane.v_index);

    double sweep = std::atan2(r0u * r1v - r0v * r1u, r0u * r1u + r0v * r1v);

    const double eps = SystemConstants::Geometry::ARC_ANGULAR_TRAVEL_EPSILON;
    if (arc.isClockwise()) {
        if (sweep >= -eps) sweep -= 2.0 * M_PI;
    }
    else {
        if (sweep <= eps) sweep += 2.0 * M_PI;
    }
    return sweep;
}

double segmentLength(const Segment& segment) {
    if (!segment.isArc()) {
        return (segment.end - segment.start).norm();
    }
    const PlaneDefinition plane = getPlaneDefinition(segment.plane);
    const double planar = std::abs(arcSweepAngle(segment)) * segment.radius;
    const double linear = segment.end(plane.normal_index) - segment.start(plane.normal_index);
    return std::hypot(planar, linear);
}

std::string segmentTypeToString(SegmentType type) {
    switch (type) {
    case SegmentType::RAPID: return "Rapid";
    case SegmentType::LINEAR: return "Linear";
    case SegmentType::ARC_CW: return "ArcCW";
    case SegmentType::ARC_CCW: return "ArcCCW";
    }
    return "Unknown";
}
