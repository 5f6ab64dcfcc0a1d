#include "cnclink/preprocessor.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include <sstream>

Preprocessor::Preprocessor(const PreprocessorConfig& config)
    : config_(config) {
}

bool Preprocessor::process(const std::vector<Segment>& input, std::vector<Segment>& output) const {
    if (!config_.isValid()) {
        setError("Invalid preprocessor configuration");
        return false;
    }

    std::vector<Segment> current = input;

    if (config_.expand_arcs) {
        std::vector<Segment> expanded;
        if (!expandArcs(current, config_.arc_tolerance, expanded)) {
            return false;
        }
        current.swap(expanded);
    }

    if (config_.convert_units) {
        current = convertUnits(current, config_.target_units);
    }

    if (config_.optimize_rapids) {
        current = optimizeRapids(current);
    }

    output.swap(current);
    return true;
}

// =============================================================================
// Arc Expansion
// =============================================================================
size_t Preprocessor::chordCount(double radius, double sweep, double tolerance) {
    if (radius <= 0.0 || tolerance <= 0.0) {
        return 1;
    }

    // Sagitta r(1 - cos(theta/2)) <= tolerance  =>  theta <= 2 acos(1 - tolerance/r)
    const double ratio = std::max(-1.0, std::min(1.0, 1.0 - tolerance / radius));
    const double maxChordAngle = 2.0 * std::acos(ratio);
    if (maxChordAngle <= 0.0) {
        return SystemConstants::Geometry::MAX_CHORDS_PER_ARC + 1;
    }

    const double chords = std::ceil(std::abs(sweep) / maxChordAngle);
    if (chords > static_cast<double>(SystemConstants::Geometry::MAX_CHORDS_PER_ARC)) {
        return SystemConstants::Geometry::MAX_CHORDS_PER_ARC + 1;
    }
    return std::max<size_t>(1, static_cast<size_t>(chords));
}

bool Preprocessor::expandArcs(const std::vector<Segment>& input, double tolerance,
    std::vector<Segment>& output) const {

    if (tolerance <= 0.0) {
        setError("Arc tolerance must be positive");
        return false;
    }

    std::vector<Segment> result;
    result.reserve(input.size());

    for (const auto& segment : input) {
        if (!segment.isArc()) {
            result.push_back(segment);
            continue;
        }
        std::vector<Segment> chords;
        if (!expandArc(segment, tolerance, chords)) {
            return false;
        }
        result.insert(result.end(), chords.begin(), chords.end());
    }

    output.swap(result);
    return true;
}

bool Preprocessor::expandArc(const Segment& arc, double tolerance, std::vector<Segment>& chords) const {
    chords.clear();

    const PlaneDefinition plane = getPlaneDefinition(arc.plane);
    const int u = plane.u_index;
    const int v = plane.v_index;
    const int n = plane.normal_index;

    double radius = arc.radius;
    if (radius <= 0.0) {
        radius = std::hypot(arc.start(u) - arc.center(u), arc.start(v) - arc.center(v));
    }

    const double sweep = arcSweepAngle(arc);
    const size_t count = chordCount(radius, sweep, tolerance);
    if (count > SystemConstants::Geometry::MAX_CHORDS_PER_ARC) {
        std::ostringstream ss;
        ss << "Arc on line " << arc.sourceLine << " needs more than "
            << SystemConstants::Geometry::MAX_CHORDS_PER_ARC << " chords at tolerance " << tolerance;
        setError(ss.str());
        return false;
    }

    const double startAngle = std::atan2(arc.start(v) - arc.center(v), arc.start(u) - arc.center(u));
    const double helix = arc.end(n) - arc.start(n);

    chords.reserve(count);
    Eigen::Vector3d previous = arc.start;

    for (size_t i = 1; i <= count; ++i) {
        Eigen::Vector3d point;
        if (i == count) {
            point = arc.end;
        }
        else {
            const double fraction = static_cast<double>(i) / static_cast<double>(count);
            const double angle = startAngle + sweep * fraction;
            point = arc.start;
            point(u) = arc.center(u) + radius * std::cos(angle);
            point(v) = arc.center(v) + radius * std::sin(angle);
            point(n) = arc.start(n) + helix * fraction;
        }

        Segment chord = arc;
        chord.type = SegmentType::LINEAR;
        chord.start = previous;
        chord.end = point;
        chord.center.setZero();
        chord.centerOffset.setZero();
        chord.radius = 0.0;
        chords.push_back(chord);

        previous = point;
    }

    return true;
}

// =============================================================================
// Unit Conversion
// =============================================================================
std::vector<Segment> Preprocessor::convertUnits(const std::vector<Segment>& input, UnitMode target) const {
    std::vector<Segment> result;
    result.reserve(input.size());

    for (const auto& segment : input) {
        Segment converted = segment;
        if (segment.units != target) {
            const double factor = target == UnitMode::MM
                ? SystemConstants::Geometry::MM_PER_INCH
                : 1.0 / SystemConstants::Geometry::MM_PER_INCH;

            converted.start *= factor;
            converted.end *= factor;
            converted.center *= factor;
            converted.centerOffset *= factor;
            converted.radius *= factor;
            converted.feedRate *= factor;
            converted.units = target;
        }
        result.push_back(converted);
    }
    return result;
}

// =============================================================================
// Rapid Optimization
// =============================================================================
std::vector<Segment> Preprocessor::optimizeRapids(const std::vector<Segment>& input) const {
    std::vector<Segment> result;
    result.reserve(input.size());

    size_t dropped = 0;
    for (const auto& segment : input) {
        // Segments are continuous, so start is the current position
        if (segment.type == SegmentType::RAPID &&
            (segment.end - segment.start).norm() < SystemConstants::Geometry::POSITION_EPSILON) {
            ++dropped;
            continue;
        }
        result.push_back(segment);
    }

    if (dropped > 0) {
        std::cout << "Preprocessor: removed " << dropped << " redundant rapid moves" << std::endl;
    }
    return result;
}

// =============================================================================
// G-code Formatting
// =============================================================================
std::vector<std::string> Preprocessor::formatProgram(const std::vector<Segment>& segments) const {
    std::vector<std::string> lines;
    if (segments.empty()) {
        return lines;
    }

    lines.push_back("G90");

    std::optional<UnitMode> units;
    std::optional<PlaneMode> plane;
    double lastFeed = -1.0;
    double lastSpindle = 0.0;

    for (const auto& segment : segments) {
        if (!units || *units != segment.units) {
            lines.push_back(segment.units == UnitMode::MM ? "G21" : "G20");
            units = segment.units;
            lastFeed = -1.0;
        }
        if (segment.isArc() && (!plane || *plane != segment.plane)) {
            lines.push_back(planeModeToString(segment.plane));
            plane = segment.plane;
        }

        const bool emitFeed = segment.type != SegmentType::RAPID &&
            segment.feedRate > 0.0 && segment.feedRate != lastFeed;
        const bool emitSpindle = segment.spindleSpeed != lastSpindle;

        lines.push_back(formatMove(segment, emitFeed, emitSpindle));

        if (emitFeed) lastFeed = segment.feedRate;
        if (emitSpindle) lastSpindle = segment.spindleSpeed;
    }

    return lines;
}

std::string Preprocessor::formatMove(const Segment& segment, bool emitFeed, bool emitSpindle) const {
    static const char AXES[3] = { 'X', 'Y', 'Z' };
    static const char OFFSETS[3] = { 'I', 'J', 'K' };

    std::ostringstream ss;
    switch (segment.type) {
    case SegmentType::RAPID: ss << "G0"; break;
    case SegmentType::LINEAR: ss << "G1"; break;
    case SegmentType::ARC_CW: ss << "G2"; break;
    case SegmentType::ARC_CCW: ss << "G3"; break;
    }

    for (int axis = 0; axis < 3; ++axis) {
        ss << " " << AXES[axis] << formatNumber(segment.end(axis), 3);
    }

    if (segment.isArc()) {
        const PlaneDefinition def = getPlaneDefinition(segment.plane);
        ss << " " << OFFSETS[def.u_index] << formatNumber(segment.centerOffset(def.u_index), 4);
        ss << " " << OFFSETS[def.v_index] << formatNumber(segment.centerOffset(def.v_index), 4);
    }

    if (emitFeed) {
        ss << " F" << formatNumber(segment.feedRate, 3, true);
    }
    if (emitSpindle) {
        ss << " S" << formatNumber(segment.spindleSpeed, 1, true);
    }
    return ss.str();
}

void Preprocessor::setError(const std::string& error) const {
    lastError_ = error;
    std::cerr << "Preprocessor Error: " << error << std::endl;
}
