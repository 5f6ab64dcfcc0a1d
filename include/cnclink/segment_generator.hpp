#pragma once

#include "cnclink/gcode_types.hpp"
#include "cnclink/segment.hpp"
#include <Eigen/Dense>
#include <optional>

/**
 * Converts ParsedCommands into motion segments.
 *
 * Tracks the current absolute position in ParserState (millimetres) and
 * emits segments in the program's active units.
 */
class SegmentGenerator {
public:
    SegmentGenerator() = default;

    /**
     * Resolve one command against the modal state
     * @param command Parsed line
     * @param state Modal state; position is advanced on success
     * @param segment Set for motion commands
     * @param error DOMAIN error for impossible geometry
     * @return true on success
     */
    bool generate(const ParsedCommand& command, ParserState& state,
        std::optional<Segment>& segment, ParseError& error) const;

private:
    Eigen::Vector3d resolveTarget(const ParsedCommand& command, const ParserState& state) const;

    bool calculateArcGeometry(const ParsedCommand& command, const ParserState& state,
        const Eigen::Vector3d& target, Eigen::Vector3d& center_point, double& radius,
        std::string& message) const;

    bool calculateCenterFromRadius(const ParsedCommand& command, const ParserState& state,
        const Eigen::Vector3d& target, Eigen::Vector3d& center_point, double& radius,
        std::string& message) const;

    bool calculateCenterFromOffsets(const ParsedCommand& command, const ParserState& state,
        const Eigen::Vector3d& target, Eigen::Vector3d& center_point, double& radius,
        std::string& message) const;

    void applyCoordinateOffset(const ParsedCommand& command, ParserState& state) const;

    double toMillimetres(double value, UnitMode units) const;
    Eigen::Vector3d fromMillimetres(const Eigen::Vector3d& point, UnitMode units) const;
};
