#pragma once

#include "cnclink/segment.hpp"
#include "cnclink/system_constants.hpp"
#include <string>
#include <vector>

struct PreprocessorConfig {
    // Arc expansion
    bool expand_arcs = true;
    double arc_tolerance = SystemConstants::Geometry::DEFAULT_ARC_TOLERANCE;  // In segment units

    // Unit conversion
    bool convert_units = false;
    UnitMode target_units = UnitMode::MM;

    // Drop rapids that do not move the tool
    bool optimize_rapids = true;

    bool isValid() const {
        return !expand_arcs || arc_tolerance > 0.0;
    }
};

/**
 * Transforms generated segments before streaming: arc expansion, unit
 * conversion and redundant-rapid removal, applied in that order.
 * Also renders segments back into GRBL-ready G-code lines.
 */
class Preprocessor {
public:
    explicit Preprocessor(const PreprocessorConfig& config = PreprocessorConfig());

    /**
     * Run every enabled stage
     * @return false if the configuration is invalid or an arc cannot be expanded
     */
    bool process(const std::vector<Segment>& input, std::vector<Segment>& output) const;

    /**
     * Replace each arc by chords whose deviation from the arc stays within tolerance
     */
    bool expandArcs(const std::vector<Segment>& input, double tolerance,
        std::vector<Segment>& output) const;

    bool expandArc(const Segment& arc, double tolerance, std::vector<Segment>& chords) const;

    /**
     * Rescale every segment not already in `target` units. Idempotent.
     */
    std::vector<Segment> convertUnits(const std::vector<Segment>& input, UnitMode target) const;

    /**
     * Remove rapid moves whose end point equals the current position.
     * The sequence of visited points is unchanged.
     */
    std::vector<Segment> optimizeRapids(const std::vector<Segment>& input) const;

    /**
     * Render segments as G-code lines (absolute, explicit units, F/S only on change)
     */
    std::vector<std::string> formatProgram(const std::vector<Segment>& segments) const;

    /**
     * Number of chords needed for an arc of the given radius and sweep
     */
    static size_t chordCount(double radius, double sweep, double tolerance);

    const PreprocessorConfig& getConfig() const { return config_; }
    const std::string& getLastError() const { return lastError_; }

private:
    PreprocessorConfig config_;
    mutable std::string lastError_;

    std::string formatMove(const Segment& segment, bool emitFeed, bool emitSpindle) const;
    void setError(const std::string& error) const;
};
