#pragma once

#include "cnclink/gcode_parser.hpp"
#include "cnclink/gcode_types.hpp"
#include "cnclink/segment.hpp"
#include "cnclink/segment_generator.hpp"
#include <string>
#include <vector>

struct ProgramLoadOptions {
    bool abort_on_error = false;       // Stop at the first bad line instead of skipping it
    bool enableDetailedLogging = false;
    ParserState initial_state;         // Modal state at program start
};

struct ProgramLoadResult {
    std::vector<ParsedCommand> commands;
    std::vector<Segment> segments;
    std::vector<ParseError> errors;    // One per failed line, in line order
    ParserState final_state;
    size_t lines_processed = 0;
    bool aborted = false;

    bool hasErrors() const { return !errors.empty(); }
};

/**
 * Runs lexer, parser and segment generator over a whole program.
 *
 * Every line is processed against a single ParserState owned by the load.
 * Bad lines are reported in the result; with abort_on_error unset the rest of
 * the program still loads.
 */
class GCodeProgram {
public:
    explicit GCodeProgram(const ProgramLoadOptions& options = ProgramLoadOptions());

    ProgramLoadResult loadFromString(const std::string& text) const;
    ProgramLoadResult loadLines(const std::vector<std::string>& lines) const;

    /**
     * Load a program file
     * @return false if the file cannot be read (see getLastError)
     */
    bool loadFromFile(const std::string& filepath, ProgramLoadResult& result) const;

    const std::string& getLastError() const { return lastError_; }

private:
    ProgramLoadOptions options_;
    GCodeParser parser_;
    SegmentGenerator generator_;
    mutable std::string lastError_;

    bool processLine(const std::string& line, size_t lineIndex, ParserState& state,
        ProgramLoadResult& result) const;
    void setError(const std::string& error) const;
};
