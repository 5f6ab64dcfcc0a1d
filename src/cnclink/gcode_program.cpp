#include "cnclink/gcode_program.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

GCodeProgram::GCodeProgram(const ProgramLoadOptions& options)
    : options_(options) {
}

ProgramLoadResult GCodeProgram::loadFromString(const std::string& text) const {
    std::vector<std::string> lines;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    return loadLines(lines);
}

ProgramLoadResult GCodeProgram::loadLines(const std::vector<std::string>& lines) const {
    ProgramLoadResult result;
    ParserState state = options_.initial_state;

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = lines[i];
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        ++result.lines_processed;
        if (!processLine(line, i + 1, state, result) && options_.abort_on_error) {
            result.aborted = true;
            break;
        }
    }

    result.final_state = state;

    if (options_.enableDetailedLogging) {
        double pathLength = 0.0;
        for (const auto& segment : result.segments) {
            pathLength += segmentLength(segment);
        }
        std::cout << "GCodeProgram: " << result.lines_processed << " lines, "
            << result.segments.size() << " segments, "
            << result.errors.size() << " errors, path length " << pathLength << std::endl;
    }

    return result;
}

bool GCodeProgram::loadFromFile(const std::string& filepath, ProgramLoadResult& result) const {
    try {
        if (!std::filesystem::exists(filepath)) {
            setError("File not found: " + filepath);
            return false;
        }
    }
    catch (const std::filesystem::filesystem_error& e) {
        setError("Cannot access " + filepath + ": " + e.what());
        return false;
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        setError("Error opening file: " + filepath);
        return false;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    if (file.bad()) {
        setError("Error reading file: " + filepath);
        return false;
    }

    std::cout << "Loading G-code program: " << filepath << " (" << lines.size() << " lines)" << std::endl;
    result = loadLines(lines);
    return true;
}

bool GCodeProgram::processLine(const std::string& line, size_t lineIndex, ParserState& state,
    ProgramLoadResult& result) const {

    // Line state is committed only when both parsing and geometry succeed
    ParserState lineState = state;
    ParseError error;

    std::optional<ParsedCommand> command;
    if (!parser_.parseLine(line, lineIndex, lineState, command, error)) {
        result.errors.push_back(error);
        if (options_.enableDetailedLogging) {
            std::cerr << "GCodeProgram: " << error.toString() << std::endl;
        }
        return false;
    }

    if (!command) {
        return true;
    }

    std::optional<Segment> segment;
    if (!generator_.generate(*command, lineState, segment, error)) {
        result.errors.push_back(error);
        if (options_.enableDetailedLogging) {
            std::cerr << "GCodeProgram: " << error.toString() << std::endl;
        }
        return false;
    }

    state = lineState;
    result.commands.push_back(*command);
    if (segment) {
        result.segments.push_back(*segment);
    }
    return true;
}

void GCodeProgram::setError(const std::string& error) const {
    lastError_ = error;
    std::cerr << "GCodeProgram Error: " << error << std::endl;
}
