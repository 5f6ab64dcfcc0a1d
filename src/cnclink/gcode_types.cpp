#include "cnclink/gcode_types.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

bool ParsedCommand::hasWord(char letter, int code, int subCode) const {
    for (const auto& word : words) {
        if (word.letter == letter && word.code == code && word.subCode == subCode) {
            return true;
        }
    }
    return false;
}

std::optional<double> ParsedCommand::parameter(char letter) const {
    auto it = parameters.find(letter);
    if (it == parameters.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ParsedCommand::hasAxisWords() const {
    return hasParameter('X') || hasParameter('Y') || hasParameter('Z');
}

std::string ParseError::toString() const {
    std::ostringstream ss;
    ss << parseErrorKindToString(kind) << " error at line " << line;
    if (column > 0) {
        ss << ", column " << column;
    }
    ss << ": " << message;
    return ss.str();
}

std::string motionModeToString(MotionMode mode) {
    switch (mode) {
    case MotionMode::NONE: return "NONE";
    case MotionMode::G0: return "G0";
    case MotionMode::G1: return "G1";
    case MotionMode::G2: return "G2";
    case MotionMode::G3: return "G3";
    }
    return "UNKNOWN";
}

std::string planeModeToString(PlaneMode plane) {
    switch (plane) {
    case PlaneMode::XY: return "G17";
    case PlaneMode::ZX: return "G18";
    case PlaneMode::YZ: return "G19";
    }
    return "UNKNOWN";
}

std::string parseErrorKindToString(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::LEXICAL: return "Lexical";
    case ParseErrorKind::SYNTAX: return "Syntax";
    case ParseErrorKind::DOMAIN: return "Domain";
    }
    return "Unknown";
}

std::string formatNumber(double value, int decimals, bool trimZeros) {
    const double half = 0.5 * std::pow(10.0, -decimals);
    if (std::abs(value) < half) {
        value = 0.0;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    std::string text = ss.str();

    if (trimZeros && text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') text.pop_back();
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    return text;
}
