#pragma once

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
// Tokens
// =============================================================================

enum class TokenType {
    COMMAND,      // G, M or T word
    PARAMETER,    // Any other letter followed by a number
    COMMENT,
    LINE_NUMBER,  // N word
    CHECKSUM      // *nn
};

struct Token {
    TokenType type = TokenType::PARAMETER;
    char letter = '\0';      // Upper-case word letter (COMMAND / PARAMETER)
    int code = 0;            // Integer part of a command word (G38.2 -> 38)
    int subCode = -1;        // Decimal part of a command word (G38.2 -> 2), -1 if none
    double value = 0.0;      // Parameter value, line number or checksum
    std::string text;        // Comment text without delimiters
    size_t column = 0;       // 1-based column of the first character
};

// =============================================================================
// Modal state enums
// =============================================================================

enum class MotionMode {
    NONE, G0, G1, G2, G3
};

enum class UnitMode {
    MM, INCH
};

enum class CoordMode {
    ABSOLUTE, RELATIVE
};

enum class PlaneMode {
    XY, ZX, YZ
};

enum class FeedRateMode {
    UNITS_PER_MINUTE,  // G94
    INVERSE_TIME       // G93
};

enum class WorkCoordinateSystem {
    G54, G55, G56, G57, G58, G59
};

enum class SpindleState {
    OFF, CW, CCW
};

struct CoolantState {
    bool mist = false;   // M7
    bool flood = false;  // M8

    bool isOff() const { return !mist && !flood; }
};

/**
 * Modal state carried across lines of a single program load.
 * Positions are always stored in millimetres regardless of the active units.
 */
struct ParserState {
    CoordMode coordMode = CoordMode::ABSOLUTE;
    UnitMode unitMode = UnitMode::MM;
    PlaneMode planeMode = PlaneMode::XY;
    FeedRateMode feedRateMode = FeedRateMode::UNITS_PER_MINUTE;
    WorkCoordinateSystem coordinateSystem = WorkCoordinateSystem::G54;
    MotionMode motionMode = MotionMode::NONE;   // Sticky until changed or cancelled by G80

    Eigen::Vector3d position = Eigen::Vector3d::Zero();  // [mm]
    Eigen::Vector3d coordinateOffset = Eigen::Vector3d::Zero();  // G92 offset [mm]
    double feedRate = 0.0;        // As programmed, in active units per minute
    double spindleSpeed = 0.0;
    SpindleState spindle = SpindleState::OFF;
    CoolantState coolant;
    int tool = 0;

    void reset() { *this = ParserState(); }
};

// =============================================================================
// Parsed commands
// =============================================================================

enum class ModalGroup {
    NONE,
    MOTION,             // G0 G1 G2 G3 G80
    PLANE,              // G17 G18 G19
    DISTANCE,           // G90 G91
    ARC_DISTANCE,       // G91.1
    FEED_RATE_MODE,     // G93 G94
    UNITS,              // G20 G21
    COORDINATE_SYSTEM,  // G54 - G59
    PATH_CONTROL,       // G61
    TOOL_LENGTH,        // G43.1 G49
    NON_MODAL,          // G4 G10 G28 G30 G53 G92
    PROGRAM_FLOW,       // M0 M1 M2 M30
    SPINDLE,            // M3 M4 M5
    COOLANT,            // M7 M8 M9
    TOOL_CHANGE         // M6
};

enum class CommandType {
    MOTION,           // Produces a segment
    MODE_CHANGE,      // Only updates modal state
    NON_MODAL,        // G10 G28 G30 G53 G92 ...
    DWELL,            // G4
    MACHINE,          // Spindle, coolant, program flow
    TOOL_CHANGE,      // M6 / T
    PARAMETERS_ONLY   // F, S or N without any command word
};

struct CommandWord {
    char letter = 'G';
    int code = 0;
    int subCode = -1;
};

struct ParsedCommand {
    std::optional<int> lineNumber;       // N word
    size_t sourceLine = 0;               // 1-based line index in the program text
    ModalGroup modalGroup = ModalGroup::NONE;
    CommandType type = CommandType::PARAMETERS_ONLY;
    MotionMode motion = MotionMode::NONE;  // Resolved motion, explicit or sticky
    bool explicitMotion = false;
    bool machineCoordinates = false;     // G53 on this line
    std::vector<CommandWord> words;
    std::map<char, double> parameters;
    std::optional<std::string> comment;
    std::string originalLine;

    bool hasWord(char letter, int code, int subCode = -1) const;
    bool hasParameter(char letter) const { return parameters.count(letter) > 0; }
    std::optional<double> parameter(char letter) const;
    bool hasAxisWords() const;
};

// =============================================================================
// Errors
// =============================================================================

enum class ParseErrorKind {
    LEXICAL,  // Malformed token
    SYNTAX,   // Tokens that do not form a valid block
    DOMAIN    // Valid syntax, invalid machine semantics
};

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::SYNTAX;
    size_t line = 0;     // 1-based
    size_t column = 0;   // 1-based, 0 when not tied to a character
    std::string message;

    std::string toString() const;
};

// Helpers
std::string motionModeToString(MotionMode mode);
std::string planeModeToString(PlaneMode plane);
std::string parseErrorKindToString(ParseErrorKind kind);

/**
 * Fixed-point text for a G-code value. Values that round to zero print
 * unsigned; trimZeros drops trailing fractional zeros ("500.000" -> "500").
 */
std::string formatNumber(double value, int decimals, bool trimZeros = false);
