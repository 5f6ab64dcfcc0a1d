#pragma once

#include "cnclink/system_constants.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <string>

// =============================================================================
// Outbound commands
// =============================================================================

enum class GrblCommandType {
    GCODE,                 // Passthrough line
    HELP,                  // $
    VIEW_SETTINGS,         // $$
    VIEW_PARAMETERS,       // $#
    VIEW_PARSER_STATE,     // $G
    VIEW_BUILD_INFO,       // $I
    VIEW_STARTUP_BLOCKS,   // $N
    CHECK_MODE,            // $C
    KILL_ALARM,            // $X
    HOME,                  // $H
    JOG,                   // $J=...
    SET_SETTING,           // $n=value
    RESET_SETTINGS,        // $RST=$
    RESET_PARAMETERS,      // $RST=#
    RESET_ALL,             // $RST=*
    SLEEP                  // $SLP
};

struct GrblCommand {
    GrblCommandType type = GrblCommandType::GCODE;
    std::string text;                                   // GCODE
    int settingNumber = 0;                              // SET_SETTING
    double settingValue = 0.0;                          // SET_SETTING
    Eigen::Vector3d jogTarget = Eigen::Vector3d::Zero(); // JOG, distance or absolute target
    double jogFeedRate = 0.0;                           // JOG
    bool jogRelative = true;                            // JOG: G91 vs G90

    static GrblCommand gcode(const std::string& line);
    static GrblCommand system(GrblCommandType type);
    static GrblCommand jog(const Eigen::Vector3d& target, double feedRate, bool relative = true);
    static GrblCommand setting(int number, double value);
};

// Real-time commands are single bytes; the enum value is the wire byte
enum class RealtimeCommand : uint8_t {
    STATUS_QUERY = '?',
    CYCLE_START = '~',
    FEED_HOLD = '!',
    SOFT_RESET = 0x18,
    SAFETY_DOOR = 0x84,
    JOG_CANCEL = 0x85,
    FEED_OVERRIDE_RESET = 0x90,
    FEED_OVERRIDE_COARSE_PLUS = 0x91,
    FEED_OVERRIDE_COARSE_MINUS = 0x92,
    FEED_OVERRIDE_FINE_PLUS = 0x93,
    FEED_OVERRIDE_FINE_MINUS = 0x94,
    RAPID_OVERRIDE_RESET = 0x95,
    RAPID_OVERRIDE_MEDIUM = 0x96,
    RAPID_OVERRIDE_LOW = 0x97,
    SPINDLE_OVERRIDE_RESET = 0x99,
    SPINDLE_OVERRIDE_COARSE_PLUS = 0x9A,
    SPINDLE_OVERRIDE_COARSE_MINUS = 0x9B,
    SPINDLE_OVERRIDE_FINE_PLUS = 0x9C,
    SPINDLE_OVERRIDE_FINE_MINUS = 0x9D,
    SPINDLE_STOP = 0x9E,
    FLOOD_COOLANT_TOGGLE = 0xA0,
    MIST_COOLANT_TOGGLE = 0xA1
};

/**
 * Override percentages as GRBL applies them.
 * Feed and spindle clamp to 10..200 %, rapid takes 100/50/25 %.
 */
struct OverrideState {
    int feed = SystemConstants::Overrides::DEFAULT_PERCENT;
    int rapid = SystemConstants::Overrides::DEFAULT_PERCENT;
    int spindle = SystemConstants::Overrides::DEFAULT_PERCENT;

    // Returns true if the command is an override command
    bool apply(RealtimeCommand command);
    void reset() { *this = OverrideState(); }
};

// =============================================================================
// Inbound responses
// =============================================================================

enum class MachineState {
    IDLE, RUN, HOLD, JOG, ALARM, DOOR, CHECK, HOME, SLEEP, UNKNOWN
};

struct PinState {
    bool limitX = false;
    bool limitY = false;
    bool limitZ = false;
    bool probe = false;
    bool door = false;
    bool hold = false;
    bool softReset = false;
    bool cycleStart = false;

    bool any() const { return limitX || limitY || limitZ || probe || door || hold || softReset || cycleStart; }
};

struct AccessoryState {
    bool spindleCW = false;
    bool spindleCCW = false;
    bool flood = false;
    bool mist = false;
};

/**
 * One parsed '<...>' status report. Absent fields stay unset.
 */
struct GrblStatus {
    MachineState state = MachineState::UNKNOWN;
    std::optional<int> subState;                          // Hold:0, Door:1 ...
    std::optional<Eigen::Vector3d> machinePosition;       // MPos
    std::optional<Eigen::Vector3d> workPosition;          // WPos
    std::optional<Eigen::Vector3d> workCoordinateOffset;  // WCO
    std::optional<int> plannerBlocksAvailable;            // Bf
    std::optional<int> rxBytesAvailable;                  // Bf
    std::optional<double> feedRate;                       // FS / F
    std::optional<double> spindleSpeed;                   // FS
    std::optional<OverrideState> overrides;               // Ov
    PinState pins;                                        // Pn
    AccessoryState accessories;                           // A
    std::optional<int> lineNumber;                        // Ln

    /**
     * WPos if reported, else MPos - WCO when both are known
     */
    std::optional<Eigen::Vector3d> resolvedWorkPosition() const;
};

enum class ResponseType {
    OK,
    ERROR,
    ALARM,
    STATUS,
    SETTING,
    FEEDBACK,
    WELCOME
};

struct GrblResponse {
    ResponseType type = ResponseType::FEEDBACK;
    int code = 0;               // ERROR / ALARM
    std::string message;        // Description (ERROR / ALARM) or feedback text
    GrblStatus status;          // STATUS
    int settingNumber = 0;      // SETTING
    std::string settingValue;   // SETTING
    std::string version;        // WELCOME
    std::string raw;            // Line as received, without terminator
};

// =============================================================================
// Codec
// =============================================================================

/**
 * Stateless GRBL text protocol codec
 */
class GrblProtocol {
public:
    /**
     * Format a command as exactly one newline-terminated line
     */
    static std::string formatCommand(const GrblCommand& command);

    static uint8_t formatRealtime(RealtimeCommand command);

    /**
     * Map a received byte back to a real-time command
     * @return false if the byte is not a real-time command
     */
    static bool realtimeFromByte(uint8_t byte, RealtimeCommand& command);

    /**
     * Classify one received line (terminator optional)
     */
    static GrblResponse parseResponse(const std::string& line);

    /**
     * Parse a '<...>' status report
     * @return false if the line is not a status report
     */
    static bool parseStatusReport(const std::string& line, GrblStatus& status);

    static std::string errorDescription(int code);
    static std::string alarmDescription(int code);

    static std::string machineStateToString(MachineState state);
    static MachineState machineStateFromString(const std::string& text);
    static std::string responseTypeToString(ResponseType type);

private:
    static bool parseVector(const std::string& text, Eigen::Vector3d& vector);
    static bool parseInteger(const std::string& text, int& value);
    static bool parseDouble(const std::string& text, double& value);
};
