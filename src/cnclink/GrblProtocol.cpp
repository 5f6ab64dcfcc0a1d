#include "cnclink/GrblProtocol.hpp"
#include "cnclink/gcode_types.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

std::string trimLine(const std::string& text) {
    size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
    size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
    return text.substr(first, last - first);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream ss(text);
    while (std::getline(ss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

const std::map<int, std::string>& errorTable() {
    static const std::map<int, std::string> table = {
        { 1, "G-code words consist of a letter and a value. Letter was not found." },
        { 2, "Numeric value format is not valid or missing an expected value." },
        { 3, "Grbl '$' system command was not recognized or supported." },
        { 4, "Negative value received for an expected positive value." },
        { 5, "Homing cycle is not enabled via settings." },
        { 6, "Minimum step pulse time must be greater than 3usec." },
        { 7, "EEPROM read failed. Reset and restored to default values." },
        { 8, "Grbl '$' command cannot be used unless Grbl is IDLE." },
        { 9, "G-code locked out during alarm or jog state." },
        { 10, "Soft limits cannot be enabled without homing also enabled." },
        { 11, "Max characters per line exceeded. Line was not processed and executed." },
        { 12, "Grbl '$' setting value exceeds the maximum step rate supported." },
        { 13, "Safety door detected as opened and door state initiated." },
        { 14, "Build info or startup line exceeded EEPROM line length limit." },
        { 15, "Jog target exceeds machine travel. Command ignored." },
        { 16, "Jog command with no '=' or contains prohibited g-code." },
        { 17, "Laser mode requires PWM output." },
        { 20, "Unsupported or invalid g-code command found in block." },
        { 21, "More than one g-code command from same modal group found in block." },
        { 22, "Feed rate has not yet been set or is undefined." },
        { 23, "G-code command in block requires an integer value." },
        { 24, "Two G-code commands that both require the use of the XYZ axis words were detected in the block." },
        { 25, "A G-code word was repeated in the block." },
        { 26, "A G-code command implicitly or explicitly requires XYZ axis words in the block, but none were detected." },
        { 27, "N line number value is not within the valid range of 1 - 9,999,999." },
        { 28, "A G-code command was sent, but is missing some required P or L value words in the line." },
        { 29, "Grbl supports six work coordinate systems G54-G59. G59.1, G59.2, and G59.3 are not supported." },
        { 30, "The G53 G-code command requires either a G0 seek or G1 feed motion mode to be active." },
        { 31, "There are unused axis words in the block and G80 motion mode cancel is active." },
        { 32, "A G2 or G3 arc was commanded but there are no XYZ axis words in the selected plane to trace the arc." },
        { 33, "The motion command has an invalid target." },
        { 34, "A G2 or G3 arc, traced with the radius definition, had a mathematical error when computing the arc geometry." },
        { 35, "A G2 or G3 arc, traced with the offset definition, is missing the IJK offset word in the selected plane." },
        { 36, "There are unused, leftover G-code words that aren't used by any command in the block." },
        { 37, "The G43.1 dynamic tool length offset command cannot apply an offset to an axis other than its configured axis." },
        { 38, "Tool number greater than max supported value." }
    };
    return table;
}

const std::map<int, std::string>& alarmTable() {
    static const std::map<int, std::string> table = {
        { 1, "Hard limit triggered. Machine position is likely lost due to sudden and immediate halt. Re-homing is highly recommended." },
        { 2, "G-code motion target exceeds machine travel. Machine position safely retained. Alarm may be unlocked." },
        { 3, "Reset while in motion. Grbl cannot guarantee position. Lost steps are likely. Re-homing is highly recommended." },
        { 4, "Probe fail. The probe is not in the expected initial state before starting probe cycle." },
        { 5, "Probe fail. Probe did not contact the workpiece within the programmed travel." },
        { 6, "Homing fail. Reset during active homing cycle." },
        { 7, "Homing fail. Safety door was opened during active homing cycle." },
        { 8, "Homing fail. Cycle failed to clear limit switch when pulling off." },
        { 9, "Homing fail. Could not find limit switch within search distance." },
        { 10, "Homing fail. On dual axis machines, could not find the second limit switch for self-squaring." }
    };
    return table;
}

}

// =============================================================================
// GrblCommand factories
// =============================================================================
GrblCommand GrblCommand::gcode(const std::string& line) {
    GrblCommand command;
    command.type = GrblCommandType::GCODE;
    command.text = line;
    return command;
}

GrblCommand GrblCommand::system(GrblCommandType type) {
    GrblCommand command;
    command.type = type;
    return command;
}

GrblCommand GrblCommand::jog(const Eigen::Vector3d& target, double feedRate, bool relative) {
    GrblCommand command;
    command.type = GrblCommandType::JOG;
    command.jogTarget = target;
    command.jogFeedRate = feedRate;
    command.jogRelative = relative;
    return command;
}

GrblCommand GrblCommand::setting(int number, double value) {
    GrblCommand command;
    command.type = GrblCommandType::SET_SETTING;
    command.settingNumber = number;
    command.settingValue = value;
    return command;
}

// =============================================================================
// Overrides
// =============================================================================
bool OverrideState::apply(RealtimeCommand command) {
    using namespace SystemConstants::Overrides;

    auto step = [](int current, int delta) {
        return std::max(MIN_PERCENT, std::min(MAX_PERCENT, current + delta));
    };

    switch (command) {
    case RealtimeCommand::FEED_OVERRIDE_RESET: feed = DEFAULT_PERCENT; return true;
    case RealtimeCommand::FEED_OVERRIDE_COARSE_PLUS: feed = step(feed, COARSE_STEP); return true;
    case RealtimeCommand::FEED_OVERRIDE_COARSE_MINUS: feed = step(feed, -COARSE_STEP); return true;
    case RealtimeCommand::FEED_OVERRIDE_FINE_PLUS: feed = step(feed, FINE_STEP); return true;
    case RealtimeCommand::FEED_OVERRIDE_FINE_MINUS: feed = step(feed, -FINE_STEP); return true;
    case RealtimeCommand::RAPID_OVERRIDE_RESET: rapid = 100; return true;
    case RealtimeCommand::RAPID_OVERRIDE_MEDIUM: rapid = 50; return true;
    case RealtimeCommand::RAPID_OVERRIDE_LOW: rapid = 25; return true;
    case RealtimeCommand::SPINDLE_OVERRIDE_RESET: spindle = DEFAULT_PERCENT; return true;
    case RealtimeCommand::SPINDLE_OVERRIDE_COARSE_PLUS: spindle = step(spindle, COARSE_STEP); return true;
    case RealtimeCommand::SPINDLE_OVERRIDE_COARSE_MINUS: spindle = step(spindle, -COARSE_STEP); return true;
    case RealtimeCommand::SPINDLE_OVERRIDE_FINE_PLUS: spindle = step(spindle, FINE_STEP); return true;
    case RealtimeCommand::SPINDLE_OVERRIDE_FINE_MINUS: spindle = step(spindle, -FINE_STEP); return true;
    case RealtimeCommand::SPINDLE_STOP: return true;  // Toggle, percentage unchanged
    default: return false;
    }
}

std::optional<Eigen::Vector3d> GrblStatus::resolvedWorkPosition() const {
    if (workPosition) {
        return workPosition;
    }
    if (machinePosition && workCoordinateOffset) {
        return Eigen::Vector3d(*machinePosition - *workCoordinateOffset);
    }
    return std::nullopt;
}

// =============================================================================
// Formatting
// =============================================================================
std::string GrblProtocol::formatCommand(const GrblCommand& command) {
    std::ostringstream ss;

    switch (command.type) {
    case GrblCommandType::GCODE: {
        std::string text = command.text;
        std::replace(text.begin(), text.end(), '\r', ' ');
        std::replace(text.begin(), text.end(), '\n', ' ');
        ss << trimLine(text);
        break;
    }
    case GrblCommandType::HELP: ss << "$"; break;
    case GrblCommandType::VIEW_SETTINGS: ss << "$$"; break;
    case GrblCommandType::VIEW_PARAMETERS: ss << "$#"; break;
    case GrblCommandType::VIEW_PARSER_STATE: ss << "$G"; break;
    case GrblCommandType::VIEW_BUILD_INFO: ss << "$I"; break;
    case GrblCommandType::VIEW_STARTUP_BLOCKS: ss << "$N"; break;
    case GrblCommandType::CHECK_MODE: ss << "$C"; break;
    case GrblCommandType::KILL_ALARM: ss << "$X"; break;
    case GrblCommandType::HOME: ss << "$H"; break;
    case GrblCommandType::JOG:
        ss << "$J=" << (command.jogRelative ? "G91" : "G90")
            << " X" << formatNumber(command.jogTarget.x(), 3)
            << " Y" << formatNumber(command.jogTarget.y(), 3)
            << " Z" << formatNumber(command.jogTarget.z(), 3)
            << " F" << formatNumber(command.jogFeedRate, 0);
        break;
    case GrblCommandType::SET_SETTING:
        ss << "$" << command.settingNumber << "=" << formatNumber(command.settingValue, 3, true);
        break;
    case GrblCommandType::RESET_SETTINGS: ss << "$RST=$"; break;
    case GrblCommandType::RESET_PARAMETERS: ss << "$RST=#"; break;
    case GrblCommandType::RESET_ALL: ss << "$RST=*"; break;
    case GrblCommandType::SLEEP: ss << "$SLP"; break;
    }

    ss << '\n';
    return ss.str();
}

uint8_t GrblProtocol::formatRealtime(RealtimeCommand command) {
    return static_cast<uint8_t>(command);
}

bool GrblProtocol::realtimeFromByte(uint8_t byte, RealtimeCommand& command) {
    switch (byte) {
    case '?': case '~': case '!': case 0x18: case 0x84: case 0x85:
    case 0x90: case 0x91: case 0x92: case 0x93: case 0x94:
    case 0x95: case 0x96: case 0x97:
    case 0x99: case 0x9A: case 0x9B: case 0x9C: case 0x9D: case 0x9E:
    case 0xA0: case 0xA1:
        command = static_cast<RealtimeCommand>(byte);
        return true;
    default:
        return false;
    }
}

// =============================================================================
// Parsing
// =============================================================================
GrblResponse GrblProtocol::parseResponse(const std::string& line) {
    GrblResponse response;
    const std::string text = trimLine(line);
    response.raw = text;

    if (text == "ok") {
        response.type = ResponseType::OK;
        return response;
    }

    if (startsWith(text, "error:")) {
        response.type = ResponseType::ERROR;
        const std::string body = text.substr(6);
        if (parseInteger(body, response.code)) {
            response.message = errorDescription(response.code);
        }
        else {
            // Pre-1.1 firmware reports text instead of a code
            response.code = 0;
            response.message = trimLine(body);
        }
        return response;
    }

    if (startsWith(text, "ALARM:")) {
        response.type = ResponseType::ALARM;
        const std::string body = text.substr(6);
        if (parseInteger(body, response.code)) {
            response.message = alarmDescription(response.code);
        }
        else {
            response.code = 0;
            response.message = trimLine(body);
        }
        return response;
    }

    if (startsWith(text, "<")) {
        if (parseStatusReport(text, response.status)) {
            response.type = ResponseType::STATUS;
            return response;
        }
    }

    if (startsWith(text, "$")) {
        const size_t equals = text.find('=');
        int number = 0;
        if (equals != std::string::npos && parseInteger(text.substr(1, equals - 1), number)) {
            response.type = ResponseType::SETTING;
            response.settingNumber = number;
            response.settingValue = trimLine(text.substr(equals + 1));
            return response;
        }
    }

    if (startsWith(text, "Grbl ")) {
        response.type = ResponseType::WELCOME;
        std::string rest = text.substr(5);
        const size_t end = rest.find_first_of(" [");
        response.version = trimLine(end == std::string::npos ? rest : rest.substr(0, end));
        response.message = text;
        return response;
    }

    response.type = ResponseType::FEEDBACK;
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
        response.message = text.substr(1, text.size() - 2);
    }
    else {
        response.message = text;
    }
    return response;
}

bool GrblProtocol::parseStatusReport(const std::string& line, GrblStatus& status) {
    const std::string text = trimLine(line);
    if (text.size() < 2 || text.front() != '<' || text.back() != '>') {
        return false;
    }

    const std::vector<std::string> fields = split(text.substr(1, text.size() - 2), '|');
    if (fields.empty()) {
        return false;
    }

    GrblStatus parsed;

    // Leading state token, optionally with a sub-state ("Hold:0")
    const std::string& stateToken = fields[0];
    const size_t colon = stateToken.find(':');
    parsed.state = machineStateFromString(stateToken.substr(0, colon));
    if (colon != std::string::npos) {
        int sub = 0;
        if (parseInteger(stateToken.substr(colon + 1), sub)) {
            parsed.subState = sub;
        }
    }

    for (size_t i = 1; i < fields.size(); ++i) {
        const std::string& field = fields[i];
        const size_t separator = field.find(':');
        if (separator == std::string::npos) {
            continue;
        }
        const std::string key = field.substr(0, separator);
        const std::string value = field.substr(separator + 1);

        if (key == "MPos") {
            Eigen::Vector3d position;
            if (parseVector(value, position)) parsed.machinePosition = position;
        }
        else if (key == "WPos") {
            Eigen::Vector3d position;
            if (parseVector(value, position)) parsed.workPosition = position;
        }
        else if (key == "WCO") {
            Eigen::Vector3d offset;
            if (parseVector(value, offset)) parsed.workCoordinateOffset = offset;
        }
        else if (key == "Bf") {
            const auto parts = split(value, ',');
            int blocks = 0;
            int bytes = 0;
            if (parts.size() == 2 && parseInteger(parts[0], blocks) && parseInteger(parts[1], bytes)) {
                parsed.plannerBlocksAvailable = blocks;
                parsed.rxBytesAvailable = bytes;
            }
        }
        else if (key == "FS") {
            const auto parts = split(value, ',');
            double feed = 0.0;
            double spindle = 0.0;
            if (parts.size() == 2 && parseDouble(parts[0], feed) && parseDouble(parts[1], spindle)) {
                parsed.feedRate = feed;
                parsed.spindleSpeed = spindle;
            }
        }
        else if (key == "F") {
            double feed = 0.0;
            if (parseDouble(value, feed)) parsed.feedRate = feed;
        }
        else if (key == "Ov") {
            const auto parts = split(value, ',');
            OverrideState overrides;
            if (parts.size() == 3 && parseInteger(parts[0], overrides.feed) &&
                parseInteger(parts[1], overrides.rapid) && parseInteger(parts[2], overrides.spindle)) {
                parsed.overrides = overrides;
            }
        }
        else if (key == "Pn") {
            for (char pin : value) {
                switch (pin) {
                case 'X': parsed.pins.limitX = true; break;
                case 'Y': parsed.pins.limitY = true; break;
                case 'Z': parsed.pins.limitZ = true; break;
                case 'P': parsed.pins.probe = true; break;
                case 'D': parsed.pins.door = true; break;
                case 'H': parsed.pins.hold = true; break;
                case 'R': parsed.pins.softReset = true; break;
                case 'S': parsed.pins.cycleStart = true; break;
                default: break;
                }
            }
        }
        else if (key == "A") {
            for (char accessory : value) {
                switch (accessory) {
                case 'S': parsed.accessories.spindleCW = true; break;
                case 'C': parsed.accessories.spindleCCW = true; break;
                case 'F': parsed.accessories.flood = true; break;
                case 'M': parsed.accessories.mist = true; break;
                default: break;
                }
            }
        }
        else if (key == "Ln") {
            int lineNumber = 0;
            if (parseInteger(value, lineNumber)) parsed.lineNumber = lineNumber;
        }
        // Unknown fields are ignored
    }

    status = parsed;
    return true;
}

std::string GrblProtocol::errorDescription(int code) {
    const auto& table = errorTable();
    auto it = table.find(code);
    if (it == table.end()) {
        return "Unknown error " + std::to_string(code);
    }
    return it->second;
}

std::string GrblProtocol::alarmDescription(int code) {
    const auto& table = alarmTable();
    auto it = table.find(code);
    if (it == table.end()) {
        return "Unknown alarm " + std::to_string(code);
    }
    return it->second;
}

std::string GrblProtocol::machineStateToString(MachineState state) {
    switch (state) {
    case MachineState::IDLE: return "Idle";
    case MachineState::RUN: return "Run";
    case MachineState::HOLD: return "Hold";
    case MachineState::JOG: return "Jog";
    case MachineState::ALARM: return "Alarm";
    case MachineState::DOOR: return "Door";
    case MachineState::CHECK: return "Check";
    case MachineState::HOME: return "Home";
    case MachineState::SLEEP: return "Sleep";
    case MachineState::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

MachineState GrblProtocol::machineStateFromString(const std::string& text) {
    static const std::map<std::string, MachineState> states = {
        { "Idle", MachineState::IDLE },
        { "Run", MachineState::RUN },
        { "Hold", MachineState::HOLD },
        { "Jog", MachineState::JOG },
        { "Alarm", MachineState::ALARM },
        { "Door", MachineState::DOOR },
        { "Check", MachineState::CHECK },
        { "Home", MachineState::HOME },
        { "Sleep", MachineState::SLEEP }
    };
    auto it = states.find(text);
    return it == states.end() ? MachineState::UNKNOWN : it->second;
}

std::string GrblProtocol::responseTypeToString(ResponseType type) {
    switch (type) {
    case ResponseType::OK: return "Ok";
    case ResponseType::ERROR: return "Error";
    case ResponseType::ALARM: return "Alarm";
    case ResponseType::STATUS: return "Status";
    case ResponseType::SETTING: return "Setting";
    case ResponseType::FEEDBACK: return "Feedback";
    case ResponseType::WELCOME: return "Welcome";
    }
    return "Unknown";
}

bool GrblProtocol::parseVector(const std::string& text, Eigen::Vector3d& vector) {
    // GRBL builds with more axes report extra components; the first three are XYZ
    const auto parts = split(text, ',');
    if (parts.size() < 3) {
        return false;
    }
    for (int i = 0; i < 3; ++i) {
        double value = 0.0;
        if (!parseDouble(parts[i], value)) {
            return false;
        }
        vector(i) = value;
    }
    return true;
}

bool GrblProtocol::parseInteger(const std::string& text, int& value) {
    const std::string trimmed = trimLine(text);
    if (trimmed.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        const int parsed = std::stoi(trimmed, &consumed);
        if (consumed != trimmed.size()) {
            return false;
        }
        value = parsed;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

bool GrblProtocol::parseDouble(const std::string& text, double& value) {
    const std::string trimmed = trimLine(text);
    if (trimmed.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        const double parsed = std::stod(trimmed, &consumed);
        if (consumed != trimmed.size()) {
            return false;
        }
        value = parsed;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}
