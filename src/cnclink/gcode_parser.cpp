#include "cnclink/gcode_parser.hpp"
#include <set>
#include <sstream>

namespace {

std::string wordToString(const Token& token) {
    std::ostringstream ss;
    ss << token.letter << token.code;
    if (token.subCode >= 0) {
        ss << '.' << token.subCode;
    }
    return ss.str();
}

bool isArcMotion(MotionMode mode) {
    return mode == MotionMode::G2 || mode == MotionMode::G3;
}

}

bool GCodeParser::parseLine(const std::string& line, size_t lineIndex, ParserState& state,
    std::optional<ParsedCommand>& command, ParseError& error) const {

    std::vector<Token> tokens;
    if (!lexer_.tokenize(line, lineIndex, tokens, error)) {
        command.reset();
        return false;
    }
    return parseTokens(tokens, line, lineIndex, state, command, error);
}

bool GCodeParser::parseTokens(const std::vector<Token>& tokens, const std::string& originalLine,
    size_t lineIndex, ParserState& state,
    std::optional<ParsedCommand>& command, ParseError& error) const {

    command.reset();

    ParsedCommand cmd;
    cmd.sourceLine = lineIndex;
    cmd.originalLine = originalLine;

    // Work on a copy so a failing line leaves the caller's state untouched
    ParserState next = state;

    std::set<ModalGroup> seenGroups;
    ModalGroup firstGGroup = ModalGroup::NONE;
    ModalGroup firstMGroup = ModalGroup::NONE;

    bool hasContent = false;
    bool motionCancel = false;
    bool axisConsumer = false;    // G10, G28, G30, G43.1, G92 take the axis words
    bool nonModal = false;
    bool dwell = false;
    bool toolChange = false;
    bool toolWord = false;
    bool programEnd = false;
    bool needsLP = false;         // G10
    bool needsAxes = false;       // G92, G43.1
    MotionMode explicitMotion = MotionMode::NONE;

    // =============================================================================
    // Collect words
    // =============================================================================
    for (const auto& token : tokens) {
        switch (token.type) {
        case TokenType::COMMENT:
            if (cmd.comment) {
                *cmd.comment += " " + token.text;
            }
            else {
                cmd.comment = token.text;
            }
            break;

        case TokenType::CHECKSUM:
            // GRBL does not validate checksums; accepted and dropped
            break;

        case TokenType::LINE_NUMBER:
            if (cmd.lineNumber) {
                setError(error, ParseErrorKind::SYNTAX, lineIndex, token.column, "Repeated line number");
                return false;
            }
            cmd.lineNumber = static_cast<int>(token.value);
            hasContent = true;
            break;

        case TokenType::PARAMETER:
            if (!isSupportedParameter(token.letter)) {
                setError(error, ParseErrorKind::DOMAIN, lineIndex, token.column,
                    std::string("Unsupported word '") + token.letter + "'");
                return false;
            }
            if (cmd.hasParameter(token.letter)) {
                setError(error, ParseErrorKind::DOMAIN, lineIndex, token.column,
                    std::string("Repeated word '") + token.letter + "'");
                return false;
            }
            cmd.parameters[token.letter] = token.value;
            hasContent = true;
            break;

        case TokenType::COMMAND: {
            hasContent = true;

            if (token.letter == 'T') {
                if (toolWord) {
                    setError(error, ParseErrorKind::DOMAIN, lineIndex, token.column, "Repeated tool word");
                    return false;
                }
                next.tool = token.code;
                toolWord = true;
                toolChange = true;
                cmd.words.push_back({ token.letter, token.code, token.subCode });
                break;
            }

            ModalGroup group = ModalGroup::NONE;
            if (!classifyCommandWord(token, group)) {
                setError(error, ParseErrorKind::DOMAIN, lineIndex, token.column,
                    "Unsupported command '" + wordToString(token) + "'");
                return false;
            }

            // M7 and M8 may share a block
            if (group != ModalGroup::COOLANT && seenGroups.count(group)) {
                setError(error, ParseErrorKind::DOMAIN, lineIndex, token.column,
                    "Modal group conflict at '" + wordToString(token) + "'");
                return false;
            }
            seenGroups.insert(group);
            cmd.words.push_back({ token.letter, token.code, token.subCode });

            if (token.letter == 'G') {
                if (firstGGroup == ModalGroup::NONE) firstGGroup = group;

                switch (token.code) {
                case 0: explicitMotion = MotionMode::G0; break;
                case 1: explicitMotion = MotionMode::G1; break;
                case 2: explicitMotion = MotionMode::G2; break;
                case 3: explicitMotion = MotionMode::G3; break;
                case 80: motionCancel = true; break;
                case 17: next.planeMode = PlaneMode::XY; break;
                case 18: next.planeMode = PlaneMode::ZX; break;
                case 19: next.planeMode = PlaneMode::YZ; break;
                case 20: next.unitMode = UnitMode::INCH; break;
                case 21: next.unitMode = UnitMode::MM; break;
                case 90: next.coordMode = CoordMode::ABSOLUTE; break;
                case 91:
                    // G91.1 only restates incremental IJK, which is always assumed
                    if (token.subCode < 0) next.coordMode = CoordMode::RELATIVE;
                    break;
                case 93: next.feedRateMode = FeedRateMode::INVERSE_TIME; break;
                case 94: next.feedRateMode = FeedRateMode::UNITS_PER_MINUTE; break;
                case 54: case 55: case 56: case 57: case 58: case 59:
                    next.coordinateSystem = static_cast<WorkCoordinateSystem>(token.code - 54);
                    break;
                case 4: dwell = true; break;
                case 10: axisConsumer = true; needsLP = true; break;
                case 28: case 30:
                    if (token.subCode < 0) axisConsumer = true;
                    nonModal = true;
                    break;
                case 92:
                    if (token.subCode < 0) {
                        axisConsumer = true;
                        needsAxes = true;
                    }
                    nonModal = true;
                    break;
                case 43:
                    axisConsumer = true;
                    needsAxes = true;
                    break;
                case 53: cmd.machineCoordinates = true; break;
                default: break;
                }
            }
            else {
                if (firstMGroup == ModalGroup::NONE) firstMGroup = group;

                switch (token.code) {
                case 2: case 30: programEnd = true; break;
                case 3: next.spindle = SpindleState::CW; break;
                case 4: next.spindle = SpindleState::CCW; break;
                case 5: next.spindle = SpindleState::OFF; break;
                case 6: toolChange = true; break;
                case 7: next.coolant.mist = true; break;
                case 8: next.coolant.flood = true; break;
                case 9: next.coolant = CoolantState(); break;
                default: break;
                }
            }
            break;
        }
        }
    }

    if (!hasContent) {
        // Comment-only line
        return true;
    }

    // =============================================================================
    // Feed and spindle words
    // =============================================================================
    if (auto f = cmd.parameter('F')) {
        if (*f < 0.0) {
            setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "Negative feed rate");
            return false;
        }
        next.feedRate = *f;
    }
    if (auto s = cmd.parameter('S')) {
        if (*s < 0.0) {
            setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "Negative spindle speed");
            return false;
        }
        next.spindleSpeed = *s;
    }

    // =============================================================================
    // Motion resolution (modal stickiness)
    // =============================================================================
    if (explicitMotion != MotionMode::NONE && motionCancel) {
        setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "Modal group conflict: G80 with a motion command");
        return false;
    }
    if (explicitMotion != MotionMode::NONE) {
        next.motionMode = explicitMotion;
    }
    if (motionCancel) {
        next.motionMode = MotionMode::NONE;
    }

    const bool axes = cmd.hasAxisWords();

    if (axisConsumer && explicitMotion != MotionMode::NONE && axes) {
        setError(error, ParseErrorKind::DOMAIN, lineIndex, 0,
            "Two commands in the block both use axis words");
        return false;
    }
    if (needsAxes && !axes) {
        setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "Command requires axis words");
        return false;
    }
    if (needsLP && (!cmd.hasParameter('L') || !cmd.hasParameter('P'))) {
        setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "G10 requires L and P words");
        return false;
    }
    if (dwell && !cmd.hasParameter('P')) {
        setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "G4 requires a P word");
        return false;
    }
    if (axes && !axisConsumer && next.motionMode == MotionMode::NONE) {
        setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "Axis words with no active motion mode");
        return false;
    }

    const bool motion = axes && !axisConsumer && next.motionMode != MotionMode::NONE;

    if (isArcMotion(explicitMotion) && !axes) {
        setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "Arc requires an end point");
        return false;
    }

    const bool arcWords = cmd.hasParameter('I') || cmd.hasParameter('J') ||
        cmd.hasParameter('K') || cmd.hasParameter('R');
    if (arcWords && !(motion && isArcMotion(next.motionMode))) {
        setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "Arc words without an arc motion");
        return false;
    }

    if (cmd.machineCoordinates &&
        !(motion && (next.motionMode == MotionMode::G0 || next.motionMode == MotionMode::G1))) {
        setError(error, ParseErrorKind::DOMAIN, lineIndex, 0, "G53 requires a G0 or G1 move");
        return false;
    }

    cmd.motion = motion ? next.motionMode : MotionMode::NONE;
    cmd.explicitMotion = explicitMotion != MotionMode::NONE;

    // =============================================================================
    // Command classification
    // =============================================================================
    if (motion) {
        cmd.type = CommandType::MOTION;
        cmd.modalGroup = ModalGroup::MOTION;
    }
    else if (dwell) {
        cmd.type = CommandType::DWELL;
        cmd.modalGroup = ModalGroup::NON_MODAL;
    }
    else if (axisConsumer || nonModal) {
        cmd.type = CommandType::NON_MODAL;
        cmd.modalGroup = firstGGroup;
    }
    else if (toolChange) {
        cmd.type = CommandType::TOOL_CHANGE;
        cmd.modalGroup = ModalGroup::TOOL_CHANGE;
    }
    else if (firstMGroup != ModalGroup::NONE) {
        cmd.type = CommandType::MACHINE;
        cmd.modalGroup = firstMGroup;
    }
    else if (firstGGroup != ModalGroup::NONE) {
        cmd.type = CommandType::MODE_CHANGE;
        cmd.modalGroup = firstGGroup;
    }
    else {
        cmd.type = CommandType::PARAMETERS_ONLY;
        cmd.modalGroup = ModalGroup::NONE;
    }

    if (programEnd) {
        resetForProgramEnd(next);
    }

    state = next;
    command = cmd;
    return true;
}

bool GCodeParser::classifyCommandWord(const Token& token, ModalGroup& group) const {
    const int code = token.code;
    const int sub = token.subCode;

    if (token.letter == 'G') {
        if (sub < 0) {
            switch (code) {
            case 0: case 1: case 2: case 3: case 80:
                group = ModalGroup::MOTION; return true;
            case 17: case 18: case 19:
                group = ModalGroup::PLANE; return true;
            case 20: case 21:
                group = ModalGroup::UNITS; return true;
            case 90: case 91:
                group = ModalGroup::DISTANCE; return true;
            case 93: case 94:
                group = ModalGroup::FEED_RATE_MODE; return true;
            case 54: case 55: case 56: case 57: case 58: case 59:
                group = ModalGroup::COORDINATE_SYSTEM; return true;
            case 61:
                group = ModalGroup::PATH_CONTROL; return true;
            case 49:
                group = ModalGroup::TOOL_LENGTH; return true;
            case 4: case 10: case 28: case 30: case 53: case 92:
                group = ModalGroup::NON_MODAL; return true;
            default:
                return false;
            }
        }
        if ((code == 28 || code == 30 || code == 92) && sub == 1) {
            group = ModalGroup::NON_MODAL;
            return true;
        }
        if (code == 91 && sub == 1) {
            group = ModalGroup::ARC_DISTANCE;
            return true;
        }
        if (code == 43 && sub == 1) {
            group = ModalGroup::TOOL_LENGTH;
            return true;
        }
        return false;
    }

    if (token.letter == 'M' && sub < 0) {
        switch (code) {
        case 0: case 1: case 2: case 30:
            group = ModalGroup::PROGRAM_FLOW; return true;
        case 3: case 4: case 5:
            group = ModalGroup::SPINDLE; return true;
        case 6:
            group = ModalGroup::TOOL_CHANGE; return true;
        case 7: case 8: case 9:
            group = ModalGroup::COOLANT; return true;
        default:
            return false;
        }
    }

    return false;
}

bool GCodeParser::isSupportedParameter(char letter) const {
    switch (letter) {
    case 'X': case 'Y': case 'Z':
    case 'I': case 'J': case 'K': case 'R':
    case 'F': case 'S': case 'P': case 'L':
        return true;
    default:
        return false;
    }
}

void GCodeParser::resetForProgramEnd(ParserState& state) const {
    // M2/M30 restore the defaults GRBL applies at program end; position is kept
    state.coordMode = CoordMode::ABSOLUTE;
    state.planeMode = PlaneMode::XY;
    state.feedRateMode = FeedRateMode::UNITS_PER_MINUTE;
    state.coordinateSystem = WorkCoordinateSystem::G54;
    state.motionMode = MotionMode::G1;
    state.spindle = SpindleState::OFF;
    state.coolant = CoolantState();
}

void GCodeParser::setError(ParseError& error, ParseErrorKind kind, size_t lineIndex,
    size_t column, const std::string& message) const {
    error.kind = kind;
    error.line = lineIndex;
    error.column = column;
    error.message = message;
}
