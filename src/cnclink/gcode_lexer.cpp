#include "cnclink/gcode_lexer.hpp"
#include "cnclink/system_constants.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace {

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string trimCopy(const std::string& text) {
    size_t first = 0;
    while (first < text.size() && isBlank(text[first])) ++first;
    size_t last = text.size();
    while (last > first && isBlank(text[last - 1])) --last;
    return text.substr(first, last - first);
}

}

bool GCodeLexer::tokenize(const std::string& line, size_t lineIndex,
    std::vector<Token>& tokens, ParseError& error) const {

    tokens.clear();

    // '%' marks program start/end in many post-processors
    std::string trimmed = trimCopy(line);
    if (trimmed.empty() || trimmed == "%") {
        return true;
    }

    size_t pos = 0;
    while (pos < line.size()) {
        char c = line[pos];

        if (isBlank(c)) {
            ++pos;
            continue;
        }

        const size_t column = pos + 1;

        if (c == '(') {
            std::string text;
            std::string message;
            if (!readComment(line, pos, text, message)) {
                setLexicalError(error, lineIndex, column, message);
                return false;
            }
            Token token;
            token.type = TokenType::COMMENT;
            token.text = text;
            token.column = column;
            tokens.push_back(token);
            continue;
        }

        if (c == ';') {
            Token token;
            token.type = TokenType::COMMENT;
            token.text = trimCopy(line.substr(pos + 1));
            token.column = column;
            tokens.push_back(token);
            break;
        }

        if (c == '*') {
            ++pos;
            double value = 0.0;
            std::string digits;
            if (!readNumber(line, pos, value, digits) || value < 0.0 || digits.find('.') != std::string::npos) {
                setLexicalError(error, lineIndex, column, "Checksum must be followed by a non-negative integer");
                return false;
            }
            Token token;
            token.type = TokenType::CHECKSUM;
            token.value = value;
            token.column = column;
            tokens.push_back(token);
            continue;
        }

        if (!std::isalpha(static_cast<unsigned char>(c))) {
            setLexicalError(error, lineIndex, column,
                std::string("Unexpected character '") + c + "'");
            return false;
        }

        const char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        ++pos;

        double value = 0.0;
        std::string digits;
        if (!readNumber(line, pos, value, digits)) {
            setLexicalError(error, lineIndex, column,
                std::string("Letter '") + letter + "' is not followed by a number");
            return false;
        }

        Token token;
        token.letter = letter;
        token.column = column;
        token.value = value;

        if (letter == 'N') {
            if (value < 0.0 || digits.find('.') != std::string::npos) {
                setLexicalError(error, lineIndex, column, "Line number must be a non-negative integer");
                return false;
            }
            if (value > SystemConstants::Protocol::MAX_LINE_NUMBER) {
                setLexicalError(error, lineIndex, column, "Line number out of range");
                return false;
            }
            token.type = TokenType::LINE_NUMBER;
        }
        else if (letter == 'G' || letter == 'M' || letter == 'T') {
            if (value < 0.0) {
                setLexicalError(error, lineIndex, column,
                    std::string("Negative value for command word '") + letter + "'");
                return false;
            }
            if (value > SystemConstants::Protocol::MAX_COMMAND_CODE) {
                setLexicalError(error, lineIndex, column,
                    std::string("Value out of range for command word '") + letter + "'");
                return false;
            }
            token.type = TokenType::COMMAND;
            token.code = static_cast<int>(std::floor(value));

            // Dotted codes such as G38.2 or G91.1 carry a single decimal digit
            const size_t dot = digits.find('.');
            if (dot != std::string::npos) {
                std::string fraction = digits.substr(dot + 1);
                while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();
                if (fraction.size() > 1 || (letter != 'G' && !fraction.empty())) {
                    setLexicalError(error, lineIndex, column,
                        std::string("Invalid command value '") + letter + digits + "'");
                    return false;
                }
                if (!fraction.empty()) {
                    token.subCode = fraction[0] - '0';
                }
            }
        }
        else {
            token.type = TokenType::PARAMETER;
        }

        tokens.push_back(token);
    }

    return true;
}

bool GCodeLexer::readNumber(const std::string& line, size_t& pos, double& value, std::string& digits) const {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) ++pos;

    const size_t start = pos;
    if (pos < line.size() && (line[pos] == '+' || line[pos] == '-')) ++pos;

    bool seenDigit = false;
    bool seenDot = false;
    while (pos < line.size()) {
        const char c = line[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            seenDigit = true;
        }
        else if (c == '.' && !seenDot) {
            seenDot = true;
        }
        else {
            break;
        }
        ++pos;
    }

    if (!seenDigit) {
        pos = start;
        return false;
    }

    digits = line.substr(start, pos - start);
    try {
        value = std::stod(digits);
    }
    catch (const std::exception&) {
        pos = start;
        return false;
    }
    return true;
}

bool GCodeLexer::readComment(const std::string& line, size_t& pos, std::string& text, std::string& message) const {
    // pos points at '('
    const size_t close = line.find_first_of("()", pos + 1);
    if (close == std::string::npos) {
        message = "Unterminated comment";
        return false;
    }
    if (line[close] == '(') {
        message = "Nested comment";
        return false;
    }
    text = trimCopy(line.substr(pos + 1, close - pos - 1));
    pos = close + 1;
    return true;
}

void GCodeLexer::setLexicalError(ParseError& error, size_t lineIndex, size_t column, const std::string& message) const {
    error.kind = ParseErrorKind::LEXICAL;
    error.line = lineIndex;
    error.column = column;
    error.message = message;
}
