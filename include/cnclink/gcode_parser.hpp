#pragma once

#include "cnclink/gcode_lexer.hpp"
#include "cnclink/gcode_types.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * Turns token sequences into ParsedCommands while maintaining modal state.
 *
 * The parser never keeps state of its own: everything modal lives in the
 * ParserState the caller threads through one program load. A line that fails
 * leaves the state untouched.
 */
class GCodeParser {
public:
    GCodeParser() = default;

    /**
     * Lex and parse a single line
     * @param line Raw line text
     * @param lineIndex 1-based line number
     * @param state Modal state, updated on success
     * @param command Set when the line carries anything besides comments
     * @param error Filled on failure
     * @return true on success
     */
    bool parseLine(const std::string& line, size_t lineIndex, ParserState& state,
        std::optional<ParsedCommand>& command, ParseError& error) const;

    /**
     * Parse an already tokenized line
     */
    bool parseTokens(const std::vector<Token>& tokens, const std::string& originalLine,
        size_t lineIndex, ParserState& state,
        std::optional<ParsedCommand>& command, ParseError& error) const;

private:
    GCodeLexer lexer_;

    bool classifyCommandWord(const Token& token, ModalGroup& group) const;
    bool isSupportedParameter(char letter) const;
    void resetForProgramEnd(ParserState& state) const;
    void setError(ParseError& error, ParseErrorKind kind, size_t lineIndex,
        size_t column, const std::string& message) const;
};
