#pragma once

#include "cnclink/gcode_types.hpp"
#include <string>
#include <vector>

/**
 * Splits one line of G-code into typed tokens.
 *
 * Accepts parenthesized and ';' comments, letters in either case and
 * whitespace between a letter and its number ("G 1" == "G1").
 * Blank lines and a lone '%' program delimiter produce no tokens.
 */
class GCodeLexer {
public:
    GCodeLexer() = default;

    /**
     * Tokenize a single line
     * @param line Raw line text (no line terminator required)
     * @param lineIndex 1-based line number used in error reports
     * @param tokens Output tokens, cleared first
     * @param error Filled with a LEXICAL error naming the offending column on failure
     * @return true on success
     */
    bool tokenize(const std::string& line, size_t lineIndex,
        std::vector<Token>& tokens, ParseError& error) const;

private:
    bool readNumber(const std::string& line, size_t& pos, double& value, std::string& digits) const;
    bool readComment(const std::string& line, size_t& pos, std::string& text, std::string& message) const;
    void setLexicalError(ParseError& error, size_t lineIndex, size_t column, const std::string& message) const;
};
