// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <string>
#include <regex>
#include <memory>
#include <cstddef>

enum PatternType {
    PATTERN_TYPE_LITERAL,
    PATTERN_TYPE_REGEX,
};

// A prompt to wait for: either a literal string or an ECMAScript regular
// expression. Both kinds are located with the same structural rule, see Find().
class Pattern
{
public:
    Pattern(const std::string &pattern, PatternType type = PATTERN_TYPE_LITERAL);
    Pattern(const char *pattern) : Pattern{std::string{pattern}}
    {}

    static Pattern Literal(const std::string &text) { return Pattern{text, PATTERN_TYPE_LITERAL}; }
    static Pattern Regex(const std::string &expression) { return Pattern{expression, PATTERN_TYPE_REGEX}; }

    // Locate the prompt in buffer, considering matches that begin at or after
    // searchFrom. A literal match is only accepted when it ends the buffer. A
    // regex match is also accepted when it ends with a newline or when the line
    // it is on has not been completed yet; a regex match followed by more text
    // on a completed line is rejected.
    //
    // Returns true and sets matchEnd to the offset just past the accepted match.
    bool Find(const std::string &buffer, size_t searchFrom, size_t &matchEnd) const;

    const std::string &GetText() const { return m_text; }
    PatternType GetType() const { return m_type; }
    bool IsRegex() const { return m_type == PATTERN_TYPE_REGEX; }

private:
    std::string m_text;
    PatternType m_type;
    std::shared_ptr<std::regex> m_regex;

    bool NextMatch(const std::string &buffer, size_t from, size_t &start, size_t &end) const;
    bool IsTail(const std::string &buffer, size_t end) const;
};
