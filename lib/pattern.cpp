// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <stdexcept>

#include "pattern.hpp"

Pattern::Pattern(const std::string &pattern, PatternType type) : m_text{pattern}, m_type{type}
{
    if (m_text.empty()) {
        throw std::invalid_argument("Empty prompt pattern");
    }

    if (m_type == PATTERN_TYPE_REGEX) {
        try {
            m_regex = std::make_shared<std::regex>(m_text, std::regex::ECMAScript);
        } catch (const std::regex_error &e) {
            throw std::invalid_argument("Invalid prompt regex '" + m_text + "': " + e.what());
        }
    }
}

bool Pattern::NextMatch(const std::string &buffer, size_t from, size_t &start, size_t &end) const
{
    if (from >= buffer.size()) {
        return false;
    }

    if (m_type == PATTERN_TYPE_LITERAL) {
        size_t pos = buffer.find(m_text, from);
        if (pos == std::string::npos) {
            return false;
        }
        start = pos;
        end = pos + m_text.size();
        return true;
    }

    std::smatch match;
    auto flags = from > 0 ? std::regex_constants::match_prev_avail : std::regex_constants::match_default;
    if (!std::regex_search(buffer.cbegin() + from, buffer.cend(), match, *m_regex, flags)) {
        return false;
    }

    start = from + match.position(0);
    end = start + match.length(0);
    return true;
}

bool Pattern::IsTail(const std::string &buffer, size_t end) const
{
    if (end >= buffer.size()) {
        return true;
    }

    if (m_type == PATTERN_TYPE_LITERAL) {
        return false;
    }

    // A regex match may end a line, or sit on a line that is still being
    // received (the autoboot countdown rewrites its line with backspaces).
    return buffer[end - 1] == '\n' || buffer.find('\n', end) == std::string::npos;
}

bool Pattern::Find(const std::string &buffer, size_t searchFrom, size_t &matchEnd) const
{
    size_t from = searchFrom;
    size_t start = 0;
    size_t end = 0;

    while (NextMatch(buffer, from, start, end)) {
        if (end > start && IsTail(buffer, end)) {
            matchEnd = end;
            return true;
        }
        from = start + 1;
    }

    return false;
}
