#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "parse_result.hpp"

namespace YamlFusion {

namespace error_formatting_detail {

inline constexpr std::string_view ws = " \t\r\f\v";

inline std::string_view rtrim(std::string_view s) {
    const std::size_t last = s.find_last_not_of(ws);
    return last == std::string_view::npos ? std::string_view{} : s.substr(0, last + 1);
}

// Source line holding `index`, without its line break
inline std::string_view line_at(std::string_view source, std::size_t index, std::size_t & lineStart) {
    if (index > source.size()) {
        index = source.size();
    }
    const std::size_t prevBreak = index == 0 ? std::string_view::npos : source.rfind('\n', index - 1);
    lineStart = prevBreak == std::string_view::npos ? 0 : prevBreak + 1;
    std::size_t lineEnd = source.find('\n', lineStart);
    if (lineEnd == std::string_view::npos) {
        lineEnd = source.size();
    }
    return source.substr(lineStart, lineEnd - lineStart);
}

}

/// Error text followed by the offending source line and a caret under its column.
/// Lines longer than 2 * window are cut around the column.
inline std::string FormatError(const Error & err, std::string_view source, std::size_t window = 40) {
    std::string out = err.to_string();
    if (!err.position || source.empty()) {
        return out;
    }
    const Position & pos = *err.position;

    std::size_t lineStart = 0;
    std::string_view line = error_formatting_detail::line_at(source, pos.index, lineStart);
    std::size_t caret = pos.index >= lineStart ? pos.index - lineStart : 0;

    std::string prefix;
    if (caret > window) {
        line.remove_prefix(caret - window);
        caret = window;
        prefix = "...";
    }
    std::string suffix;
    if (line.size() > caret + window) {
        line = line.substr(0, caret + window);
        suffix = "...";
    }
    line = error_formatting_detail::rtrim(line);

    out += std::format("\n --> line {}, column {}\n  |\n  | {}{}{}\n  | {}^",
                       pos.line, pos.column,
                       prefix, line, suffix,
                       std::string(prefix.size() + caret, ' '));
    return out;
}

inline std::string FormatError(const ParseResult & res, std::string_view source, std::size_t window = 40) {
    return FormatError(res.error(), source, window);
}

} // namespace YamlFusion
