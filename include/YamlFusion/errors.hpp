#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace YamlFusion {


enum class ErrorKind {
    NO_ERROR,

    PARSE_SYNTAX,
    UNEXPECTED_SHAPE,
    MISSING_FIELD,
    UNKNOWN_FIELD,
    UNKNOWN_VARIANT,
    AMBIGUOUS_VARIANT_REPRESENTATION,
    NUMERIC_RANGE,
    NON_FINITE_NUMBER,
    IO,
    UTF8
};

constexpr std::string_view error_kind_to_string(ErrorKind e) {
    switch(e) {
    case ErrorKind::NO_ERROR: return "NO_ERROR"; break;
    case ErrorKind::PARSE_SYNTAX: return "PARSE_SYNTAX"; break;
    case ErrorKind::UNEXPECTED_SHAPE: return "UNEXPECTED_SHAPE"; break;
    case ErrorKind::MISSING_FIELD: return "MISSING_FIELD"; break;
    case ErrorKind::UNKNOWN_FIELD: return "UNKNOWN_FIELD"; break;
    case ErrorKind::UNKNOWN_VARIANT: return "UNKNOWN_VARIANT"; break;
    case ErrorKind::AMBIGUOUS_VARIANT_REPRESENTATION: return "AMBIGUOUS_VARIANT_REPRESENTATION"; break;
    case ErrorKind::NUMERIC_RANGE: return "NUMERIC_RANGE"; break;
    case ErrorKind::NON_FINITE_NUMBER: return "NON_FINITE_NUMBER"; break;
    case ErrorKind::IO: return "IO"; break;
    case ErrorKind::UTF8: return "UTF8"; break;
    }
    return "N/A";
}

/// Source coordinates: 0-based byte index, 1-based line and column
struct Position {
    std::size_t index = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    constexpr bool operator==(const Position&) const = default;
};

struct Error {
    ErrorKind kind = ErrorKind::NO_ERROR;
    std::string message;
    std::optional<Position> position;
    std::string path = ".";

    explicit operator bool() const {
        return kind != ErrorKind::NO_ERROR;
    }

    // "<path>: <message> at line L column C"
    std::string to_string() const {
        std::string out;
        if (!path.empty() && path != ".") {
            out += path;
            out += ": ";
        }
        out += message;
        if (position) {
            out += " at line ";
            out += std::to_string(position->line);
            out += " column ";
            out += std::to_string(position->column);
        }
        return out;
    }
};

namespace errors_detail {

// Messages quote at most this much of the offending text
inline constexpr std::size_t MaxQuotedLength = 64;

inline std::string quoted(std::string_view text) {
    std::string out = "`";
    if (text.size() > MaxQuotedLength) {
        out.append(text.substr(0, MaxQuotedLength));
        out += "...";
    } else {
        out.append(text);
    }
    out += "`";
    return out;
}

template<class... Parts>
std::string concat(const Parts&... parts) {
    std::string out;
    ((out += parts), ...);
    return out;
}

} // namespace errors_detail

} // namespace YamlFusion
