#pragma once

#include <cstddef>
#include <istream>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "errors.hpp"

namespace YamlFusion {

namespace io {

namespace detail {

inline Position position_of(std::string_view bytes, std::size_t index) {
    Position p;
    p.index = index;
    std::size_t lineStart = 0;
    for (std::size_t i = 0; i < index && i < bytes.size(); i++) {
        if (bytes[i] == '\n') {
            p.line++;
            lineStart = i + 1;
        }
    }
    p.column = index - lineStart + 1;
    return p;
}

inline Error utf8_error(std::string_view bytes, std::size_t index, std::string message) {
    Error e;
    e.kind = ErrorKind::UTF8;
    e.message = std::move(message);
    e.position = position_of(bytes, index);
    return e;
}

} // namespace detail

/// First invalid UTF-8 sequence, nullopt when the whole buffer is well formed.
/// Overlong encodings, surrogates and code points above U+10FFFF are invalid.
inline std::optional<Error> validate_utf8(std::string_view bytes) {
    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            i++;
            continue;
        }
        std::size_t width = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            width = 2;
        } else if (c == 0xE0) {
            width = 3; lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            width = 3;
        } else if (c == 0xED) {
            width = 3; hi = 0x9F;
        } else if (c == 0xF0) {
            width = 4; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            width = 4;
        } else if (c == 0xF4) {
            width = 4; hi = 0x8F;
        } else {
            return detail::utf8_error(bytes, i,
                "invalid utf-8 sequence of 1 bytes from index " + std::to_string(i));
        }
        for (std::size_t k = 1; k < width; k++) {
            if (i + k >= n) {
                return detail::utf8_error(bytes, i,
                    "incomplete utf-8 byte sequence from index " + std::to_string(i));
            }
            const unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            const unsigned char l = k == 1 ? lo : 0x80;
            const unsigned char h = k == 1 ? hi : 0xBF;
            if (cc < l || cc > h) {
                return detail::utf8_error(bytes, i,
                    "invalid utf-8 sequence of " + std::to_string(k) + " bytes from index " + std::to_string(i));
            }
        }
        i += width;
    }
    return std::nullopt;
}

// Whole stream into `out`; an unreadable stream is an IO error
inline std::optional<Error> read_all(std::istream& is, std::string& out) {
    out.assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    if (is.bad()) {
        Error e;
        e.kind = ErrorKind::IO;
        e.message = "failed to read from input stream";
        return e;
    }
    return std::nullopt;
}

inline std::optional<Error> write_all(std::ostream& os, std::string_view text) {
    os.write(text.data(), static_cast<std::streamsize>(text.size()));
    os.flush();
    if (!os) {
        Error e;
        e.kind = ErrorKind::IO;
        e.message = "failed to write to output stream";
        return e;
    }
    return std::nullopt;
}

} // namespace io

} // namespace YamlFusion
