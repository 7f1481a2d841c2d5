#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "number.hpp"
#include "value.hpp"

namespace YamlFusion {
namespace scalars {

enum class ScalarStyle : std::uint8_t {
    Auto,          // writer decides from the text
    Plain,
    SingleQuoted,
    DoubleQuoted,
    Literal
};

/// Core schema tags that change how a scalar resolves
enum class StandardTag : std::uint8_t {
    None,
    Str,
    Int,
    Float,
    Bool,
    Null,
    Seq,
    Map,
    Other       // !!binary, !!timestamp, ...: resolved like an untagged node
};

constexpr bool is_null_word(std::string_view s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

constexpr std::optional<bool> parse_bool_word(std::string_view s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    return std::nullopt;
}

// YAML 1.1 booleans that other readers still resolve
constexpr bool is_legacy_bool_word(std::string_view s) {
    constexpr std::string_view words[] = {
        "y", "Y", "yes", "Yes", "YES", "n", "N", "no", "No", "NO",
        "on", "On", "ON", "off", "Off", "OFF"
    };
    for (auto w : words) {
        if (w == s) return true;
    }
    return false;
}

/// Null, Bool, Number or String, in that order of precedence
inline Value resolve_plain(std::string_view text) {
    if (is_null_word(text)) {
        return Value();
    }
    if (auto b = parse_bool_word(text)) {
        return Value(*b);
    }
    if (auto n = Number::from_string(text)) {
        return Value(*n);
    }
    return Value(text);
}

constexpr bool is_indicator(char c) {
    switch (c) {
    case '-': case '?': case ':': case ',': case '[': case ']': case '{': case '}':
    case '#': case '&': case '*': case '!': case '|': case '>': case '\'': case '"':
    case '%': case '@': case '`': case '.': case '+':
        return true;
    default:
        return false;
    }
}

constexpr bool is_space(char c) {
    return c == ' ' || c == '\t';
}

/// True when the plain form of `text` would not read back as the same string
inline bool is_ambiguous_plain(std::string_view text) {
    if (text.empty()) {
        return true;
    }
    if (is_null_word(text) || parse_bool_word(text) || is_legacy_bool_word(text)) {
        return true;
    }
    if (Number::from_string(text)) {
        return true;
    }
    if (is_indicator(text.front()) || is_space(text.front()) || is_space(text.back())) {
        return true;
    }
    if (text.back() == ':') {
        return true;
    }
    if (text.find(": ") != std::string_view::npos || text.find(" #") != std::string_view::npos) {
        return true;
    }
    return false;
}

constexpr bool has_control_characters(std::string_view text, bool allow_newline) {
    for (char c : text) {
        auto u = static_cast<unsigned char>(c);
        if (c == '\n' && allow_newline) continue;
        if (u < 0x20 || u == 0x7f) return true;
    }
    return false;
}

inline ScalarStyle choose_string_style(std::string_view text) {
    const bool multiline = text.find('\n') != std::string_view::npos;
    if (has_control_characters(text, true) || (multiline && !text.empty() && is_space(text.front()))) {
        return ScalarStyle::DoubleQuoted;
    }
    if (multiline) {
        return ScalarStyle::Literal;
    }
    if (is_ambiguous_plain(text)) {
        return ScalarStyle::SingleQuoted;
    }
    return ScalarStyle::Plain;
}

/// "!!int", "tag:yaml.org,2002:int" and "<tag:yaml.org,2002:int>" name the same tag
constexpr StandardTag standard_tag(std::string_view tag) {
    if (tag.empty()) {
        return StandardTag::None;
    }
    if (tag == "!") {
        return StandardTag::Str;
    }
    std::string_view name;
    constexpr std::string_view long_prefix = "tag:yaml.org,2002:";
    if (tag.size() > 2 && tag.substr(0, 2) == "!!") {
        name = tag.substr(2);
    } else if (tag.front() == '<' && tag.back() == '>' && tag.substr(1, long_prefix.size()) == long_prefix) {
        name = tag.substr(1 + long_prefix.size(), tag.size() - 2 - long_prefix.size());
    } else if (tag.substr(0, long_prefix.size()) == long_prefix) {
        name = tag.substr(long_prefix.size());
    } else {
        return StandardTag::None;
    }
    if (name == "str") return StandardTag::Str;
    if (name == "int") return StandardTag::Int;
    if (name == "float") return StandardTag::Float;
    if (name == "bool") return StandardTag::Bool;
    if (name == "null") return StandardTag::Null;
    if (name == "seq") return StandardTag::Seq;
    if (name == "map") return StandardTag::Map;
    return StandardTag::Other;
}

/// Application tag text without '!', empty for standard and non-specific tags
constexpr std::string_view custom_tag_name(std::string_view tag) {
    if (tag.empty() || standard_tag(tag) != StandardTag::None) {
        return {};
    }
    if (tag.front() == '!') {
        tag.remove_prefix(1);
    }
    return tag;
}

/// Scalar under an explicit core schema tag; nullopt when the text does not fit the tag
inline std::optional<Value> resolve_tagged(StandardTag tag, std::string_view text) {
    switch (tag) {
    case StandardTag::Str:
        return Value(text);
    case StandardTag::Int:
        if (auto n = Number::parse_integer(text)) return Value(*n);
        return std::nullopt;
    case StandardTag::Float:
        if (auto n = Number::parse_float(text)) return Value(*n);
        if (auto n = Number::parse_integer(text)) return Value(n->as_f64());
        return std::nullopt;
    case StandardTag::Bool:
        if (auto b = parse_bool_word(text)) return Value(*b);
        return std::nullopt;
    case StandardTag::Null:
        if (is_null_word(text)) return Value();
        return std::nullopt;
    case StandardTag::None:
    case StandardTag::Seq:
    case StandardTag::Map:
    case StandardTag::Other:
        break;
    }
    return resolve_plain(text);
}

/// Quoted scalars are strings unless a core schema tag says otherwise
inline std::optional<Value> resolve_scalar(std::string_view text, bool quoted, StandardTag tag) {
    switch (tag) {
    case StandardTag::Str:
    case StandardTag::Int:
    case StandardTag::Float:
    case StandardTag::Bool:
    case StandardTag::Null:
        return resolve_tagged(tag, text);
    case StandardTag::None:
    case StandardTag::Seq:
    case StandardTag::Map:
    case StandardTag::Other:
        break;
    }
    if (quoted) {
        return Value(text);
    }
    return resolve_plain(text);
}

} // namespace scalars
} // namespace YamlFusion
