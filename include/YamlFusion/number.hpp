#pragma once

#include <charconv>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace YamlFusion {

/// YAML number: keeps unsigned / signed / floating point apart, since it decides equality and formatting
class Number {
public:
    enum class Kind : std::uint8_t {
        PosInt,   // >= 0
        NegInt,   // < 0
        Float
    };

    constexpr Number() : kind_(Kind::PosInt), u_(0) {}

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    constexpr Number(I v) {
        if constexpr (std::is_signed_v<I>) {
            if (v < 0) {
                kind_ = Kind::NegInt;
                i_ = static_cast<std::int64_t>(v);
                return;
            }
        }
        kind_ = Kind::PosInt;
        u_ = static_cast<std::uint64_t>(v);
    }

    constexpr Number(double d) : kind_(Kind::Float), f_(d) {}

    // Goes through the shortest float text so 0.1f stays 0.1
    Number(float f) : kind_(Kind::Float) {
        if (!std::isfinite(f)) {
            f_ = static_cast<double>(f);
            return;
        }
        char buf[64];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), f);
        double d = static_cast<double>(f);
        if (ec == std::errc()) {
            std::from_chars(buf, ptr, d);
        }
        f_ = d;
    }

    constexpr Kind kind() const { return kind_; }

    constexpr bool is_u64() const { return kind_ == Kind::PosInt; }
    constexpr bool is_i64() const {
        return kind_ == Kind::NegInt
               || (kind_ == Kind::PosInt && u_ <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()));
    }
    constexpr bool is_f64() const { return kind_ == Kind::Float; }
    constexpr bool is_integer() const { return kind_ != Kind::Float; }

    constexpr std::optional<std::uint64_t> as_u64() const {
        if (kind_ == Kind::PosInt) return u_;
        return std::nullopt;
    }
    constexpr std::optional<std::int64_t> as_i64() const {
        if (kind_ == Kind::NegInt) return i_;
        if (is_i64()) return static_cast<std::int64_t>(u_);
        return std::nullopt;
    }
    // Every number has a floating point view
    constexpr double as_f64() const {
        switch (kind_) {
        case Kind::PosInt: return static_cast<double>(u_);
        case Kind::NegInt: return static_cast<double>(i_);
        case Kind::Float: return f_;
        }
        return 0.0;
    }

    bool is_nan() const { return kind_ == Kind::Float && std::isnan(f_); }
    bool is_infinite() const { return kind_ == Kind::Float && std::isinf(f_); }
    bool is_finite() const { return kind_ != Kind::Float || std::isfinite(f_); }

    /// Plain scalar text as YAML number syntax, nullopt when it is not a number
    static std::optional<Number> from_string(std::string_view text) {
        if (auto i = parse_integer(text)) {
            return i;
        }
        return parse_float(text);
    }

    std::string to_string() const {
        switch (kind_) {
        case Kind::PosInt: return std::to_string(u_);
        case Kind::NegInt: return std::to_string(i_);
        case Kind::Float: break;
        }
        if (std::isnan(f_)) return ".nan";
        if (std::isinf(f_)) return f_ < 0 ? "-.inf" : ".inf";
        char buf[64];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), f_);
        if (ec != std::errc()) {
            return std::to_string(f_);
        }
        std::string out(buf, ptr);
        // integral floats keep a fraction so they read back as floats
        if (out.find_first_of(".eE") == std::string::npos) {
            out += ".0";
        }
        return out;
    }

    bool operator==(const Number& other) const {
        if (kind_ != other.kind_) {
            return false;
        }
        switch (kind_) {
        case Kind::PosInt: return u_ == other.u_;
        case Kind::NegInt: return i_ == other.i_;
        case Kind::Float: break;
        }
        if (std::isnan(f_) && std::isnan(other.f_)) {
            return true;
        }
        return f_ == other.f_;
    }

    static std::optional<Number> parse_integer(std::string_view text);
    static std::optional<Number> parse_float(std::string_view text);

    /// [-+]?[0-9]+, true also for literals too wide for 64 bits
    static constexpr bool is_decimal_integer_literal(std::string_view text) {
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            text.remove_prefix(1);
        }
        if (text.empty()) {
            return false;
        }
        for (char c : text) {
            if (c < '0' || c > '9') return false;
        }
        return true;
    }

private:
    Kind kind_;
    union {
        std::uint64_t u_;
        std::int64_t i_;
        double f_;
    };
};


namespace number_detail {

constexpr bool is_digit_in_base(char c, int base) {
    switch (base) {
    case 2: return c == '0' || c == '1';
    case 8: return c >= '0' && c <= '7';
    case 10: return c >= '0' && c <= '9';
    case 16: return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }
    return false;
}

constexpr bool all_digits(std::string_view s, int base) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_digit_in_base(c, base)) return false;
    }
    return true;
}

} // namespace number_detail


// [-+]?(0x hex | 0o oct | 0b bin | decimal), "01" is not a number
inline std::optional<Number> Number::parse_integer(std::string_view text) {
    bool negative = false;
    std::string_view s = text;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    int base = 10;
    if (s.size() > 2 && s[0] == '0') {
        switch (s[1]) {
        case 'x': base = 16; break;
        case 'o': base = 8; break;
        case 'b': base = 2; break;
        default: break;
        }
        if (base != 10) {
            s.remove_prefix(2);
        }
    }
    if (!number_detail::all_digits(s, base)) {
        return std::nullopt;
    }
    if (base == 10 && s.size() > 1 && s.front() == '0') {
        return std::nullopt;
    }
    std::uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), magnitude, base);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    if (!negative || magnitude == 0) {
        return Number(magnitude);
    }
    constexpr std::uint64_t min_magnitude = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1;
    if (magnitude > min_magnitude) {
        return std::nullopt;
    }
    if (magnitude == min_magnitude) {
        return Number(std::numeric_limits<std::int64_t>::min());
    }
    return Number(-static_cast<std::int64_t>(magnitude));
}

// decimal with fraction / exponent, [-+]?.inf, .nan; finite results only for decimals
inline std::optional<Number> Number::parse_float(std::string_view text) {
    std::string_view s = text;
    bool negative = false;
    bool signed_text = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        negative = s.front() == '-';
        signed_text = true;
        s.remove_prefix(1);
    }
    if (s == ".inf" || s == ".Inf" || s == ".INF") {
        double inf = std::numeric_limits<double>::infinity();
        return Number(negative ? -inf : inf);
    }
    if (s == ".nan" || s == ".NaN" || s == ".NAN") {
        if (signed_text) {
            return std::nullopt;
        }
        return Number(std::numeric_limits<double>::quiet_NaN());
    }
    bool has_digit = false;
    for (char c : s) {
        if (c >= '0' && c <= '9') {
            has_digit = true;
        } else if (c != '.' && c != 'e' && c != 'E' && c != '+' && c != '-') {
            return std::nullopt;
        }
    }
    if (!has_digit || s.front() == '+' || s.front() == '-') {
        return std::nullopt;
    }
    // without fraction or exponent only an out-of-range decimal integer reads as a float
    if (s.find_first_of(".eE") == std::string_view::npos && s.size() > 1 && s.front() == '0') {
        return std::nullopt;
    }
    double d = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), d);
    if (ec != std::errc() || ptr != s.data() + s.size() || !std::isfinite(d)) {
        return std::nullopt;
    }
    return Number(negative ? -d : d);
}

} // namespace YamlFusion
