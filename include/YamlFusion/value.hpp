#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "number.hpp"

namespace YamlFusion {

struct Null {
    constexpr bool operator==(const Null&) const = default;
};

class Value;

using Sequence = std::vector<Value>;

/// Ordered Value -> Value entries, keys unique by deep equality.
/// Equality ignores entry order.
class Mapping {
public:
    using entry_type = std::pair<Value, Value>;
    using storage_type = std::vector<entry_type>;
    using const_iterator = storage_type::const_iterator;
    using iterator = storage_type::iterator;

    Mapping() = default;
    Mapping(std::initializer_list<entry_type> entries);

    /// Replaces the value of an existing key in place; returns true when the key is new
    bool insert(Value key, Value value);

    const Value* get(const Value& key) const;
    Value* get(const Value& key);
    bool contains(const Value& key) const;
    bool remove(const Value& key);

    std::size_t size() const;
    bool empty() const;

    const_iterator begin() const;
    const_iterator end() const;
    iterator begin();
    iterator end();

    bool operator==(const Mapping& other) const;

private:
    storage_type entries_;
};

/// `!tag value`; the tag is stored without its leading '!'
class Tagged {
public:
    Tagged();
    Tagged(std::string_view tag, Value value);
    Tagged(const Tagged& other);
    Tagged(Tagged&& other) noexcept;
    Tagged& operator=(const Tagged& other);
    Tagged& operator=(Tagged&& other) noexcept;
    ~Tagged();

    const std::string& tag() const { return tag_; }
    const Value& value() const;
    Value& value();

    bool operator==(const Tagged& other) const;

    static std::string_view nobang(std::string_view tag) {
        if (!tag.empty() && tag.front() == '!') {
            tag.remove_prefix(1);
        }
        return tag;
    }

private:
    std::string tag_;
    std::unique_ptr<Value> value_;
};

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Sequence,
    Mapping,
    Tagged
};

constexpr std::string_view value_kind_to_string(ValueKind k) {
    switch (k) {
    case ValueKind::Null: return "null";
    case ValueKind::Bool: return "bool";
    case ValueKind::Number: return "number";
    case ValueKind::String: return "string";
    case ValueKind::Sequence: return "sequence";
    case ValueKind::Mapping: return "mapping";
    case ValueKind::Tagged: return "tagged value";
    }
    return "N/A";
}

/// Any YAML node. Values built from parsed text remember their source position;
/// the position never takes part in equality.
class Value {
public:
    using Storage = std::variant<Null, bool, Number, std::string, Sequence, Mapping, Tagged>;

    Value() = default;
    Value(Null) {}
    Value(bool b) : data_(b) {}

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    Value(I i) : data_(Number(i)) {}

    Value(float f) : data_(Number(f)) {}
    Value(double d) : data_(Number(d)) {}
    Value(Number n) : data_(n) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(Sequence s) : data_(std::move(s)) {}
    Value(Mapping m) : data_(std::move(m)) {}
    Value(Tagged t) : data_(std::move(t)) {}

    ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<bool>(data_); }
    bool is_number() const { return std::holds_alternative<Number>(data_); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_sequence() const { return std::holds_alternative<Sequence>(data_); }
    bool is_mapping() const { return std::holds_alternative<Mapping>(data_); }
    bool is_tagged() const { return std::holds_alternative<Tagged>(data_); }

    bool is_u64() const { return is_number() && std::get<Number>(data_).is_u64(); }
    bool is_i64() const { return is_number() && std::get<Number>(data_).is_i64(); }
    bool is_f64() const { return is_number() && std::get<Number>(data_).is_f64(); }

    std::optional<bool> as_bool() const {
        if (auto p = std::get_if<bool>(&data_)) return *p;
        return std::nullopt;
    }
    std::optional<std::uint64_t> as_u64() const {
        if (auto p = std::get_if<Number>(&data_)) return p->as_u64();
        return std::nullopt;
    }
    std::optional<std::int64_t> as_i64() const {
        if (auto p = std::get_if<Number>(&data_)) return p->as_i64();
        return std::nullopt;
    }
    std::optional<double> as_f64() const {
        if (auto p = std::get_if<Number>(&data_)) return p->as_f64();
        return std::nullopt;
    }

    const Number* as_number() const { return std::get_if<Number>(&data_); }
    const std::string* as_string() const { return std::get_if<std::string>(&data_); }
    const Sequence* as_sequence() const { return std::get_if<Sequence>(&data_); }
    Sequence* as_sequence() { return std::get_if<Sequence>(&data_); }
    const Mapping* as_mapping() const { return std::get_if<Mapping>(&data_); }
    Mapping* as_mapping() { return std::get_if<Mapping>(&data_); }
    const Tagged* as_tagged() const { return std::get_if<Tagged>(&data_); }
    Tagged* as_tagged() { return std::get_if<Tagged>(&data_); }

    const Storage& storage() const { return data_; }

    // nullptr when absent or when this node is not a mapping / sequence
    const Value* get(const Value& key) const {
        if (auto m = as_mapping()) return m->get(key);
        return nullptr;
    }
    const Value* get(const char* key) const { return get(Value(key)); }
    const Value* get(std::string_view key) const { return get(Value(key)); }
    const Value* get(const std::string& key) const { return get(std::string_view(key)); }

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    const Value* get(I index) const {
        auto s = as_sequence();
        if constexpr (std::is_signed_v<I>) {
            if (index < 0) return nullptr;
        }
        if (s == nullptr || static_cast<std::size_t>(index) >= s->size()) {
            return nullptr;
        }
        return &(*s)[static_cast<std::size_t>(index)];
    }

    // In-place access to an existing entry or element, nullptr like the const overloads
    Value* get(const Value& key) {
        if (auto m = as_mapping()) return m->get(key);
        return nullptr;
    }
    Value* get(const char* key) { return get(Value(key)); }
    Value* get(std::string_view key) { return get(Value(key)); }
    Value* get(const std::string& key) { return get(std::string_view(key)); }

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    Value* get(I index) {
        return const_cast<Value*>(std::as_const(*this).get(index));
    }

    // Reads only: an absent entry yields a shared null, never an insertion
    const Value& operator[](const Value& key) const { return or_null(get(key)); }
    const Value& operator[](const char* key) const { return or_null(get(key)); }
    const Value& operator[](std::string_view key) const { return or_null(get(key)); }
    const Value& operator[](const std::string& key) const { return or_null(get(key)); }

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    const Value& operator[](I index) const { return or_null(get(index)); }

    const std::optional<Position>& position() const { return position_; }
    void set_position(std::optional<Position> p) { position_ = p; }

    bool operator==(const Value& other) const {
        return data_ == other.data_;
    }

    bool operator==(const char* s) const {
        auto str = as_string();
        return str != nullptr && *str == s;
    }
    bool operator==(std::string_view s) const {
        auto str = as_string();
        return str != nullptr && *str == s;
    }
    bool operator==(const std::string& s) const {
        return *this == std::string_view(s);
    }
    bool operator==(bool b) const {
        auto v = as_bool();
        return v && *v == b;
    }
    template<std::integral I>
        requires (!std::same_as<I, bool>)
    bool operator==(I i) const {
        if constexpr (std::is_signed_v<I>) {
            auto v = as_i64();
            return v && *v == static_cast<std::int64_t>(i);
        } else {
            auto v = as_u64();
            return v && *v == static_cast<std::uint64_t>(i);
        }
    }
    bool operator==(double d) const {
        auto v = as_f64();
        return v && *v == d;
    }

private:
    static const Value& or_null(const Value* v) {
        static const Value null_value;
        return v != nullptr ? *v : null_value;
    }

    Storage data_;
    std::optional<Position> position_;
};


inline Mapping::Mapping(std::initializer_list<entry_type> entries) {
    for (const auto & e : entries) {
        insert(e.first, e.second);
    }
}

inline bool Mapping::insert(Value key, Value value) {
    if (Value* existing = get(key)) {
        *existing = std::move(value);
        return false;
    }
    entries_.emplace_back(std::move(key), std::move(value));
    return true;
}

inline const Value* Mapping::get(const Value& key) const {
    for (const auto & e : entries_) {
        if (e.first == key) return &e.second;
    }
    return nullptr;
}

inline Value* Mapping::get(const Value& key) {
    for (auto & e : entries_) {
        if (e.first == key) return &e.second;
    }
    return nullptr;
}

inline bool Mapping::contains(const Value& key) const {
    return get(key) != nullptr;
}

inline bool Mapping::remove(const Value& key) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

inline std::size_t Mapping::size() const { return entries_.size(); }
inline bool Mapping::empty() const { return entries_.empty(); }
inline Mapping::const_iterator Mapping::begin() const { return entries_.begin(); }
inline Mapping::const_iterator Mapping::end() const { return entries_.end(); }
inline Mapping::iterator Mapping::begin() { return entries_.begin(); }
inline Mapping::iterator Mapping::end() { return entries_.end(); }

inline bool Mapping::operator==(const Mapping& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto & e : entries_) {
        const Value* v = other.get(e.first);
        if (v == nullptr || !(*v == e.second)) {
            return false;
        }
    }
    return true;
}


inline Tagged::Tagged() : value_(std::make_unique<Value>()) {}

inline Tagged::Tagged(std::string_view tag, Value value)
    : tag_(nobang(tag))
    , value_(std::make_unique<Value>(std::move(value)))
{}

inline Tagged::Tagged(const Tagged& other)
    : tag_(other.tag_)
    , value_(std::make_unique<Value>(other.value()))
{}

// a moved-from Tagged reads as a Null payload
inline Tagged::Tagged(Tagged&& other) noexcept
    : tag_(std::move(other.tag_))
    , value_(std::move(other.value_))
{}

inline Tagged& Tagged::operator=(const Tagged& other) {
    if (this != &other) {
        tag_ = other.tag_;
        value_ = std::make_unique<Value>(other.value());
    }
    return *this;
}

inline Tagged& Tagged::operator=(Tagged&& other) noexcept {
    tag_ = std::move(other.tag_);
    value_ = std::move(other.value_);
    return *this;
}

inline Tagged::~Tagged() = default;

inline const Value& Tagged::value() const {
    static const Value null_value;
    return value_ ? *value_ : null_value;
}

inline Value& Tagged::value() {
    if (!value_) {
        value_ = std::make_unique<Value>();
    }
    return *value_;
}

inline bool Tagged::operator==(const Tagged& other) const {
    return tag_ == other.tag_ && value() == other.value();
}

} // namespace YamlFusion
