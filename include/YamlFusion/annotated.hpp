#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>

namespace YamlFusion {

template <class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

// Attaches YAML options to a record field in place:
//   Annotated<std::optional<Mode>, options::singleton_map_optional> mode;
//   Annotated<int, options::key<"max-depth">> maxDepth;
// The codecs read and write `value`; the wrapper itself never appears in YAML.
//
// For types that cannot be wrapped, specialize the empty pack instead:
//   template<> struct YamlFusion::Annotated<Closed> { using Options = OptionsPack<options::deny_unknown_fields>; };
// Every field of type Closed then carries those options.
template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }
};

// Options for field I of record T, without touching the record's declaration:
//   template<> struct YamlFusion::AnnotatedField<Vec, 1> { using Options = OptionsPack<options::skip>; };
// They are merged ahead of the field's own Annotated<> options.
template <class T, std::size_t FieldIndex>
struct AnnotatedField {};

} // namespace YamlFusion
