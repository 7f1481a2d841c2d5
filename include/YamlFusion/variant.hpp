#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "const_string.hpp"

namespace YamlFusion {

// Alternatives of a YAML-representable variant:
//   using Shape = std::variant<Case<"Empty">,              // unit
//                              Case<"Circle", double>,      // newtype
//                              Case<"Rect", double, double> // tuple, stored as std::tuple
//                             >;
template<ConstString Name, class... Payload>
struct Case;

template<ConstString Name>
struct Case<Name> {
    static_assert(!Name.empty() && Name.check(), "[[[ YamlFusion ]]] Case name must be non-empty and printable");
    static constexpr auto name = Name;
    static constexpr std::size_t arity = 0;

    bool operator==(const Case&) const = default;
};

template<ConstString Name, class T>
struct Case<Name, T> {
    static_assert(!Name.empty() && Name.check(), "[[[ YamlFusion ]]] Case name must be non-empty and printable");
    static constexpr auto name = Name;
    static constexpr std::size_t arity = 1;
    using payload_type = T;

    T value{};

    bool operator==(const Case&) const = default;
};

template<ConstString Name, class A, class B, class... Rest>
struct Case<Name, A, B, Rest...> {
    static_assert(!Name.empty() && Name.check(), "[[[ YamlFusion ]]] Case name must be non-empty and printable");
    static constexpr auto name = Name;
    static constexpr std::size_t arity = 2 + sizeof...(Rest);
    using payload_type = std::tuple<A, B, Rest...>;

    payload_type value{};

    bool operator==(const Case&) const = default;
};


namespace variant_detail {

template<class T>
struct is_case : std::false_type {};

template<ConstString Name, class... Payload>
struct is_case<Case<Name, Payload...>> : std::true_type {};

template<class T>
struct is_case_variant : std::false_type {};

template<class... Cases>
struct is_case_variant<std::variant<Cases...>>
    : std::bool_constant<(sizeof...(Cases) > 0) && (is_case<Cases>::value && ...)> {};

template<class T>
inline constexpr bool is_case_variant_v = is_case_variant<std::remove_cvref_t<T>>::value;

constexpr std::size_t NOT_FOUND = static_cast<std::size_t>(-1);

template<class V>
struct variant_traits;

template<class... Cases>
struct variant_traits<std::variant<Cases...>> {
    using VariantT = std::variant<Cases...>;

    static constexpr std::size_t casesCount = sizeof...(Cases);

    static constexpr std::array<std::string_view, casesCount> names = { Cases::name.toStringView()... };
    static constexpr std::array<std::size_t, casesCount> arities = { Cases::arity... };

    static constexpr bool namesAreUnique = [](std::array<std::string_view, casesCount> sorted) consteval {
        std::ranges::sort(sorted);
        return std::ranges::adjacent_find(sorted) == sorted.end();
    }(names);

    static constexpr std::size_t find(std::string_view name) {
        for (std::size_t i = 0; i < casesCount; i++) {
            if (names[i] == name) {
                return i;
            }
        }
        return NOT_FOUND;
    }

    static std::string_view nameOf(const VariantT& v) {
        return names[v.index()];
    }

    static std::string expectedCasesList() {
        std::string out = casesCount == 1 ? "expected `" : "expected one of `";
        for (std::size_t i = 0; i < casesCount; i++) {
            if (i != 0) {
                out += "`, `";
            }
            out += names[i];
        }
        out += "`";
        return out;
    }

    // Makes alternative `index` active and hands it to fn; false when the index is out of range
    template<class Fn>
    static bool emplace_by_index(VariantT& v, std::size_t index, Fn&& fn) {
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            bool ok = false;
            ((index == I ? (ok = fn(v.template emplace<I>()), true) : false) || ...);
            return ok;
        }(std::index_sequence_for<Cases...>{});
    }
};

} // namespace variant_detail
} // namespace YamlFusion
