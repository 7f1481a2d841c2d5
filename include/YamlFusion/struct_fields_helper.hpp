#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace YamlFusion {

namespace struct_fields_helper {

struct FieldDescr {
    std::string_view name;
    std::size_t originalIndex;
};

constexpr std::size_t NOT_FOUND = static_cast<std::size_t>(-1);

template<class T>
struct FieldsHelper {

    static constexpr std::size_t rawFieldsCount = introspection::fieldCount<T>;

    template<std::size_t I>
    using field = introspection::RecordField<T, I>;

    static constexpr std::size_t fieldsCount = []<std::size_t... I>(std::index_sequence<I...>) consteval{
        return (std::size_t{0} + ... + (!field<I>::skipped ? 1: 0));
    }(std::make_index_sequence<rawFieldsCount>{});

    // Declaration order, skipped fields left out
    static constexpr std::array<FieldDescr, fieldsCount> fieldIndexesToFieldNames =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<FieldDescr, fieldsCount> arr{};
            std::size_t index = 0;
            auto add_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (!field<J>::skipped) {
                    arr[index++] = FieldDescr{ field<J>::name, J };
                }
            };
            (add_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr bool fieldsAreUnique = [](std::array<FieldDescr, fieldsCount> inputArr) consteval{
        auto sortedArr = inputArr;
        std::ranges::sort(sortedArr, {}, &FieldDescr::name);
        return std::ranges::adjacent_find(sortedArr, {}, &FieldDescr::name) == sortedArr.end();
    }(fieldIndexesToFieldNames);

    static constexpr std::size_t maxFieldNameLength = []() consteval {
        std::size_t maxLen = 0;
        for (const auto& field : fieldIndexesToFieldNames) {
            if (field.name.size() > maxLen) {
                maxLen = field.name.size();
            }
        }
        return maxLen;
    }();

    /// Position in fieldIndexesToFieldNames, NOT_FOUND otherwise
    static constexpr std::size_t findField(std::string_view name) {
        if (name.size() > maxFieldNameLength) {
            return NOT_FOUND;
        }
        for(std::size_t i = 0; i < fieldsCount; i++) {
            if(fieldIndexesToFieldNames[i].name == name) {
                return i;
            }
        }
        return NOT_FOUND;
    }

    // "`a`, `b`" / "there are no fields"
    static std::string expectedFieldsList() {
        if constexpr (fieldsCount == 0) {
            return "there are no fields";
        } else {
            std::string out = fieldsCount == 1 ? "expected `" : "expected one of `";
            for (std::size_t i = 0; i < fieldsCount; i++) {
                if (i != 0) {
                    out += "`, `";
                }
                out += fieldIndexesToFieldNames[i].name;
            }
            out += "`";
            return out;
        }
    }
};

} // namespace struct_fields_helper
} // namespace YamlFusion
