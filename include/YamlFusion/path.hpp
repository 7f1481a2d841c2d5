#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace YamlFusion {
namespace path {

enum class ElementKind : std::uint8_t {
    Index,
    Key,
    Unknown   // mapping entry whose key is not a string
};

struct PathElement {
    ElementKind kind = ElementKind::Unknown;
    std::size_t array_index = std::numeric_limits<std::size_t>::max();
    std::string field_name;

    PathElement() = default;

    explicit PathElement(std::size_t index)
        : kind(ElementKind::Index)
        , array_index(index)
    {}

    explicit PathElement(std::string_view key)
        : kind(ElementKind::Key)
        , field_name(key)
    {}

    bool operator==(const PathElement&) const = default;
};

/// Logical location of a node: sequence indexes and mapping keys from the root
struct Path {
    std::vector<PathElement> storage;

    Path() = default;

    // Path("items", 0, "name") for comparisons in tests and callers
    template <class ... PathElems>
        requires (sizeof...(PathElems) > 0)
    explicit Path(PathElems ... args) {
        auto toPathElement = []<class ArgT>(ArgT arg) {
            if constexpr (std::is_convertible_v<ArgT, std::string_view>) {
                return PathElement{std::string_view(arg)};
            } else if constexpr (std::is_integral_v<ArgT>){
                return PathElement{static_cast<std::size_t>(arg)};
            } else {
                static_assert(!sizeof(arg), "[[[ YamlFusion ]]] Use integer or string segments in Path construction");
            }
        };
        storage = {toPathElement(args)...};
    }

    std::size_t currentLength() const {
        return storage.size();
    }

    void push_index(std::size_t index) {
        storage.emplace_back(index);
    }
    void push_key(std::string_view key) {
        storage.emplace_back(key);
    }
    void push_unknown() {
        storage.emplace_back();
    }
    void pop() {
        storage.pop_back();
    }

    bool operator==(const Path&) const = default;

    // ".", "key", "parent.key", "[0]", "parent[0]", "?", "parent.?"
    std::string to_string() const {
        if (storage.empty()) {
            return ".";
        }
        std::string out;
        for (const auto & el : storage) {
            switch (el.kind) {
            case ElementKind::Index:
                out += "[";
                out += std::to_string(el.array_index);
                out += "]";
                break;
            case ElementKind::Key:
                if (!out.empty()) out += ".";
                out += el.field_name;
                break;
            case ElementKind::Unknown:
                if (!out.empty()) out += ".";
                out += "?";
                break;
            }
        }
        return out;
    }
};

} // namespace path
} // namespace YamlFusion
