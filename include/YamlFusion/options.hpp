#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <optional>
#include <memory>
#include "annotated.hpp"
#include "const_string.hpp"

namespace YamlFusion {


namespace options {

namespace detail {

struct skip_tag{};
struct key_tag{};
struct default_on_absence_tag{};
struct allow_non_finite_tag{};
struct deny_unknown_fields_tag{};
struct skip_nulls_tag{};
struct as_sequence_tag{};
struct variant_repr_tag{};
}

/// How a variant value is laid out in YAML
enum class VariantRepr : std::uint8_t {
    tag,                       // !Case payload, bare Case for unit cases
    singleton_map,             // {Case: payload} for this field only
    singleton_map_optional,    // same, applied through std::optional / std::unique_ptr
    singleton_map_recursive,   // {Case: payload} for every variant nested under this field
    singleton_map_custom       // {Case: payload} with payload produced by caller hooks
};

constexpr std::string_view variant_repr_to_string(VariantRepr r) {
    switch(r) {
    case VariantRepr::tag: return "tag";
    case VariantRepr::singleton_map: return "singleton_map";
    case VariantRepr::singleton_map_optional: return "singleton_map_optional";
    case VariantRepr::singleton_map_recursive: return "singleton_map_recursive";
    case VariantRepr::singleton_map_custom: return "singleton_map_custom";
    }
    return "N/A";
}

/// Field is neither read nor written
struct skip {
    using tag = detail::skip_tag;
    static constexpr std::string_view to_string() {
        return "skip";
    }
};

template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ YamlFusion ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

/// Missing key keeps the field's default; an absent nullable field is omitted on output
struct default_on_absence {
    using tag = detail::default_on_absence_tag;
    static constexpr std::string_view to_string() {
        return "default_on_absence";
    }
};

/// Accept and emit .nan / .inf for a floating point field
struct allow_non_finite {
    using tag = detail::allow_non_finite_tag;
    static constexpr std::string_view to_string() {
        return "allow_non_finite";
    }
};

/// Closed record: unknown keys are an error instead of being skipped
struct deny_unknown_fields {
    using tag = detail::deny_unknown_fields_tag;
    static constexpr std::string_view to_string() {
        return "deny_unknown_fields";
    }
};

/// Record-level: absent nullable fields are omitted on output
struct skip_nulls {
    using tag = detail::skip_nulls_tag;
    static constexpr std::string_view to_string() {
        return "skip_nulls";
    }
};

/// Record is laid out as a sequence of its field values, in declaration order
struct as_sequence {
    using tag = detail::as_sequence_tag;
    static constexpr std::string_view to_string() {
        return "as_sequence";
    }
};

struct singleton_map {
    using tag = detail::variant_repr_tag;
    static constexpr VariantRepr repr = VariantRepr::singleton_map;
    static constexpr std::string_view to_string() {
        return "singleton_map";
    }
};

struct singleton_map_optional {
    using tag = detail::variant_repr_tag;
    static constexpr VariantRepr repr = VariantRepr::singleton_map_optional;
    static constexpr std::string_view to_string() {
        return "singleton_map_optional";
    }
};

struct singleton_map_recursive {
    using tag = detail::variant_repr_tag;
    static constexpr VariantRepr repr = VariantRepr::singleton_map_recursive;
    static constexpr std::string_view to_string() {
        return "singleton_map_recursive";
    }
};

/// SerializeFn: bool(const V&, Value& payload)
/// DeserializeFn: bool(std::string_view caseName, const Value& payload, V&)
template<auto SerializeFn, auto DeserializeFn>
struct singleton_map_with {
    using tag = detail::variant_repr_tag;
    static constexpr VariantRepr repr = VariantRepr::singleton_map_custom;
    static constexpr auto serialize = SerializeFn;
    static constexpr auto deserialize = DeserializeFn;
    static constexpr std::string_view to_string() {
        return "singleton_map_with";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class Tag, class... Opts>
inline constexpr std::size_t count_options_by_tag = (std::size_t{0} + ... + (option_matches_tag<Opts, Tag>::value ? 1 : 0));

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;

    static constexpr VariantRepr variant_repr = VariantRepr::tag;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    static_assert(count_options_by_tag<variant_repr_tag, Opts...> <= 1,
                  "[[[ YamlFusion ]]] At most one variant representation option per field");

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

    static constexpr VariantRepr variant_repr = [] {
        if constexpr (has_option<variant_repr_tag>) {
            return get_option<variant_repr_tag>::repr;
        } else {
            return VariantRepr::tag;
        }
    }();
};



template<class T>
struct is_options_pack : std::false_type {};

template<class... Opts>
struct is_options_pack<OptionsPack<Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_options_pack_v = is_options_pack<T>::value;


template<class T, class = void>
struct has_annotation_specialization_impl : std::false_type {};

template<class T>
struct has_annotation_specialization_impl<T,
                                          std::void_t<typename Annotated<T>::Options>
                                          > : std::bool_constant<
                                                                 is_options_pack_v<typename Annotated<T>::Options>
                                                                    && (Annotated<T>::Options::Count > 0)
                                                                 > {};

template<class T>
inline constexpr bool has_annotation_specialization =
    has_annotation_specialization_impl<T>::value;

template<class Field>
struct annotation_meta{};

template<class T>
    requires (!has_annotation_specialization<T>)
struct annotation_meta<T> {
    using value_t = T;
    using options      = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ YamlFusion ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ YamlFusion ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};


template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;

    using value_t = T;
    using options      = field_options<
        OptionsPack<Opts...>
        >;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
};


template<class T> requires has_annotation_specialization<T>
struct annotation_meta<T> {
    using value_t = T;
    using options      = field_options<typename Annotated<T>::Options>;

    using OptionsP = typename Annotated<T>::Options;

    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }

};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};



} // namespace detail


} //namespace options


} // namespace YamlFusion
