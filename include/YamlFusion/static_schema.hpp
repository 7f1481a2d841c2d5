#pragma once
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "options.hpp"
#include "struct_introspection.hpp"
#include "struct_fields_helper.hpp"
#include "value.hpp"
#include "variant.hpp"

namespace YamlFusion {

enum class stream_read_result : std::uint8_t {
    value,  // one value produced; keep going
    end,    // normal end-of-stream
    error   // unrecoverable error; abort
};

enum class stream_write_result : std::uint8_t {
    slot_allocated,
    overflow,        // fixed-size container full, or duplicate map key
    error,
    value_processed
};

namespace static_schema {


namespace input_checks {

// Top-level forbidden shapes: no recursion, no PFR, no ranges.
template<class T>
struct is_directly_forbidden {
    using D = std::remove_cvref_t<T>;
    static constexpr bool value =
        std::is_void_v<D> ||
        std::is_pointer_v<D> ||
        std::is_member_pointer_v<D> ||
        std::is_null_pointer_v<D> ||
        std::is_function_v<D> ||
        std::is_reference_v<T>;
};

template<class T>
constexpr bool is_directly_forbidden_v =
    is_directly_forbidden<T>::value;

} // namespace input_checks


using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;


// helper: detect specializations
template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};


template<class C>
struct array_read_cursor{};

template<class C>
concept ArrayReadable = requires(C& c) {
    typename array_read_cursor<C>::element_type;
    { array_read_cursor<C>{c}.read_more() } -> std::same_as<stream_read_result>;
    { array_read_cursor<C>{c}.get() } -> std::same_as<const typename array_read_cursor<C>::element_type&>;
    array_read_cursor<C>{c}.reset();
};

template<class C>
    requires std::ranges::sized_range<C>
struct array_read_cursor<C> {
    using element_type = typename C::value_type;
    const C& c;
    decltype(c.begin()) it = c.begin();
    decltype(c.begin()) b = c.begin();
    bool first = true;

    constexpr const element_type& get() const {
        return *it;
    }
    constexpr stream_read_result read_more() {
        if(first) {
            first = false;
        } else {
            it ++;
        }
        if(it != c.end()) return stream_read_result::value;
        else return stream_read_result::end;
    }
    constexpr std::size_t size() const {
        return std::ranges::size(c);
    }
    constexpr void reset() {
        it = b;
        first = true;
    }
};

template<class C>
struct array_write_cursor;

template<class C>
concept ArrayWritable = requires(C& c) {
    typename array_write_cursor<C>::element_type;
    { array_write_cursor<C>{c}.allocate_slot() } -> std::same_as<stream_write_result>;
    { array_write_cursor<C>{c}.get_slot() } -> std::same_as<typename array_write_cursor<C>::element_type&>;
    { array_write_cursor<C>{c}.finalize(std::declval<bool>()) } -> std::same_as<stream_write_result>;
    array_write_cursor<C>{c}.reset();
};

template<class C>
struct map_write_cursor;

template<class C>
concept MapWritable = requires(C& c) {
    typename map_write_cursor<C>::key_type;
    typename map_write_cursor<C>::mapped_type;
    { map_write_cursor<C>{c}.allocate_key() } -> std::same_as<stream_write_result>;
    { map_write_cursor<C>{c}.key_ref() } -> std::same_as<typename map_write_cursor<C>::key_type&>;
    { map_write_cursor<C>{c}.allocate_value_for_parsed_key() } -> std::same_as<stream_write_result>;
    { map_write_cursor<C>{c}.value_ref() } -> std::same_as<typename map_write_cursor<C>::mapped_type&>;
    { map_write_cursor<C>{c}.finalize_pair(std::declval<bool>()) } -> std::same_as<stream_write_result>;
    map_write_cursor<C>{c}.reset();
};

template<class C>
struct map_read_cursor;

template<class C>
concept MapReadable = requires(C& c) {
    typename map_read_cursor<C>::key_type;
    typename map_read_cursor<C>::mapped_type;
    { map_read_cursor<C>{c}.read_more() } -> std::same_as<stream_read_result>;
    { map_read_cursor<C>{c}.get_key() } -> std::same_as<const typename map_read_cursor<C>::key_type&>;
    { map_read_cursor<C>{c}.get_value() } -> std::same_as<const typename map_read_cursor<C>::mapped_type&>;
    map_read_cursor<C>{c}.reset();
};

// std::vector, std::list, std::deque
template<class C>
    requires requires(C& c) {
        { c.emplace_back() } -> std::same_as<typename C::value_type & >;
        c.clear();
    }
struct array_write_cursor<C> {
    using element_type = typename C::value_type;
    C& c;

    constexpr stream_write_result allocate_slot() {
        return stream_write_result::slot_allocated;
    }
    constexpr element_type & get_slot() {
        return c.emplace_back();
    }
    constexpr stream_write_result finalize(bool) {
        return stream_write_result::value_processed;
    }
    constexpr void reset(){
        c.clear();
    }
};

// fixed-size std::array: the element count must match exactly
template<class T, std::size_t N>
struct array_write_cursor<std::array<T, N>> {
    using element_type = T;
    static constexpr std::size_t fixed_size = N;
    std::array<T, N>& c;
    std::size_t index = 0;
    bool first = true;
    constexpr stream_write_result allocate_slot() {
        if(first) {
            index = 0;
            first = false;
        } else {
            index ++;
        }
        if(index < N)
            return stream_write_result::slot_allocated;
        else {
            return stream_write_result::overflow;
        }
    }
    constexpr element_type & get_slot() {
        return c[index];
    }
    constexpr stream_write_result finalize(bool ok) {
        if (!ok) {
            return stream_write_result::error;
        }
        std::size_t filled = first ? 0 : index + 1;
        return filled == N ? stream_write_result::value_processed : stream_write_result::overflow;
    }
    constexpr void reset(){
        index = 0;
        first = true;
    }
};

// Map-like containers with try_emplace
template<class M>
    requires requires(M& m) {
        typename M::key_type;
        typename M::mapped_type;
        { m.try_emplace(std::declval<typename M::key_type>(), std::declval<typename M::mapped_type>()) };
        m.clear();
    }
struct map_write_cursor<M> {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    M& m;
    key_type current_key{};
    mapped_type current_value{};

    constexpr stream_write_result allocate_key() {
        current_key = key_type{};
        return stream_write_result::slot_allocated;
    }

    constexpr key_type& key_ref() {
        return current_key;
    }

    constexpr stream_write_result allocate_value_for_parsed_key() {
        current_value = mapped_type{};
        return stream_write_result::slot_allocated;
    }

    constexpr mapped_type& value_ref() {
        return current_value;
    }

    constexpr stream_write_result finalize_pair(bool ok) {
        if (!ok) return stream_write_result::error;

        auto [it, inserted] = m.try_emplace(
            std::move(current_key),
            std::move(current_value)
        );

        return inserted ? stream_write_result::value_processed
                        : stream_write_result::overflow;  // duplicate key
    }

    constexpr void reset() {
        m.clear();
    }
};

template<class M>
    requires requires(const M& m) {
        typename M::key_type;
        typename M::mapped_type;
        { m.begin() } -> std::same_as<typename M::const_iterator>;
        { m.end() } -> std::same_as<typename M::const_iterator>;
        { m.size() } -> std::convertible_to<std::size_t>;
    }
struct map_read_cursor<M> {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    const M& m;
    typename M::const_iterator it = m.begin();
    typename M::const_iterator b = m.begin();
    bool first = true;

    constexpr stream_read_result read_more() {
        if (first) {
            first = false;
        } else {
            ++it;
        }
        return (it != m.end()) ? stream_read_result::value
                               : stream_read_result::end;
    }

    constexpr const key_type& get_key() const {
        return it->first;
    }

    constexpr const mapped_type& get_value() const {
        return it->second;
    }

    constexpr std::size_t size() const {
        return m.size();
    }

    constexpr void reset() {
        it = b;
        first = true;
    }
};


/* ######## Scalar type detection ######## */
template<class C>
concept YamlBool = std::same_as<AnnotatedValue<C>, bool>;

template<class C>
concept YamlNumber =
    !YamlBool<C> &&
    (std::is_integral_v<AnnotatedValue<C>> || std::is_floating_point_v<AnnotatedValue<C>>);

template<class C>
concept YamlString =
    std::same_as<AnnotatedValue<C>, std::string> ||
    std::same_as<AnnotatedValue<C>, std::string_view>;

template<class C>
concept YamlParsableString = std::same_as<AnnotatedValue<C>, std::string>;

/* ######## Generic node and variants ######## */
template<class C>
concept YamlValueNode = std::same_as<AnnotatedValue<C>, Value>;

template<class C>
concept YamlVariant = variant_detail::is_case_variant_v<AnnotatedValue<C>>;

template<class C>
concept YamlTuple = is_specialization_of<AnnotatedValue<C>, std::tuple>::value;

/* ######## Record type detection ######## */

template<typename T>
struct is_yaml_record {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (YamlBool<T> || YamlString<T> || YamlNumber<T> || YamlValueNode<T> || YamlVariant<T> || YamlTuple<T>) {
            return false;
        } else if constexpr (variant_detail::is_case<U>::value) {
            return false;
        } else if constexpr (std::ranges::range<U>) {
            return false; // sequences and maps are handled separately
        } else if constexpr (MapWritable<U> || MapReadable<U>) {
            return false;
        } else if constexpr (is_specialization_of<U, std::optional>::value || is_specialization_of<U, std::unique_ptr>::value) {
            return false;
        } else if constexpr (!std::is_class_v<U>) {
            return false;
        } else if constexpr (introspection::has_registered_fields<U>) {
            return true;
        } else if constexpr (!std::is_aggregate_v<U>) {
            return false;
        } else {
            return true;
        }
    }();
};

template<class C>
concept YamlRecord = is_yaml_record<C>::value;

template<class C>
concept YamlMapKey =
    YamlString<C> || (std::is_integral_v<AnnotatedValue<C>> && !YamlBool<C>);


template<class T> struct is_yaml_serializable_value;
template<class T> struct is_yaml_parsable_value;


template<class T>
struct is_yaml_serializable_array {
    static constexpr bool value = []{
        using U = AnnotatedValue<T>;
        if constexpr (YamlString<T> || YamlBool<T> || YamlNumber<T> || YamlValueNode<T> || YamlRecord<T>)
            return false;
        else if constexpr (MapReadable<U>)
            return false;
        else if constexpr (ArrayReadable<U>)
            return is_yaml_serializable_value<typename array_read_cursor<U>::element_type>::value;
        else
            return false;
    }();
};

template<class C>
concept YamlSerializableArray = is_yaml_serializable_array<C>::value;

template<typename T>
struct is_yaml_serializable_map {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (YamlBool<T> || YamlString<T> || YamlNumber<T> || YamlValueNode<T> || YamlRecord<T>) {
            return false;
        } else if constexpr (MapReadable<U>) {
            using Cursor = map_read_cursor<U>;
            return YamlMapKey<typename Cursor::key_type> &&
                   is_yaml_serializable_value<typename Cursor::mapped_type>::value;
        } else {
            return false;
        }
    }();
};

template<class C>
concept YamlSerializableMap = is_yaml_serializable_map<C>::value;

template<class T>
struct is_non_null_yaml_serializable_value {
    static constexpr bool value = []{
        if constexpr (YamlBool<T> || YamlNumber<T> || YamlString<T> || YamlValueNode<T>) {
            return true;
        } else if constexpr (YamlVariant<T> || YamlTuple<T> || YamlRecord<T>) {
            return true;
        } else {
            return is_yaml_serializable_array<T>::value || is_yaml_serializable_map<T>::value;
        }
    }();
};

template<class Field>
struct is_nullable_yaml_serializable_value {
    using AV = AnnotatedValue<Field>;
    static constexpr bool value = []{
        if constexpr (is_specialization_of<AV, std::optional>::value) {
            return is_non_null_yaml_serializable_value<typename AV::value_type>::value;
        } else if constexpr (is_specialization_of<AV, std::unique_ptr>::value) {
            return is_non_null_yaml_serializable_value<typename AV::element_type>::value;
        } else {
            return false;
        }
    }();
};

template<class Field>
concept YamlNullableSerializableValue = is_nullable_yaml_serializable_value<Field>::value;

template<class Field>
concept YamlNonNullableSerializableValue = is_non_null_yaml_serializable_value<Field>::value;

template<class T>
struct is_yaml_serializable_value {
    static constexpr bool value = is_non_null_yaml_serializable_value<T>::value
                                  || is_nullable_yaml_serializable_value<T>::value;
};

template<class C>
concept YamlSerializableValue = !input_checks::is_directly_forbidden_v<C> && is_yaml_serializable_value<C>::value;


template<class T>
struct is_yaml_parsable_array {
    static constexpr bool value = []{
        using U = AnnotatedValue<T>;
        if constexpr (YamlString<T> || YamlBool<T> || YamlNumber<T> || YamlValueNode<T> || YamlRecord<T>)
            return false;
        else if constexpr (MapWritable<U>)
            return false;
        else if constexpr (ArrayWritable<U>)
            return is_yaml_parsable_value<typename array_write_cursor<U>::element_type>::value;
        else
            return false;
    }();
};

template<class C>
concept YamlParsableArray = is_yaml_parsable_array<C>::value;

template<typename T>
struct is_yaml_parsable_map {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (YamlBool<T> || YamlString<T> || YamlNumber<T> || YamlValueNode<T> || YamlRecord<T>) {
            return false;
        } else if constexpr (MapWritable<U>) {
            using Cursor = map_write_cursor<U>;
            return YamlMapKey<typename Cursor::key_type> &&
                   !std::same_as<typename Cursor::key_type, std::string_view> &&
                   is_yaml_parsable_value<typename Cursor::mapped_type>::value;
        } else {
            return false;
        }
    }();
};

template<class C>
concept YamlParsableMap = is_yaml_parsable_map<C>::value;

template<class T>
struct is_non_null_yaml_parsable_value {
    static constexpr bool value = []{
        if constexpr (YamlBool<T> || YamlNumber<T> || YamlParsableString<T> || YamlValueNode<T>) {
            return true;
        } else if constexpr (YamlString<T>) {
            return false;  // std::string_view cannot own parsed text
        } else if constexpr (YamlVariant<T> || YamlTuple<T> || YamlRecord<T>) {
            return true;
        } else {
            return is_yaml_parsable_array<T>::value || is_yaml_parsable_map<T>::value;
        }
    }();
};

template<class Field>
struct is_nullable_yaml_parsable_value {
    using AV = AnnotatedValue<Field>;
    static constexpr bool value = []{
        if constexpr (is_specialization_of<AV, std::optional>::value) {
            return is_non_null_yaml_parsable_value<typename AV::value_type>::value;
        } else if constexpr (is_specialization_of<AV, std::unique_ptr>::value) {
            return is_non_null_yaml_parsable_value<typename AV::element_type>::value;
        } else {
            return false;
        }
    }();
};

template<class Field>
concept YamlNullableParsableValue = is_nullable_yaml_parsable_value<Field>::value;

template<class Field>
concept YamlNonNullableParsableValue = is_non_null_yaml_parsable_value<Field>::value;

template<class T>
struct is_yaml_parsable_value {
    static constexpr bool value = is_non_null_yaml_parsable_value<T>::value
                                  || is_nullable_yaml_parsable_value<T>::value;
};

template<class C>
concept YamlParsableValue = !input_checks::is_directly_forbidden_v<C> && is_yaml_parsable_value<C>::value;


/* ######## Generic data access ######## */

// Payload type behind std::optional / std::unique_ptr, the type itself otherwise
template<class T>
struct non_null_type {
    using type = T;
};
template<class T>
struct non_null_type<std::optional<T>> {
    using type = T;
};
template<class T>
struct non_null_type<std::unique_ptr<T>> {
    using type = T;
};
template<class T>
using non_null_type_t = typename non_null_type<AnnotatedValue<T>>::type;

template <YamlNullableParsableValue Field>
constexpr void setNull(Field &f) {
    annotation_meta_getter<Field>::getRef(f).reset(); // same for std::optional and std::unique_ptr
}

template <YamlNullableSerializableValue Field>
constexpr bool isNull(const Field &f) {
    using AV = AnnotatedValue<Field>;
    if constexpr (is_specialization_of<AV, std::optional>::value) {
        return !annotation_meta_getter<Field>::getRef(f).has_value();
    } else {
        return annotation_meta_getter<Field>::getRef(f).get() == nullptr;
    }
}

template<YamlNullableParsableValue Field>
constexpr decltype(auto) getRef(Field & f) {
    using S = annotation_meta_getter<Field>;
    if constexpr (is_specialization_of<typename S::value_t, std::optional>::value) {
        auto& opt = S::getRef(f);
        if(!opt)
            return (opt.emplace());
        else return (*opt);
    } else {
        auto& opt = S::getRef(f);
        if(opt == nullptr)
            opt = std::make_unique<typename S::value_t::element_type>();
        return (*opt);
    }
}

template<YamlNullableSerializableValue Field>
constexpr decltype(auto) getRef(const Field & f) { // only after checking isNull
    using S = annotation_meta_getter<Field>;
    return (*S::getRef(f));
}

template<YamlNonNullableParsableValue Field>
constexpr decltype(auto) getRef(Field & f) {
    using S = annotation_meta_getter<Field>;
    return (S::getRef(f));
}

template<YamlNonNullableSerializableValue Field>
constexpr decltype(auto) getRef(const Field & f) {
    using S = annotation_meta_getter<Field>;
    return (S::getRef(f));
}


/* ######## Record helpers ######## */

// Every field may be absent, so a null document reads as an all-absent record
template<class T>
consteval bool recordFieldsAllOptional() {
    if constexpr (!YamlRecord<T>) {
        return false;
    } else {
        using U = AnnotatedValue<T>;
        return []<std::size_t... I>(std::index_sequence<I...>) {
            return ((introspection::RecordField<U, I>::skipped
                     || introspection::RecordField<U, I>::absence != introspection::Absence::required) && ...);
        }(std::make_index_sequence<introspection::fieldCount<U>>{});
    }
}


namespace detail {
template<class T>
struct always_false : std::false_type {};
}

} // namespace static_schema
} // namespace YamlFusion
