#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "annotated.hpp"
#include "const_string.hpp"
#include "options.hpp"

namespace YamlFusion {

// Registration for records PFR cannot enumerate (private members, non-aggregates):
//   template<> struct YamlFusion::StructMeta<Point> {
//       using Fields = StructFields<Field<&Point::x, "x">, Field<&Point::y, "y", options::default_on_absence>>;
//   };
// The registered key is the YAML key; registration order is the emission order.
template <class RecordT>
struct StructMeta {};

template <auto MemberPtr, ConstString Key, class... Opts>
struct Field;

template <class C, class T, T C::*MemberPtr, ConstString Key, class... Opts>
struct Field<MemberPtr, Key, Opts...> {
    using record_type = C;
    using member_type = T;
    using options_pack = OptionsPack<Opts...>;
    static constexpr ConstString key = Key;
    static constexpr T C::* member = MemberPtr;
};

template <class... Fields>
struct StructFields {
    using list = std::tuple<Fields...>;
};


namespace introspection {

/// What a record does with a field whose key is missing from the mapping
enum class Absence : std::uint8_t {
    required,       // MissingField
    null,           // std::optional / std::unique_ptr is reset
    keep_default    // default_on_absence, value left as constructed
};

namespace detail {

template<class T>
struct is_field_list : std::false_type {};

template<class... F>
struct is_field_list<StructFields<F...>> : std::true_type {};

template<class T, class = void>
struct registered : std::false_type {};

template<class T>
struct registered<T, std::void_t<typename StructMeta<T>::Fields>>
    : is_field_list<typename StructMeta<T>::Fields> {};

template<class T, std::size_t I, class = void>
struct external_field_options {
    using type = OptionsPack<>;
};

template<class T, std::size_t I>
struct external_field_options<T, I, std::void_t<typename AnnotatedField<T, I>::Options>> {
    using type = typename AnnotatedField<T, I>::Options;
};

template<class P1, class P2>
struct concat_packs;

template<class... A, class... B>
struct concat_packs<OptionsPack<A...>, OptionsPack<B...>> {
    using type = OptionsPack<A..., B...>;
};

template<class T>
struct is_nullable_storage : std::false_type {};
template<class T>
struct is_nullable_storage<std::optional<T>> : std::true_type {};
template<class T>
struct is_nullable_storage<std::unique_ptr<T>> : std::true_type {};

// Aggregate seen through PFR: member names from the declaration, options from Annotated<> wrappers
template<class RecordT, std::size_t I, bool Registered = registered<RecordT>::value>
struct field_source {
    using meta = options::detail::annotation_meta_getter<pfr::tuple_element_t<I, RecordT>>;
    using value_type = typename meta::value_t;
    using declared_options = typename meta::OptionsP;
    static constexpr std::string_view member_name = pfr::get_name<I, RecordT>();

    static constexpr value_type& get(RecordT& r) {
        return meta::getRef(pfr::get<I>(r));
    }
    static constexpr const value_type& get(const RecordT& r) {
        return meta::getRef(pfr::get<I>(r));
    }
};

// StructMeta registration: registered key and options come first
template<class RecordT, std::size_t I>
struct field_source<RecordT, I, true> {
    using entry = std::tuple_element_t<I, typename StructMeta<RecordT>::Fields::list>;
    using meta = options::detail::annotation_meta_getter<typename entry::member_type>;
    using value_type = typename meta::value_t;
    using declared_options = typename concat_packs<typename entry::options_pack, typename meta::OptionsP>::type;
    static constexpr std::string_view member_name = entry::key.toStringView();

    static constexpr value_type& get(RecordT& r) {
        return meta::getRef(r.*(entry::member));
    }
    static constexpr const value_type& get(const RecordT& r) {
        return meta::getRef(r.*(entry::member));
    }
};

template<class RecordT, bool Registered = registered<RecordT>::value>
struct field_count {
    static constexpr std::size_t value = pfr::tuple_size_v<RecordT>;
};

template<class RecordT>
struct field_count<RecordT, true> {
    static constexpr std::size_t value = std::tuple_size_v<typename StructMeta<RecordT>::Fields::list>;
};

} // namespace detail

template<class T>
inline constexpr bool has_registered_fields = detail::registered<std::remove_cv_t<T>>::value;

/// Declared fields, skipped ones included
template<class RecordT>
inline constexpr std::size_t fieldCount = detail::field_count<std::remove_cv_t<RecordT>>::value;

/// Everything the record codecs need about field I: YAML key, merged options,
/// absence policy and access to the unwrapped value.
/// Options merge in the order AnnotatedField<T, I>, registration / Annotated<>, Annotated<V> of the value type.
template<class RecordT, std::size_t I>
struct RecordField {
    using source = detail::field_source<std::remove_cv_t<RecordT>, I>;
    using value_type = typename source::value_type;
    using field_opts = options::detail::field_options<
        typename detail::concat_packs<
            typename detail::external_field_options<std::remove_cv_t<RecordT>, I>::type,
            typename source::declared_options
        >::type
    >;

    static constexpr bool skipped = field_opts::template has_option<options::detail::skip_tag>;

    static constexpr std::string_view name = [] {
        if constexpr (field_opts::template has_option<options::detail::key_tag>) {
            return field_opts::template get_option<options::detail::key_tag>::desc.toStringView();
        } else {
            return source::member_name;
        }
    }();

    static constexpr Absence absence = [] {
        if constexpr (field_opts::template has_option<options::detail::default_on_absence_tag>) {
            return Absence::keep_default;
        } else if constexpr (detail::is_nullable_storage<value_type>::value) {
            return Absence::null;
        } else {
            return Absence::required;
        }
    }();

    static constexpr value_type& get(std::remove_cv_t<RecordT>& r) {
        return source::get(r);
    }
    static constexpr const value_type& get(const std::remove_cv_t<RecordT>& r) {
        return source::get(r);
    }
};

} // namespace introspection
} // namespace YamlFusion
