#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "errors.hpp"
#include "io.hpp"
#include "number.hpp"
#include "options.hpp"
#include "parse_result.hpp"
#include "scalars.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "struct_introspection.hpp"
#include "value.hpp"
#include "value_io.hpp"
#include "variant.hpp"
#include "writer_concept.hpp"
#include "yaml.hpp"

namespace YamlFusion {

namespace serializer_details {

using errors_detail::concat;
using errors_detail::quoted;

class SerializationContext {
    Error m_error;
    bool m_singletonRecursive = false;
    std::size_t m_depth = 0;

public:
    class DepthGuard {
        SerializationContext& ctx;
    public:
        explicit DepthGuard(SerializationContext& c): ctx(c) {
            ctx.m_depth++;
        }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        ~DepthGuard() {
            ctx.m_depth--;
        }
        explicit operator bool() const {
            return ctx.m_depth <= YAMLFUSION_RECURSION_LIMIT;
        }
    };

    DepthGuard getDepthGuard() {
        return DepthGuard(*this);
    }

    class SingletonRecursiveGuard {
        SerializationContext& ctx;
        bool previous;
    public:
        explicit SingletonRecursiveGuard(SerializationContext& c): ctx(c), previous(c.m_singletonRecursive) {
            ctx.m_singletonRecursive = true;
        }
        SingletonRecursiveGuard(const SingletonRecursiveGuard&) = delete;
        SingletonRecursiveGuard& operator=(const SingletonRecursiveGuard&) = delete;
        ~SingletonRecursiveGuard() {
            ctx.m_singletonRecursive = previous;
        }
    };

    SingletonRecursiveGuard getSingletonRecursiveGuard() {
        return SingletonRecursiveGuard(*this);
    }

    bool singletonRecursive() const {
        return m_singletonRecursive;
    }

    ErrorKind currentError() const {
        return m_error.kind;
    }

    // Serialized values are programmatic: no Position
    bool withError(ErrorKind kind, std::string message) {
        if (m_error.kind == ErrorKind::NO_ERROR) {
            m_error.kind = kind;
            m_error.message = std::move(message);
        }
        return false;
    }

    template<writer::WriterLike Writer>
    bool withWriterError(const Writer & writer) {
        std::string message = writer.errorMessage();
        if (message.empty()) {
            message = "writer failure";
        }
        return withError(ErrorKind::UNEXPECTED_SHAPE, std::move(message));
    }

    SerializeResult result() const {
        return SerializeResult(m_error);
    }
};


template <class FieldOptions, class Field, writer::WriterLike Writer, class CTX>
bool SerializeValue(const Field & obj, Writer & writer, CTX &ctx);


/* ######## Scalars ######## */

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlBool<ObjT>
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    const bool b = obj;
    if (!writer.write_bool(b)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlNumber<ObjT>
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    Number n;
    if constexpr (std::is_integral_v<ObjT>) {
        n = Number(obj);
    } else {
        if constexpr (std::is_same_v<ObjT, float>) {
            n = Number(obj);
        } else {
            n = Number(static_cast<double>(obj));
        }
        if constexpr (!Opts::template has_option<options::detail::allow_non_finite_tag>) {
            if (!n.is_finite()) {
                return ctx.withError(ErrorKind::NON_FINITE_NUMBER,
                                     concat("non-finite number ", quoted(n.to_string()), " is not allowed"));
            }
        }
    }
    if (!writer.write_number(n)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlString<ObjT>
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    if (!writer.write_string(std::string_view(obj), scalars::ScalarStyle::Auto)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


/* ######## Generic node ######## */

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlValueNode<ObjT>
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    // Value trees built in code have no parser bounding their depth
    typename CTX::DepthGuard depth = ctx.getDepthGuard();
    if (!depth) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, "recursion limit exceeded");
    }
    bool ok = true;
    switch (obj.kind()) {
    case ValueKind::Null:
        ok = writer.write_null();
        break;
    case ValueKind::Bool:
        ok = writer.write_bool(*obj.as_bool());
        break;
    case ValueKind::Number:
        ok = writer.write_number(*obj.as_number());
        break;
    case ValueKind::String:
        ok = writer.write_string(*obj.as_string(), scalars::ScalarStyle::Auto);
        break;
    case ValueKind::Sequence: {
        const Sequence & seq = *obj.as_sequence();
        typename Writer::ArrayFrame fr;
        if (!writer.write_array_begin(seq.size(), fr)) {
            return ctx.withWriterError(writer);
        }
        bool first = true;
        for (const Value & item : seq) {
            if (!first && !writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
            first = false;
            if (!SerializeNonNullValue<Opts>(item, writer, ctx)) {
                return false;
            }
        }
        ok = writer.write_array_end(fr);
        break;
    }
    case ValueKind::Mapping: {
        const Mapping & map = *obj.as_mapping();
        typename Writer::MapFrame fr;
        if (!writer.write_map_begin(map.size(), fr)) {
            return ctx.withWriterError(writer);
        }
        bool first = true;
        for (const auto & [key, item] : map) {
            if (!first && !writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
            first = false;
            if (!SerializeNonNullValue<Opts>(key, writer, ctx)) {
                return false;
            }
            if (!writer.move_to_value(fr)) {
                return ctx.withWriterError(writer);
            }
            if (!SerializeNonNullValue<Opts>(item, writer, ctx)) {
                return false;
            }
        }
        ok = writer.write_map_end(fr);
        break;
    }
    case ValueKind::Tagged: {
        const Tagged & tagged = *obj.as_tagged();
        if (!writer.write_tag(tagged.tag())) {
            return ctx.withWriterError(writer);
        }
        return SerializeNonNullValue<Opts>(tagged.value(), writer, ctx);
    }
    }
    if (!ok) {
        return ctx.withWriterError(writer);
    }
    return true;
}


/* ######## Sequences and maps ######## */

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlSerializableArray<ObjT>
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    using FH = static_schema::array_read_cursor<ObjT>;
    FH cursor{obj};

    typename Writer::ArrayFrame fr;
    if (!writer.write_array_begin(cursor.size(), fr)) {
        return ctx.withWriterError(writer);
    }

    cursor.reset();
    stream_read_result res = cursor.read_more();
    while (res == stream_read_result::value) {
        const auto & ch = cursor.get();
        using Meta = options::detail::annotation_meta_getter<typename FH::element_type>;
        if (!SerializeValue<typename Meta::options>(Meta::getRef(ch), writer, ctx)) {
            return false;
        }
        res = cursor.read_more();
        if (res != stream_read_result::end) {
            if (!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
    }
    if (!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlSerializableMap<ObjT>
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    using FH = static_schema::map_read_cursor<ObjT>;
    FH cursor{obj};

    typename Writer::MapFrame fr;
    if (!writer.write_map_begin(cursor.size(), fr)) {
        return ctx.withWriterError(writer);
    }

    cursor.reset();
    bool first = true;
    stream_read_result res = cursor.read_more();
    while (res == stream_read_result::value) {
        const auto & key = cursor.get_key();
        const auto & value = cursor.get_value();

        using Meta = options::detail::annotation_meta_getter<typename FH::mapped_type>;
        if constexpr (static_schema::YamlNullableSerializableValue<typename FH::mapped_type> &&
                      Opts::template has_option<options::detail::skip_nulls_tag>) {
            if (static_schema::isNull(value)) {
                res = cursor.read_more();
                continue;
            }
        }
        if (!first && !writer.advance_after_value(fr)) {
            return ctx.withWriterError(writer);
        }
        first = false;

        if constexpr (static_schema::YamlString<typename FH::key_type>) {
            if (!writer.write_string(std::string_view(key), scalars::ScalarStyle::Auto)) {
                return ctx.withWriterError(writer);
            }
        } else {
            if (!writer.write_number(Number(key))) {
                return ctx.withWriterError(writer);
            }
        }
        if (!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }
        if (!SerializeValue<typename Meta::options>(Meta::getRef(value), writer, ctx)) {
            return false;
        }
        res = cursor.read_more();
    }

    if (!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


/* ######## Tuples ######## */

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlTuple<ObjT>
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    typename Writer::ArrayFrame fr;
    if (!writer.write_array_begin(std::tuple_size_v<ObjT>, fr)) {
        return ctx.withWriterError(writer);
    }
    bool first = true;
    auto serializeOne = [&](const auto & elem) -> bool {
        if (!first && !writer.advance_after_value(fr)) {
            return ctx.withWriterError(writer);
        }
        first = false;
        using Meta = options::detail::annotation_meta_getter<std::remove_cvref_t<decltype(elem)>>;
        return SerializeValue<typename Meta::options>(Meta::getRef(elem), writer, ctx);
    };
    const bool ok = std::apply([&](const auto &... elems) {
        return (serializeOne(elems) && ...);
    }, obj);
    if (!ok) {
        return false;
    }
    if (!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


/* ######## Records ######## */

template <bool AsSequence, bool SkipNulls, std::size_t StructIndex, class Frame, class ObjT, writer::WriterLike Writer, class CTX>
bool SerializeOneStructField(std::size_t & count, Frame & fr, const ObjT& structObj, Writer & writer, CTX &ctx) {
    using F = introspection::RecordField<ObjT, StructIndex>;

    if constexpr (F::skipped) {
        return true;
    } else {
        const auto & field = F::get(structObj);
        // absent optionals are omitted when the record or the field asks for it
        if constexpr (!AsSequence && static_schema::YamlNullableSerializableValue<typename F::value_type>
                      && (SkipNulls || F::absence == introspection::Absence::keep_default)) {
            if (static_schema::isNull(field)) {
                return true;
            }
        }
        if (count > 0) {
            if (!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        if constexpr (!AsSequence) {
            if (!writer.write_string(F::name, scalars::ScalarStyle::Auto)) {
                return ctx.withWriterError(writer);
            }
            if (!writer.move_to_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        count++;
        return SerializeValue<typename F::field_opts>(field, writer, ctx);
    }
}

template <bool AsSequence, bool SkipNulls, class Frame, class ObjT, writer::WriterLike Writer, class CTX, std::size_t... StructIndex>
bool SerializeStructFields(Frame &fr, const ObjT& structObj, Writer & writer, CTX &ctx, std::index_sequence<StructIndex...>) {
    std::size_t count = 0;
    return (
        SerializeOneStructField<AsSequence, SkipNulls, StructIndex>(count, fr, structObj, writer, ctx)
        && ...
        );
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlRecord<ObjT>
             && (!Opts::template has_option<options::detail::as_sequence_tag>)
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ YamlFusion ]]] Field keys are not unique");

    typename Writer::MapFrame fr;
    if (!writer.write_map_begin(FH::fieldsCount, fr)) {
        return ctx.withWriterError(writer);
    }
    if (!SerializeStructFields<false, Opts::template has_option<options::detail::skip_nulls_tag>>(
            fr, obj, writer, ctx, std::make_index_sequence<FH::rawFieldsCount>{})) {
        return false;
    }
    if (!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlRecord<ObjT>
             && Opts::template has_option<options::detail::as_sequence_tag>
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    typename Writer::ArrayFrame fr;
    if (!writer.write_array_begin(FH::fieldsCount, fr)) {
        return ctx.withWriterError(writer);
    }
    if (!SerializeStructFields<true, false>(fr, obj, writer, ctx, std::make_index_sequence<FH::rawFieldsCount>{})) {
        return false;
    }
    if (!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


/* ######## Variants ######## */

template <class CaseT, writer::WriterLike Writer, class CTX>
bool SerializeCasePayload(const CaseT & c, Writer & writer, CTX &ctx) {
    using Meta = options::detail::annotation_meta_getter<typename CaseT::payload_type>;
    return SerializeValue<typename Meta::options>(Meta::getRef(c.value), writer, ctx);
}

// Unit: Name; newtype: !Name payload; tuple: !Name [a, b]
template <class ObjT, writer::WriterLike Writer, class CTX>
bool SerializeVariantTagged(const ObjT & obj, Writer & writer, CTX &ctx) {
    return std::visit([&](const auto & c) -> bool {
        using CaseT = std::remove_cvref_t<decltype(c)>;
        constexpr std::string_view name = CaseT::name.toStringView();
        if constexpr (CaseT::arity == 0) {
            if (!writer.write_string(name, scalars::ScalarStyle::Auto)) {
                return ctx.withWriterError(writer);
            }
            return true;
        } else {
            if (!writer.write_tag(name)) {
                return ctx.withWriterError(writer);
            }
            return SerializeCasePayload(c, writer, ctx);
        }
    }, obj);
}

// {Name: payload}; PayloadFn writes the entry value
template <writer::WriterLike Writer, class CTX, class PayloadFn>
bool SerializeSingletonMapEntry(std::string_view name, Writer & writer, CTX &ctx, PayloadFn && writePayload) {
    typename Writer::MapFrame fr;
    if (!writer.write_map_begin(1, fr)) {
        return ctx.withWriterError(writer);
    }
    if (!writer.write_string(name, scalars::ScalarStyle::Auto)) {
        return ctx.withWriterError(writer);
    }
    if (!writer.move_to_value(fr)) {
        return ctx.withWriterError(writer);
    }
    if (!writePayload()) {
        return false;
    }
    if (!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class ObjT, writer::WriterLike Writer, class CTX>
bool SerializeVariantSingleton(const ObjT & obj, Writer & writer, CTX &ctx) {
    return std::visit([&](const auto & c) -> bool {
        using CaseT = std::remove_cvref_t<decltype(c)>;
        return SerializeSingletonMapEntry(CaseT::name.toStringView(), writer, ctx, [&]() -> bool {
            if constexpr (CaseT::arity == 0) {
                if (!writer.write_null()) {
                    return ctx.withWriterError(writer);
                }
                return true;
            } else {
                return SerializeCasePayload(c, writer, ctx);
            }
        });
    }, obj);
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
bool SerializeVariantCustom(const ObjT & obj, Writer & writer, CTX &ctx) {
    using Opt = typename Opts::template get_option<options::detail::variant_repr_tag>;
    using Tr = variant_detail::variant_traits<ObjT>;

    const std::string_view name = Tr::nameOf(obj);
    Value payload;
    if (!Opt::serialize(obj, payload)) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE,
                             concat("variant ", quoted(name), " rejected by custom serializer"));
    }
    return SerializeSingletonMapEntry(name, writer, ctx, [&]() -> bool {
        return SerializeNonNullValue<options::detail::no_options>(payload, writer, ctx);
    });
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlVariant<ObjT>
bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    using Tr = variant_detail::variant_traits<ObjT>;
    static_assert(Tr::namesAreUnique, "[[[ YamlFusion ]]] Case names are not unique");

    if (obj.valueless_by_exception()) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, "variant holds no value");
    }

    constexpr options::VariantRepr repr = Opts::variant_repr;
    if constexpr (repr == options::VariantRepr::singleton_map_custom) {
        return SerializeVariantCustom<Opts>(obj, writer, ctx);
    } else if constexpr (repr == options::VariantRepr::tag) {
        if (ctx.singletonRecursive()) {
            return SerializeVariantSingleton(obj, writer, ctx);
        }
        return SerializeVariantTagged(obj, writer, ctx);
    } else {
        return SerializeVariantSingleton(obj, writer, ctx);
    }
}


/* ######## Entry for every node ######## */

template <class FieldOptions, class Field, writer::WriterLike Writer, class CTX>
bool SerializeFieldValue(const Field & obj, Writer & writer, CTX &ctx) {
    if constexpr (static_schema::YamlNullableSerializableValue<Field>) {
        if (static_schema::isNull(obj)) {
            if (!writer.write_null()) {
                return ctx.withWriterError(writer);
            }
            return true;
        }
    }
    return SerializeNonNullValue<FieldOptions>(static_schema::getRef(obj), writer, ctx);
}

template <class FieldOptions, class Field, writer::WriterLike Writer, class CTX>
bool SerializeValue(const Field & obj, Writer & writer, CTX &ctx) {
    constexpr options::VariantRepr repr = FieldOptions::variant_repr;
    if constexpr (repr == options::VariantRepr::singleton_map || repr == options::VariantRepr::singleton_map_custom) {
        static_assert(static_schema::YamlVariant<Field>,
                      "[[[ YamlFusion ]]] singleton_map / singleton_map_with apply to variant fields only");
    } else if constexpr (repr == options::VariantRepr::singleton_map_optional) {
        static_assert(static_schema::YamlNullableSerializableValue<Field>
                          && static_schema::YamlVariant<static_schema::non_null_type_t<Field>>,
                      "[[[ YamlFusion ]]] singleton_map_optional applies to std::optional / std::unique_ptr of a variant");
    }

    typename CTX::DepthGuard depth = ctx.getDepthGuard();
    if (!depth) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, "recursion limit exceeded");
    }

    if constexpr (repr == options::VariantRepr::singleton_map_recursive) {
        typename CTX::SingletonRecursiveGuard recursive = ctx.getSingletonRecursiveGuard();
        return SerializeFieldValue<FieldOptions>(obj, writer, ctx);
    } else {
        return SerializeFieldValue<FieldOptions>(obj, writer, ctx);
    }
}

} // namespace serializer_details


template <static_schema::YamlSerializableValue InputObjectT, writer::WriterLike Writer>
SerializeResult SerializeWithWriter(const InputObjectT & obj, Writer & writer) {
    serializer_details::SerializationContext ctx;
    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    serializer_details::SerializeValue<typename Meta::options>(Meta::getRef(obj), writer, ctx);
    if (ctx.currentError() == ErrorKind::NO_ERROR) {
        if (!writer.finish()) {
            ctx.withWriterError(writer);
        }
    }
    return ctx.result();
}

/// YAML text into `out`; `out` is left empty on failure
template <static_schema::YamlSerializableValue InputObjectT>
SerializeResult Serialize(const InputObjectT & obj, std::string & out) {
    out.clear();
    RapidYamlWriter writer(out);
    return SerializeWithWriter(obj, writer);
}

template <static_schema::YamlSerializableValue InputObjectT>
SerializeResult SerializeToStream(const InputObjectT & obj, std::ostream & os) {
    std::string text;
    SerializeResult r = Serialize(obj, text);
    if (!r) {
        return r;
    }
    if (std::optional<Error> err = io::write_all(os, text)) {
        return SerializeResult(std::move(*err));
    }
    return r;
}

template <static_schema::YamlSerializableValue InputObjectT>
SerializeResult ToValue(const InputObjectT & obj, Value & out) {
    Value built;
    ValueWriter writer(built);
    SerializeResult r = SerializeWithWriter(obj, writer);
    if (r) {
        out = std::move(built);
    }
    return r;
}


template <class T>
    requires (!static_schema::YamlSerializableValue<T>)
SerializeResult Serialize(const T &, std::string &) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ YamlFusion ]]] T is not a supported YamlFusion serializable value model type.\n"
                  "see YamlSerializableValue concept for full rules");
    return {};
}

template <class T>
    requires (!static_schema::YamlSerializableValue<T>)
SerializeResult ToValue(const T &, Value &) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ YamlFusion ]]] T is not a supported YamlFusion serializable value model type.\n"
                  "see YamlSerializableValue concept for full rules");
    return {};
}

} // namespace YamlFusion
