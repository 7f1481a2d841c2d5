#pragma once

#include <bitset>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "io.hpp"
#include "number.hpp"
#include "options.hpp"
#include "parse_result.hpp"
#include "path.hpp"
#include "reader_concept.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "struct_introspection.hpp"
#include "value.hpp"
#include "value_io.hpp"
#include "variant.hpp"
#include "yaml.hpp"

namespace YamlFusion {

namespace parser_details {

using errors_detail::concat;
using errors_detail::quoted;

class DeserializationContext {
    Error m_error;
    path::Path m_path;
    std::size_t m_depth = 0;
    bool m_singletonRecursive = false;

public:
    class PathGuard {
        DeserializationContext& ctx;
    public:
        explicit PathGuard(DeserializationContext& c): ctx(c) {}
        PathGuard(const PathGuard&) = delete;
        PathGuard& operator=(const PathGuard&) = delete;
        ~PathGuard() {
            ctx.m_path.pop();
        }
    };

    class DepthGuard {
        DeserializationContext& ctx;
    public:
        explicit DepthGuard(DeserializationContext& c): ctx(c) {
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

    // Every variant reached while the guard lives is read in singleton-map form
    class SingletonRecursiveGuard {
        DeserializationContext& ctx;
        bool previous;
    public:
        explicit SingletonRecursiveGuard(DeserializationContext& c): ctx(c), previous(c.m_singletonRecursive) {
            ctx.m_singletonRecursive = true;
        }
        SingletonRecursiveGuard(const SingletonRecursiveGuard&) = delete;
        SingletonRecursiveGuard& operator=(const SingletonRecursiveGuard&) = delete;
        ~SingletonRecursiveGuard() {
            ctx.m_singletonRecursive = previous;
        }
    };

    PathGuard getArrayItemGuard(std::size_t index) {
        m_path.push_index(index);
        return PathGuard(*this);
    }
    PathGuard getMapItemGuard(std::string_view key) {
        m_path.push_key(key);
        return PathGuard(*this);
    }
    PathGuard getUnknownKeyGuard() {
        m_path.push_unknown();
        return PathGuard(*this);
    }
    DepthGuard getDepthGuard() {
        return DepthGuard(*this);
    }
    SingletonRecursiveGuard getSingletonRecursiveGuard() {
        return SingletonRecursiveGuard(*this);
    }

    bool singletonRecursive() const {
        return m_singletonRecursive;
    }

    ErrorKind currentError() const {
        return m_error.kind;
    }

    // The first failure wins
    bool withError(ErrorKind kind, std::string message, std::optional<Position> position) {
        if (m_error.kind == ErrorKind::NO_ERROR) {
            m_error.kind = kind;
            m_error.message = std::move(message);
            m_error.position = position;
            m_error.path = m_path.to_string();
        }
        return false;
    }

    template<reader::ReaderLike Reader>
    bool withError(ErrorKind kind, std::string message, const Reader& reader) {
        return withError(kind, std::move(message), reader.position());
    }

    template<reader::ReaderLike Reader>
    bool withReaderError(const Reader& reader) {
        if (reader.errorKind() == ErrorKind::NO_ERROR) {
            return withError(ErrorKind::PARSE_SYNTAX, "invalid reader state", reader.position());
        }
        return withError(reader.errorKind(), reader.errorMessage(), reader.errorPosition());
    }

    ParseResult result(std::size_t documentCount) const {
        return ParseResult(m_error, documentCount);
    }
};


/* ######## Diagnostics ######## */

template<class T>
constexpr std::string_view number_type_name() {
    if constexpr (std::is_floating_point_v<T>) {
        return sizeof(T) <= 4 ? "f32" : "f64";
    } else if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return "i8";
        else if constexpr (sizeof(T) == 2) return "i16";
        else if constexpr (sizeof(T) == 4) return "i32";
        else return "i64";
    } else {
        if constexpr (sizeof(T) == 1) return "u8";
        else if constexpr (sizeof(T) == 2) return "u16";
        else if constexpr (sizeof(T) == 4) return "u32";
        else return "u64";
    }
}

template<class T, class Opts = options::detail::no_options>
std::string expected_description() {
    using U = static_schema::AnnotatedValue<T>;
    if constexpr (static_schema::YamlNullableParsableValue<T>) {
        return expected_description<static_schema::non_null_type_t<T>, Opts>();
    } else if constexpr (static_schema::YamlBool<T>) {
        return "a boolean";
    } else if constexpr (static_schema::YamlNumber<T>) {
        return std::string(number_type_name<U>());
    } else if constexpr (static_schema::YamlString<T>) {
        return "a string";
    } else if constexpr (static_schema::YamlValueNode<T>) {
        return "any YAML value";
    } else if constexpr (static_schema::YamlVariant<T>) {
        if constexpr (Opts::variant_repr == options::VariantRepr::tag) {
            return "a YAML tag starting with '!'";
        } else {
            return "a map containing 1 entry";
        }
    } else if constexpr (static_schema::YamlTuple<T>) {
        return concat("a tuple of size ", std::to_string(std::tuple_size_v<U>));
    } else if constexpr (static_schema::YamlRecord<T>) {
        if constexpr (Opts::template has_option<options::detail::as_sequence_tag>) {
            return concat("a sequence of ", std::to_string(struct_fields_helper::FieldsHelper<U>::fieldsCount), " elements");
        } else {
            return "a mapping";
        }
    } else if constexpr (static_schema::YamlParsableMap<T>) {
        return "a map";
    } else if constexpr (requires { static_schema::array_write_cursor<U>::fixed_size; }) {
        return concat("an array of length ", std::to_string(static_schema::array_write_cursor<U>::fixed_size));
    } else {
        return "a sequence";
    }
}

// "string `abc`", "integer `5`", "mapping"
template<reader::ReaderLike Reader>
std::string found_description(const Reader& reader) {
    reader::NodeKind k = reader.node_kind();
    std::string out(reader::node_kind_to_string(k));
    if (reader::is_scalar_kind(k) && k != reader::NodeKind::Null) {
        out += " ";
        out += quoted(reader.scalar_text());
    }
    return out;
}

template<reader::ReaderLike Reader>
std::string invalid_type(const Reader& reader, std::string_view expected) {
    return concat("invalid type: ", found_description(reader), ", expected ", expected);
}

inline std::string invalid_length(std::size_t found, std::string_view expected) {
    return concat("invalid length ", std::to_string(found), ", expected ", expected);
}

inline std::string value_key_text(const Value& key) {
    if (auto s = key.as_string()) return *s;
    if (auto n = key.as_number()) return n->to_string();
    if (auto b = key.as_bool()) return *b ? "true" : "false";
    if (key.is_null()) return "null";
    return std::string(value_kind_to_string(key.kind()));
}


/* ######## Number conversion ######## */

template<class I>
bool integer_from_number(const Number& n, I& out) {
    if constexpr (std::is_signed_v<I>) {
        std::optional<std::int64_t> v = n.as_i64();
        if (!v || *v < std::numeric_limits<I>::min() || *v > std::numeric_limits<I>::max()) {
            return false;
        }
        out = static_cast<I>(*v);
    } else {
        std::optional<std::uint64_t> v = n.as_u64();
        if (!v || *v > std::numeric_limits<I>::max()) {
            return false;
        }
        out = static_cast<I>(*v);
    }
    return true;
}

template<class I, reader::ReaderLike Tokenizer, class CTX>
bool read_integer(I& out, Tokenizer& reader, CTX& ctx) {
    constexpr std::string_view expected = number_type_name<I>();
    Number n;
    reader::TryParseStatus st = reader.read_number(n);
    if (st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, expected), reader);
    } else if (!n.is_integer()) {
        // decimal literal wider than 64 bits, resolved as a float
        const std::string_view text = reader.scalar_text();
        if (Number::is_decimal_integer_literal(text)) {
            return ctx.withError(ErrorKind::NUMERIC_RANGE,
                                 concat("invalid value: integer ", quoted(text), ", expected ", expected),
                                 reader);
        }
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, expected), reader);
    }
    if (!integer_from_number(n, out)) {
        return ctx.withError(ErrorKind::NUMERIC_RANGE,
                             concat("invalid value: integer ", quoted(n.to_string()), ", expected ", expected),
                             reader);
    }
    return true;
}


template <class FieldOptions, class Field, reader::ReaderLike Tokenizer, class CTX>
bool ParseValue(Field & field, Tokenizer & reader, CTX &ctx);


/* ######## Scalars ######## */

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlBool<ObjT>
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    reader::TryParseStatus st = reader.read_bool(obj);
    if (st == reader::TryParseStatus::ok) {
        return true;
    } else if (st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a boolean"), reader);
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlNumber<ObjT>
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    if constexpr (std::is_integral_v<ObjT>) {
        return read_integer(obj, reader, ctx);
    } else {
        constexpr std::string_view expected = number_type_name<ObjT>();
        Number n;
        reader::TryParseStatus st = reader.read_number(n);
        if (st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if (st == reader::TryParseStatus::no_match) {
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, expected), reader);
        }
        if constexpr (!Opts::template has_option<options::detail::allow_non_finite_tag>) {
            if (!n.is_finite()) {
                return ctx.withError(ErrorKind::NON_FINITE_NUMBER,
                                     concat("non-finite number ", quoted(n.to_string()), " is not allowed, expected ", expected),
                                     reader);
            }
        }
        // narrowing saturates to infinity, magnitude never fails
        obj = static_cast<ObjT>(n.as_f64());
        return true;
    }
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlParsableString<ObjT>
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    reader::TryParseStatus st = reader.read_string(obj);
    if (st == reader::TryParseStatus::ok) {
        return true;
    } else if (st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a string"), reader);
}


/* ######## Generic node ######## */

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlValueNode<ObjT>
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    const std::optional<Position> pos = reader.position();

    if (std::string_view tagView = reader.tag(); !tagView.empty()) {
        std::string tag(tagView);
        reader.consume_tag();
        Value inner;
        if (!ParseNonNullValue<Opts>(inner, reader, ctx)) {
            return false;
        }
        obj = Value(Tagged(tag, std::move(inner)));
        obj.set_position(pos);
        return true;
    }

    switch (reader.node_kind()) {
    case reader::NodeKind::Sequence: {
        typename Tokenizer::ArrayFrame fr;
        reader::IterationStatus iterStatus = reader.read_array_begin(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
        Sequence seq;
        seq.reserve(fr.size);
        std::size_t index = 0;
        while (iterStatus.has_value) {
            {
                typename CTX::PathGuard guard = ctx.getArrayItemGuard(index);
                if (!ParseValue<options::detail::no_options>(seq.emplace_back(), reader, ctx)) {
                    return false;
                }
            }
            index++;
            iterStatus = reader.advance_after_value(fr);
            if (iterStatus.status != reader::TryParseStatus::ok) {
                return ctx.withReaderError(reader);
            }
        }
        obj = Value(std::move(seq));
        break;
    }
    case reader::NodeKind::Mapping: {
        typename Tokenizer::MapFrame fr;
        reader::IterationStatus iterStatus = reader.read_map_begin(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
        Mapping map;
        while (iterStatus.has_value) {
            const std::optional<Position> keyPos = reader.position();
            Value key;
            if (!ParseValue<options::detail::no_options>(key, reader, ctx)) {
                return false;
            }
            if (!reader.move_to_value(fr)) {
                return ctx.withReaderError(reader);
            }
            if (map.contains(key)) {
                return ctx.withError(ErrorKind::UNEXPECTED_SHAPE,
                                     concat("duplicate entry with key ", quoted(value_key_text(key))),
                                     keyPos);
            }
            Value item;
            if (const std::string* s = key.as_string()) {
                typename CTX::PathGuard guard = ctx.getMapItemGuard(*s);
                if (!ParseValue<options::detail::no_options>(item, reader, ctx)) {
                    return false;
                }
            } else {
                typename CTX::PathGuard guard = ctx.getUnknownKeyGuard();
                if (!ParseValue<options::detail::no_options>(item, reader, ctx)) {
                    return false;
                }
            }
            map.insert(std::move(key), std::move(item));
            iterStatus = reader.advance_after_value(fr);
            if (iterStatus.status != reader::TryParseStatus::ok) {
                return ctx.withReaderError(reader);
            }
        }
        obj = Value(std::move(map));
        break;
    }
    default: {
        reader::TryParseStatus st = reader.start_value_and_try_read_null();
        if (st == reader::TryParseStatus::ok) {
            obj = Value();
            break;
        } else if (st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }
        bool b = false;
        st = reader.read_bool(b);
        if (st == reader::TryParseStatus::ok) {
            obj = Value(b);
            break;
        } else if (st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }
        Number n;
        st = reader.read_number(n);
        if (st == reader::TryParseStatus::ok) {
            obj = Value(n);
            break;
        } else if (st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }
        std::string s;
        st = reader.read_string(s);
        if (st == reader::TryParseStatus::ok) {
            obj = Value(std::move(s));
            break;
        } else if (st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "any YAML value"), reader);
    }
    }
    obj.set_position(pos);
    return true;
}


/* ######## Sequences and maps ######## */

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlParsableArray<ObjT>
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    const std::optional<Position> pos = reader.position();
    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if (iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, expected_description<ObjT>()), reader);
    } else if (iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = static_schema::array_write_cursor<ObjT>;
    FH cursor{obj};
    cursor.reset();

    std::size_t parsed_items_count = 0;
    while (iterStatus.has_value) {
        stream_write_result alloc_r = cursor.allocate_slot();
        if (alloc_r != stream_write_result::slot_allocated) {
            cursor.finalize(false);
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_length(fr.size, expected_description<ObjT>()), pos);
        }
        typename FH::element_type & newItem = cursor.get_slot();
        {
            typename CTX::PathGuard guard = ctx.getArrayItemGuard(parsed_items_count);
            using Meta = options::detail::annotation_meta_getter<typename FH::element_type>;
            if (!ParseValue<typename Meta::options>(Meta::getRef(newItem), reader, ctx)) {
                cursor.finalize(false);
                return false;
            }
        }
        parsed_items_count++;
        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            cursor.finalize(false);
            return ctx.withReaderError(reader);
        }
    }
    if (cursor.finalize(true) != stream_write_result::value_processed) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_length(parsed_items_count, expected_description<ObjT>()), pos);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlParsableMap<ObjT>
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    typename Tokenizer::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if (iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a map"), reader);
    } else if (iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = static_schema::map_write_cursor<ObjT>;
    using K = typename FH::key_type;
    FH cursor{obj};
    cursor.reset();

    while (iterStatus.has_value) {
        const std::optional<Position> keyPos = reader.position();
        cursor.allocate_key();
        K & key = cursor.key_ref();
        std::string keyText;
        if constexpr (static_schema::YamlString<K>) {
            reader::TryParseStatus st = reader.read_string(key);
            if (st == reader::TryParseStatus::error) {
                return ctx.withReaderError(reader);
            } else if (st == reader::TryParseStatus::no_match) {
                return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a string key"), reader);
            }
            keyText = key;
        } else {
            if (!read_integer(key, reader, ctx)) {
                return false;
            }
            keyText = std::to_string(key);
        }
        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        cursor.allocate_value_for_parsed_key();
        {
            typename CTX::PathGuard guard = ctx.getMapItemGuard(keyText);
            using Meta = options::detail::annotation_meta_getter<typename FH::mapped_type>;
            if (!ParseValue<typename Meta::options>(Meta::getRef(cursor.value_ref()), reader, ctx)) {
                return false;
            }
        }
        if (cursor.finalize_pair(true) != stream_write_result::value_processed) {
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, concat("duplicate entry with key ", quoted(keyText)), keyPos);
        }
        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    return true;
}


/* ######## Tuples ######## */

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlTuple<ObjT>
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    constexpr std::size_t N = std::tuple_size_v<ObjT>;
    const std::optional<Position> pos = reader.position();
    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if (iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, expected_description<ObjT>()), reader);
    } else if (iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    if (fr.size != N) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_length(fr.size, expected_description<ObjT>()), pos);
    }

    std::size_t index = 0;
    auto parseOne = [&](auto & elem) -> bool {
        using Meta = options::detail::annotation_meta_getter<std::remove_cvref_t<decltype(elem)>>;
        {
            typename CTX::PathGuard guard = ctx.getArrayItemGuard(index);
            if (!ParseValue<typename Meta::options>(Meta::getRef(elem), reader, ctx)) {
                return false;
            }
        }
        index++;
        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
        return true;
    };
    return std::apply([&](auto &... elems) {
        return (parseOne(elems) && ...);
    }, obj);
}


/* ######## Records ######## */

template <class ObjT, reader::ReaderLike Tokenizer, class CTX, std::size_t... StructIndex>
    requires static_schema::YamlRecord<ObjT>
bool ParseStructField(ObjT& structObj, Tokenizer & reader, CTX &ctx, std::index_sequence<StructIndex...>, std::size_t requiredIndex) {
    bool ok = false;
    (
        (requiredIndex == StructIndex
             ? (
                ok = ParseValue<typename introspection::RecordField<ObjT, StructIndex>::field_opts>(
                       introspection::RecordField<ObjT, StructIndex>::get(structObj),
                       reader, ctx
                       )
                , 0)
             : 0),
        ...
        );
    return ok;
}

template<std::size_t I, class ObjT, class CTX>
bool ApplyAbsentField(ObjT& obj, CTX& ctx, const std::optional<Position>& mapPos) {
    using F = introspection::RecordField<ObjT, I>;
    if constexpr (F::absence == introspection::Absence::keep_default) {
        return true;
    } else if constexpr (F::absence == introspection::Absence::null) {
        F::get(obj).reset();
        return true;
    } else {
        return ctx.withError(ErrorKind::MISSING_FIELD, concat("missing field ", quoted(F::name)), mapPos);
    }
}

// Fields never seen in the mapping: default, absent or MissingField, in declaration order
template<class ObjT, class CTX, std::size_t N>
bool ApplyAbsentFields(ObjT& obj, const std::bitset<N>& parsedFieldsByIndex, CTX& ctx, const std::optional<Position>& mapPos) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    return [&]<std::size_t... J>(std::index_sequence<J...>) {
        return ((parsedFieldsByIndex[J]
                 || ApplyAbsentField<FH::fieldIndexesToFieldNames[J].originalIndex>(obj, ctx, mapPos)) && ...);
    }(std::make_index_sequence<FH::fieldsCount>{});
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlRecord<ObjT>
             && (!Opts::template has_option<options::detail::as_sequence_tag>)
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ YamlFusion ]]] Field keys are not unique");

    const std::optional<Position> mapPos = reader.position();
    typename Tokenizer::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if (iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a mapping"), reader);
    } else if (iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    std::bitset<FH::fieldsCount> parsedFieldsByIndex{};

    while (iterStatus.has_value) {
        const std::optional<Position> keyPos = reader.position();
        std::string key;
        reader::TryParseStatus st = reader.read_string(key);
        if (st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if (st == reader::TryParseStatus::no_match) {
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a field name"), reader);
        }
        const std::size_t arrayIndex = FH::findField(key);

        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        if (arrayIndex == struct_fields_helper::NOT_FOUND) {
            if constexpr (Opts::template has_option<options::detail::deny_unknown_fields_tag>) {
                return ctx.withError(ErrorKind::UNKNOWN_FIELD,
                                     concat("unknown field ", quoted(key), ", ", FH::expectedFieldsList()),
                                     keyPos);
            } else {
                if (!reader.skip_value()) {
                    return ctx.withReaderError(reader);
                }
            }
        } else {
            if (parsedFieldsByIndex[arrayIndex]) {
                return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, concat("duplicate field ", quoted(key)), keyPos);
            }
            typename CTX::PathGuard guard = ctx.getMapItemGuard(FH::fieldIndexesToFieldNames[arrayIndex].name);
            if (!ParseStructField(obj, reader, ctx, std::make_index_sequence<FH::rawFieldsCount>{},
                                  FH::fieldIndexesToFieldNames[arrayIndex].originalIndex)) {
                return false;
            }
            parsedFieldsByIndex[arrayIndex] = true;
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }

    return ApplyAbsentFields(obj, parsedFieldsByIndex, ctx, mapPos);
}

/* #### Records laid out as sequences #### */

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlRecord<ObjT>
             && Opts::template has_option<options::detail::as_sequence_tag>
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;

    const std::optional<Position> pos = reader.position();
    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if (iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, expected_description<ObjT, Opts>()), reader);
    } else if (iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    if (fr.size != FH::fieldsCount) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_length(fr.size, expected_description<ObjT, Opts>()), pos);
    }

    std::size_t requiredIndex = 0;
    while (iterStatus.has_value) {
        {
            typename CTX::PathGuard guard = ctx.getArrayItemGuard(requiredIndex);
            if (!ParseStructField(obj, reader, ctx, std::make_index_sequence<FH::rawFieldsCount>{},
                                  FH::fieldIndexesToFieldNames[requiredIndex].originalIndex)) {
                return false;
            }
        }
        requiredIndex++;
        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    return true;
}


/* ######## Variants ######## */

template <class CaseT, reader::ReaderLike Tokenizer, class CTX>
bool ParseCasePayload(CaseT & c, Tokenizer & reader, CTX &ctx) {
    if constexpr (CaseT::arity == 0) {
        reader::TryParseStatus st = reader.start_value_and_try_read_null();
        if (st == reader::TryParseStatus::ok) {
            return true;
        } else if (st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "unit variant"), reader);
    } else {
        using Meta = options::detail::annotation_meta_getter<typename CaseT::payload_type>;
        return ParseValue<typename Meta::options>(Meta::getRef(c.value), reader, ctx);
    }
}

// Bare scalar naming a unit case
template <class ObjT, reader::ReaderLike Tokenizer, class CTX>
bool ParseUnitCaseByName(ObjT & obj, const std::string & name, Tokenizer & reader, CTX &ctx) {
    using Tr = variant_detail::variant_traits<ObjT>;
    const std::size_t index = Tr::find(name);
    if (index == variant_detail::NOT_FOUND) {
        return ctx.withError(ErrorKind::UNKNOWN_VARIANT,
                             concat("unknown variant ", quoted(name), ", ", Tr::expectedCasesList()),
                             reader);
    }
    if (Tr::arities[index] != 0) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE,
                             concat("invalid type: unit variant, expected ",
                                    Tr::arities[index] == 1 ? "newtype variant" : "tuple variant"),
                             reader);
    }
    return Tr::emplace_by_index(obj, index, [](auto &) { return true; });
}

template <class ObjT, reader::ReaderLike Tokenizer, class CTX>
bool ParseVariantTagged(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    using Tr = variant_detail::variant_traits<ObjT>;
    constexpr std::string_view expected = "a YAML tag starting with '!'";

    if (std::string_view tagView = reader.tag(); !tagView.empty()) {
        std::string tag(tagView);
        const std::size_t index = Tr::find(tag);
        if (index == variant_detail::NOT_FOUND) {
            return ctx.withError(ErrorKind::UNKNOWN_VARIANT,
                                 concat("unknown variant ", quoted(tag), ", ", Tr::expectedCasesList()),
                                 reader);
        }
        reader.consume_tag();
        return Tr::emplace_by_index(obj, index, [&](auto & c) {
            return ParseCasePayload(c, reader, ctx);
        });
    }

    const reader::NodeKind kind = reader.node_kind();
    if (!reader::is_scalar_kind(kind) || kind == reader::NodeKind::Null) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, expected), reader);
    }
    std::string name;
    reader::TryParseStatus st = reader.read_string(name);
    if (st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, expected), reader);
    }
    return ParseUnitCaseByName(obj, name, reader, ctx);
}

// Singleton map forms carry no YAML tag
template <reader::ReaderLike Tokenizer, class CTX>
bool RejectTaggedSingleton(Tokenizer & reader, CTX &ctx) {
    if (std::string_view tag = reader.tag(); !tag.empty()) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE,
                             concat("invalid type: tagged value ", quoted(concat("!", tag)),
                                    ", expected a map containing 1 entry"),
                             reader);
    }
    return true;
}

// {Case: payload}; PayloadFn(index, caseName) parses the entry value
template <class ObjT, reader::ReaderLike Tokenizer, class CTX, class PayloadFn>
bool ParseSingletonMapEntry(ObjT & obj, Tokenizer & reader, CTX &ctx, PayloadFn && parsePayload) {
    using Tr = variant_detail::variant_traits<ObjT>;
    constexpr std::string_view expected = "a map containing 1 entry";

    const std::optional<Position> pos = reader.position();
    typename Tokenizer::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if (iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, expected), reader);
    } else if (iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    if (fr.size != 1) {
        return ctx.withError(ErrorKind::AMBIGUOUS_VARIANT_REPRESENTATION, invalid_length(fr.size, "map containing 1 entry"), pos);
    }

    std::string key;
    reader::TryParseStatus st = reader.read_string(key);
    if (st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a variant name"), reader);
    }
    const std::size_t index = Tr::find(key);
    if (index == variant_detail::NOT_FOUND) {
        return ctx.withError(ErrorKind::UNKNOWN_VARIANT,
                             concat("unknown variant ", quoted(key), ", ", Tr::expectedCasesList()),
                             reader);
    }
    if (!reader.move_to_value(fr)) {
        return ctx.withReaderError(reader);
    }
    {
        typename CTX::PathGuard guard = ctx.getMapItemGuard(Tr::names[index]);
        if (!parsePayload(index, Tr::names[index])) {
            return false;
        }
    }
    iterStatus = reader.advance_after_value(fr);
    if (iterStatus.status != reader::TryParseStatus::ok) {
        return ctx.withReaderError(reader);
    }
    return true;
}

template <class ObjT, reader::ReaderLike Tokenizer, class CTX>
bool ParseVariantSingleton(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    using Tr = variant_detail::variant_traits<ObjT>;
    if (!RejectTaggedSingleton(reader, ctx)) {
        return false;
    }

    const reader::NodeKind kind = reader.node_kind();
    if (kind != reader::NodeKind::Mapping) {
        if (!reader::is_scalar_kind(kind) || kind == reader::NodeKind::Null) {
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a map containing 1 entry"), reader);
        }
        std::string name;
        reader::TryParseStatus st = reader.read_string(name);
        if (st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if (st == reader::TryParseStatus::no_match) {
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a map containing 1 entry"), reader);
        }
        return ParseUnitCaseByName(obj, name, reader, ctx);
    }
    return ParseSingletonMapEntry(obj, reader, ctx, [&](std::size_t index, std::string_view) {
        return Tr::emplace_by_index(obj, index, [&](auto & c) {
            return ParseCasePayload(c, reader, ctx);
        });
    });
}

// Payload goes through the caller's DeserializeFn as a Value
template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
bool ParseVariantCustom(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    using Opt = typename Opts::template get_option<options::detail::variant_repr_tag>;
    using Tr = variant_detail::variant_traits<ObjT>;

    if (!RejectTaggedSingleton(reader, ctx)) {
        return false;
    }
    const std::optional<Position> pos = reader.position();
    const reader::NodeKind kind = reader.node_kind();
    if (kind != reader::NodeKind::Mapping) {
        if (!reader::is_scalar_kind(kind) || kind == reader::NodeKind::Null) {
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a map containing 1 entry"), reader);
        }
        std::string name;
        reader::TryParseStatus st = reader.read_string(name);
        if (st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if (st == reader::TryParseStatus::no_match) {
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE, invalid_type(reader, "a map containing 1 entry"), reader);
        }
        const std::size_t index = Tr::find(name);
        if (index == variant_detail::NOT_FOUND) {
            return ctx.withError(ErrorKind::UNKNOWN_VARIANT,
                                 concat("unknown variant ", quoted(name), ", ", Tr::expectedCasesList()),
                                 reader);
        }
        if (!Opt::deserialize(Tr::names[index], Value(), obj)) {
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE,
                                 concat("variant ", quoted(name), " rejected by custom deserializer"),
                                 pos);
        }
        return true;
    }
    return ParseSingletonMapEntry(obj, reader, ctx, [&](std::size_t, std::string_view name) {
        Value payload;
        if (!ParseValue<options::detail::no_options>(payload, reader, ctx)) {
            return false;
        }
        if (!Opt::deserialize(name, payload, obj)) {
            return ctx.withError(ErrorKind::UNEXPECTED_SHAPE,
                                 concat("variant ", quoted(name), " rejected by custom deserializer"),
                                 pos);
        }
        return true;
    });
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlVariant<ObjT>
bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    using Tr = variant_detail::variant_traits<ObjT>;
    static_assert(Tr::namesAreUnique, "[[[ YamlFusion ]]] Case names are not unique");

    constexpr options::VariantRepr repr = Opts::variant_repr;
    if constexpr (repr == options::VariantRepr::singleton_map_custom) {
        return ParseVariantCustom<Opts>(obj, reader, ctx);
    } else if constexpr (repr == options::VariantRepr::tag) {
        if (ctx.singletonRecursive()) {
            return ParseVariantSingleton(obj, reader, ctx);
        }
        return ParseVariantTagged(obj, reader, ctx);
    } else {
        return ParseVariantSingleton(obj, reader, ctx);
    }
}


/* ######## Entry for every node ######## */

template <class FieldOptions, class Field, reader::ReaderLike Tokenizer, class CTX>
bool ParseFieldValue(Field & field, Tokenizer & reader, CTX &ctx) {
    if constexpr (static_schema::YamlValueNode<Field>) {
        return ParseNonNullValue<FieldOptions>(field, reader, ctx);
    } else {
        if (reader::TryParseStatus r = reader.start_value_and_try_read_null(); r == reader::TryParseStatus::ok) {
            if constexpr (static_schema::YamlNullableParsableValue<Field>) {
                static_schema::setNull(field);
                return true;
            } else {
                return ctx.withError(ErrorKind::UNEXPECTED_SHAPE,
                                     invalid_type(reader, expected_description<Field, FieldOptions>()),
                                     reader);
            }
        } else if (r == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }

        auto & inner = static_schema::getRef(field);
        using Inner = std::remove_cvref_t<decltype(inner)>;
        if constexpr (!static_schema::YamlVariant<Inner> && !static_schema::YamlValueNode<Inner>) {
            if (std::string_view tag = reader.tag(); !tag.empty()) {
                return ctx.withError(ErrorKind::UNEXPECTED_SHAPE,
                                     concat("invalid type: tagged value ", quoted(concat("!", tag)),
                                            ", expected ", expected_description<Inner, FieldOptions>()),
                                     reader);
            }
        }
        return ParseNonNullValue<FieldOptions>(inner, reader, ctx);
    }
}

template <class FieldOptions, class Field, reader::ReaderLike Tokenizer, class CTX>
bool ParseValue(Field & field, Tokenizer & reader, CTX &ctx) {
    constexpr options::VariantRepr repr = FieldOptions::variant_repr;
    if constexpr (repr == options::VariantRepr::singleton_map || repr == options::VariantRepr::singleton_map_custom) {
        static_assert(static_schema::YamlVariant<Field>,
                      "[[[ YamlFusion ]]] singleton_map / singleton_map_with apply to variant fields only");
    } else if constexpr (repr == options::VariantRepr::singleton_map_optional) {
        static_assert(static_schema::YamlNullableParsableValue<Field>
                          && static_schema::YamlVariant<static_schema::non_null_type_t<Field>>,
                      "[[[ YamlFusion ]]] singleton_map_optional applies to std::optional / std::unique_ptr of a variant");
    }

    typename CTX::DepthGuard depth = ctx.getDepthGuard();
    if (!depth) {
        return ctx.withError(ErrorKind::PARSE_SYNTAX, "recursion limit exceeded", reader);
    }

    if constexpr (repr == options::VariantRepr::singleton_map_recursive) {
        typename CTX::SingletonRecursiveGuard recursive = ctx.getSingletonRecursiveGuard();
        return ParseFieldValue<FieldOptions>(field, reader, ctx);
    } else {
        return ParseFieldValue<FieldOptions>(field, reader, ctx);
    }
}

} // namespace parser_details


template <static_schema::YamlParsableValue InputObjectT, reader::ReaderLike Reader>
ParseResult ParseWithReader(InputObjectT & obj, Reader & reader, std::size_t documentCount = 1) {
    parser_details::DeserializationContext ctx;

    if (reader.errorKind() != ErrorKind::NO_ERROR) {
        ctx.withReaderError(reader);
        return ctx.result(documentCount);
    }

    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    bool lenientRoot = false;
    if constexpr (static_schema::recordFieldsAllOptional<InputObjectT>()) {
        // null document into a record whose fields may all be absent
        if (reader.tag().empty() && reader.node_kind() == reader::NodeKind::Null) {
            using RecordT = static_schema::AnnotatedValue<InputObjectT>;
            using FH = struct_fields_helper::FieldsHelper<RecordT>;
            parser_details::ApplyAbsentFields(Meta::getRef(obj), std::bitset<FH::fieldsCount>{}, ctx, reader.position());
            lenientRoot = true;
        }
    }
    if (!lenientRoot) {
        parser_details::ParseValue<typename Meta::options>(Meta::getRef(obj), reader, ctx);
    }

    if (ctx.currentError() == ErrorKind::NO_ERROR) {
        if (!reader.finish()) {
            ctx.withReaderError(reader);
        }
    }
    return ctx.result(documentCount);
}

template <static_schema::YamlParsableValue InputObjectT>
ParseResult Parse(InputObjectT & obj, std::string_view text) {
    RapidYamlReader reader(text);
    const bool parsed = reader.errorKind() == ErrorKind::NO_ERROR;
    const std::size_t count = reader.document_count();
    if (parsed && count > 1) {
        Error e;
        e.kind = ErrorKind::PARSE_SYNTAX;
        e.message = "deserializing from YAML containing more than one document is not supported";
        return ParseResult(std::move(e), count);
    }
    // an empty stream reads as null only into optional roots and all-optional records
    constexpr bool acceptsEmpty = static_schema::YamlNullableParsableValue<InputObjectT>
                                  || static_schema::recordFieldsAllOptional<InputObjectT>();
    if (parsed && count == 0 && !acceptsEmpty) {
        Error e;
        e.kind = ErrorKind::PARSE_SYNTAX;
        e.message = "EOF while parsing a value";
        return ParseResult(std::move(e), 0);
    }
    return ParseWithReader(obj, reader, count);
}

template <static_schema::YamlParsableValue InputObjectT>
ParseResult ParseBytes(InputObjectT & obj, const void * data, std::size_t size) {
    std::string_view bytes(static_cast<const char*>(data), size);
    if (std::optional<Error> err = io::validate_utf8(bytes)) {
        return ParseResult(std::move(*err), 0);
    }
    return Parse(obj, bytes);
}

template <static_schema::YamlParsableValue InputObjectT>
ParseResult ParseBytes(InputObjectT & obj, std::span<const std::byte> bytes) {
    return ParseBytes(obj, bytes.data(), bytes.size());
}

template <static_schema::YamlParsableValue InputObjectT>
ParseResult ParseStream(InputObjectT & obj, std::istream & is) {
    std::string text;
    if (std::optional<Error> err = io::read_all(is, text)) {
        return ParseResult(std::move(*err), 0);
    }
    return ParseBytes(obj, text.data(), text.size());
}

/// One element per document of a multi-document stream; `out` is left empty on failure
template <static_schema::YamlParsableValue InputObjectT>
ParseResult ParseDocuments(std::vector<InputObjectT> & out, std::string_view text) {
    out.clear();
    RapidYamlReader reader(text);
    const std::size_t count = reader.document_count();
    for (std::size_t i = 0; i < count && reader.errorKind() == ErrorKind::NO_ERROR; i++) {
        if (!reader.select_document(i)) {
            break;
        }
        ParseResult r = ParseWithReader(out.emplace_back(), reader, count);
        if (!r) {
            out.clear();
            return r;
        }
    }
    if (reader.errorKind() != ErrorKind::NO_ERROR) {
        out.clear();
        Error e;
        e.kind = reader.errorKind();
        e.message = reader.errorMessage();
        e.position = reader.errorPosition();
        return ParseResult(std::move(e), count);
    }
    return ParseResult(Error{}, count);
}

template <static_schema::YamlParsableValue InputObjectT>
ParseResult FromValue(InputObjectT & obj, const Value & value) {
    ValueReader reader(value);
    return ParseWithReader(obj, reader);
}


template <class T>
    requires (!static_schema::YamlParsableValue<T>)
ParseResult Parse(T &, std::string_view) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ YamlFusion ]]] T is not a supported YamlFusion parsable value model type.\n"
                  "see YamlParsableValue concept for full rules");
    return {};
}

template <class T>
    requires (!static_schema::YamlParsableValue<T>)
ParseResult FromValue(T &, const Value &) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ YamlFusion ]]] T is not a supported YamlFusion parsable value model type.\n"
                  "see YamlParsableValue concept for full rules");
    return {};
}

} // namespace YamlFusion
