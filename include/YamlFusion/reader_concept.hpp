#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "number.hpp"

#ifndef YAMLFUSION_RECURSION_LIMIT
#define YAMLFUSION_RECURSION_LIMIT 128
#endif

namespace YamlFusion {

namespace reader {
enum class TryParseStatus {
    no_match,   // not our case, reader state unchanged
    ok,         // parsed and consumed
    error       // malformed, reader already has error
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};

/// Resolved kind of the current node (or key)
enum class NodeKind : std::uint8_t {
    Null,
    Bool,
    Integer,
    Float,
    String,
    Sequence,
    Mapping
};

constexpr std::string_view node_kind_to_string(NodeKind k) {
    switch (k) {
    case NodeKind::Null: return "null";
    case NodeKind::Bool: return "boolean";
    case NodeKind::Integer: return "integer";
    case NodeKind::Float: return "floating point";
    case NodeKind::String: return "string";
    case NodeKind::Sequence: return "sequence";
    case NodeKind::Mapping: return "mapping";
    }
    return "N/A";
}

constexpr bool is_scalar_kind(NodeKind k) {
    return k != NodeKind::Sequence && k != NodeKind::Mapping;
}


/// ReaderLike is the pull side of the structural event protocol.
/// After read_map_begin / advance_after_value(MapFrame&) report an entry, the reader
/// stands on the entry's key: node_kind(), scalar_text(), position() and the scalar
/// reads act on the key until move_to_value().
template<typename R>
concept ReaderLike = requires(R reader,
                               R& mutable_reader,
                               bool& bool_ref,
                               Number& number_ref,
                               std::string& string_ref,
                               typename R::ArrayFrame & arrFrameRef,
                               typename R::MapFrame & mapFrameRef
                              ) {

    // ========== Type Requirements ==========
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    { arrFrameRef.size } -> std::convertible_to<std::size_t>;
    { mapFrameRef.size } -> std::convertible_to<std::size_t>;

    // ========== Error state ==========
    { reader.getError() } -> std::same_as<typename R::error_type>;
    { reader.errorKind() } -> std::same_as<ErrorKind>;
    { reader.errorMessage() } -> std::convertible_to<std::string>;
    { reader.errorPosition() } -> std::same_as<std::optional<Position>>;

    // ========== Current node ==========
    { reader.position() } -> std::same_as<std::optional<Position>>;
    { reader.node_kind() } -> std::same_as<NodeKind>;
    // Application tag without '!', empty when there is none or it was consumed
    { reader.tag() } -> std::convertible_to<std::string_view>;
    { mutable_reader.consume_tag() };
    { reader.scalar_text() } -> std::convertible_to<std::string_view>;

    // ========== Containers ==========
    { mutable_reader.read_array_begin(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.read_map_begin(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    // ========== Scalars ==========
    { mutable_reader.start_value_and_try_read_null() } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_bool(bool_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_number(number_ref) } -> std::same_as<TryParseStatus>;
    // Text readers accept any scalar as its text; tree readers only strings outside keys
    { mutable_reader.read_string(string_ref) } -> std::same_as<TryParseStatus>;

    // ========== Utility Operations ==========
    { mutable_reader.skip_value() } -> std::same_as<bool>;
    { mutable_reader.finish() } -> std::same_as<bool>;
};

template<typename R>
constexpr bool is_reader_like_v = ReaderLike<R>;


} // namespace reader

} // namespace YamlFusion
