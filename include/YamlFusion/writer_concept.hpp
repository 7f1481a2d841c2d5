#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>

#include "number.hpp"
#include "scalars.hpp"

namespace YamlFusion {

namespace writer {

/// WriterLike is the push side of the structural event protocol.
/// Inside a mapping, the scalar written while a key is expected becomes the key;
/// write_tag() applies to the next node written.
template<typename R>
concept WriterLike = requires(R writer,
                               R& mutable_writer,
                               const bool& bool_ref,
                               const Number& number_ref,
                               std::string_view text,
                               scalars::ScalarStyle style,
                               const std::size_t & sizeRef,
                               typename R::ArrayFrame & arrFrameRef,
                               typename R::MapFrame & mapFrameRef
                              ) {

    // ========== Type Requirements ==========
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    { writer.getError() } -> std::same_as<typename R::error_type>;
    { writer.errorMessage() } -> std::convertible_to<std::string>;

    { mutable_writer.write_array_begin(sizeRef, arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_begin(sizeRef, mapFrameRef) } -> std::same_as<bool>;

    // Containers
    { mutable_writer.advance_after_value(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.advance_after_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_array_end(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_end(mapFrameRef) } -> std::same_as<bool>;

    // ========== Scalars ==========
    { mutable_writer.write_null() } -> std::same_as<bool>;
    { mutable_writer.write_bool(bool_ref) } -> std::same_as<bool>;
    { mutable_writer.write_number(number_ref) } -> std::same_as<bool>;
    { mutable_writer.write_string(text, style) } -> std::same_as<bool>;
    { mutable_writer.write_tag(text) } -> std::same_as<bool>;

    // ========== Utility Operations ==========
    { mutable_writer.finish() } -> std::same_as<bool>;
};

template<typename R>
constexpr bool is_writer_like_v = WriterLike<R>;


} // namespace writer

} // namespace YamlFusion
