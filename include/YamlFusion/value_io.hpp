#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "number.hpp"
#include "reader_concept.hpp"
#include "scalars.hpp"
#include "value.hpp"
#include "writer_concept.hpp"

namespace YamlFusion {

/// Reader over an in-memory Value tree. Tags are peeled one layer per consume_tag();
/// shape queries look through any remaining tags.
class ValueReader {
public:
    enum class ReadError {
        NO_ERROR
    };
    using error_type = ReadError;

    struct ArrayFrame {
        const Value* node = nullptr;
        std::size_t  index = 0;
        std::size_t  size = 0;
        bool         was_key = false;
    };

    struct MapFrame {
        const Value* node = nullptr;
        std::size_t  index = 0;
        std::size_t  size = 0;
        bool         was_key = false;
    };

    explicit ValueReader(const Value& root)
        : cur_(&root)
    {}

    ReadError getError() const noexcept { return ReadError::NO_ERROR; }
    ErrorKind errorKind() const noexcept { return ErrorKind::NO_ERROR; }
    std::string errorMessage() const { return {}; }
    std::optional<Position> errorPosition() const { return std::nullopt; }

    // ---- Current node ----

    std::optional<Position> position() const {
        if (cur_->position()) {
            return cur_->position();
        }
        return untagged(*cur_).position();
    }

    reader::NodeKind node_kind() const {
        const Value& v = untagged(*cur_);
        switch (v.kind()) {
        case ValueKind::Null: return reader::NodeKind::Null;
        case ValueKind::Bool: return reader::NodeKind::Bool;
        case ValueKind::Number: return v.is_f64() ? reader::NodeKind::Float : reader::NodeKind::Integer;
        case ValueKind::String: return reader::NodeKind::String;
        case ValueKind::Sequence: return reader::NodeKind::Sequence;
        case ValueKind::Mapping: return reader::NodeKind::Mapping;
        case ValueKind::Tagged: break;
        }
        return reader::NodeKind::Null;
    }

    std::string_view tag() const {
        if (auto t = cur_->as_tagged()) {
            return t->tag();
        }
        return {};
    }

    void consume_tag() {
        if (auto t = cur_->as_tagged()) {
            cur_ = &t->value();
        }
    }

    std::string_view scalar_text() const {
        const Value& v = untagged(*cur_);
        switch (v.kind()) {
        case ValueKind::String: return *v.as_string();
        case ValueKind::Bool: return *v.as_bool() ? "true" : "false";
        case ValueKind::Number:
            scratch_ = v.as_number()->to_string();
            return scratch_;
        case ValueKind::Null: return "null";
        case ValueKind::Sequence:
        case ValueKind::Mapping:
        case ValueKind::Tagged:
            break;
        }
        return {};
    }

    // ---- Scalars ----

    reader::TryParseStatus start_value_and_try_read_null() {
        if (cur_->is_null()) {
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    reader::TryParseStatus read_bool(bool& b) {
        if (auto v = untagged(*cur_).as_bool()) {
            b = *v;
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    reader::TryParseStatus read_number(Number& n) {
        if (auto v = untagged(*cur_).as_number()) {
            n = *v;
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    // Strict for values, any scalar for mapping keys
    reader::TryParseStatus read_string(std::string& out) {
        const Value& v = untagged(*cur_);
        if (auto s = v.as_string()) {
            out = *s;
            return reader::TryParseStatus::ok;
        }
        if (reading_key_ && !v.is_sequence() && !v.is_mapping()) {
            out.assign(scalar_text());
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    // ---- Arrays ----

    reader::IterationStatus read_array_begin(ArrayFrame& frame) {
        reader::IterationStatus ret;
        const Value& v = untagged(*cur_);
        const Sequence* seq = v.as_sequence();
        if (seq == nullptr) {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }
        frame.node = &v;
        frame.index = 0;
        frame.size = seq->size();
        frame.was_key = reading_key_;
        reading_key_ = false;

        if (frame.size > 0) {
            cur_ = &(*seq)[0];
            ret.has_value = true;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    reader::IterationStatus advance_after_value(ArrayFrame& frame) {
        reader::IterationStatus ret;
        ++frame.index;
        if (frame.index < frame.size) {
            cur_ = &(*frame.node->as_sequence())[frame.index];
            ret.has_value = true;
        } else {
            cur_ = frame.node;
            reading_key_ = frame.was_key;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    // ---- Maps ----

    reader::IterationStatus read_map_begin(MapFrame& frame) {
        reader::IterationStatus ret;
        const Value& v = untagged(*cur_);
        const Mapping* map = v.as_mapping();
        if (map == nullptr) {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }
        frame.node = &v;
        frame.index = 0;
        frame.size = map->size();
        frame.was_key = reading_key_;

        if (frame.size > 0) {
            cur_ = &entry(frame).first;
            reading_key_ = true;
            ret.has_value = true;
        } else {
            reading_key_ = false;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    bool move_to_value(MapFrame& frame) {
        cur_ = &entry(frame).second;
        reading_key_ = false;
        return true;
    }

    reader::IterationStatus advance_after_value(MapFrame& frame) {
        reader::IterationStatus ret;
        ++frame.index;
        if (frame.index < frame.size) {
            cur_ = &entry(frame).first;
            reading_key_ = true;
            ret.has_value = true;
        } else {
            cur_ = frame.node;
            reading_key_ = frame.was_key;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    bool skip_value() {
        return true;
    }

    bool finish() {
        return true;
    }

private:
    const Value* cur_;
    bool reading_key_ = false;
    mutable std::string scratch_;

    static const Value& untagged(const Value& v) {
        const Value* p = &v;
        while (auto t = p->as_tagged()) {
            p = &t->value();
        }
        return *p;
    }

    static const Mapping::entry_type& entry(const MapFrame& frame) {
        return *(frame.node->as_mapping()->begin() + static_cast<std::ptrdiff_t>(frame.index));
    }
};

static_assert(reader::ReaderLike<ValueReader>);


/// Writer that builds a Value tree. Mapping keys may be any Value; tags nest.
class ValueWriter {
public:
    enum class Error {
        None,
        InvalidState
    };
    using error_type = Error;

    struct ArrayFrame {
        std::size_t depth = 0;
    };

    struct MapFrame {
        std::size_t depth = 0;
    };

    explicit ValueWriter(Value& out)
        : out_(&out)
    {}

    Error getError() const noexcept { return error_; }

    std::string errorMessage() const {
        return error_ == Error::None ? std::string{} : std::string("invalid writer state");
    }

    bool write_array_begin(std::size_t const& size, ArrayFrame& frame) {
        if (!ensure_ok()) return false;
        Building b;
        b.value = Value(Sequence{});
        b.value.as_sequence()->reserve(size);
        b.tags = std::move(pending_tags_);
        pending_tags_.clear();
        stack_.push_back(std::move(b));
        frame.depth = stack_.size();
        return true;
    }

    bool write_map_begin(std::size_t const& /*size*/, MapFrame& frame) {
        if (!ensure_ok()) return false;
        Building b;
        b.value = Value(Mapping{});
        b.is_map = true;
        b.tags = std::move(pending_tags_);
        pending_tags_.clear();
        stack_.push_back(std::move(b));
        frame.depth = stack_.size();
        return true;
    }

    bool advance_after_value(ArrayFrame&) {
        return ensure_ok();
    }

    bool advance_after_value(MapFrame&) {
        return ensure_ok();
    }

    bool move_to_value(MapFrame& frame) {
        if (!ensure_ok()) return false;
        if (frame.depth != stack_.size() || !stack_.back().is_map || stack_.back().expecting_key) {
            return fail();
        }
        return true;
    }

    bool write_array_end(ArrayFrame& frame) {
        if (!ensure_ok()) return false;
        if (frame.depth != stack_.size() || stack_.back().is_map) {
            return fail();
        }
        return close_top();
    }

    bool write_map_end(MapFrame& frame) {
        if (!ensure_ok()) return false;
        if (frame.depth != stack_.size() || !stack_.back().is_map || !stack_.back().expecting_key) {
            return fail();
        }
        return close_top();
    }

    bool write_tag(std::string_view tag) {
        if (!ensure_ok()) return false;
        pending_tags_.emplace_back(tag);
        return true;
    }

    bool write_null() {
        return write_scalar(Value());
    }

    bool write_bool(bool const& b) {
        return write_scalar(Value(b));
    }

    bool write_number(Number const& n) {
        return write_scalar(Value(n));
    }

    bool write_string(std::string_view text, scalars::ScalarStyle /*style*/ = scalars::ScalarStyle::Auto) {
        return write_scalar(Value(text));
    }

    bool finish() {
        if (!ensure_ok()) return false;
        if (!stack_.empty() || !pending_tags_.empty()) {
            return fail();
        }
        if (!root_written_) {
            *out_ = Value();
        }
        return true;
    }

private:
    struct Building {
        Value value;
        std::vector<std::string> tags;
        bool is_map = false;
        bool expecting_key = true;
        Value pending_key;
    };

    Value* out_;
    Error error_ = Error::None;
    std::vector<Building> stack_;
    std::vector<std::string> pending_tags_;
    bool root_written_ = false;

    bool ensure_ok() const noexcept {
        return error_ == Error::None;
    }

    bool fail() {
        if (error_ == Error::None) {
            error_ = Error::InvalidState;
        }
        return false;
    }

    bool write_scalar(Value v) {
        if (!ensure_ok()) return false;
        std::vector<std::string> tags = std::move(pending_tags_);
        pending_tags_.clear();
        return deliver(std::move(v), std::move(tags));
    }

    bool close_top() {
        Building b = std::move(stack_.back());
        stack_.pop_back();
        return deliver(std::move(b.value), std::move(b.tags));
    }

    // Hands a finished node to its parent; the innermost tag is the last one written
    bool deliver(Value v, std::vector<std::string> tags) {
        for (auto it = tags.rbegin(); it != tags.rend(); ++it) {
            v = Value(Tagged(*it, std::move(v)));
        }
        if (stack_.empty()) {
            if (root_written_) {
                return fail();
            }
            *out_ = std::move(v);
            root_written_ = true;
            return true;
        }
        Building& top = stack_.back();
        if (top.is_map) {
            if (top.expecting_key) {
                top.pending_key = std::move(v);
                top.expecting_key = false;
            } else {
                top.value.as_mapping()->insert(std::move(top.pending_key), std::move(v));
                top.pending_key = Value();
                top.expecting_key = true;
            }
        } else {
            top.value.as_sequence()->push_back(std::move(v));
        }
        return true;
    }
};

static_assert(writer::WriterLike<ValueWriter>);

} // namespace YamlFusion
