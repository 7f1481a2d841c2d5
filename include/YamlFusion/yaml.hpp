#pragma once
#include <rapidyaml.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "errors.hpp"
#include "number.hpp"
#include "scalars.hpp"
#include "reader_concept.hpp"
#include "writer_concept.hpp"

namespace YamlFusion {

namespace detail {

// ryml's error handler must not return; it throws this and the adapters catch it by type
struct ryml_error : std::runtime_error {
    ryml::Location location;
    ryml_error(std::string msg, ryml::Location loc)
        : std::runtime_error(std::move(msg))
        , location(loc)
    {}
};

inline void throw_ryml_error(const char* msg, std::size_t len, ryml::Location location, void* /*user_data*/) {
    throw ryml_error(std::string(msg, len), location);
}

// Per-instance callbacks, the global ryml handler is left untouched
inline ryml::Callbacks make_ryml_callbacks() {
    return ryml::Callbacks(nullptr, nullptr, nullptr, &throw_ryml_error);
}

// Error-handler locations are 1-based, node and buffer locations 0-based
inline Position to_position(const ryml::Location& loc, bool zero_based) {
    Position p;
    p.index = loc.offset;
    p.line = zero_based ? loc.line + 1 : (loc.line == 0 ? 1 : loc.line);
    p.column = zero_based ? loc.col + 1 : (loc.col == 0 ? 1 : loc.col);
    return p;
}

inline std::string_view to_sv(ryml::csubstr s) {
    if (s.str == nullptr) return {};
    return std::string_view(s.str, s.len);
}

} // namespace detail


class RapidYamlReader {
public:
    enum class ParseError {
        NO_ERROR,
        SYNTAX,
        UNKNOWN_ANCHOR,
        INVALID_TAGGED_SCALAR,
        UNEXPECTED_END_OF_DATA
    };
    using error_type = ParseError;

    struct ArrayFrame {
        ryml::ConstNodeRef node{};
        std::size_t        index = 0;
        std::size_t        size  = 0;
        ryml::ConstNodeRef current{};
    };

    struct MapFrame {
        ryml::ConstNodeRef node{};
        std::size_t        index = 0;
        std::size_t        size  = 0;
        ryml::ConstNodeRef current_child{};  // current key-value pair node
    };

    /// Parses the whole stream up front; the first document is selected
    explicit RapidYamlReader(std::string_view yaml)
        : callbacks_(detail::make_ryml_callbacks())
        , handler_(std::make_unique<ryml::EventHandlerTree>(callbacks_))
        , parser_(std::make_unique<ryml::Parser>(handler_.get(), ryml::ParserOptions().locations(true)))
        , tree_(std::make_unique<ryml::Tree>(callbacks_))
    {
        try {
            ryml::parse_in_arena(parser_.get(), ryml::csubstr(yaml.data(), yaml.size()), tree_.get());
        } catch (const detail::ryml_error& e) {
            setError(ParseError::SYNTAX, e.what(), detail::to_position(e.location, false));
            return;
        }
        try {
            tree_->resolve();
        } catch (const detail::ryml_error& e) {
            setError(ParseError::UNKNOWN_ANCHOR, "unknown anchor", detail::to_position(e.location, false));
            return;
        }
        // blank input holds no document
        if (yaml.find_first_not_of(" \t\r\n") != std::string_view::npos) {
            collect_documents();
        }
        if (!documents_.empty()) {
            select_document(0);
        }
    }

    RapidYamlReader(const RapidYamlReader&) = delete;
    RapidYamlReader& operator=(const RapidYamlReader&) = delete;
    RapidYamlReader(RapidYamlReader&&) = default;
    RapidYamlReader& operator=(RapidYamlReader&&) = default;

    // ---- Documents ----

    std::size_t document_count() const noexcept {
        return documents_.size();
    }

    bool select_document(std::size_t i) {
        if (i >= documents_.size()) {
            return false;
        }
        current_ = tree_->cref(documents_[i]);
        reading_key_ = false;
        consumed_tag_node_ = ryml::NONE;
        return true;
    }

    // ---- Errors ----

    ParseError getError() const noexcept { return err_; }

    ErrorKind errorKind() const noexcept {
        switch (err_) {
        case ParseError::NO_ERROR: return ErrorKind::NO_ERROR;
        case ParseError::INVALID_TAGGED_SCALAR: return ErrorKind::UNEXPECTED_SHAPE;
        case ParseError::SYNTAX:
        case ParseError::UNKNOWN_ANCHOR:
        case ParseError::UNEXPECTED_END_OF_DATA:
            break;
        }
        return ErrorKind::PARSE_SYNTAX;
    }

    const std::string& errorMessage() const noexcept { return err_message_; }

    std::optional<Position> errorPosition() const { return err_position_; }

    // ---- Current node ----

    std::optional<Position> position() const {
        if (!current_.readable()) {
            return std::nullopt;
        }
        try {
            if (reading_key_) {
                if (current_.has_key() && current_.key().str != nullptr) {
                    return detail::to_position(parser_->val_location(current_.key().str), true);
                }
            } else if (current_.has_val() && current_.val().str != nullptr && !current_.val().empty()) {
                return detail::to_position(parser_->val_location(current_.val().str), true);
            }
            return detail::to_position(current_.location(*parser_), true);
        } catch (const detail::ryml_error&) {
            // nodes synthesized by alias resolution have no source location
            return std::nullopt;
        }
    }

    reader::NodeKind node_kind() const {
        if (!current_.readable()) {
            return reader::NodeKind::Null;
        }
        if (!reading_key_) {
            if (current_.is_map()) return reader::NodeKind::Mapping;
            if (current_.is_seq()) return reader::NodeKind::Sequence;
            if (!current_.has_val()) return reader::NodeKind::Null;
        }
        auto v = resolve_current();
        if (!v) {
            return reader::NodeKind::String;
        }
        switch (v->kind()) {
        case ValueKind::Null: return reader::NodeKind::Null;
        case ValueKind::Bool: return reader::NodeKind::Bool;
        case ValueKind::Number: return v->is_f64() ? reader::NodeKind::Float : reader::NodeKind::Integer;
        default: break;
        }
        return reader::NodeKind::String;
    }

    std::string_view tag() const {
        if (reading_key_ || !current_.readable() || !current_.has_val_tag()) {
            return {};
        }
        if (current_.id() == consumed_tag_node_) {
            return {};
        }
        return scalars::custom_tag_name(detail::to_sv(current_.val_tag()));
    }

    void consume_tag() {
        if (current_.readable()) {
            consumed_tag_node_ = current_.id();
        }
    }

    std::string_view scalar_text() const {
        if (!current_.readable()) {
            return {};
        }
        if (reading_key_) {
            return current_.has_key() ? detail::to_sv(current_.key()) : std::string_view{};
        }
        return current_.has_val() ? detail::to_sv(current_.val()) : std::string_view{};
    }

    // ---- Scalars ----

    reader::TryParseStatus start_value_and_try_read_null() {
        if (!current_.readable()) {
            return reader::TryParseStatus::ok;
        }
        if (!tag().empty()) {
            return reader::TryParseStatus::no_match;
        }
        if (node_kind() == reader::NodeKind::Null) {
            if (!resolve_current()) {
                return invalid_tagged_scalar();
            }
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    reader::TryParseStatus read_bool(bool& b) {
        if (!current_.readable()) {
            return end_of_data();
        }
        if (!is_scalar()) {
            return reader::TryParseStatus::no_match;
        }
        auto v = resolve_current();
        if (!v) {
            return invalid_tagged_scalar();
        }
        if (auto r = v->as_bool()) {
            b = *r;
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    reader::TryParseStatus read_number(Number& n) {
        if (!current_.readable()) {
            return end_of_data();
        }
        if (!is_scalar()) {
            return reader::TryParseStatus::no_match;
        }
        auto v = resolve_current();
        if (!v) {
            return invalid_tagged_scalar();
        }
        if (auto r = v->as_number()) {
            n = *r;
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    reader::TryParseStatus read_string(std::string& out) {
        if (!current_.readable()) {
            return end_of_data();
        }
        if (!is_scalar()) {
            return reader::TryParseStatus::no_match;
        }
        out.assign(scalar_text());
        return reader::TryParseStatus::ok;
    }

    // ---- Arrays ----

    reader::IterationStatus read_array_begin(ArrayFrame& frame) {
        reader::IterationStatus ret;
        if (!current_.readable()) {
            end_of_data();
            return ret;
        }
        if (reading_key_ || !current_.is_seq()) {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }

        frame.node    = current_;
        frame.size    = current_.num_children();
        frame.index   = 0;
        frame.current = ryml::ConstNodeRef{};

        if (frame.size > 0) {
            frame.current = current_.first_child();
            current_ = frame.current;
            ret.has_value = true;
        } else {
            ret.has_value = false;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    reader::IterationStatus advance_after_value(ArrayFrame& frame) {
        reader::IterationStatus ret;
        if (!frame.node.readable()) {
            end_of_data();
            return ret;
        }

        ++frame.index;
        if (frame.index < frame.size) {
            frame.current = frame.current.next_sibling();
            current_ = frame.current;
            ret.has_value = true;
        } else {
            frame.current = ryml::ConstNodeRef{};
            current_ = frame.node;
            ret.has_value = false;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    // ---- Maps ----

    reader::IterationStatus read_map_begin(MapFrame& frame) {
        reader::IterationStatus ret;
        if (!current_.readable()) {
            end_of_data();
            return ret;
        }
        if (reading_key_ || !current_.is_map()) {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }

        frame.node          = current_;
        frame.size          = current_.num_children();
        frame.index         = 0;
        frame.current_child = ryml::ConstNodeRef{};

        if (frame.size > 0) {
            frame.current_child = current_.first_child();
            current_ = frame.current_child;
            reading_key_ = true;
            ret.has_value = true;
        } else {
            ret.has_value = false;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    bool move_to_value(MapFrame& frame) {
        if (!frame.current_child.readable()) {
            end_of_data();
            return false;
        }
        current_ = frame.current_child;
        reading_key_ = false;
        return true;
    }

    reader::IterationStatus advance_after_value(MapFrame& frame) {
        reader::IterationStatus ret;
        if (!frame.node.readable()) {
            end_of_data();
            return ret;
        }

        ++frame.index;
        if (frame.index < frame.size) {
            frame.current_child = frame.current_child.next_sibling();
            current_ = frame.current_child;
            reading_key_ = true;
            ret.has_value = true;
        } else {
            frame.current_child = ryml::ConstNodeRef{};
            current_ = frame.node;
            reading_key_ = false;
            ret.has_value = false;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    // ---- Skip/Finish ----

    bool skip_value() {
        // the tree is already built, nothing to consume
        return true;
    }

    bool finish() {
        return err_ == ParseError::NO_ERROR;
    }

private:
    ryml::Callbacks                        callbacks_;
    std::unique_ptr<ryml::EventHandlerTree> handler_;
    std::unique_ptr<ryml::Parser>          parser_;
    std::unique_ptr<ryml::Tree>            tree_;
    std::vector<ryml::id_type>             documents_;

    ryml::ConstNodeRef current_{};
    bool               reading_key_ = false;
    ryml::id_type      consumed_tag_node_ = ryml::NONE;

    ParseError              err_ = ParseError::NO_ERROR;
    std::string             err_message_;
    std::optional<Position> err_position_;

    void setError(ParseError e, std::string message, std::optional<Position> pos) {
        if (err_ != ParseError::NO_ERROR) return;
        err_ = e;
        err_message_ = std::move(message);
        err_position_ = pos;
    }

    reader::TryParseStatus end_of_data() {
        setError(ParseError::UNEXPECTED_END_OF_DATA, "EOF while parsing a value", std::nullopt);
        return reader::TryParseStatus::error;
    }

    reader::TryParseStatus invalid_tagged_scalar() {
        std::string msg = "invalid value ";
        msg += errors_detail::quoted(scalar_text());
        msg += " for tag ";
        msg += detail::to_sv(current_.val_tag());
        setError(ParseError::INVALID_TAGGED_SCALAR, std::move(msg), position());
        return reader::TryParseStatus::error;
    }

    bool is_scalar() const {
        return reading_key_ || !current_.is_container();
    }

    std::optional<Value> resolve_current() const {
        if (reading_key_) {
            return scalars::resolve_scalar(scalar_text(), current_.is_key_quoted(), scalars::StandardTag::None);
        }
        scalars::StandardTag stdTag = scalars::StandardTag::None;
        if (current_.has_val_tag()) {
            stdTag = scalars::standard_tag(detail::to_sv(current_.val_tag()));
        }
        return scalars::resolve_scalar(scalar_text(), current_.is_val_quoted(), stdTag);
    }

    void collect_documents() {
        ryml::ConstNodeRef root = tree_->crootref();
        if (root.is_stream()) {
            for (ryml::ConstNodeRef doc = root.first_child(); doc.readable(); doc = doc.next_sibling()) {
                documents_.push_back(doc.id());
            }
        } else if (root.is_container() || root.has_val() || root.is_doc()) {
            documents_.push_back(root.id());
        }
    }
};

static_assert(reader::ReaderLike<RapidYamlReader>);


class RapidYamlWriter {
public:
    enum class Error {
        None,
        InvalidState,
        NestedTag,
        NonScalarKey,
        EmitFailed
    };

    using error_type = Error;

    struct ArrayFrame {
        ryml::NodeRef node{};
        void*         parent_frame   = nullptr;
        bool          parent_is_map  = false;
    };

    struct MapFrame {
        ryml::NodeRef       node{};
        void*               parent_frame   = nullptr;
        bool                parent_is_map  = false;
        bool                expecting_key  = true;
        std::string         pending_key;
        scalars::ScalarStyle pending_key_style = scalars::ScalarStyle::Plain;
    };

    /// Text is emitted into `output` by finish()
    explicit RapidYamlWriter(std::string& output)
        : callbacks_(detail::make_ryml_callbacks())
        , tree_(std::make_unique<ryml::Tree>(callbacks_))
        , output_(&output)
    {
    }

    RapidYamlWriter(const RapidYamlWriter&) = delete;
    RapidYamlWriter& operator=(const RapidYamlWriter&) = delete;

    error_type getError() const noexcept {
        return error_;
    }

    std::string errorMessage() const {
        switch (error_) {
        case Error::None: return {};
        case Error::InvalidState: return "invalid writer state";
        case Error::NestedTag: return "serializing nested enums in YAML is not supported yet";
        case Error::NonScalarKey: return "mapping keys must be scalars in YAML";
        case Error::EmitFailed: return "failed to emit YAML: " + emit_message_;
        }
        return {};
    }

    // ---- Containers ----

    bool write_array_begin(std::size_t const& /*size*/, ArrayFrame& frame) {
        if (!ensure_ok()) return false;

        ryml::NodeRef seq = attach_container_to_current(ryml::SEQ);
        if (!seq.readable()) return false;

        frame.node          = seq;
        frame.parent_frame  = scope_frame_;
        frame.parent_is_map = (scope_kind_ == ScopeKind::Map);

        scope_kind_  = ScopeKind::Array;
        scope_frame_ = &frame;
        return true;
    }

    bool write_map_begin(std::size_t const& /*size*/, MapFrame& frame) {
        if (!ensure_ok()) return false;

        ryml::NodeRef map = attach_container_to_current(ryml::MAP);
        if (!map.readable()) return false;

        frame.node          = map;
        frame.parent_frame  = scope_frame_;
        frame.parent_is_map = (scope_kind_ == ScopeKind::Map);
        frame.expecting_key = true;
        frame.pending_key.clear();

        scope_kind_  = ScopeKind::Map;
        scope_frame_ = &frame;
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
        if (scope_kind_ != ScopeKind::Map || scope_frame_ != &frame || frame.expecting_key) {
            return fail(Error::InvalidState);
        }
        return true;
    }

    bool write_array_end(ArrayFrame& frame) {
        if (!ensure_ok()) return false;
        if (scope_kind_ != ScopeKind::Array || scope_frame_ != &frame) {
            return fail(Error::InvalidState);
        }
        restore_parent_scope(frame.parent_frame, frame.parent_is_map);
        return true;
    }

    bool write_map_end(MapFrame& frame) {
        if (!ensure_ok()) return false;
        if (scope_kind_ != ScopeKind::Map || scope_frame_ != &frame || !frame.expecting_key) {
            return fail(Error::InvalidState);
        }
        restore_parent_scope(frame.parent_frame, frame.parent_is_map);
        return true;
    }

    // ---- Tags ----

    bool write_tag(std::string_view tag) {
        if (!ensure_ok()) return false;
        if (has_pending_tag_) {
            return fail(Error::NestedTag);
        }
        if (key_expected()) {
            return fail(Error::InvalidState);
        }
        pending_tag_.assign("!");
        pending_tag_.append(tag);
        has_pending_tag_ = true;
        return true;
    }

    // ---- Scalars ----

    bool write_null() {
        return write_scalar("null", scalars::ScalarStyle::Plain);
    }

    bool write_bool(bool const& b) {
        return write_scalar(b ? "true" : "false", scalars::ScalarStyle::Plain);
    }

    bool write_number(Number const& n) {
        return write_scalar(n.to_string(), scalars::ScalarStyle::Plain);
    }

    bool write_string(std::string_view text, scalars::ScalarStyle style = scalars::ScalarStyle::Auto) {
        if (style == scalars::ScalarStyle::Auto) {
            style = scalars::choose_string_style(text);
        }
        return write_scalar(text, style);
    }

    // ---- Finish ----

    bool finish() {
        if (!ensure_ok()) return false;
        if (scope_kind_ != ScopeKind::Root || has_pending_tag_) {
            return fail(Error::InvalidState);
        }
        if (!root_written_) {
            if (!write_null()) return false;
        }
        try {
            *output_ = ryml::emitrs_yaml<std::string>(*tree_);
        } catch (const detail::ryml_error& e) {
            emit_message_ = e.what();
            return fail(Error::EmitFailed);
        }
        return true;
    }

private:
    enum class ScopeKind { Root, Array, Map };

    ryml::Callbacks             callbacks_;
    std::unique_ptr<ryml::Tree> tree_;
    std::string*                output_ = nullptr;
    error_type                  error_ = Error::None;
    std::string                 emit_message_;

    ScopeKind scope_kind_  = ScopeKind::Root;
    void*     scope_frame_ = nullptr;
    bool      root_written_ = false;

    std::string pending_tag_;
    bool        has_pending_tag_ = false;

    bool ensure_ok() const noexcept {
        return error_ == Error::None;
    }

    bool fail(Error e) {
        if (error_ == Error::None) {
            error_ = e;
        }
        return false;
    }

    bool key_expected() const {
        return scope_kind_ == ScopeKind::Map && static_cast<MapFrame*>(scope_frame_)->expecting_key;
    }

    void restore_parent_scope(void* parent_frame, bool parent_is_map) {
        if (!parent_frame) {
            scope_kind_  = ScopeKind::Root;
            scope_frame_ = nullptr;
        } else {
            scope_kind_  = parent_is_map ? ScopeKind::Map : ScopeKind::Array;
            scope_frame_ = parent_frame;
        }
    }

    ryml::csubstr arena(std::string_view s) {
        if (s.empty()) {
            return ryml::csubstr("", 0);
        }
        return tree_->to_arena(ryml::csubstr(s.data(), s.size()));
    }

    static ryml::NodeType_e val_style(scalars::ScalarStyle s) {
        switch (s) {
        case scalars::ScalarStyle::SingleQuoted: return ryml::VAL_SQUO;
        case scalars::ScalarStyle::DoubleQuoted: return ryml::VAL_DQUO;
        case scalars::ScalarStyle::Literal: return ryml::VAL_LITERAL;
        case scalars::ScalarStyle::Auto:
        case scalars::ScalarStyle::Plain:
            break;
        }
        return ryml::VAL_PLAIN;
    }

    static ryml::NodeType_e key_style(scalars::ScalarStyle s) {
        switch (s) {
        case scalars::ScalarStyle::SingleQuoted: return ryml::KEY_SQUO;
        case scalars::ScalarStyle::DoubleQuoted:
        case scalars::ScalarStyle::Literal: return ryml::KEY_DQUO;
        case scalars::ScalarStyle::Auto:
        case scalars::ScalarStyle::Plain:
            break;
        }
        return ryml::KEY_PLAIN;
    }

    void apply_pending_tag(ryml::NodeRef node) {
        if (has_pending_tag_) {
            node.set_val_tag(arena(pending_tag_));
            pending_tag_.clear();
            has_pending_tag_ = false;
        }
    }

    // New child of the current scope; inside a mapping it receives the pending key
    ryml::NodeRef new_node() {
        switch (scope_kind_) {
        case ScopeKind::Root: {
            if (root_written_) {
                fail(Error::InvalidState);
                return ryml::NodeRef{};
            }
            root_written_ = true;
            return tree_->rootref();
        }

        case ScopeKind::Array: {
            auto* frame = static_cast<ArrayFrame*>(scope_frame_);
            if (!frame || !frame->node.readable()) {
                fail(Error::InvalidState);
                return ryml::NodeRef{};
            }
            return frame->node.append_child();
        }

        case ScopeKind::Map: {
            auto* frame = static_cast<MapFrame*>(scope_frame_);
            if (!frame || !frame->node.readable() || frame->expecting_key) {
                fail(Error::InvalidState);
                return ryml::NodeRef{};
            }
            ryml::NodeRef child = frame->node.append_child();
            child.set_key(arena(frame->pending_key));
            child.set_key_style(key_style(frame->pending_key_style));
            frame->pending_key.clear();
            frame->expecting_key = true;
            return child;
        }
        }
        return ryml::NodeRef{};
    }

    ryml::NodeRef attach_container_to_current(ryml::NodeType_e type) {
        if (key_expected()) {
            fail(Error::NonScalarKey);
            return ryml::NodeRef{};
        }
        ryml::NodeRef node = new_node();
        if (!node.readable()) {
            return node;
        }
        node |= type;
        node.set_container_style(ryml::BLOCK);
        apply_pending_tag(node);
        return node;
    }

    bool write_scalar(std::string_view text, scalars::ScalarStyle style) {
        if (!ensure_ok()) return false;

        if (key_expected()) {
            auto* frame = static_cast<MapFrame*>(scope_frame_);
            frame->pending_key.assign(text);
            frame->pending_key_style = style;
            frame->expecting_key = false;
            return true;
        }

        ryml::NodeRef node = new_node();
        if (!node.readable()) return false;
        node.set_val(arena(text));
        node.set_val_style(val_style(style));
        apply_pending_tag(node);
        return true;
    }
};

static_assert(writer::WriterLike<RapidYamlWriter>);

} // namespace YamlFusion
