#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "errors.hpp"

namespace YamlFusion {


class ParseResult {
    Error m_error;
    std::size_t m_documentCount = 0;

public:
    ParseResult() = default;
    ParseResult(Error err, std::size_t documentCount):
        m_error(std::move(err)), m_documentCount(documentCount)
    {}
    operator bool() const {
        return m_error.kind == ErrorKind::NO_ERROR;
    }
    const Error& error() const {
        return m_error;
    }
    ErrorKind kind() const {
        return m_error.kind;
    }
    const std::optional<Position>& position() const {
        return m_error.position;
    }
    const std::string& errorPath() const {
        return m_error.path;
    }
    const std::string& message() const {
        return m_error.message;
    }
    // Documents in the input stream (0 for empty input)
    std::size_t document_count() const {
        return m_documentCount;
    }
};


class SerializeResult {
    Error m_error;

public:
    SerializeResult() = default;
    explicit SerializeResult(Error err):
        m_error(std::move(err))
    {}
    operator bool() const {
        return m_error.kind == ErrorKind::NO_ERROR;
    }
    const Error& error() const {
        return m_error;
    }
    ErrorKind kind() const {
        return m_error.kind;
    }
    const std::string& message() const {
        return m_error.message;
    }
};


} // namespace YamlFusion
