#include "cactisynth/core/Error.h"

#include <utility>

namespace cactisynth::core {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::MalformedInput:
        return "malformed_input";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::CorruptContainer:
        return "corrupt_container";
    case ErrorKind::PreconditionViolation:
        return "precondition_violation";
    case ErrorKind::Io:
        return "io";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , m_kind(kind) {
}

ErrorKind Error::kind() const noexcept {
    return m_kind;
}

ParseError::ParseError(const std::string& message)
    : Error(ErrorKind::MalformedInput, message) {
}

NotFoundError::NotFoundError(const std::string& message)
    : Error(ErrorKind::NotFound, message) {
}

CorruptContainerError::CorruptContainerError(const std::string& message)
    : Error(ErrorKind::CorruptContainer, message) {
}

PreconditionError::PreconditionError(const std::string& message)
    : Error(ErrorKind::PreconditionViolation, message) {
}

ValidationError::ValidationError(std::string field, const std::string& message)
    : PreconditionError(message)
    , m_field(std::move(field)) {
}

const std::string& ValidationError::field() const noexcept {
    return m_field;
}

IoError::IoError(const std::string& message)
    : Error(ErrorKind::Io, message) {
}

} // namespace cactisynth::core
