#pragma once

#include <stdexcept>
#include <string>

namespace cactisynth::core {

enum class ErrorKind {
    MalformedInput,
    NotFound,
    CorruptContainer,
    PreconditionViolation,
    Io,
};

// Stable identifier, usable as a localization lookup key.
[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept;

private:
    ErrorKind m_kind;
};

class ParseError : public Error {
public:
    explicit ParseError(const std::string& message);
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message);
};

class CorruptContainerError : public Error {
public:
    explicit CorruptContainerError(const std::string& message);
};

class PreconditionError : public Error {
public:
    explicit PreconditionError(const std::string& message);
};

// A model field outside its documented range.
class ValidationError : public PreconditionError {
public:
    ValidationError(std::string field, const std::string& message);

    [[nodiscard]] const std::string& field() const noexcept;

private:
    std::string m_field;
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message);
};

} // namespace cactisynth::core
