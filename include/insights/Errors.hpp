#pragma once

#include <stdexcept>
#include <string>

namespace insights {

// Thrown when a value is built with a field that breaks a structural constraint.
class ValidationError : public std::runtime_error {
public:
    ValidationError(std::string field, const std::string& message);

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

enum class SchemaErrorKind {
    Missing,
    WrongType,
    UnrecognizedToken,
    TypeMismatch,
    InvalidValue,
    Malformed
};

const char* to_string(SchemaErrorKind kind);

// Thrown when an incoming JSON document does not match the wire schema.
class SchemaError : public std::runtime_error {
public:
    SchemaError(SchemaErrorKind kind, std::string field, const std::string& message);

    SchemaErrorKind kind() const noexcept { return kind_; }
    const std::string& field() const noexcept { return field_; }

private:
    SchemaErrorKind kind_;
    std::string field_;
};

}  // namespace insights
