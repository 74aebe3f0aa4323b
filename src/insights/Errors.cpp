#include "insights/Errors.hpp"

#include <utility>

namespace insights {

ValidationError::ValidationError(std::string field, const std::string& message)
    : std::runtime_error(field + ": " + message), field_(std::move(field)) {}

const char* to_string(SchemaErrorKind kind) {
    switch (kind) {
        case SchemaErrorKind::Missing: return "missing";
        case SchemaErrorKind::WrongType: return "wrong-type";
        case SchemaErrorKind::UnrecognizedToken: return "unrecognized-enum-token";
        case SchemaErrorKind::TypeMismatch: return "type-mismatch";
        case SchemaErrorKind::InvalidValue: return "invalid-value";
        case SchemaErrorKind::Malformed: return "malformed";
    }
    return "unknown";
}

SchemaError::SchemaError(SchemaErrorKind kind, std::string field, const std::string& message)
    : std::runtime_error(field + " (" + to_string(kind) + "): " + message),
      kind_(kind),
      field_(std::move(field)) {}

}  // namespace insights
