#include "insights/Annotation.hpp"

#include <utility>

#include "Checks.hpp"
#include "insights/Errors.hpp"
#include "insights/Limits.hpp"

namespace insights {

Annotation::Annotation(AnnotationFields fields) : f_(std::move(fields)) {
    detail::require_non_empty(f_.path, "path");
    if (f_.line < 1) {
        throw ValidationError("line", "must be a positive integer, got " + std::to_string(f_.line));
    }
    detail::require_non_empty(f_.message, "message");
    detail::require_max_length(f_.message, limits::kAnnotationMessage, "message");
    detail::require_max_length(f_.external_id, limits::kAnnotationExternalId, "externalId");
    detail::require_utf8(f_.path, "path");
    detail::require_utf8(f_.message, "message");
    detail::require_utf8(f_.link, "link");
    detail::require_utf8(f_.external_id, "externalId");
}

Annotation::Annotation(std::string path, std::int64_t line, std::string message)
    : Annotation(AnnotationFields{std::move(path), line, std::move(message), {}, {}, {}, {}}) {}

bool Annotation::operator==(const Annotation& other) const {
    return f_.path == other.f_.path &&
           f_.line == other.f_.line &&
           f_.message == other.f_.message &&
           f_.severity == other.f_.severity &&
           f_.type == other.f_.type &&
           f_.link == other.f_.link &&
           f_.external_id == other.f_.external_id;
}

AnnotationBatch::AnnotationBatch(std::vector<Annotation> annotations) : annotations_(std::move(annotations)) {
    if (annotations_.size() > limits::kAnnotationsPerBatch) {
        throw ValidationError("annotations", std::to_string(annotations_.size()) +
                                                 " entries exceed the allowed limit " +
                                                 std::to_string(limits::kAnnotationsPerBatch));
    }
}

const char* to_token(Severity s) {
    switch (s) {
        case Severity::Low: return "LOW";
        case Severity::Medium: return "MEDIUM";
        case Severity::High: return "HIGH";
    }
    return "";
}

const char* to_token(AnnotationType t) {
    switch (t) {
        case AnnotationType::Vulnerability: return "VULNERABILITY";
        case AnnotationType::CodeSmell: return "CODE_SMELL";
        case AnnotationType::Bug: return "BUG";
    }
    return "";
}

std::optional<Severity> parse_severity(const std::string& token) {
    if (token == "LOW") return Severity::Low;
    if (token == "MEDIUM") return Severity::Medium;
    if (token == "HIGH") return Severity::High;
    return std::nullopt;
}

std::optional<AnnotationType> parse_annotation_type(const std::string& token) {
    if (token == "VULNERABILITY") return AnnotationType::Vulnerability;
    if (token == "CODE_SMELL") return AnnotationType::CodeSmell;
    if (token == "BUG") return AnnotationType::Bug;
    return std::nullopt;
}

}  // namespace insights
