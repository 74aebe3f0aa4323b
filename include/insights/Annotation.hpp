#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace insights {

enum class Severity { Low, Medium, High };

enum class AnnotationType { Vulnerability, CodeSmell, Bug };

struct AnnotationFields {
    std::string path;                           // relative to the repository root
    std::int64_t line = 0;                      // 1-based
    std::string message;
    std::optional<Severity> severity;
    std::optional<AnnotationType> type;
    std::optional<std::string> link;
    std::optional<std::string> external_id;     // caller's own id, used to update or delete
};

// One finding tied to a file and line. Immutable once built.
class Annotation {
public:
    // Throws ValidationError if any field breaks a structural constraint.
    explicit Annotation(AnnotationFields fields);
    Annotation(std::string path, std::int64_t line, std::string message);

    const std::string& path() const { return f_.path; }
    std::int64_t line() const { return f_.line; }
    const std::string& message() const { return f_.message; }
    const std::optional<Severity>& severity() const { return f_.severity; }
    const std::optional<AnnotationType>& type() const { return f_.type; }
    const std::optional<std::string>& link() const { return f_.link; }
    const std::optional<std::string>& external_id() const { return f_.external_id; }

    bool operator==(const Annotation& other) const;
    bool operator!=(const Annotation& other) const { return !(*this == other); }

private:
    AnnotationFields f_;
};

// Envelope for submitting several annotations to one report in a single request.
class AnnotationBatch {
public:
    explicit AnnotationBatch(std::vector<Annotation> annotations);

    const std::vector<Annotation>& annotations() const { return annotations_; }
    std::size_t size() const { return annotations_.size(); }

    bool operator==(const AnnotationBatch& other) const { return annotations_ == other.annotations_; }
    bool operator!=(const AnnotationBatch& other) const { return !(*this == other); }

private:
    std::vector<Annotation> annotations_;
};

const char* to_token(Severity s);
const char* to_token(AnnotationType t);
std::optional<Severity> parse_severity(const std::string& token);
std::optional<AnnotationType> parse_annotation_type(const std::string& token);

}  // namespace insights
