#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "insights/Annotation.hpp"
#include "insights/Report.hpp"

namespace insights {

// Keys keep insertion order so the payload reads in declaration order.
using Json = nlohmann::ordered_json;

// Unset optional fields never produce a key; there is no null on the wire.
Json to_json(const DataField& field);
Json to_json(const Report& report);
Json to_json(const Annotation& annotation);
Json to_json(const AnnotationBatch& batch);

std::string serialize(const Report& report);
std::string serialize(const Annotation& annotation);
std::string serialize(const AnnotationBatch& batch);

// The *_from_json readers throw SchemaError; `where` prefixes the field path in errors.
DataField data_field_from_json(const Json& j, const std::string& where = "root");
Report report_from_json(const Json& j, const std::string& where = "root");
Annotation annotation_from_json(const Json& j, const std::string& where = "root");
AnnotationBatch annotations_from_json(const Json& j, const std::string& where = "root");

Report deserialize_report(const std::string& text);
Annotation deserialize_annotation(const std::string& text);
AnnotationBatch deserialize_annotations(const std::string& text);

Report load_report(const std::filesystem::path& path);
AnnotationBatch load_annotations(const std::filesystem::path& path);
void write_json(const std::filesystem::path& path, const Json& j);

}  // namespace insights
