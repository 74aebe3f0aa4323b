#include "io/JsonIO.hpp"

#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "insights/Errors.hpp"

namespace insights {

namespace {

using Kind = SchemaErrorKind;

std::string field_path(const std::string& where, const char* key) {
    return where + "." + key;
}

std::string index_path(const std::string& where, std::size_t i) {
    std::ostringstream oss;
    oss << where << "[" << i << "]";
    return oss.str();
}

void require_object(const Json& j, const std::string& where) {
    if (!j.is_object()) {
        throw SchemaError(Kind::WrongType, where, "must be an object");
    }
}

const Json& require_key(const Json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw SchemaError(Kind::Missing, field_path(where, key), "missing required field");
    }
    return *it;
}

// nullptr when the key is absent; an explicit null is not the same as absent.
const Json* find_optional(const Json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end()) return nullptr;
    if (it->is_null()) {
        throw SchemaError(Kind::WrongType, field_path(where, key), "must be omitted rather than null");
    }
    return &*it;
}

std::string as_string(const Json& v, const std::string& where) {
    if (!v.is_string()) throw SchemaError(Kind::WrongType, where, "must be a string");
    return v.get<std::string>();
}

std::int64_t as_integer(const Json& v, const std::string& where) {
    if (!v.is_number_integer()) throw SchemaError(Kind::WrongType, where, "must be an integer");
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw SchemaError(Kind::InvalidValue, where, "integer out of range");
    }
    return v.get<std::int64_t>();
}

std::string require_string(const Json& j, const char* key, const std::string& where) {
    return as_string(require_key(j, key, where), field_path(where, key));
}

std::optional<std::string> optional_string(const Json& j, const char* key, const std::string& where) {
    const Json* v = find_optional(j, key, where);
    if (!v) return std::nullopt;
    return as_string(*v, field_path(where, key));
}

std::optional<std::int64_t> optional_integer(const Json& j, const char* key, const std::string& where) {
    const Json* v = find_optional(j, key, where);
    if (!v) return std::nullopt;
    return as_integer(*v, field_path(where, key));
}

template <typename Enum, typename Parser>
Enum to_enum(const Json& v, const std::string& where, Parser parse) {
    const std::string token = as_string(v, where);
    std::optional<Enum> e = parse(token);
    if (!e) {
        throw SchemaError(Kind::UnrecognizedToken, where, "unrecognized token \"" + token + "\"");
    }
    return *e;
}

template <typename Enum, typename Parser>
std::optional<Enum> optional_enum(const Json& j, const char* key, const std::string& where, Parser parse) {
    const Json* v = find_optional(j, key, where);
    if (!v) return std::nullopt;
    return to_enum<Enum>(*v, field_path(where, key), parse);
}

// Runs a constructor and reports its ValidationError against the JSON path.
template <typename Make>
auto construct(const std::string& where, Make make) -> decltype(make()) {
    try {
        return make();
    } catch (const ValidationError& e) {
        throw SchemaError(Kind::InvalidValue, field_path(where, e.field().c_str()), e.what());
    }
}

[[noreturn]] void value_mismatch(DataType type, const std::string& where, const char* expected) {
    throw SchemaError(Kind::TypeMismatch, where,
                      std::string(to_token(type)) + " value must be " + expected);
}

Json data_value_to_json(const DataField::Value& value) {
    struct Visitor {
        Json operator()(bool b) const { return b; }
        Json operator()(std::int64_t i) const { return i; }
        Json operator()(std::uint64_t u) const { return u; }
        Json operator()(double d) const { return d; }
        Json operator()(const std::string& s) const { return s; }
        Json operator()(const Link& l) const {
            Json j = Json::object();
            j["linktext"] = l.text;
            j["href"] = l.href;
            return j;
        }
    };
    return std::visit(Visitor{}, value);
}

bool fits_int64(const Json& v) {
    return !v.is_number_unsigned() ||
           v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
}

DataField parse_data_value(const std::string& title, DataType type, const Json& v, const std::string& where) {
    switch (type) {
        case DataType::Boolean:
            if (!v.is_boolean()) value_mismatch(type, where, "a boolean");
            return DataField::boolean(title, v.get<bool>());
        case DataType::Date:
            if (!v.is_number_integer() || !fits_int64(v)) value_mismatch(type, where, "an integer timestamp");
            return DataField::date(title, as_integer(v, where));
        case DataType::Duration:
            if (!v.is_number_integer() || !fits_int64(v)) {
                value_mismatch(type, where, "an integer number of milliseconds");
            }
            return DataField::duration(title, as_integer(v, where));
        case DataType::Link: {
            const auto text = v.is_object() ? v.find("linktext") : v.end();
            const auto href = v.is_object() ? v.find("href") : v.end();
            if (text == v.end() || href == v.end() || !text->is_string() || !href->is_string()) {
                value_mismatch(type, where, "an object with string linktext and href");
            }
            return DataField::link(title, text->get<std::string>(), href->get<std::string>());
        }
        case DataType::Number:
        case DataType::Percentage: {
            if (!v.is_number()) value_mismatch(type, where, "a number");
            if (v.is_number_unsigned()) {
                const auto u = v.get<std::uint64_t>();
                return type == DataType::Number ? DataField::number(title, u) : DataField::percentage(title, u);
            }
            if (v.is_number_integer()) {
                const auto i = v.get<std::int64_t>();
                return type == DataType::Number ? DataField::number(title, i) : DataField::percentage(title, i);
            }
            const auto d = v.get<double>();
            return type == DataType::Number ? DataField::number(title, d) : DataField::percentage(title, d);
        }
        case DataType::Text:
            if (!v.is_string()) value_mismatch(type, where, "a string");
            return DataField::text(title, v.get<std::string>());
    }
    throw SchemaError(Kind::UnrecognizedToken, where, "unhandled data type");
}

}  // namespace

Json to_json(const DataField& field) {
    Json j = Json::object();
    j["title"] = field.title();
    j["type"] = to_token(field.type());
    j["value"] = data_value_to_json(field.value());
    return j;
}

Json to_json(const Report& report) {
    Json j = Json::object();
    j["title"] = report.title();
    if (report.details()) j["details"] = *report.details();
    if (report.result()) j["result"] = to_token(*report.result());
    if (!report.data().empty()) {
        Json arr = Json::array();
        for (const auto& d : report.data()) {
            arr.push_back(to_json(d));
        }
        j["data"] = std::move(arr);
    }
    if (report.reporter()) j["reporter"] = *report.reporter();
    if (report.link()) j["link"] = *report.link();
    if (report.logo_url()) j["logoUrl"] = *report.logo_url();
    if (report.created_date()) j["createdDate"] = *report.created_date();
    return j;
}

Json to_json(const Annotation& annotation) {
    Json j = Json::object();
    j["path"] = annotation.path();
    j["line"] = annotation.line();
    j["message"] = annotation.message();
    if (annotation.severity()) j["severity"] = to_token(*annotation.severity());
    if (annotation.type()) j["type"] = to_token(*annotation.type());
    if (annotation.link()) j["link"] = *annotation.link();
    if (annotation.external_id()) j["externalId"] = *annotation.external_id();
    return j;
}

Json to_json(const AnnotationBatch& batch) {
    Json arr = Json::array();
    for (const auto& a : batch.annotations()) {
        arr.push_back(to_json(a));
    }
    Json j = Json::object();
    j["annotations"] = std::move(arr);
    return j;
}

std::string serialize(const Report& report) { return to_json(report).dump(); }
std::string serialize(const Annotation& annotation) { return to_json(annotation).dump(); }
std::string serialize(const AnnotationBatch& batch) { return to_json(batch).dump(); }

DataField data_field_from_json(const Json& j, const std::string& where) {
    require_object(j, where);

    const std::string title = require_string(j, "title", where);
    const DataType type = to_enum<DataType>(require_key(j, "type", where), field_path(where, "type"), parse_data_type);
    const Json& value = require_key(j, "value", where);
    const std::string value_where = field_path(where, "value");

    try {
        return parse_data_value(title, type, value, value_where);
    } catch (const ValidationError& e) {
        // "value" itself outside what the tag admits is a mismatch; other constraints are bad values
        const Kind kind = e.field() == "value" ? Kind::TypeMismatch : Kind::InvalidValue;
        throw SchemaError(kind, field_path(where, e.field().c_str()), e.what());
    }
}

Report report_from_json(const Json& j, const std::string& where) {
    require_object(j, where);

    ReportFields f;
    f.title    = require_string(j, "title", where);
    f.details  = optional_string(j, "details", where);
    f.result   = optional_enum<ReportResult>(j, "result", where, parse_report_result);
    f.reporter = optional_string(j, "reporter", where);
    f.link     = optional_string(j, "link", where);
    f.logo_url = optional_string(j, "logoUrl", where);
    f.created_date = optional_integer(j, "createdDate", where);

    if (const Json* data = find_optional(j, "data", where)) {
        const std::string data_where = field_path(where, "data");
        if (!data->is_array()) {
            throw SchemaError(Kind::WrongType, data_where, "must be an array");
        }
        for (std::size_t i = 0; i < data->size(); ++i) {
            f.data.push_back(data_field_from_json(data->at(i), index_path(data_where, i)));
        }
    }

    return construct(where, [&] { return Report(std::move(f)); });
}

Annotation annotation_from_json(const Json& j, const std::string& where) {
    require_object(j, where);

    AnnotationFields f;
    f.path     = require_string(j, "path", where);
    f.line     = as_integer(require_key(j, "line", where), field_path(where, "line"));
    f.message  = require_string(j, "message", where);
    f.severity = optional_enum<Severity>(j, "severity", where, parse_severity);
    f.type     = optional_enum<AnnotationType>(j, "type", where, parse_annotation_type);
    f.link     = optional_string(j, "link", where);
    f.external_id = optional_string(j, "externalId", where);

    return construct(where, [&] { return Annotation(std::move(f)); });
}

AnnotationBatch annotations_from_json(const Json& j, const std::string& where) {
    require_object(j, where);

    const std::string arr_where = field_path(where, "annotations");
    const Json& arr = require_key(j, "annotations", where);
    if (!arr.is_array()) {
        throw SchemaError(Kind::WrongType, arr_where, "must be an array");
    }

    std::vector<Annotation> out;
    out.reserve(arr.size());
    for (std::size_t i = 0; i < arr.size(); ++i) {
        out.push_back(annotation_from_json(arr.at(i), index_path(arr_where, i)));
    }

    return construct(where, [&] { return AnnotationBatch(std::move(out)); });
}

namespace {

Json parse_document(const std::string& text) {
    try {
        return Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw SchemaError(Kind::Malformed, "root", std::string("failed to parse JSON: ") + e.what());
    }
}

std::string read_file(const std::filesystem::path& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

Report deserialize_report(const std::string& text) {
    return report_from_json(parse_document(text));
}

Annotation deserialize_annotation(const std::string& text) {
    return annotation_from_json(parse_document(text));
}

AnnotationBatch deserialize_annotations(const std::string& text) {
    return annotations_from_json(parse_document(text));
}

Report load_report(const std::filesystem::path& path) {
    return deserialize_report(read_file(path, "report"));
}

AnnotationBatch load_annotations(const std::filesystem::path& path) {
    return deserialize_annotations(read_file(path, "annotations"));
}

void write_json(const std::filesystem::path& path, const Json& j) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());

    out << j.dump(2) << "\n";
}

}  // namespace insights
