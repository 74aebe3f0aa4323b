#include "insights/Report.hpp"

#include <cmath>
#include <utility>

#include "Checks.hpp"
#include "insights/Errors.hpp"
#include "insights/Limits.hpp"

namespace insights {

using detail::require_max_length;
using detail::require_non_empty;
using detail::require_utf8;

DataField::DataField(std::string title, DataType type, Value value)
    : title_(std::move(title)), type_(type), value_(std::move(value)) {
    require_non_empty(title_, "title");
    require_utf8(title_, "title");
}

DataField DataField::boolean(std::string title, bool value) {
    return DataField(std::move(title), DataType::Boolean, value);
}

DataField DataField::date(std::string title, std::int64_t epoch_millis) {
    if (epoch_millis < 0) throw ValidationError("value", "DATE must not be negative");
    return DataField(std::move(title), DataType::Date, epoch_millis);
}

DataField DataField::duration(std::string title, std::int64_t millis) {
    if (millis < 0) throw ValidationError("value", "DURATION must not be negative");
    return DataField(std::move(title), DataType::Duration, millis);
}

DataField DataField::link(std::string title, std::string text, std::string href) {
    require_non_empty(text, "value.linktext");
    require_non_empty(href, "value.href");
    require_utf8(text, "value.linktext");
    require_utf8(href, "value.href");
    return DataField(std::move(title), DataType::Link, Link{std::move(text), std::move(href)});
}

DataField DataField::text(std::string title, std::string value) {
    require_utf8(value, "value");
    return DataField(std::move(title), DataType::Text, std::move(value));
}

DataField DataField::make_numeric(DataType type, std::string title, Value value) {
    double as_double = 0.0;
    if (const auto* d = std::get_if<double>(&value)) {
        if (!std::isfinite(*d)) throw ValidationError("value", "number must be finite");
        as_double = *d;
    } else if (const auto* u = std::get_if<std::uint64_t>(&value)) {
        as_double = static_cast<double>(*u);
    } else {
        as_double = static_cast<double>(std::get<std::int64_t>(value));
    }

    if (type == DataType::Percentage && (as_double < 0.0 || as_double > 100.0)) {
        throw ValidationError("value", "PERCENTAGE must be between 0 and 100");
    }
    return DataField(std::move(title), type, std::move(value));
}

bool DataField::operator==(const DataField& other) const {
    return title_ == other.title_ && type_ == other.type_ && value_ == other.value_;
}

Report::Report(ReportFields fields) : f_(std::move(fields)) {
    require_non_empty(f_.title, "title");
    require_max_length(f_.title, limits::kReportTitle, "title");
    require_max_length(f_.details, limits::kReportDetails, "details");
    require_max_length(f_.reporter, limits::kReportReporter, "reporter");
    require_utf8(f_.title, "title");
    require_utf8(f_.details, "details");
    require_utf8(f_.reporter, "reporter");
    require_utf8(f_.link, "link");
    require_utf8(f_.logo_url, "logoUrl");

    if (f_.data.size() > limits::kReportDataFields) {
        throw ValidationError("data", std::to_string(f_.data.size()) + " entries exceed the allowed limit " +
                                          std::to_string(limits::kReportDataFields));
    }
    if (f_.created_date && *f_.created_date < 0) {
        throw ValidationError("createdDate", "must not be negative");
    }
}

bool Report::operator==(const Report& other) const {
    return f_.title == other.f_.title &&
           f_.details == other.f_.details &&
           f_.result == other.f_.result &&
           f_.data == other.f_.data &&
           f_.reporter == other.f_.reporter &&
           f_.link == other.f_.link &&
           f_.logo_url == other.f_.logo_url &&
           f_.created_date == other.f_.created_date;
}

const char* to_token(ReportResult r) {
    switch (r) {
        case ReportResult::Pass: return "PASS";
        case ReportResult::Fail: return "FAIL";
    }
    return "";
}

const char* to_token(DataType t) {
    switch (t) {
        case DataType::Boolean: return "BOOLEAN";
        case DataType::Date: return "DATE";
        case DataType::Duration: return "DURATION";
        case DataType::Link: return "LINK";
        case DataType::Number: return "NUMBER";
        case DataType::Percentage: return "PERCENTAGE";
        case DataType::Text: return "TEXT";
    }
    return "";
}

std::optional<ReportResult> parse_report_result(const std::string& token) {
    if (token == "PASS") return ReportResult::Pass;
    if (token == "FAIL") return ReportResult::Fail;
    return std::nullopt;
}

std::optional<DataType> parse_data_type(const std::string& token) {
    if (token == "BOOLEAN") return DataType::Boolean;
    if (token == "DATE") return DataType::Date;
    if (token == "DURATION") return DataType::Duration;
    if (token == "LINK") return DataType::Link;
    if (token == "NUMBER") return DataType::Number;
    if (token == "PERCENTAGE") return DataType::Percentage;
    if (token == "TEXT") return DataType::Text;
    return std::nullopt;
}

}  // namespace insights
