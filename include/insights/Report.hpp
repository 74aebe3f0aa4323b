#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace insights {

enum class ReportResult { Pass, Fail };

// Type tag of a report data field; decides the shape of its value.
enum class DataType { Boolean, Date, Duration, Link, Number, Percentage, Text };

struct Link {
    std::string text;   // "linktext" on the wire
    std::string href;

    bool operator==(const Link& other) const { return text == other.text && href == other.href; }
    bool operator!=(const Link& other) const { return !(*this == other); }
};

// A typed key/value entry shown on a report, e.g. coverage or error count.
//
// Instances are created through the per-tag factories below, each of which
// throws ValidationError when the value does not fit the tag. Integers and
// floating point numbers are kept apart so that 42 goes out as 42, not 42.0.
// An unsigned value is held as uint64_t only when it does not fit int64_t.
class DataField {
public:
    using Value = std::variant<bool, std::int64_t, std::uint64_t, double, std::string, Link>;

    static DataField boolean(std::string title, bool value);
    static DataField date(std::string title, std::int64_t epoch_millis);
    static DataField duration(std::string title, std::int64_t millis);
    static DataField link(std::string title, std::string text, std::string href);
    static DataField text(std::string title, std::string value);

    template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>>
    static DataField number(std::string title, T value) {
        return make_numeric(DataType::Number, std::move(title), to_value(value));
    }

    // value must lie in [0, 100]
    template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>>
    static DataField percentage(std::string title, T value) {
        return make_numeric(DataType::Percentage, std::move(title), to_value(value));
    }

    const std::string& title() const { return title_; }
    DataType type() const { return type_; }
    const Value& value() const { return value_; }

    bool operator==(const DataField& other) const;
    bool operator!=(const DataField& other) const { return !(*this == other); }

private:
    DataField(std::string title, DataType type, Value value);

    static DataField make_numeric(DataType type, std::string title, Value value);

    template <typename T>
    static Value to_value(T value) {
        if constexpr (std::is_floating_point_v<T>) {
            return static_cast<double>(value);
        } else if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
            if (value > static_cast<T>(std::numeric_limits<std::int64_t>::max())) return static_cast<std::uint64_t>(value);
            return static_cast<std::int64_t>(value);
        } else {
            return static_cast<std::int64_t>(value);
        }
    }

    std::string title_;
    DataType type_;
    Value value_;
};

struct ReportFields {
    std::string title;
    std::optional<std::string> details;
    std::optional<ReportResult> result;
    std::vector<DataField> data;
    std::optional<std::string> reporter;
    std::optional<std::string> link;
    std::optional<std::string> logo_url;
    std::optional<std::int64_t> created_date;  // epoch millis
};

// Summary of one analysis run, attached to a commit. Immutable once built.
class Report {
public:
    // Throws ValidationError if any field breaks a structural constraint.
    explicit Report(ReportFields fields);

    const std::string& title() const { return f_.title; }
    const std::optional<std::string>& details() const { return f_.details; }
    const std::optional<ReportResult>& result() const { return f_.result; }
    const std::vector<DataField>& data() const { return f_.data; }
    const std::optional<std::string>& reporter() const { return f_.reporter; }
    const std::optional<std::string>& link() const { return f_.link; }
    const std::optional<std::string>& logo_url() const { return f_.logo_url; }
    const std::optional<std::int64_t>& created_date() const { return f_.created_date; }

    bool operator==(const Report& other) const;
    bool operator!=(const Report& other) const { return !(*this == other); }

private:
    ReportFields f_;
};

const char* to_token(ReportResult r);
const char* to_token(DataType t);
std::optional<ReportResult> parse_report_result(const std::string& token);
std::optional<DataType> parse_data_type(const std::string& token);

}  // namespace insights
