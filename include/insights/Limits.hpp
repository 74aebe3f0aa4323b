#pragma once

#include <cstddef>

// Server-side limits of the Code Insights REST API.
namespace insights::limits {

constexpr std::size_t kReportTitle = 450;
constexpr std::size_t kReportDetails = 2000;
constexpr std::size_t kReportReporter = 450;
constexpr std::size_t kReportDataFields = 6;

constexpr std::size_t kAnnotationMessage = 2000;
constexpr std::size_t kAnnotationExternalId = 450;
constexpr std::size_t kAnnotationsPerBatch = 1000;

}  // namespace insights::limits
