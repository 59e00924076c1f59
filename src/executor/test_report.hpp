#pragma once

#include <optional>
#include <string>

#include "session/session_types.hpp"

namespace runbox::executor {

// Line printed by the test script right before the JSON report.
inline constexpr const char* kReportMarker = "<<<RUNBOX_TEST_REPORT>>>";

// exit 0 -> "success", exit 1 -> "partial_success", anything else -> "failure".
std::string ClassifyExitCode(int exit_code);

// Extracts pass/fail counts from the pytest-json-report document that follows
// kReportMarker, or from a legacy {"report": {...}} object. Returns nullopt if
// no report is present or it does not parse.
std::optional<session::TestSummary> ParseTestReport(const std::string& output);

}  // namespace runbox::executor
