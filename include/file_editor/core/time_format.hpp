#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace file_editor {

// "2023-01-01T12:00:00Z": RFC3339, UTC, second precision.
std::string FormatRfc3339Utc(std::time_t t);

// Current wall-clock time formatted with FormatRfc3339Utc.
std::string NowRfc3339Utc();

// "2023-01-01T12:00:00.123Z", used for log timestamps.
std::string FormatIso8601Millis(std::chrono::system_clock::time_point tp);

} // namespace file_editor
