#pragma once

#include <chrono>
#include <string>

namespace KD::Dashboard {

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z.
auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

} // namespace KD::Dashboard
