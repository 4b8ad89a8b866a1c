#pragma once

#include <chrono>
#include <string>

namespace tablepod::core::util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

std::string FormatUtcTimestamp(TimePoint timestamp);
bool ParseUtcTimestamp(const std::string& text, TimePoint& timestamp);

}  // namespace tablepod::core::util
