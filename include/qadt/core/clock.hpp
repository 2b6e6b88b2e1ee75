#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace qadt::core {

using SystemTime = std::chrono::system_clock::time_point;

std::tm to_local_tm(SystemTime time);

// strftime-style formatting in local time
std::string format_local(SystemTime time, const char* format);

// "HH:MM:SS.mmm", the prefix of every captured log line
std::string format_clock_millis(SystemTime time);

std::int64_t to_epoch_ms(SystemTime time);
SystemTime from_epoch_ms(std::int64_t ms);

// Local broken-down time back to a time point; nullopt if out of range
std::optional<SystemTime> from_local_tm(std::tm tm);

} // namespace qadt::core
