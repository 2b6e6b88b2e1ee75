#include "qadt/core/clock.hpp"

#include <array>
#include <cstdio>

namespace qadt::core {

std::tm to_local_tm(SystemTime time) {
    const std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string format_local(SystemTime time, const char* format) {
    const std::tm tm = to_local_tm(time);
    std::array<char, 128> buffer{};
    const std::size_t written = std::strftime(buffer.data(), buffer.size(), format, &tm);
    return std::string(buffer.data(), written);
}

std::string format_clock_millis(SystemTime time) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    std::array<char, 8> millis{};
    std::snprintf(millis.data(), millis.size(), ".%03d", static_cast<int>(ms));
    return format_local(time, "%H:%M:%S") + millis.data();
}

std::int64_t to_epoch_ms(SystemTime time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

SystemTime from_epoch_ms(std::int64_t ms) {
    return SystemTime{std::chrono::milliseconds{ms}};
}

std::optional<SystemTime> from_local_tm(std::tm tm) {
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace qadt::core
