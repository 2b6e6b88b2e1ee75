#pragma once

#include "qadt/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace qadt::core {

/**
 * @brief Names or absolute paths of the external device tools
 */
struct ToolPaths {
    std::string adb = "adb";
    std::string idevice_id = "idevice_id";
    std::string ideviceinfo = "ideviceinfo";
    std::string idevicesyslog = "idevicesyslog";
    std::string idevicescreenshot = "idevicescreenshot";
    std::string ideviceinstaller = "ideviceinstaller";
    std::string afcclient = "afcclient";
    std::string scrcpy = "scrcpy";
};

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;  ///< Empty: console only
    bool console_stderr = false; ///< Console sink on stderr, leaving stdout to log output
};

/**
 * @brief Runtime configuration passed explicitly to every component
 *
 * Settings file layout (all keys optional):
 * {
 *   "sessions_root": "/home/qa/QA_Device_Tool/Sessions",
 *   "poll_interval_ms": 5000,
 *   "flush_interval_ms": 200,
 *   "max_batch_lines": 200,
 *   "delivery_capacity": 10000,
 *   "command_timeout_ms": 10000,
 *   "gate_timeout_ms": 15000,
 *   "stop_grace_ms": 500,
 *   "auto_capture": true,
 *   "tools": { "adb": "/opt/platform-tools/adb", ... },
 *   "logging": { "level": "debug", "file": "/tmp/qadt.log" }
 * }
 */
struct Config {
    // Smallest accepted value for every *_ms key
    static constexpr std::chrono::milliseconds kMinInterval{1};

    std::filesystem::path sessions_root = default_sessions_root();
    std::chrono::milliseconds poll_interval{5000};
    std::chrono::milliseconds flush_interval{200};
    std::size_t max_batch_lines = 200;
    std::size_t delivery_capacity = 10000;
    std::chrono::milliseconds command_timeout{10000};
    std::chrono::milliseconds gate_timeout{15000};
    std::chrono::milliseconds stop_grace{500};
    bool auto_capture = true;
    ToolPaths tools;
    LoggingConfig logging;

    /**
     * @brief Read settings from a JSON file
     *
     * A missing file yields defaults. A malformed file or a wrongly typed
     * value yields an error; callers normally log it and keep defaults.
     */
    static Result<Config> load(const std::filesystem::path& path);

    Result<void> save(const std::filesystem::path& path) const;

    static std::filesystem::path default_sessions_root();
    static std::filesystem::path default_settings_path();
};

// Millisecond count from a command-line flag; at least Config::kMinInterval
Result<std::chrono::milliseconds> parse_interval_ms(const std::string& text);

} // namespace qadt::core
