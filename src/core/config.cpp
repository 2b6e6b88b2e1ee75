#include "qadt/core/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <fstream>
#include <system_error>
#include <utility>

namespace qadt::core {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path home_directory() {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return fs::path(home);
    }
    return fs::temp_directory_path();
}

std::chrono::milliseconds read_ms(const json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return std::chrono::milliseconds{j.at(key).get<std::int64_t>()};
}

void read_tools(const json& j, ToolPaths& tools) {
    tools.adb = j.value("adb", tools.adb);
    tools.idevice_id = j.value("idevice_id", tools.idevice_id);
    tools.ideviceinfo = j.value("ideviceinfo", tools.ideviceinfo);
    tools.idevicesyslog = j.value("idevicesyslog", tools.idevicesyslog);
    tools.idevicescreenshot = j.value("idevicescreenshot", tools.idevicescreenshot);
    tools.ideviceinstaller = j.value("ideviceinstaller", tools.ideviceinstaller);
    tools.afcclient = j.value("afcclient", tools.afcclient);
    tools.scrcpy = j.value("scrcpy", tools.scrcpy);
}

json tools_to_json(const ToolPaths& tools) {
    return json{
        {"adb", tools.adb},
        {"idevice_id", tools.idevice_id},
        {"ideviceinfo", tools.ideviceinfo},
        {"idevicesyslog", tools.idevicesyslog},
        {"idevicescreenshot", tools.idevicescreenshot},
        {"ideviceinstaller", tools.ideviceinstaller},
        {"afcclient", tools.afcclient},
        {"scrcpy", tools.scrcpy},
    };
}

} // namespace

fs::path Config::default_sessions_root() {
    return home_directory() / "QA_Device_Tool" / "Sessions";
}

fs::path Config::default_settings_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return fs::path(xdg) / "qadt" / "settings.json";
    }
    return home_directory() / ".config" / "qadt" / "settings.json";
}

Result<Config> Config::load(const fs::path& path) {
    Config config;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok(config);
    }

    std::ifstream input(path);
    if (!input) {
        return Err<Config>(ErrorKind::Io, "Cannot open settings file: " + path.string());
    }

    const json j = json::parse(input, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Err<Config>(ErrorKind::InvalidArgument, "Malformed settings file: " + path.string());
    }

    try {
        const std::string root = j.value("sessions_root", std::string{});
        if (!root.empty()) {
            config.sessions_root = fs::path(root);
        }
        config.poll_interval = read_ms(j, "poll_interval_ms", config.poll_interval);
        config.flush_interval = read_ms(j, "flush_interval_ms", config.flush_interval);
        config.command_timeout = read_ms(j, "command_timeout_ms", config.command_timeout);
        config.gate_timeout = read_ms(j, "gate_timeout_ms", config.gate_timeout);
        config.stop_grace = read_ms(j, "stop_grace_ms", config.stop_grace);
        config.max_batch_lines = j.value("max_batch_lines", config.max_batch_lines);
        config.delivery_capacity = j.value("delivery_capacity", config.delivery_capacity);
        config.auto_capture = j.value("auto_capture", config.auto_capture);

        if (j.contains("tools") && j.at("tools").is_object()) {
            read_tools(j.at("tools"), config.tools);
        }
        if (j.contains("logging") && j.at("logging").is_object()) {
            const auto& logging = j.at("logging");
            config.logging.level = logging.value("level", config.logging.level);
            const std::string file = logging.value("file", std::string{});
            if (!file.empty()) {
                config.logging.file = fs::path(file);
            }
        }
    } catch (const json::exception& e) {
        return Err<Config>(ErrorKind::InvalidArgument,
                           "Invalid value in " + path.string() + ": " + e.what());
    }

    if (config.max_batch_lines == 0) {
        return Err<Config>(ErrorKind::InvalidArgument, "max_batch_lines must be positive");
    }
    const std::pair<const char*, std::chrono::milliseconds> intervals[] = {
        {"poll_interval_ms", config.poll_interval},
        {"flush_interval_ms", config.flush_interval},
        {"command_timeout_ms", config.command_timeout},
        {"gate_timeout_ms", config.gate_timeout},
        {"stop_grace_ms", config.stop_grace},
    };
    for (const auto& [key, value] : intervals) {
        if (value < kMinInterval) {
            return Err<Config>(ErrorKind::InvalidArgument,
                               std::string(key) + " must be at least 1, got " + std::to_string(value.count()));
        }
    }

    return Ok(config);
}

Result<std::chrono::milliseconds> parse_interval_ms(const std::string& text) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        return Err<std::chrono::milliseconds>(ErrorKind::InvalidArgument, "Not a number: '" + text + "'");
    }
    if (consumed != text.size()) {
        return Err<std::chrono::milliseconds>(ErrorKind::InvalidArgument, "Not a number: '" + text + "'");
    }
    const std::chrono::milliseconds interval{value};
    if (interval < Config::kMinInterval) {
        return Err<std::chrono::milliseconds>(ErrorKind::InvalidArgument,
                                              "Interval must be at least 1 ms, got " + text);
    }
    return Ok(interval);
}

Result<void> Config::save(const fs::path& path) const {
    json j;
    j["sessions_root"] = sessions_root.string();
    j["poll_interval_ms"] = poll_interval.count();
    j["flush_interval_ms"] = flush_interval.count();
    j["max_batch_lines"] = max_batch_lines;
    j["delivery_capacity"] = delivery_capacity;
    j["command_timeout_ms"] = command_timeout.count();
    j["gate_timeout_ms"] = gate_timeout.count();
    j["stop_grace_ms"] = stop_grace.count();
    j["auto_capture"] = auto_capture;
    j["tools"] = tools_to_json(tools);
    j["logging"] = json{{"level", logging.level}, {"file", logging.file.string()}};

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<void>(ErrorKind::Io, "Cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorKind::Io, "Cannot write settings file: " + path.string());
    }
    output << j.dump(2) << '\n';
    if (!output) {
        return Err<void>(ErrorKind::Io, "Short write to settings file: " + path.string());
    }
    return Ok();
}

} // namespace qadt::core
