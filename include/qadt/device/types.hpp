#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qadt::device {

enum class PlatformKind {
    Android,
    iOS
};

enum class ConnectionState {
    Online,
    Offline,
    Unauthorized,
    PendingTrust  ///< iOS device attached but the host is not paired/trusted yet
};

inline const char* platform_name(PlatformKind kind) {
    return kind == PlatformKind::Android ? "Android" : "iOS";
}

inline std::optional<PlatformKind> parse_platform(const std::string& name) {
    if (name == "Android") return PlatformKind::Android;
    if (name == "iOS") return PlatformKind::iOS;
    return std::nullopt;
}

inline const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Online: return "online";
        case ConnectionState::Offline: return "offline";
        case ConnectionState::Unauthorized: return "unauthorized";
        case ConnectionState::PendingTrust: return "pending_trust";
    }
    return "unknown";
}

/**
 * @brief Immutable identity snapshot of one attached device
 *
 * Built fresh on every poll. Two snapshots refer to the same physical unit
 * when their ids are equal.
 */
struct Device {
    std::string id;            ///< adb serial or iOS UDID
    std::string display_name;
    std::string model;
    std::string os_version;
    PlatformKind platform = PlatformKind::Android;
    ConnectionState connection_state = ConnectionState::Online;
    std::string battery_level = "N/A";

    // Human readable name: display name, then model, then id
    [[nodiscard]] const std::string& label() const {
        if (!display_name.empty()) return display_name;
        if (!model.empty()) return model;
        return id;
    }

    bool operator==(const Device& other) const {
        return id == other.id && display_name == other.display_name && model == other.model &&
               os_version == other.os_version && platform == other.platform &&
               connection_state == other.connection_state && battery_level == other.battery_level;
    }
};

struct FileEntry {
    std::string name;
    std::string path;
    bool is_directory = false;
    std::uint64_t size = 0;
};

struct AppEntry {
    std::string package_id;
    std::string name;
    std::string version;
    PlatformKind platform = PlatformKind::Android;
};

struct OperationResult {
    bool success = false;
    std::string message;

    static OperationResult ok(std::string msg = {}) { return {true, std::move(msg)}; }
    static OperationResult failed(std::string msg) { return {false, std::move(msg)}; }
};

/**
 * @brief Availability of one external tool a backend relies on
 */
struct ToolStatus {
    std::string name;
    bool installed = false;
    std::string version;
    std::string path;
    std::string message;
};

/**
 * @brief One sample of an Android device's memory and process load
 *
 * RAM figures are kilobytes as reported by `dumpsys meminfo`; each is
 * nullopt when that summary line is missing.
 */
struct DeviceVitals {
    std::string memory_summary;  ///< `dumpsys meminfo` from the "Total RAM" line down
    std::optional<std::uint64_t> total_ram_kb;
    std::optional<std::uint64_t> free_ram_kb;
    std::optional<std::uint64_t> used_ram_kb;
    std::string top_processes;   ///< Leading lines of `top -b -n 1`
};

} // namespace qadt::device
