#include "qadt/backends/android_backend.hpp"

#include "qadt/backends/parsers.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace qadt::backends {
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

constexpr auto kPropertyTimeout = 5000ms;
constexpr auto kTransferTimeout = 60000ms;
constexpr auto kScreenshotTimeout = 15000ms;
constexpr auto kInstallTimeout = 600000ms;
constexpr auto kWirelessTimeout = 10000ms;
constexpr auto kCommandTimeout = 60000ms;
constexpr const char* kRemoteScreenshot = "/sdcard/qa_screenshot.png";
constexpr const char* kViewAction = "android.intent.action.VIEW";

std::string trim_copy(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    return text.substr(first, text.find_last_not_of(" \t\r\n") - first + 1);
}

bool valid_port(int port) {
    return port > 0 && port <= 65535;
}

} // namespace

AndroidBackend::AndroidBackend(const core::ToolPaths& tools,
                               process::ProcessSupervisor* supervisor,
                               std::chrono::milliseconds command_timeout)
    : adb_(tools.adb), supervisor_(supervisor), runner_(supervisor, command_timeout) {}

process::CommandResult AndroidBackend::adb(const std::string& serial,
                                           std::vector<std::string> args,
                                           std::chrono::milliseconds timeout,
                                           const core::Deadline& deadline) const {
    if (!serial.empty()) {
        args.insert(args.begin(), {"-s", serial});
    }
    auto result = runner_.run(adb_, args, timeout, deadline);
    if (!result.success()) {
        spdlog::debug("[AndroidBackend] adb {} failed: {}", args.size() > 2 ? args[2] : args.front(),
                      result.diagnostic());
    }
    return result;
}

std::vector<device::ToolStatus> AndroidBackend::check_availability(const core::Deadline& deadline) {
    device::ToolStatus status;
    status.name = "ADB (Android Debug Bridge)";

    auto result = adb("", {"version"}, runner_.default_timeout(), deadline);
    if (result.success()) {
        status.installed = true;
        status.version = extract_version(result.stdout_text).value_or("Installed");
        auto path = process::find_executable(adb_);
        status.path = path ? path->string() : adb_;
        status.message = "ADB is ready";
    } else {
        status.installed = false;
        status.message = "ADB not found. Install platform-tools or set tools.adb in the settings file.";
    }
    return {status};
}

std::vector<device::Device> AndroidBackend::list_devices(const core::Deadline& deadline) {
    auto result = adb("", {"devices", "-l"}, runner_.default_timeout(), deadline);
    if (!result.success()) {
        spdlog::warn("[AndroidBackend] Device listing failed: {}", result.diagnostic());
        return {};
    }

    auto devices = parse_adb_devices(result.stdout_text);
    for (auto& device : devices) {
        if (device.model.empty()) {
            device.model = get_property(device.id, "ro.product.model", deadline).value_or(device.id);
        }
    }
    return devices;
}

std::optional<std::string> AndroidBackend::get_property(const std::string& serial, const std::string& property,
                                                        const core::Deadline& deadline) {
    auto result = adb(serial, {"shell", "getprop", property}, kPropertyTimeout, deadline);
    if (!result.success()) {
        return std::nullopt;
    }
    std::string value = result.stdout_text;
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
        value.pop_back();
    }
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

device::Device AndroidBackend::get_device_details(const device::Device& device, const core::Deadline& deadline) {
    device::Device details = device;
    details.os_version = get_property(device.id, "ro.build.version.release", deadline).value_or("Unknown");

    auto battery = adb(device.id, {"shell", "dumpsys", "battery"}, kPropertyTimeout, deadline);
    if (battery.success()) {
        if (auto level = parse_battery_level(battery.stdout_text)) {
            details.battery_level = std::to_string(*level) + "%";
        }
    }
    return details;
}

Result<process::ProcessPtr> AndroidBackend::start_log_stream(const std::string& device_id) {
    auto spawned = process::ChildProcess::spawn(adb_, {"-s", device_id, "logcat", "-v", "threadtime"});
    if (spawned.is_error()) {
        return spawned;
    }
    if (supervisor_ != nullptr) {
        supervisor_->track(spawned.value());
    }
    spdlog::debug("[AndroidBackend] logcat for {} running as pid {}", device_id, spawned.value()->pid());
    return spawned;
}

bool AndroidBackend::capture_screenshot(const std::string& device_id, const fs::path& destination,
                                        const core::Deadline& deadline) {
    auto capture = adb(device_id, {"shell", "screencap", "-p", kRemoteScreenshot}, kScreenshotTimeout, deadline);
    if (!capture.success()) {
        return false;
    }

    auto pulled = adb(device_id, {"pull", kRemoteScreenshot, destination.string()}, kScreenshotTimeout, deadline);
    auto cleanup = adb(device_id, {"shell", "rm", kRemoteScreenshot}, kPropertyTimeout, deadline);
    if (!cleanup.success()) {
        spdlog::debug("[AndroidBackend] Could not remove {} from {}", kRemoteScreenshot, device_id);
    }
    return pulled.success();
}

bool AndroidBackend::pull_file(const std::string& device_id, const std::string& remote_path,
                               const fs::path& local_path, const core::Deadline& deadline) {
    auto result = adb(device_id, {"pull", remote_path, local_path.string()}, kTransferTimeout, deadline);
    std::error_code ec;
    return result.success() && fs::exists(local_path, ec);
}

bool AndroidBackend::push_file(const std::string& device_id, const fs::path& local_path,
                               const std::string& remote_path, const core::Deadline& deadline) {
    return adb(device_id, {"push", local_path.string(), remote_path}, kTransferTimeout, deadline).success();
}

bool AndroidBackend::delete_file(const std::string& device_id, const std::string& remote_path,
                                 const core::Deadline& deadline) {
    return adb(device_id, {"shell", "rm -rf " + shell_quote(remote_path)}, runner_.default_timeout(), deadline)
        .success();
}

std::vector<device::FileEntry> AndroidBackend::list_directory(const std::string& device_id, const std::string& path,
                                                              const core::Deadline& deadline) {
    // Trailing slash so symlinked directories such as /sdcard list their contents
    std::string target = path.empty() ? "/" : path;
    if (target.back() != '/') {
        target.push_back('/');
    }
    auto result = adb(device_id, {"shell", "ls -l " + shell_quote(target)}, runner_.default_timeout(), deadline);
    if (!result.success() && result.stdout_text.empty()) {
        return {};
    }
    return parse_ls_long(result.stdout_text, path.empty() ? "/" : path);
}

std::vector<device::AppEntry> AndroidBackend::list_installed_apps(const std::string& device_id,
                                                                  const core::Deadline& deadline) {
    auto result = adb(device_id, {"shell", "pm", "list", "packages"}, kScreenshotTimeout, deadline);
    if (!result.success()) {
        return {};
    }
    return parse_pm_packages(result.stdout_text);
}

device::OperationResult AndroidBackend::install_app(const std::string& device_id, const fs::path& package,
                                                    const core::Deadline& deadline) {
    auto result = adb(device_id, {"install", "-r", package.string()}, kInstallTimeout, deadline);
    if (result.success() && result.stdout_text.find("Success") != std::string::npos) {
        return device::OperationResult::ok("APK installed successfully.");
    }
    return device::OperationResult::failed(result.diagnostic());
}

device::OperationResult AndroidBackend::uninstall_app(const std::string& device_id, const std::string& package_id,
                                                      const core::Deadline& deadline) {
    auto result = adb(device_id, {"uninstall", package_id}, kTransferTimeout, deadline);
    if (result.success() && result.stdout_text.find("Success") != std::string::npos) {
        return device::OperationResult::ok("Uninstalled " + package_id + ".");
    }
    return device::OperationResult::failed(result.diagnostic());
}

// ════════════════════════════════════════════════════════
// Wireless adb
// ════════════════════════════════════════════════════════

device::OperationResult AndroidBackend::enable_wireless(const std::string& serial, int port,
                                                        const core::Deadline& deadline) {
    if (!valid_port(port)) {
        return device::OperationResult::failed("Invalid port " + std::to_string(port));
    }
    auto tcpip = adb(serial, {"tcpip", std::to_string(port)}, kWirelessTimeout, deadline);
    if (!tcpip.success()) {
        return device::OperationResult::failed("Failed to enable TCP mode: " + tcpip.diagnostic());
    }

    auto ip = adb(serial, {"shell", "ip", "-f", "inet", "addr", "show", "wlan0"}, kPropertyTimeout, deadline);
    if (ip.success()) {
        if (auto address = parse_inet_address(ip.stdout_text)) {
            spdlog::info("[AndroidBackend] {} listening on {}:{}", serial, *address, port);
            return device::OperationResult::ok(*address);
        }
    }
    return device::OperationResult::ok("TCP mode enabled. Find the device IP in Settings > About phone > Status.");
}

device::OperationResult AndroidBackend::connect_wireless(const std::string& host, int port,
                                                         const core::Deadline& deadline) {
    if (host.empty() || !valid_port(port)) {
        return device::OperationResult::failed("Invalid address " + host + ":" + std::to_string(port));
    }
    const std::string target = host + ":" + std::to_string(port);
    auto result = adb("", {"connect", target}, kWirelessTimeout, deadline);
    if (result.success() && adb_connect_succeeded(result.stdout_text)) {
        return device::OperationResult::ok("Connected to " + target);
    }
    return device::OperationResult::failed(result.diagnostic());
}

device::OperationResult AndroidBackend::disconnect_wireless(const std::string& host, int port,
                                                            const core::Deadline& deadline) {
    if (host.empty() || !valid_port(port)) {
        return device::OperationResult::failed("Invalid address " + host + ":" + std::to_string(port));
    }
    auto result = adb("", {"disconnect", host + ":" + std::to_string(port)}, kPropertyTimeout, deadline);
    const std::string message = result.diagnostic();
    return result.success() ? device::OperationResult::ok(message) : device::OperationResult::failed(message);
}

// ════════════════════════════════════════════════════════
// Diagnostics
// ════════════════════════════════════════════════════════

Result<process::CommandResult> AndroidBackend::execute_command(const std::string& serial,
                                                               const std::string& command_line,
                                                               const core::Deadline& deadline) {
    auto args = split_command_line(command_line);
    if (args.empty()) {
        return Err<process::CommandResult>(ErrorKind::InvalidArgument, "Empty adb command");
    }
    spdlog::debug("[AndroidBackend] {}: adb {}", serial, command_line);
    return Ok(adb(serial, std::move(args), kCommandTimeout, deadline));
}

std::optional<device::DeviceVitals> AndroidBackend::query_vitals(const std::string& serial,
                                                                 const core::Deadline& deadline) {
    auto meminfo = adb(serial, {"shell", "dumpsys", "meminfo"}, kPropertyTimeout, deadline);
    auto top = adb(serial, {"shell", "top", "-b", "-n", "1"}, kPropertyTimeout, deadline);
    if (!meminfo.success() && !top.success()) {
        return std::nullopt;
    }
    return parse_vitals(meminfo.success() ? meminfo.stdout_text : std::string{},
                        top.success() ? top.stdout_text : std::string{});
}

device::OperationResult AndroidBackend::fire_intent(const std::string& serial, const std::string& uri,
                                                    const core::Deadline& deadline) {
    const std::string target = trim_copy(uri);
    if (target.empty()) {
        return device::OperationResult::failed("Enter a URL or intent URI.");
    }
    const std::string command = std::string("am start -a ") + kViewAction + " -d " + shell_quote(target);
    auto result = adb(serial, {"shell", command}, runner_.default_timeout(), deadline);
    if (result.success() && am_start_succeeded(result.stdout_text + result.stderr_text)) {
        return device::OperationResult::ok("Launched " + target);
    }
    return device::OperationResult::failed(result.diagnostic());
}

} // namespace qadt::backends
