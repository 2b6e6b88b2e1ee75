#include "qadt/backends/ios_backend.hpp"

#include "qadt/backends/parsers.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <system_error>

namespace qadt::backends {
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

constexpr auto kScreenshotTimeout = 15000ms;
constexpr auto kTransferTimeout = 60000ms;
constexpr auto kUninstallTimeout = 20000ms;
constexpr auto kInstallTimeout = 600000ms;

} // namespace

IosBackend::IosBackend(const core::ToolPaths& tools,
                       process::ProcessSupervisor* supervisor,
                       std::chrono::milliseconds command_timeout)
    : tools_(tools), supervisor_(supervisor), runner_(supervisor, command_timeout) {}

std::vector<device::ToolStatus> IosBackend::check_availability(const core::Deadline& deadline) {
    device::ToolStatus status;
    status.name = "libimobiledevice (iOS Tools)";

    auto result = runner_.run(tools_.idevice_id, {"-l"}, deadline);
    auto path = process::find_executable(tools_.idevice_id);
    if (result.success()) {
        status.installed = true;
        status.version = "Installed";
        status.path = path ? path->parent_path().string() : tools_.idevice_id;
        status.message = "iOS tools are ready";
    } else if (path) {
        // idevice_id -l fails when usbmuxd is not running
        status.installed = true;
        status.version = "Installed (usbmuxd not active)";
        status.path = path->parent_path().string();
        status.message = "iOS tools found, but usbmuxd is not running. Start usbmuxd to enable iOS device support.";
    } else {
        status.installed = false;
        status.message = "libimobiledevice not found. Install it or set the tools paths in the settings file.";
    }
    return {status};
}

std::vector<device::Device> IosBackend::list_devices(const core::Deadline& deadline) {
    auto result = runner_.run(tools_.idevice_id, {"-l"}, deadline);
    if (!result.success()) {
        spdlog::debug("[IosBackend] idevice_id -l failed: {}", result.diagnostic());
        return {};
    }

    std::vector<device::Device> devices;
    std::istringstream lines(result.stdout_text);
    std::string udid;
    while (lines >> udid) {
        device::Device device;
        device.id = udid;
        device.platform = device::PlatformKind::iOS;
        device.connection_state = device::ConnectionState::Online;
        devices.push_back(get_device_details(device, deadline));
    }
    return devices;
}

device::Device IosBackend::get_device_details(const device::Device& device, const core::Deadline& deadline) {
    auto result = runner_.run(tools_.ideviceinfo, {"-u", device.id}, deadline);
    if (!result.success()) {
        device::Device pending = device;
        if (indicates_pending_trust(result.stderr_text + result.stdout_text)) {
            pending.connection_state = device::ConnectionState::PendingTrust;
        }
        spdlog::debug("[IosBackend] ideviceinfo {}: {}", device.id, result.diagnostic());
        return pending;
    }
    return parse_ideviceinfo(result.stdout_text, device);
}

Result<process::ProcessPtr> IosBackend::start_log_stream(const std::string& device_id) {
    auto spawned = process::ChildProcess::spawn(tools_.idevicesyslog, {"-u", device_id});
    if (spawned.is_error()) {
        return spawned;
    }
    if (supervisor_ != nullptr) {
        supervisor_->track(spawned.value());
    }
    spdlog::debug("[IosBackend] idevicesyslog for {} running as pid {}", device_id, spawned.value()->pid());
    return spawned;
}

bool IosBackend::capture_screenshot(const std::string& device_id, const fs::path& destination,
                                    const core::Deadline& deadline) {
    return runner_.run(tools_.idevicescreenshot, {"-u", device_id, destination.string()},
                       kScreenshotTimeout, deadline).success();
}

bool IosBackend::pull_file(const std::string& device_id, const std::string& remote_path,
                           const fs::path& local_path, const core::Deadline& deadline) {
    auto result = runner_.run(tools_.afcclient, {"-u", device_id, "get", remote_path, local_path.string()},
                              kTransferTimeout, deadline);
    std::error_code ec;
    return result.success() && fs::exists(local_path, ec);
}

bool IosBackend::push_file(const std::string& device_id, const fs::path& local_path,
                           const std::string& remote_path, const core::Deadline& deadline) {
    return runner_.run(tools_.afcclient, {"-u", device_id, "put", local_path.string(), remote_path},
                       kTransferTimeout, deadline).success();
}

bool IosBackend::delete_file(const std::string& device_id, const std::string& remote_path,
                             const core::Deadline& deadline) {
    return runner_.run(tools_.afcclient, {"-u", device_id, "rm", "-rf", remote_path}, deadline).success();
}

std::vector<device::FileEntry> IosBackend::list_directory(const std::string& device_id, const std::string& path,
                                                          const core::Deadline& deadline) {
    const std::string target = path.empty() ? "/" : path;
    auto result = runner_.run(tools_.afcclient, {"-u", device_id, "ls", "-l", target}, deadline);
    if (!result.success()) {
        spdlog::debug("[IosBackend] afcclient ls {}: {}", target, result.diagnostic());
        return {};
    }
    return parse_ls_long(result.stdout_text, target);
}

std::vector<device::AppEntry> IosBackend::list_installed_apps(const std::string& device_id,
                                                              const core::Deadline& deadline) {
    auto result = runner_.run(tools_.ideviceinstaller, {"-u", device_id, "-l"}, kScreenshotTimeout, deadline);
    if (!result.success()) {
        return {};
    }
    return parse_ideviceinstaller_list(result.stdout_text);
}

device::OperationResult IosBackend::install_app(const std::string& device_id, const fs::path& package,
                                                const core::Deadline& deadline) {
    auto result = runner_.run(tools_.ideviceinstaller, {"-u", device_id, "-i", package.string()},
                              kInstallTimeout, deadline);
    if (result.success()) {
        return device::OperationResult::ok("IPA installed successfully.");
    }
    // ideviceinstaller reports some failures on stdout
    return device::OperationResult::failed("Failed to install IPA. Error: " + result.diagnostic());
}

device::OperationResult IosBackend::uninstall_app(const std::string& device_id, const std::string& package_id,
                                                  const core::Deadline& deadline) {
    auto result = runner_.run(tools_.ideviceinstaller, {"-u", device_id, "-U", package_id},
                              kUninstallTimeout, deadline);
    if (result.success() && result.stdout_text.find("Complete") != std::string::npos) {
        return device::OperationResult::ok("Uninstalled " + package_id + ".");
    }
    return device::OperationResult::failed(result.diagnostic());
}

} // namespace qadt::backends
