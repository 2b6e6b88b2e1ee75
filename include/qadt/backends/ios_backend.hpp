#pragma once

#include "qadt/core/config.hpp"
#include "qadt/device/backend.hpp"
#include "qadt/process/command_runner.hpp"
#include "qadt/process/supervisor.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace qadt::backends {

/**
 * @brief DeviceBackend over the libimobiledevice tools
 *
 * idevice_id, ideviceinfo, idevicesyslog, idevicescreenshot,
 * ideviceinstaller and afcclient, each called with `-u <udid>`. All of them
 * go through usbmuxd, which is the gate key.
 */
class IosBackend : public device::DeviceBackend {
public:
    IosBackend(const core::ToolPaths& tools,
               process::ProcessSupervisor* supervisor,
               std::chrono::milliseconds command_timeout = std::chrono::milliseconds(10000));

    [[nodiscard]] std::string backend_id() const override { return "usbmuxd"; }
    [[nodiscard]] device::PlatformKind platform() const override { return device::PlatformKind::iOS; }

    std::vector<device::ToolStatus> check_availability(const core::Deadline& deadline) override;

    // Each UDID is enriched with ideviceinfo; untrusted devices come back PendingTrust
    std::vector<device::Device> list_devices(const core::Deadline& deadline) override;
    device::Device get_device_details(const device::Device& device, const core::Deadline& deadline) override;

    Result<process::ProcessPtr> start_log_stream(const std::string& device_id) override;

    bool capture_screenshot(const std::string& device_id, const std::filesystem::path& destination,
                            const core::Deadline& deadline) override;

    bool pull_file(const std::string& device_id, const std::string& remote_path,
                   const std::filesystem::path& local_path, const core::Deadline& deadline) override;
    bool push_file(const std::string& device_id, const std::filesystem::path& local_path,
                   const std::string& remote_path, const core::Deadline& deadline) override;
    bool delete_file(const std::string& device_id, const std::string& remote_path,
                     const core::Deadline& deadline) override;
    std::vector<device::FileEntry> list_directory(const std::string& device_id, const std::string& path,
                                                  const core::Deadline& deadline) override;

    std::vector<device::AppEntry> list_installed_apps(const std::string& device_id,
                                                      const core::Deadline& deadline) override;
    device::OperationResult install_app(const std::string& device_id, const std::filesystem::path& package,
                                        const core::Deadline& deadline) override;
    device::OperationResult uninstall_app(const std::string& device_id, const std::string& package_id,
                                          const core::Deadline& deadline) override;

private:
    core::ToolPaths tools_;
    process::ProcessSupervisor* supervisor_;
    process::CommandRunner runner_;
};

} // namespace qadt::backends
