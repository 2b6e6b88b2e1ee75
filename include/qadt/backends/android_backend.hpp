#pragma once

#include "qadt/core/config.hpp"
#include "qadt/device/backend.hpp"
#include "qadt/process/command_runner.hpp"
#include "qadt/process/supervisor.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace qadt::backends {

/**
 * @brief DeviceBackend over the adb command-line client
 *
 * Every device is addressed with `adb -s <serial>`. All devices share one
 * adb server, so the gate key is "adb".
 */
class AndroidBackend : public device::DeviceBackend {
public:
    AndroidBackend(const core::ToolPaths& tools,
                   process::ProcessSupervisor* supervisor,
                   std::chrono::milliseconds command_timeout = std::chrono::milliseconds(10000));

    [[nodiscard]] std::string backend_id() const override { return "adb"; }
    [[nodiscard]] device::PlatformKind platform() const override { return device::PlatformKind::Android; }

    std::vector<device::ToolStatus> check_availability(const core::Deadline& deadline) override;

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

    // `getprop <property>`, nullopt when the command fails
    std::optional<std::string> get_property(const std::string& serial, const std::string& property,
                                            const core::Deadline& deadline);

    static constexpr int kDefaultWirelessPort = 5555;

    /**
     * @brief Switch a USB-attached device to adb over TCP (`tcpip <port>`)
     *
     * On success the message is the device's wlan0 address when it can be
     * read, otherwise a hint on where to find it.
     */
    device::OperationResult enable_wireless(const std::string& serial, int port, const core::Deadline& deadline);

    // `adb connect host:port`; the device then lists under that name
    device::OperationResult connect_wireless(const std::string& host, int port, const core::Deadline& deadline);
    device::OperationResult disconnect_wireless(const std::string& host, int port, const core::Deadline& deadline);

    /**
     * @brief Run a typed adb command line against one device
     *
     * "shell ls /sdcard" runs `adb -s <serial> shell ls /sdcard`. The
     * result carries exit code and both streams as they came back.
     * Errors: InvalidArgument for an empty command line.
     */
    Result<process::CommandResult> execute_command(const std::string& serial, const std::string& command_line,
                                                   const core::Deadline& deadline);

    // Memory summary and process table; nullopt if neither query answered
    std::optional<device::DeviceVitals> query_vitals(const std::string& serial, const core::Deadline& deadline);

    // Open a URL or intent URI with `am start -a android.intent.action.VIEW -d <uri>`
    device::OperationResult fire_intent(const std::string& serial, const std::string& uri,
                                        const core::Deadline& deadline);

private:
    process::CommandResult adb(const std::string& serial,
                               std::vector<std::string> args,
                               std::chrono::milliseconds timeout,
                               const core::Deadline& deadline) const;

    std::string adb_;
    process::ProcessSupervisor* supervisor_;
    process::CommandRunner runner_;
};

} // namespace qadt::backends
