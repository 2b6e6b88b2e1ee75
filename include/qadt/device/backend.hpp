#pragma once

#include "qadt/core/deadline.hpp"
#include "qadt/core/result.hpp"
#include "qadt/device/types.hpp"
#include "qadt/process/child_process.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace qadt::device {

/**
 * @brief Capability interface over one device family's command-line tools
 *
 * The core talks to devices only through this interface. Every call that
 * runs a command is expected to go through the TransportGate, which hands
 * in the deadline the backend must pass to each command it runs.
 *
 * Operations fail soft: empty lists, false, or an OperationResult carrying
 * the reason. Implementations log the detail.
 */
class DeviceBackend {
public:
    virtual ~DeviceBackend() = default;

    // Key of the shared transport in the TransportGate ("adb", "usbmuxd")
    [[nodiscard]] virtual std::string backend_id() const = 0;
    [[nodiscard]] virtual PlatformKind platform() const = 0;

    virtual std::vector<ToolStatus> check_availability(const core::Deadline& deadline) = 0;

    virtual std::vector<Device> list_devices(const core::Deadline& deadline) = 0;
    virtual Device get_device_details(const Device& device, const core::Deadline& deadline) = 0;

    /**
     * @brief Spawn the long-running log stream for one device
     *
     * The returned child writes raw log lines on stdout. It has no timeout:
     * it runs until stopped or the device goes away.
     */
    virtual Result<process::ProcessPtr> start_log_stream(const std::string& device_id) = 0;

    virtual bool capture_screenshot(const std::string& device_id,
                                    const std::filesystem::path& destination,
                                    const core::Deadline& deadline) = 0;

    virtual bool pull_file(const std::string& device_id, const std::string& remote_path,
                           const std::filesystem::path& local_path, const core::Deadline& deadline) = 0;
    virtual bool push_file(const std::string& device_id, const std::filesystem::path& local_path,
                           const std::string& remote_path, const core::Deadline& deadline) = 0;
    virtual bool delete_file(const std::string& device_id, const std::string& remote_path,
                             const core::Deadline& deadline) = 0;
    virtual std::vector<FileEntry> list_directory(const std::string& device_id, const std::string& path,
                                                  const core::Deadline& deadline) = 0;

    virtual std::vector<AppEntry> list_installed_apps(const std::string& device_id,
                                                      const core::Deadline& deadline) = 0;
    virtual OperationResult install_app(const std::string& device_id, const std::filesystem::path& package,
                                        const core::Deadline& deadline) = 0;
    virtual OperationResult uninstall_app(const std::string& device_id, const std::string& package_id,
                                          const core::Deadline& deadline) = 0;
};

using BackendPtr = std::shared_ptr<DeviceBackend>;

/**
 * @brief Backends keyed by platform kind, kept in registration order
 */
class BackendRegistry {
public:
    // Replaces a backend already registered for the same platform
    void add(BackendPtr backend);

    [[nodiscard]] BackendPtr find(PlatformKind kind) const;
    [[nodiscard]] const std::vector<BackendPtr>& all() const noexcept { return backends_; }
    [[nodiscard]] bool empty() const noexcept { return backends_.empty(); }

private:
    std::vector<BackendPtr> backends_;
};

} // namespace qadt::device
