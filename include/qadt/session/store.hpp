#pragma once

#include "qadt/core/clock.hpp"
#include "qadt/core/result.hpp"
#include "qadt/device/types.hpp"
#include "qadt/session/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qadt::session {

/**
 * @brief On-disk layout of capture sessions
 *
 * LAYOUT:
 * <root>/
 *   Pixel_7_03.15.42PM_18.10.2026/
 *     Android_SER123_log.txt      primary log
 *     session.json                sidecar written when the capture stops
 *     screenshot_*.png            optional artifacts
 *
 * Directory names come from a sanitized device label and the local creation
 * time. A second directory with the same name within the same second gets
 * a "_2", "_3", ... suffix.
 */
class SessionStore {
public:
    static constexpr const char* kMetadataFile = "session.json";

    explicit SessionStore(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /**
     * @brief Create a fresh, collision-free session directory for device
     * @return the created directory
     */
    Result<std::filesystem::path> allocate(const device::Device& device,
                                           core::SystemTime now = std::chrono::system_clock::now());

    static std::string directory_name(const std::string& label, core::SystemTime time);
    static std::string sanitize_label(const std::string& label);
    static std::string log_file_name(const device::Device& device);

    // Creation time encoded in a directory name, if it follows the layout
    static std::optional<core::SystemTime> parse_directory_time(const std::string& name);

    Result<void> write_metadata(const SessionInfo& info) const;
    Result<SessionInfo> read_metadata(const std::filesystem::path& directory) const;

    /**
     * @brief Stopped sessions reconstructed from the directories under root
     *
     * Newest first. Uses the sidecar when present, the directory name and
     * the log file's modification time otherwise.
     */
    [[nodiscard]] std::vector<SessionInfo> list_saved() const;

    /**
     * @brief Last max_lines lines of a file
     * @return nullopt if the file does not exist or cannot be read
     */
    static std::optional<std::vector<std::string>> read_tail(const std::filesystem::path& file,
                                                             std::size_t max_lines);

    // Recursive delete; false if the directory did not exist or removal failed
    bool remove(const std::filesystem::path& directory) const noexcept;

private:
    static std::optional<std::filesystem::path> find_log_file(const std::filesystem::path& directory);

    std::filesystem::path root_;
};

} // namespace qadt::session
