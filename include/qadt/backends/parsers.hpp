/**
 * @file parsers.hpp
 * @brief Pure parsers for the text output of adb and libimobiledevice tools
 *
 * Kept free of process handling so they can be tested against captured
 * output without a device attached.
 */

#pragma once

#include "qadt/device/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace qadt::backends {

/**
 * @brief Parse `adb devices -l`
 *
 * INPUT:
 *   List of devices attached
 *   SER123   device usb:1-1 product:panther model:Pixel_7 device:panther
 *   emulator-5554 unauthorized
 *
 * The header and daemon chatter ("* daemon started ...") are skipped.
 * "device" maps to Online, "unauthorized" to Unauthorized, anything else to
 * Offline. model: and device: values have '_' replaced by ' '.
 */
std::vector<device::Device> parse_adb_devices(const std::string& output);

// "level: 87" from `dumpsys battery`
std::optional<int> parse_battery_level(const std::string& output);

// "Key: value" lines of `ideviceinfo`; fills name, model, OS version and battery
device::Device parse_ideviceinfo(const std::string& output, device::Device device);

// ideviceinfo failed because the host is not paired/trusted yet
bool indicates_pending_trust(const std::string& output);

/**
 * @brief Parse `ls -l` from `adb shell` (toybox) or `afcclient`
 *
 * Handles both the ISO date layout (name from field 8) and the classic
 * "Mon DD HH:MM YYYY" layout (name from field 10). "total", "." and ".."
 * are skipped, symlink targets stripped. Directories first, then by name.
 */
std::vector<device::FileEntry> parse_ls_long(const std::string& output, const std::string& directory);

// "package:com.example.app" lines of `pm list packages`, sorted by name
std::vector<device::AppEntry> parse_pm_packages(const std::string& output);

/**
 * @brief Parse `ideviceinstaller -l`
 *
 * INPUT:
 *   CFBundleIdentifier, CFBundleVersion, CFBundleDisplayName
 *   com.example.app, "1.2", "Example"
 */
std::vector<device::AppEntry> parse_ideviceinstaller_list(const std::string& output);

// IPv4 address of the first "inet a.b.c.d/nn" line of `ip -f inet addr show`
std::optional<std::string> parse_inet_address(const std::string& output);

// `adb connect` exits 0 on refusal too; only "connected to" means success
bool adb_connect_succeeded(const std::string& output);

// `am start` reports an unresolved intent on an "Error:" line with exit 0
bool am_start_succeeded(const std::string& output);

/**
 * @brief Combine `dumpsys meminfo` and `top -b -n 1` into one vitals sample
 *
 * INPUT (meminfo tail):
 *   Total RAM: 7,651,088K (status normal)
 *    Free RAM: 3,452,996K ( 1,084,920K cached pss + ...)
 *    Used RAM: 4,013,836K ( 3,211,372K used pss + ...)
 *
 * The memory summary is everything from the "Total RAM" line on, trimmed;
 * the process table keeps the first `top_lines` lines.
 */
device::DeviceVitals parse_vitals(const std::string& meminfo, const std::string& top, std::size_t top_lines = 15);

/**
 * @brief Split a typed adb command line into arguments
 *
 * Whitespace separates arguments; single and double quotes group them and
 * are removed. An unterminated quote runs to the end of the line.
 */
std::vector<std::string> split_command_line(const std::string& text);

// First dotted version number ("1.0.41", "2.4") in a tool's banner
std::optional<std::string> extract_version(const std::string& output);

std::string strip_ansi(const std::string& text);

// Single-quote for the device-side shell of `adb shell`
std::string shell_quote(const std::string& text);

} // namespace qadt::backends
