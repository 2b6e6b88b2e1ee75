#include "qadt/backends/parsers.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <sstream>

namespace qadt::backends {
using device::AppEntry;
using device::ConnectionState;
using device::Device;
using device::FileEntry;
using device::PlatformKind;

namespace {

std::string trim(const std::string& text, const char* chars = " \t\r\n") {
    const auto first = text.find_first_not_of(chars);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(chars);
    return text.substr(first, last - first + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream stream(line);
    std::string field;
    while (stream >> field) {
        fields.push_back(std::move(field));
    }
    return fields;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::string underscores_to_spaces(std::string text) {
    std::replace(text.begin(), text.end(), '_', ' ');
    return text;
}

std::string join_from(const std::vector<std::string>& fields, std::size_t first) {
    std::string joined;
    for (std::size_t i = first; i < fields.size(); ++i) {
        if (i > first) {
            joined.push_back(' ');
        }
        joined += fields[i];
    }
    return joined;
}

bool is_iso_date(const std::string& field) {
    static const std::regex pattern(R"(\d{4}-\d{2}-\d{2})");
    return std::regex_match(field, pattern);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void sort_apps(std::vector<AppEntry>& apps) {
    std::stable_sort(apps.begin(), apps.end(),
                     [](const AppEntry& a, const AppEntry& b) { return a.name < b.name; });
}

} // namespace

std::vector<Device> parse_adb_devices(const std::string& output) {
    std::vector<Device> devices;
    const auto lines = split_lines(output);

    for (const auto& raw : lines) {
        const std::string line = trim(raw);
        if (line.empty() || line.front() == '*' || starts_with(line, "List of devices")) {
            continue;
        }
        const auto fields = split_fields(line);
        if (fields.size() < 2) {
            continue;
        }

        Device device;
        device.id = fields[0];
        device.platform = PlatformKind::Android;
        if (fields[1] == "device") {
            device.connection_state = ConnectionState::Online;
        } else if (fields[1] == "unauthorized") {
            device.connection_state = ConnectionState::Unauthorized;
        } else {
            device.connection_state = ConnectionState::Offline;
        }

        for (std::size_t f = 2; f < fields.size(); ++f) {
            if (starts_with(fields[f], "model:")) {
                device.model = underscores_to_spaces(fields[f].substr(6));
            } else if (starts_with(fields[f], "device:")) {
                device.display_name = underscores_to_spaces(fields[f].substr(7));
            }
        }
        devices.push_back(std::move(device));
    }
    return devices;
}

std::optional<int> parse_battery_level(const std::string& output) {
    static const std::regex pattern(R"(level:\s*(\d+))");
    std::smatch match;
    if (!std::regex_search(output, match, pattern)) {
        return std::nullopt;
    }
    return std::stoi(match[1].str());
}

Device parse_ideviceinfo(const std::string& output, Device device) {
    for (const auto& raw : split_lines(output)) {
        const std::string line = trim(raw);
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = line.substr(0, colon);
        const std::string value = trim(line.substr(colon + 1));

        if (key == "DeviceName") {
            device.display_name = value;
        } else if (key == "ProductType") {
            device.model = value;
        } else if (key == "ProductVersion") {
            device.os_version = value;
        } else if (key == "BatteryCurrentCapacity" && !value.empty()) {
            device.battery_level = value + "%";
        }
    }
    if (device.model.empty()) {
        device.model = "iOS Device";
    }
    return device;
}

bool indicates_pending_trust(const std::string& output) {
    const std::string lower = to_lower(output);
    return lower.find("error") != std::string::npos ||
           lower.find("lockdown") != std::string::npos ||
           lower.find("could not connect") != std::string::npos;
}

std::vector<FileEntry> parse_ls_long(const std::string& output, const std::string& directory) {
    std::vector<FileEntry> entries;
    std::string base = directory;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }

    for (const auto& raw : split_lines(output)) {
        const std::string line = strip_ansi(raw);
        const auto fields = split_fields(line);
        if (fields.empty() || fields[0] == "total") {
            continue;
        }

        std::size_t name_field = 0;
        if (fields.size() >= 8 && is_iso_date(fields[5])) {
            name_field = 7;
        } else if (fields.size() >= 10) {
            name_field = 9;
        } else {
            continue;
        }

        const std::string& mode = fields[0];
        std::string name = join_from(fields, name_field);
        if (!mode.empty() && mode.front() == 'l') {
            if (auto arrow = name.find(" -> "); arrow != std::string::npos) {
                name.erase(arrow);
            }
        }
        if (name.empty() || name == "." || name == "..") {
            continue;
        }

        FileEntry entry;
        entry.name = name;
        entry.path = base == "/" ? "/" + name : base + "/" + name;
        entry.is_directory = !mode.empty() && mode.front() == 'd';
        try {
            entry.size = std::stoull(fields[4]);
        } catch (const std::exception&) {
            entry.size = 0;
        }
        entries.push_back(std::move(entry));
    }

    std::stable_sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        if (a.is_directory != b.is_directory) {
            return a.is_directory;
        }
        return a.name < b.name;
    });
    return entries;
}

std::vector<AppEntry> parse_pm_packages(const std::string& output) {
    std::vector<AppEntry> apps;
    for (const auto& raw : split_lines(output)) {
        const std::string line = trim(raw);
        if (!starts_with(line, "package:")) {
            continue;
        }
        std::string package = line.substr(8);
        // `pm list packages -f` prints "package:/data/app/.../base.apk=com.example"
        if (auto eq = package.rfind('='); eq != std::string::npos) {
            package = package.substr(eq + 1);
        }
        if (package.empty()) {
            continue;
        }
        apps.push_back(AppEntry{package, package, "", PlatformKind::Android});
    }
    sort_apps(apps);
    return apps;
}

std::vector<AppEntry> parse_ideviceinstaller_list(const std::string& output) {
    std::vector<AppEntry> apps;
    for (const auto& raw : split_lines(output)) {
        const std::string line = trim(raw);
        if (line.empty() || starts_with(line, "CFBundleIdentifier")) {
            continue;
        }

        std::vector<std::string> parts;
        std::size_t start = 0;
        while (parts.size() < 2) {
            const auto comma = line.find(',', start);
            if (comma == std::string::npos) {
                break;
            }
            parts.push_back(line.substr(start, comma - start));
            start = comma + 1;
        }
        parts.push_back(line.substr(start));

        AppEntry app;
        app.platform = PlatformKind::iOS;
        app.package_id = trim(parts[0]);
        app.version = parts.size() > 1 ? trim(parts[1], " \"") : "";
        app.name = parts.size() > 2 ? trim(parts[2], " \"") : app.package_id;
        if (app.name.empty()) {
            app.name = app.package_id;
        }
        if (!app.package_id.empty()) {
            apps.push_back(std::move(app));
        }
    }
    sort_apps(apps);
    return apps;
}

std::optional<std::string> parse_inet_address(const std::string& output) {
    static const std::regex pattern(R"(inet (\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))");
    std::smatch match;
    if (!std::regex_search(output, match, pattern)) {
        return std::nullopt;
    }
    return match[1].str();
}

bool adb_connect_succeeded(const std::string& output) {
    const std::string lower = to_lower(output);
    return lower.find("connected to") != std::string::npos &&
           lower.find("failed") == std::string::npos &&
           lower.find("unable") == std::string::npos;
}

bool am_start_succeeded(const std::string& output) {
    for (const auto& raw : split_lines(output)) {
        if (starts_with(trim(raw), "Error")) {
            return false;
        }
    }
    return true;
}

device::DeviceVitals parse_vitals(const std::string& meminfo, const std::string& top, std::size_t top_lines) {
    static const std::regex ram_line(R"(^\s*(Total|Free|Used) RAM:\s*([\d,]+)K)");

    device::DeviceVitals vitals;
    std::string summary;
    bool in_summary = false;
    for (const auto& line : split_lines(meminfo)) {
        if (!in_summary && line.find("Total RAM") == std::string::npos) {
            continue;
        }
        in_summary = true;
        summary += line;
        summary.push_back('\n');

        std::smatch match;
        if (!std::regex_search(line, match, ram_line)) {
            continue;
        }
        std::string digits = match[2].str();
        digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
        if (digits.empty() || digits.size() > 18) {
            continue;
        }
        const std::uint64_t kb = std::stoull(digits);
        if (match[1] == "Total") {
            vitals.total_ram_kb = kb;
        } else if (match[1] == "Free") {
            vitals.free_ram_kb = kb;
        } else {
            vitals.used_ram_kb = kb;
        }
    }
    vitals.memory_summary = trim(summary);

    std::string head;
    std::size_t taken = 0;
    for (const auto& line : split_lines(top)) {
        if (taken++ == top_lines) {
            break;
        }
        head += line;
        head.push_back('\n');
    }
    vitals.top_processes = trim(head);
    return vitals;
}

std::vector<std::string> split_command_line(const std::string& text) {
    std::vector<std::string> args;
    std::string current;
    bool in_token = false;
    char quote = '\0';
    for (char c : text) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current.push_back(c);
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                args.push_back(std::move(current));
                current.clear();
                in_token = false;
            }
        } else {
            current.push_back(c);
            in_token = true;
        }
    }
    if (in_token) {
        args.push_back(std::move(current));
    }
    return args;
}

std::optional<std::string> extract_version(const std::string& output) {
    static const std::regex pattern(R"((\d+\.\d+(\.\d+)?))");
    std::smatch match;
    if (!std::regex_search(output, match, pattern)) {
        return std::nullopt;
    }
    return match[1].str();
}

std::string strip_ansi(const std::string& text) {
    static const std::regex pattern("\x1B\\[[^a-zA-Z]*[a-zA-Z]");
    return std::regex_replace(text, pattern, "");
}

std::string shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

} // namespace qadt::backends
