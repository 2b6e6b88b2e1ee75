#include "qadt/session/store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <deque>
#include <fstream>
#include <sstream>
#include <system_error>

namespace qadt::session {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kFallbackLabel = "device";
constexpr const char* kLogSuffix = "_log.txt";

bool is_invalid_name_char(unsigned char c) {
    if (c < 0x20 || c == 0x7f) {
        return true;
    }
    switch (c) {
        case '/': case '\\': case '<': case '>': case ':':
        case '"': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(text);
    while (std::getline(stream, current, separator)) {
        parts.push_back(current);
    }
    return parts;
}

bool all_digits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Index of the time token in a split directory name, skipping a "_N" suffix
std::optional<std::size_t> time_token_index(const std::vector<std::string>& parts) {
    std::size_t end = parts.size();
    if (end >= 1 && all_digits(parts[end - 1])) {
        --end;
    }
    if (end < 3) {
        return std::nullopt;
    }
    return end - 2;
}

core::SystemTime to_system_time(fs::file_time_type file_time) {
    const auto now_file = fs::file_time_type::clock::now();
    const auto now_sys = std::chrono::system_clock::now();
    return now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(file_time - now_file);
}

std::optional<core::SystemTime> optional_time(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return core::from_epoch_ms(j.at(key).get<std::int64_t>());
}

// "{Platform}_{serial}_log.txt" back to platform and serial
void apply_log_file_name(const std::string& file_name, SessionInfo& info) {
    if (file_name.size() <= std::char_traits<char>::length(kLogSuffix) ||
        file_name.compare(file_name.size() - std::char_traits<char>::length(kLogSuffix),
                          std::string::npos, kLogSuffix) != 0) {
        return;
    }
    const std::string stem = file_name.substr(0, file_name.size() - std::char_traits<char>::length(kLogSuffix));
    const auto underscore = stem.find('_');
    if (underscore == std::string::npos) {
        return;
    }
    if (auto platform = device::parse_platform(stem.substr(0, underscore))) {
        info.platform = *platform;
        info.device_id = stem.substr(underscore + 1);
    }
}

} // namespace

SessionStore::SessionStore(fs::path root) : root_(std::move(root)) {}

std::string SessionStore::sanitize_label(const std::string& label) {
    std::vector<std::string> pieces;
    std::string current;
    for (unsigned char c : label) {
        if (is_invalid_name_char(c)) {
            if (!current.empty()) {
                pieces.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(static_cast<char>(c));
        }
    }
    if (!current.empty()) {
        pieces.push_back(std::move(current));
    }

    std::string joined;
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        if (i > 0) {
            joined.push_back('_');
        }
        joined += pieces[i];
    }

    const auto first = joined.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return kFallbackLabel;
    }
    const auto last = joined.find_last_not_of(" \t");
    joined = joined.substr(first, last - first + 1);

    if (joined == "." || joined == "..") {
        return kFallbackLabel;
    }
    return joined;
}

std::string SessionStore::directory_name(const std::string& label, core::SystemTime time) {
    return sanitize_label(label) + "_" + core::format_local(time, "%I.%M.%S%p") + "_" +
           core::format_local(time, "%d.%m.%Y");
}

std::string SessionStore::log_file_name(const device::Device& device) {
    return std::string(device::platform_name(device.platform)) + "_" + sanitize_label(device.id) + kLogSuffix;
}

std::optional<core::SystemTime> SessionStore::parse_directory_time(const std::string& name) {
    const auto parts = split(name, '_');
    const auto index = time_token_index(parts);
    if (!index) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    char meridiem[3] = {0, 0, 0};
    if (std::sscanf(parts[*index].c_str(), "%2d.%2d.%2d%2c", &hour, &minute, &second, meridiem) != 4) {
        return std::nullopt;
    }
    int day = 0;
    int month = 0;
    int year = 0;
    if (std::sscanf(parts[*index + 1].c_str(), "%2d.%2d.%4d", &day, &month, &year) != 3) {
        return std::nullopt;
    }

    const std::string am_pm(meridiem, 2);
    if (hour < 1 || hour > 12 || (am_pm != "AM" && am_pm != "PM")) {
        return std::nullopt;
    }
    hour %= 12;
    if (am_pm == "PM") {
        hour += 12;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return core::from_local_tm(tm);
}

Result<fs::path> SessionStore::allocate(const device::Device& device, core::SystemTime now) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return Err<fs::path>(ErrorKind::Io, "Cannot create sessions root " + root_.string() + ": " + ec.message());
    }

    const std::string base = directory_name(device.label(), now);
    for (int attempt = 1; attempt < 1000; ++attempt) {
        const fs::path candidate = root_ / (attempt == 1 ? base : base + "_" + std::to_string(attempt));
        // create_directory reports false when the name is taken
        if (fs::create_directory(candidate, ec)) {
            return Ok(candidate);
        }
        if (ec) {
            return Err<fs::path>(ErrorKind::Io, "Cannot create " + candidate.string() + ": " + ec.message());
        }
    }
    return Err<fs::path>(ErrorKind::Io, "No free session directory name for " + base);
}

Result<void> SessionStore::write_metadata(const SessionInfo& info) const {
    if (info.session_directory.empty()) {
        return Err<void>(ErrorKind::InvalidArgument, "Session has no directory");
    }

    json j;
    j["session_id"] = info.session_id;
    j["device_id"] = info.device_id;
    j["device_name"] = info.device_name;
    j["platform"] = device::platform_name(info.platform);
    j["log_file"] = info.log_file_path.filename().string();
    j["start_time"] = info.start_time ? json(core::to_epoch_ms(*info.start_time)) : json(nullptr);
    j["end_time"] = info.end_time ? json(core::to_epoch_ms(*info.end_time)) : json(nullptr);
    j["line_count"] = info.line_count;

    const fs::path target = info.session_directory / kMetadataFile;
    const fs::path temp = info.session_directory / (std::string(kMetadataFile) + ".tmp");
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorKind::Io, "Cannot write " + temp.string());
        }
        output << j.dump(2) << '\n';
        if (!output) {
            return Err<void>(ErrorKind::Io, "Short write to " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Cannot replace " + target.string() + ": " + ec.message());
    }
    return Ok();
}

Result<SessionInfo> SessionStore::read_metadata(const fs::path& directory) const {
    const fs::path file = directory / kMetadataFile;
    std::ifstream input(file);
    if (!input) {
        return Err<SessionInfo>(ErrorKind::NotFound, "No metadata in " + directory.string());
    }

    const json j = json::parse(input, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Err<SessionInfo>(ErrorKind::InvalidArgument, "Malformed " + file.string());
    }

    SessionInfo info;
    try {
        info.session_id = j.value("session_id", std::string{});
        info.device_id = j.value("device_id", std::string{});
        info.device_name = j.value("device_name", std::string{});
        info.platform = device::parse_platform(j.value("platform", std::string{}))
                            .value_or(device::PlatformKind::Android);
        const std::string log_file = j.value("log_file", std::string{});
        if (!log_file.empty()) {
            info.log_file_path = directory / log_file;
        }
        info.start_time = optional_time(j, "start_time");
        info.end_time = optional_time(j, "end_time");
        info.line_count = j.value("line_count", std::size_t{0});
    } catch (const json::exception& e) {
        return Err<SessionInfo>(ErrorKind::InvalidArgument, "Invalid " + file.string() + ": " + e.what());
    }
    info.session_directory = directory;
    info.status = SessionStatus::Stopped;
    return Ok(std::move(info));
}

std::optional<fs::path> SessionStore::find_log_file(const fs::path& directory) {
    std::vector<fs::path> txt;
    std::vector<fs::path> log;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const auto ext = it->path().extension().string();
        if (ext == ".txt") {
            txt.push_back(it->path());
        } else if (ext == ".log") {
            log.push_back(it->path());
        }
    }
    std::sort(txt.begin(), txt.end());
    std::sort(log.begin(), log.end());
    if (!txt.empty()) {
        return txt.front();
    }
    if (!log.empty()) {
        return log.front();
    }
    return std::nullopt;
}

std::vector<SessionInfo> SessionStore::list_saved() const {
    std::vector<SessionInfo> sessions;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return sessions;
    }

    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory(ec)) {
            continue;
        }
        const fs::path directory = it->path();
        const std::string name = directory.filename().string();

        SessionInfo info;
        auto metadata = read_metadata(directory);
        if (metadata.is_ok()) {
            info = std::move(metadata.value());
        } else {
            if (metadata.error().kind != ErrorKind::NotFound) {
                spdlog::warn("[SessionStore] Ignoring sidecar: {}", metadata.error().message);
            }
            info.session_id = name;
            info.session_directory = directory;
            info.status = SessionStatus::Stopped;
            const auto parts = split(name, '_');
            if (auto index = time_token_index(parts)) {
                std::string label;
                for (std::size_t i = 0; i < *index; ++i) {
                    label += (i > 0 ? "_" : "") + parts[i];
                }
                info.device_name = label;
            }
        }

        std::error_code file_ec;
        if (info.log_file_path.empty() || !fs::exists(info.log_file_path, file_ec)) {
            if (auto log_file = find_log_file(directory)) {
                info.log_file_path = *log_file;
            } else {
                info.log_file_path.clear();
            }
        }
        if (info.device_id.empty() && !info.log_file_path.empty()) {
            apply_log_file_name(info.log_file_path.filename().string(), info);
        }

        if (!info.start_time) {
            info.start_time = parse_directory_time(name);
        }
        if (!info.start_time) {
            const auto written = fs::last_write_time(directory, file_ec);
            if (!file_ec) {
                info.start_time = to_system_time(written);
            }
        }
        if (!info.end_time && !info.log_file_path.empty()) {
            const auto written = fs::last_write_time(info.log_file_path, file_ec);
            if (!file_ec) {
                info.end_time = to_system_time(written);
            }
        }

        sessions.push_back(std::move(info));
    }

    std::sort(sessions.begin(), sessions.end(), [](const SessionInfo& a, const SessionInfo& b) {
        if (a.start_time != b.start_time) {
            // Newest first; sessions without a known time go last
            if (!a.start_time) return false;
            if (!b.start_time) return true;
            return *a.start_time > *b.start_time;
        }
        return a.session_directory.filename().string() > b.session_directory.filename().string();
    });
    return sessions;
}

std::optional<std::vector<std::string>> SessionStore::read_tail(const fs::path& file, std::size_t max_lines) {
    std::error_code ec;
    if (file.empty() || !fs::is_regular_file(file, ec)) {
        return std::nullopt;
    }
    std::ifstream input(file);
    if (!input) {
        return std::nullopt;
    }

    std::deque<std::string> tail;
    std::string line;
    while (std::getline(input, line)) {
        if (max_lines == 0) {
            continue;
        }
        if (tail.size() == max_lines) {
            tail.pop_front();
        }
        tail.push_back(std::move(line));
    }
    return std::vector<std::string>(std::make_move_iterator(tail.begin()), std::make_move_iterator(tail.end()));
}

bool SessionStore::remove(const fs::path& directory) const noexcept {
    std::error_code ec;
    if (directory.empty() || !fs::is_directory(directory, ec)) {
        return false;
    }
    fs::remove_all(directory, ec);
    if (ec) {
        spdlog::warn("[SessionStore] Could not delete {}: {}", directory.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace qadt::session
