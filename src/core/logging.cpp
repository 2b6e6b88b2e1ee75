#include "qadt/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <system_error>
#include <vector>

namespace qadt::core {
namespace {

constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 5;
constexpr const char* kPattern = "[%H:%M:%S] [%^%l%$] %v";

} // namespace

spdlog::level::level_enum parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console_stderr) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    std::string file_error;
    if (!config.file.empty()) {
        std::error_code ec;
        if (config.file.has_parent_path()) {
            std::filesystem::create_directories(config.file.parent_path(), ec);
        }
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), kMaxLogFileBytes, kMaxLogFiles));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("qadt", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(parse_level(config.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("[Logging] File sink {} unavailable, console only: {}", config.file.string(), file_error);
    }
}

} // namespace qadt::core
