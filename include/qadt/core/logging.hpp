#pragma once

#include "qadt/core/config.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace qadt::core {

/**
 * @brief Install the process-wide spdlog default logger
 *
 * Console sink always (stdout, or stderr with config.console_stderr); rotating file sink (5 MiB x 5 files) when
 * config.file is set. Falls back to console only if the file sink
 * cannot be created.
 */
void init_logging(const LoggingConfig& config);

spdlog::level::level_enum parse_level(const std::string& name);

} // namespace qadt::core
