#include "qadt/core/logging.hpp"

#include "support/test_utils.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using qadt::core::LoggingConfig;
using qadt::core::init_logging;
using qadt::core::parse_level;
using qadt::test_support::TempDir;
using qadt::test_support::read_file;

TEST(Logging, ParseLevel) {
    EXPECT_EQ(parse_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_level("nonsense"), spdlog::level::info);
}

TEST(Logging, FileSinkReceivesMessages) {
    TempDir temp;
    auto previous = spdlog::default_logger();

    LoggingConfig config;
    config.level = "debug";
    config.file = temp.path() / "logs" / "qadt.log";
    init_logging(config);

    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
    spdlog::warn("[LoggingTest] written to file");
    spdlog::default_logger()->flush();

    EXPECT_NE(read_file(config.file).find("[LoggingTest] written to file"), std::string::npos);

    spdlog::set_default_logger(previous);
}

TEST(Logging, ConsoleSinkMovesToStderrOnRequest) {
    auto previous = spdlog::default_logger();

    LoggingConfig config;
    init_logging(config);
    auto sinks = spdlog::default_logger()->sinks();
    ASSERT_EQ(sinks.size(), 1u);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(sinks[0]), nullptr);

    config.console_stderr = true;
    init_logging(config);
    sinks = spdlog::default_logger()->sinks();
    ASSERT_EQ(sinks.size(), 1u);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(sinks[0]), nullptr);
    EXPECT_EQ(std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(sinks[0]), nullptr);

    spdlog::set_default_logger(previous);
}
