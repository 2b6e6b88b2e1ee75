#include "qadt/backends/android_backend.hpp"
#include "qadt/backends/ios_backend.hpp"
#include "qadt/backends/mirror_controller.hpp"
#include "qadt/core/clock.hpp"
#include "qadt/core/config.hpp"
#include "qadt/core/logging.hpp"
#include "qadt/device/backend.hpp"
#include "qadt/device/monitor.hpp"
#include "qadt/device/transport_gate.hpp"
#include "qadt/events/components.hpp"
#include "qadt/events/event_bus.hpp"
#include "qadt/events/events.hpp"
#include "qadt/process/supervisor.hpp"
#include "qadt/session/auto_capture.hpp"
#include "qadt/session/manager.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

std::atomic<bool> g_stop_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

struct Options {
    std::optional<fs::path> config;
    std::optional<fs::path> sessions;
    std::optional<std::chrono::milliseconds> interval;
    std::optional<std::string> log_level;
    std::optional<std::string> mirror;
    bool no_auto_capture = false;
    bool follow = false;
    bool list_sessions = false;
    bool help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <file>      settings file (default: " << qadt::core::Config::default_settings_path().string() << ")\n"
              << "  --sessions <dir>     sessions root directory\n"
              << "  --interval <ms>      device poll interval\n"
              << "  --no-auto-capture    do not start captures on connect\n"
              << "  --follow             print captured log lines to stdout\n"
              << "  --list-sessions      print saved sessions and exit\n"
              << "  --mirror <serial>    mirror an Android device with scrcpy\n"
              << "  --log-level <level>  trace|debug|info|warn|error\n";
}

std::optional<Options> parse_options(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config = fs::path(argv[++i]);
        } else if (arg == "--sessions" && i + 1 < argc) {
            options.sessions = fs::path(argv[++i]);
        } else if (arg == "--interval" && i + 1 < argc) {
            auto interval = qadt::core::parse_interval_ms(argv[++i]);
            if (interval.is_error()) {
                std::cerr << "Invalid --interval value: " << interval.error().message << "\n";
                return std::nullopt;
            }
            options.interval = interval.value();
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.log_level = argv[++i];
        } else if (arg == "--mirror" && i + 1 < argc) {
            options.mirror = argv[++i];
        } else if (arg == "--no-auto-capture") {
            options.no_auto_capture = true;
        } else if (arg == "--follow") {
            options.follow = true;
        } else if (arg == "--list-sessions") {
            options.list_sessions = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return options;
}

void print_saved_sessions(const qadt::session::SessionManager& manager) {
    const auto sessions = manager.get_saved_sessions();
    if (sessions.empty()) {
        std::cout << "No saved sessions under " << manager.sessions_root().string() << "\n";
        return;
    }
    for (const auto& session : sessions) {
        const auto start = session->start_time();
        std::cout << session->session_id() << "  "
                  << qadt::device::platform_name(session->platform()) << "  "
                  << session->device_name() << "  "
                  << (start ? qadt::core::format_local(*start, "%Y-%m-%d %H:%M:%S") : std::string("-")) << "  "
                  << session->session_directory().string() << "\n";
    }
}

void report_tools(qadt::device::BackendRegistry& registry,
                  qadt::device::TransportGate& gate,
                  const qadt::backends::MirrorController& mirror,
                  std::chrono::milliseconds timeout) {
    std::vector<qadt::device::ToolStatus> statuses;
    for (const auto& backend : registry.all()) {
        auto checked = gate.run_exclusive(backend->backend_id(), timeout,
            [&](const qadt::core::Deadline& deadline) { return backend->check_availability(deadline); });
        if (checked.is_error()) {
            spdlog::warn("[Daemon] {} tool check: {}", backend->backend_id(), checked.error().describe());
            continue;
        }
        statuses.insert(statuses.end(), checked.value().begin(), checked.value().end());
    }
    statuses.push_back(mirror.check_availability(qadt::core::Deadline::after(timeout)));

    for (const auto& status : statuses) {
        if (status.installed) {
            spdlog::info("[Daemon] {} {} ({})", status.name, status.version, status.path);
        } else {
            spdlog::warn("[Daemon] {}: {}", status.name, status.message);
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_options(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }
    if (options->help) {
        print_usage(argv[0]);
        return 0;
    }

    const fs::path settings_path = options->config.value_or(qadt::core::Config::default_settings_path());
    auto loaded = qadt::core::Config::load(settings_path);
    qadt::core::Config config = loaded.is_ok() ? loaded.value() : qadt::core::Config{};

    if (options->sessions) {
        config.sessions_root = *options->sessions;
    }
    if (options->interval) {
        config.poll_interval = *options->interval;
    }
    if (options->log_level) {
        config.logging.level = *options->log_level;
    }
    if (options->no_auto_capture) {
        config.auto_capture = false;
    }
    if (options->follow) {
        config.logging.console_stderr = true;
    }

    qadt::core::init_logging(config.logging);
    if (loaded.is_error()) {
        spdlog::warn("[Daemon] {}; using defaults", loaded.error().describe());
    }

    qadt::events::EventBus event_bus;
    qadt::process::ProcessSupervisor supervisor;
    qadt::device::TransportGate gate;

    qadt::device::BackendRegistry registry;
    registry.add(std::make_shared<qadt::backends::AndroidBackend>(config.tools, &supervisor, config.command_timeout));
    registry.add(std::make_shared<qadt::backends::IosBackend>(config.tools, &supervisor, config.command_timeout));

    qadt::session::SessionManager manager(config, registry, gate, event_bus, &supervisor);

    if (options->list_sessions) {
        print_saved_sessions(manager);
        return 0;
    }

    qadt::events::LoggerComponent logger(event_bus);
    std::unique_ptr<qadt::events::EventInbox<qadt::events::LogBatchReceivedEvent>> inbox;
    if (options->follow) {
        inbox = std::make_unique<qadt::events::EventInbox<qadt::events::LogBatchReceivedEvent>>(event_bus);
    }

    qadt::backends::MirrorController mirror(config.tools.scrcpy, &supervisor);
    qadt::device::DeviceMonitor monitor(registry, gate, event_bus, config.command_timeout);
    qadt::session::AutoCaptureComponent auto_capture(event_bus, manager, config.auto_capture);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("[Daemon] Sessions root: {}", manager.sessions_root().string());
    spdlog::info("[Daemon] Auto-capture {}", auto_capture.enabled() ? "enabled" : "disabled");
    report_tools(registry, gate, mirror, config.command_timeout);

    if (options->mirror && !mirror.start(*options->mirror)) {
        spdlog::warn("[Daemon] Screen mirror for {} did not start", *options->mirror);
    }

    monitor.start_monitoring(config.poll_interval);
    spdlog::info("[Daemon] Polling devices every {} ms. Press Ctrl+C to stop.", config.poll_interval.count());

    while (!g_stop_requested) {
        if (inbox) {
            if (auto batch = inbox->next_for(200ms)) {
                std::cout << batch->text << '\n';
                std::cout.flush();
            }
        } else {
            std::this_thread::sleep_for(200ms);
        }
    }

    spdlog::info("[Daemon] Shutting down");
    monitor.stop_monitoring();
    manager.stop_all_captures();
    mirror.stop();
    const auto killed = supervisor.kill_all_tracked();
    if (killed > 0) {
        spdlog::warn("[Daemon] Killed {} leftover process(es)", killed);
    }
    if (manager.dropped_line_count() > 0) {
        spdlog::warn("[Daemon] {} log line(s) were not delivered (buffer full)", manager.dropped_line_count());
    }
    if (inbox) {
        inbox->close();
        if (inbox->dropped() > 0) {
            spdlog::warn("[Daemon] {} log batch(es) were not printed (console fell behind)", inbox->dropped());
        }
    }

    spdlog::info("[Daemon] Stopped");
    spdlog::default_logger()->flush();
    return 0;
}
