#include "qadt/session/manager.hpp"

#include "qadt/core/clock.hpp"
#include "qadt/events/events.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace qadt::session {
namespace fs = std::filesystem;

namespace {

constexpr auto kKillWait = std::chrono::milliseconds(2000);

std::string join_lines(const std::vector<std::string>& lines) {
    std::string text;
    std::size_t total = lines.size();
    for (const auto& line : lines) {
        total += line.size();
    }
    text.reserve(total);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text.push_back('\n');
        }
        text += lines[i];
    }
    return text;
}

} // namespace

SessionManager::SessionManager(const core::Config& config,
                               device::BackendRegistry& registry,
                               device::TransportGate& gate,
                               events::EventBus& bus,
                               process::ProcessSupervisor* supervisor)
    : max_batch_lines_(config.max_batch_lines == 0 ? 1 : config.max_batch_lines),
      flush_interval_(config.flush_interval),
      gate_timeout_(config.gate_timeout),
      stop_grace_(config.stop_grace),
      registry_(registry),
      gate_(gate),
      bus_(bus),
      supervisor_(supervisor),
      store_(config.sessions_root),
      queue_(config.delivery_capacity),
      flush_timer_("log-flush") {}

SessionManager::~SessionManager() {
    shutting_down_ = true;
    stop_all_captures();
    join_background_stops(true);
    flush_timer_.stop();
}

// ════════════════════════════════════════════════════════
// Lifecycle
// ════════════════════════════════════════════════════════

Result<SessionPtr> SessionManager::create_session(const device::Device& device) {
    auto directory = store_.allocate(device);
    if (directory.is_error()) {
        spdlog::error("[SessionManager] Cannot create session for {}: {}", device.id, directory.error().message);
        return Err<SessionPtr>(directory.error());
    }

    SessionInfo info;
    info.session_id = CaptureSession::generate_id();
    info.device_id = device.id;
    info.device_name = device.label();
    info.platform = device.platform;
    info.session_directory = directory.value();
    info.log_file_path = directory.value() / SessionStore::log_file_name(device);

    auto session = std::make_shared<CaptureSession>(std::move(info));
    spdlog::info("[SessionManager] Created session {} for {} in {}",
                 session->session_id(), device.id, session->session_directory().string());
    bus_.emit(events::SessionListChangedEvent{session->session_id()});
    return Ok(std::move(session));
}

bool SessionManager::start_capture(const SessionPtr& session) {
    if (!session || shutting_down_) {
        return false;
    }
    if (!begin_capture(session)) {
        return false;
    }

    // Emitted with no lock held; handlers may start or stop other sessions
    spdlog::info("[SessionManager] Capturing {} into {}",
                 session->device_id(), session->log_file_path().string());
    bus_.emit(events::CaptureStartedEvent{session->info()});
    bus_.emit(events::SessionListChangedEvent{session->session_id()});
    return true;
}

bool SessionManager::begin_capture(const SessionPtr& session) {
    std::lock_guard start_lock(start_mutex_);

    {
        std::lock_guard lock(mutex_);
        if (active_.count(session->session_id()) > 0) {
            spdlog::debug("[SessionManager] Session {} is already capturing", session->session_id());
            return false;
        }
        for (const auto& [id, context] : active_) {
            if (context->session->device_id() == session->device_id()) {
                spdlog::warn("[SessionManager] Device {} already captured by session {}",
                             session->device_id(), id);
                return false;
            }
        }
    }
    if (session->status() != SessionStatus::Idle) {
        spdlog::warn("[SessionManager] Session {} is {}, cannot start",
                     session->session_id(), session_status_name(session->status()));
        return false;
    }

    auto backend = registry_.find(session->platform());
    if (!backend) {
        spdlog::error("[SessionManager] No {} backend registered", device::platform_name(session->platform()));
        return false;
    }

    auto spawned = gate_.run_exclusive(backend->backend_id(), gate_timeout_,
        [&](const core::Deadline&) { return backend->start_log_stream(session->device_id()); });
    if (spawned.is_error()) {
        spdlog::error("[SessionManager] Log stream for {}: {}", session->device_id(), spawned.error().describe());
        return false;
    }
    if (spawned.value().is_error()) {
        spdlog::error("[SessionManager] Log stream for {}: {}",
                      session->device_id(), spawned.value().error().describe());
        return false;
    }
    process::ProcessPtr process = spawned.value().value();
    if (supervisor_ != nullptr) {
        supervisor_->track(process);
    }

    auto discard = [&](const std::string& why) {
        spdlog::error("[SessionManager] {}: {}", error_kind_name(ErrorKind::Writer), why);
        auto killed = process->kill_tree();
        if (killed.is_error()) {
            spdlog::warn("[SessionManager] {}", killed.error().message);
        }
        process->close_output();
        if (!process->wait_for_exit(kKillWait)) {
            spdlog::warn("[SessionManager] Log stream pid {} did not exit", process->pid());
        }
    };

    auto context = std::make_unique<CaptureContext>();
    context->session = session;
    context->process = process;

    std::error_code ec;
    fs::create_directories(session->session_directory(), ec);
    context->writer.open(session->log_file_path(), std::ios::out | std::ios::app);
    if (!context->writer.is_open()) {
        discard("cannot open " + session->log_file_path().string());
        return false;
    }

    auto marked = session->mark_capturing(std::chrono::system_clock::now());
    if (marked.is_error()) {
        discard(marked.error().message);
        return false;
    }

    {
        // Readers start under the lock so a stop cannot see a half-built context
        std::lock_guard lock(mutex_);
        CaptureContext* raw = context.get();
        active_[session->session_id()] = std::move(context);
        raw->stdout_reader = std::thread(&SessionManager::read_stream, this, raw, false);
        raw->stderr_reader = std::thread(&SessionManager::read_stream, this, raw, true);
    }
    ensure_flush_timer();

    spdlog::debug("[SessionManager] Log stream of {} is pid {}", session->device_id(), process->pid());
    return true;
}

void SessionManager::stop_capture(const SessionPtr& session, const std::string& reason) {
    if (!session) {
        return;
    }
    stop_session(session->session_id(), reason);
}

bool SessionManager::stop_session(const std::string& session_id, const std::string& reason) {
    std::unique_ptr<CaptureContext> context;
    {
        std::lock_guard lock(mutex_);
        auto it = active_.find(session_id);
        if (it == active_.end()) {
            return false;
        }
        context = std::move(it->second);
        active_.erase(it);
    }

    context->stopping = true;
    {
        std::lock_guard lock(context->writer_mutex);
        context->writer.close();
    }

    auto& process = context->process;
    process->close_output();
    if (!process->wait_for_exit(stop_grace_)) {
        auto killed = process->kill();
        if (killed.is_error()) {
            spdlog::warn("[SessionManager] {}", killed.error().message);
        }
        if (!process->wait_for_exit(kKillWait)) {
            spdlog::error("[SessionManager] pid {} survived SIGKILL", process->pid());
        }
    }

    for (std::thread* reader : {&context->stdout_reader, &context->stderr_reader}) {
        if (reader->joinable() && reader->get_id() != std::this_thread::get_id()) {
            reader->join();
        }
    }

    flush_all();

    auto& session = context->session;
    auto stopped = session->mark_stopped(std::chrono::system_clock::now());
    if (stopped.is_error()) {
        spdlog::warn("[SessionManager] {}", stopped.error().message);
    }
    const SessionInfo info = session->info();
    auto written = store_.write_metadata(info);
    if (written.is_error()) {
        spdlog::warn("[SessionManager] Session sidecar: {}", written.error().message);
    }

    stop_flush_timer_if_idle();

    spdlog::info("[SessionManager] Stopped session {} ({} lines, {})", session_id, info.line_count, reason);
    bus_.emit(events::CaptureStoppedEvent{info, reason});
    bus_.emit(events::SessionListChangedEvent{session_id});
    return true;
}

SessionPtr SessionManager::stop_capture_for_device(const std::string& device_id,
                                                   const std::vector<SessionPtr>& known) {
    for (const auto& session : known) {
        if (session && session->device_id() == device_id && session->status() == SessionStatus::Capturing) {
            stop_capture(session, stop_reason::kDeviceDisconnected);
            return session;
        }
    }
    return nullptr;
}

void SessionManager::stop_all_captures() {
    std::vector<std::string> ids;
    {
        std::lock_guard lock(mutex_);
        for (const auto& entry : active_) {
            ids.push_back(entry.first);
        }
    }

    for (const auto& id : ids) {
        try {
            stop_session(id, stop_reason::kShutdown);
        } catch (const std::exception& e) {
            spdlog::error("[SessionManager] Failed to stop session {}: {}", id, e.what());
        }
    }
}

bool SessionManager::delete_session(const SessionPtr& session) {
    if (!session) {
        return false;
    }
    try {
        stop_capture(session);
        const bool removed = store_.remove(session->session_directory());
        if (removed) {
            spdlog::info("[SessionManager] Deleted session {}", session->session_directory().string());
            bus_.emit(events::SessionListChangedEvent{session->session_id()});
        }
        return removed;
    } catch (const std::exception& e) {
        spdlog::error("[SessionManager] Failed to delete session {}: {}", session->session_id(), e.what());
        return false;
    }
}

// ════════════════════════════════════════════════════════
// Stream consumption
// ════════════════════════════════════════════════════════

void SessionManager::read_stream(CaptureContext* context, bool from_stderr) {
    std::string line;
    auto& process = *context->process;
    while (from_stderr ? process.read_stderr_line(line) : process.read_stdout_line(line)) {
        append_line(*context, line);
    }

    if (!from_stderr && !context->stopping.load()) {
        spdlog::warn("[SessionManager] Log stream of {} ended on its own", context->session->device_id());
        schedule_stop(context->session->session_id(), stop_reason::kProcessExited);
    }
}

void SessionManager::append_line(CaptureContext& context, const std::string& raw) {
    std::string text = "[" + core::format_clock_millis(std::chrono::system_clock::now()) + "] " + raw;

    // One lock per context keeps file order and queue order identical
    std::lock_guard lock(context.writer_mutex);
    if (!context.writer.is_open()) {
        return;
    }
    if (!context.writer_failed) {
        context.writer << text << '\n';
        context.writer.flush();
        if (!context.writer) {
            context.writer_failed = true;
            spdlog::error("[SessionManager] Write to {} failed, delivery continues",
                          context.session->log_file_path().string());
        }
    }
    context.session->add_lines(1);
    queue_.try_push(std::move(text));
}

void SessionManager::schedule_stop(const std::string& session_id, const std::string& reason) {
    if (shutting_down_) {
        return;
    }
    join_background_stops(false);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard lock(background_mutex_);
    background_stops_.push_back(BackgroundStop{
        std::thread([this, session_id, reason, done]() {
            try {
                stop_session(session_id, reason);
            } catch (const std::exception& e) {
                spdlog::error("[SessionManager] Background stop of {} failed: {}", session_id, e.what());
            }
            done->store(true);
        }),
        done});
}

void SessionManager::join_background_stops(bool all) {
    std::vector<BackgroundStop> finished;
    {
        std::lock_guard lock(background_mutex_);
        for (auto it = background_stops_.begin(); it != background_stops_.end();) {
            if (all || it->done->load()) {
                finished.push_back(std::move(*it));
                it = background_stops_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Joined outside the lock: a stop in progress may be waiting on a reader
    // that is itself about to schedule a stop
    for (auto& stop : finished) {
        if (stop.thread.joinable()) {
            stop.thread.join();
        }
    }
}

// ════════════════════════════════════════════════════════
// Batched delivery
// ════════════════════════════════════════════════════════

void SessionManager::ensure_flush_timer() {
    std::lock_guard lock(timer_mutex_);
    if (!flush_timer_.running()) {
        flush_timer_.start(flush_interval_, [this]() { flush_batch(); });
    }
}

void SessionManager::stop_flush_timer_if_idle() {
    std::lock_guard lock(timer_mutex_);
    if (!has_active_capture()) {
        flush_timer_.stop();
    }
}

void SessionManager::flush_batch() {
    std::lock_guard lock(flush_mutex_);
    auto lines = queue_.drain(max_batch_lines_);
    if (lines.empty()) {
        return;
    }

    events::LogBatchReceivedEvent batch{join_lines(lines), lines.size()};
    bus_.emit(batch);

    BatchSink sink;
    {
        std::lock_guard sink_lock(sink_mutex_);
        sink = sink_;
    }
    if (sink) {
        sink(batch.text, batch.line_count);
    }
}

void SessionManager::flush_all() {
    std::lock_guard lock(flush_mutex_);
    while (!queue_.empty()) {
        const std::size_t before = queue_.size();
        flush_batch();
        if (queue_.size() >= before) {
            // A producer is mid-push; what it adds goes out with the next tick
            break;
        }
    }
}

void SessionManager::set_batch_sink(BatchSink sink) {
    std::lock_guard lock(sink_mutex_);
    sink_ = std::move(sink);
}

// ════════════════════════════════════════════════════════
// Queries
// ════════════════════════════════════════════════════════

std::optional<std::string> SessionManager::read_log_content(const SessionPtr& session, std::size_t max_lines) const {
    if (!session) {
        return std::nullopt;
    }
    auto lines = SessionStore::read_tail(session->log_file_path(), max_lines);
    if (!lines) {
        return std::nullopt;
    }
    return join_lines(*lines);
}

Result<fs::path> SessionManager::save_log_content(const SessionPtr& session, const std::string& text) {
    fs::path directory = session ? session->session_directory() : fs::path{};
    if (directory.empty()) {
        directory = store_.root();
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return Err<fs::path>(ErrorKind::Io, "Cannot create " + directory.string() + ": " + ec.message());
    }

    fs::path target = session ? session->log_file_path() : fs::path{};
    if (target.empty()) {
        target = directory / ("manual_log_" + core::format_local(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S") + ".txt");
    }

    std::ofstream output(target, std::ios::out | std::ios::trunc);
    if (!output) {
        return Err<fs::path>(ErrorKind::Writer, "Cannot open " + target.string());
    }
    output << text;
    if (!output) {
        return Err<fs::path>(ErrorKind::Writer, "Short write to " + target.string());
    }
    spdlog::info("[SessionManager] Saved {} bytes to {}", text.size(), target.string());
    return Ok(std::move(target));
}

std::vector<SessionPtr> SessionManager::get_saved_sessions() const {
    std::vector<SessionPtr> sessions;
    for (auto& info : store_.list_saved()) {
        sessions.push_back(CaptureSession::restore(std::move(info)));
    }
    return sessions;
}

std::vector<SessionPtr> SessionManager::active_sessions() const {
    std::lock_guard lock(mutex_);
    std::vector<SessionPtr> sessions;
    sessions.reserve(active_.size());
    for (const auto& entry : active_) {
        sessions.push_back(entry.second->session);
    }
    return sessions;
}

SessionPtr SessionManager::active_session_for_device(const std::string& device_id) const {
    std::lock_guard lock(mutex_);
    for (const auto& entry : active_) {
        if (entry.second->session->device_id() == device_id) {
            return entry.second->session;
        }
    }
    return nullptr;
}

bool SessionManager::has_active_capture() const {
    std::lock_guard lock(mutex_);
    return !active_.empty();
}

} // namespace qadt::session
