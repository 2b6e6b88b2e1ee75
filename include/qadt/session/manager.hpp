#pragma once

#include "qadt/core/config.hpp"
#include "qadt/core/periodic_timer.hpp"
#include "qadt/core/result.hpp"
#include "qadt/device/backend.hpp"
#include "qadt/device/transport_gate.hpp"
#include "qadt/events/event_bus.hpp"
#include "qadt/process/child_process.hpp"
#include "qadt/process/supervisor.hpp"
#include "qadt/session/log_buffer.hpp"
#include "qadt/session/session.hpp"
#include "qadt/session/store.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace qadt::session {

namespace stop_reason {
constexpr const char* kRequested = "requested";
constexpr const char* kDeviceDisconnected = "device_disconnected";
constexpr const char* kProcessExited = "process_exited";
constexpr const char* kShutdown = "shutdown";
} // namespace stop_reason

/**
 * @brief Owns every active capture: its log-stream process, its file writer
 *        and its reader threads
 *
 * WHAT IT DOES:
 * - create_session allocates a session directory; start_capture spawns the
 *   backend's log stream through the transport gate and starts one reader
 *   thread per output stream
 * - Each line is stamped "[HH:MM:SS.mmm] ", appended to the session's log
 *   file and pushed to a bounded lock-free delivery queue
 * - While at least one session captures, a flush timer drains at most
 *   max_batch_lines per tick into one LogBatchReceivedEvent
 * - stop_capture closes the writer, closes the process output, waits
 *   stop_grace, SIGKILLs that pid only, joins the readers and flushes what
 *   is left before returning
 *
 * A session whose process exits on its own is stopped in the background
 * with reason "process_exited".
 *
 * THREAD SAFETY:
 * All public methods may be called from any thread, including from event
 * handlers running on the flush timer or the monitor thread.
 */
class SessionManager {
public:
    using BatchSink = std::function<void(const std::string& text, std::size_t line_count)>;

    SessionManager(const core::Config& config,
                   device::BackendRegistry& registry,
                   device::TransportGate& gate,
                   events::EventBus& bus,
                   process::ProcessSupervisor* supervisor = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Allocates the session directory and returns an Idle session; starts nothing
    Result<SessionPtr> create_session(const device::Device& device);

    /**
     * @brief Start capturing; false if the session is already active, not
     *        Idle, its device already has a capturing session, or the
     *        process or the log file cannot be started
     */
    bool start_capture(const SessionPtr& session);

    // No-op unless the session is active
    void stop_capture(const SessionPtr& session, const std::string& reason = stop_reason::kRequested);

    /**
     * @brief Stop the capturing session of device_id among known
     * @return the stopped session, or nullptr if none was capturing
     */
    SessionPtr stop_capture_for_device(const std::string& device_id, const std::vector<SessionPtr>& known);

    void stop_all_captures();

    // Stops the capture first if active; never throws
    bool delete_session(const SessionPtr& session);

    /**
     * @brief Last max_lines lines of the session's log file, newline-joined
     * @return nullopt if there is no log file
     */
    std::optional<std::string> read_log_content(const SessionPtr& session, std::size_t max_lines = 1000) const;

    /**
     * @brief Write text to the session's log file, or to a new
     *        manual_log_<timestamp>.txt when the session has none
     * @return the path written
     */
    Result<std::filesystem::path> save_log_content(const SessionPtr& session, const std::string& text);

    // Stopped sessions rebuilt from disk, newest first
    std::vector<SessionPtr> get_saved_sessions() const;

    std::vector<SessionPtr> active_sessions() const;
    SessionPtr active_session_for_device(const std::string& device_id) const;
    bool has_active_capture() const;
    [[nodiscard]] bool flushing() const { return flush_timer_.running(); }

    [[nodiscard]] std::size_t dropped_line_count() const noexcept { return queue_.dropped(); }
    [[nodiscard]] const std::filesystem::path& sessions_root() const noexcept { return store_.root(); }
    [[nodiscard]] const SessionStore& store() const noexcept { return store_; }

    // Direct consumer of log batches, called in addition to the event bus
    void set_batch_sink(BatchSink sink);

private:
    /**
     * @brief Live OS resources of one capturing session
     *
     * Exists exactly while the session is registered as active.
     */
    struct CaptureContext {
        SessionPtr session;
        process::ProcessPtr process;

        std::mutex writer_mutex;
        std::ofstream writer;
        bool writer_failed = false;

        std::thread stdout_reader;
        std::thread stderr_reader;
        std::atomic<bool> stopping{false};
    };

    struct BackgroundStop {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Spawn and register under start_mutex_; emits nothing
    bool begin_capture(const SessionPtr& session);
    bool stop_session(const std::string& session_id, const std::string& reason);
    void read_stream(CaptureContext* context, bool from_stderr);
    void append_line(CaptureContext& context, const std::string& raw);
    void schedule_stop(const std::string& session_id, const std::string& reason);
    void join_background_stops(bool all);

    void ensure_flush_timer();
    void stop_flush_timer_if_idle();
    void flush_batch();
    void flush_all();

    const std::size_t max_batch_lines_;
    const std::chrono::milliseconds flush_interval_;
    const std::chrono::milliseconds gate_timeout_;
    const std::chrono::milliseconds stop_grace_;

    device::BackendRegistry& registry_;
    device::TransportGate& gate_;
    events::EventBus& bus_;
    process::ProcessSupervisor* supervisor_;
    SessionStore store_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<CaptureContext>> active_;

    // Serializes start_capture so two starts cannot race past the checks
    std::mutex start_mutex_;

    LogDeliveryQueue queue_;
    std::recursive_mutex flush_mutex_;
    std::mutex sink_mutex_;
    BatchSink sink_;

    std::mutex timer_mutex_;
    core::PeriodicTimer flush_timer_;

    std::mutex background_mutex_;
    std::vector<BackgroundStop> background_stops_;
    std::atomic<bool> shutting_down_{false};
};

} // namespace qadt::session
