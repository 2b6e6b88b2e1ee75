#include "qadt/session/manager.hpp"

#include "qadt/device/transport_gate.hpp"
#include "qadt/events/event_bus.hpp"
#include "qadt/events/events.hpp"
#include "qadt/process/supervisor.hpp"
#include "support/fake_backend.hpp"
#include "support/test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using qadt::device::PlatformKind;
using qadt::session::SessionManager;
using qadt::session::SessionPtr;
using qadt::session::SessionStatus;
using qadt::test_support::FakeBackend;
using qadt::test_support::TempDir;
using qadt::test_support::make_device;
using qadt::test_support::wait_until;

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

// "[12:00:00.000] line 7" -> "line 7"
std::string strip_stamp(const std::string& line) {
    const auto close = line.find("] ");
    return close == std::string::npos ? line : line.substr(close + 2);
}

} // namespace

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<FakeBackend>(PlatformKind::Android, &supervisor_);
        registry_.add(backend_);
        config_ = qadt::test_support::test_config(temp_.path() / "Sessions");
    }

    SessionManager& manager() {
        if (!manager_) {
            manager_ = std::make_unique<SessionManager>(config_, registry_, gate_, bus_, &supervisor_);
        }
        return *manager_;
    }

    SessionPtr create(const std::string& device_id = "SER123") {
        auto created = manager().create_session(make_device(device_id));
        EXPECT_TRUE(created.is_ok());
        return created.is_ok() ? created.value() : nullptr;
    }

    TempDir temp_;
    qadt::core::Config config_;
    qadt::process::ProcessSupervisor supervisor_;
    qadt::device::BackendRegistry registry_;
    qadt::device::TransportGate gate_;
    qadt::events::EventBus bus_;
    std::shared_ptr<FakeBackend> backend_;
    std::unique_ptr<SessionManager> manager_;
};

TEST_F(SessionManagerTest, CreateSessionAllocatesDirectoryAndStaysIdle) {
    auto session = create();
    ASSERT_NE(session, nullptr);

    EXPECT_EQ(session->status(), SessionStatus::Idle);
    EXPECT_EQ(session->device_id(), "SER123");
    EXPECT_EQ(session->session_id().size(), 8u);
    EXPECT_TRUE(fs::is_directory(session->session_directory()));
    EXPECT_EQ(session->log_file_path().parent_path(), session->session_directory());
    EXPECT_EQ(session->log_file_path().filename(), "Android_SER123_log.txt");
    EXPECT_EQ(backend_->spawn_calls, 0);
    EXPECT_FALSE(manager().has_active_capture());
}

TEST_F(SessionManagerTest, StartCaptureTwiceKeepsOneProcess) {
    auto session = create();

    EXPECT_TRUE(manager().start_capture(session));
    EXPECT_FALSE(manager().start_capture(session));

    EXPECT_EQ(backend_->spawn_calls, 1);
    EXPECT_EQ(manager().active_sessions().size(), 1u);
    EXPECT_EQ(session->status(), SessionStatus::Capturing);
    EXPECT_TRUE(session->start_time().has_value());
    EXPECT_TRUE(manager().flushing());
}

TEST_F(SessionManagerTest, OneCapturingSessionPerDevice) {
    auto first = create("SER123");
    auto second = create("SER123");
    auto other = create("SER999");

    EXPECT_TRUE(manager().start_capture(first));
    EXPECT_FALSE(manager().start_capture(second));
    EXPECT_TRUE(manager().start_capture(other));

    EXPECT_EQ(second->status(), SessionStatus::Idle);
    EXPECT_EQ(manager().active_session_for_device("SER123"), first);
    EXPECT_EQ(manager().active_session_for_device("SER999"), other);
    EXPECT_EQ(manager().active_session_for_device("nope"), nullptr);
}

TEST_F(SessionManagerTest, StopCaptureIsIdempotentAndTerminatesProcess) {
    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    auto process = backend_->last_process();
    ASSERT_NE(process, nullptr);

    EXPECT_NO_THROW(manager().stop_capture(session));
    EXPECT_NO_THROW(manager().stop_capture(session));

    EXPECT_EQ(session->status(), SessionStatus::Stopped);
    EXPECT_TRUE(session->end_time().has_value());
    EXPECT_FALSE(process->running());
    EXPECT_FALSE(manager().has_active_capture());
    EXPECT_FALSE(manager().flushing());
}

TEST_F(SessionManagerTest, StoppedSessionCannotRestart) {
    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    manager().stop_capture(session);

    EXPECT_FALSE(manager().start_capture(session));
    EXPECT_EQ(session->status(), SessionStatus::Stopped);
    EXPECT_EQ(backend_->spawn_calls, 1);
}

TEST_F(SessionManagerTest, BatchesDeliverEveryLineInOrder) {
    std::mutex mutex;
    std::vector<std::string> delivered;
    std::vector<std::size_t> batch_sizes;
    auto sub = bus_.subscribe_scoped<qadt::events::LogBatchReceivedEvent>(
        [&](const qadt::events::LogBatchReceivedEvent& e) {
            std::lock_guard lock(mutex);
            batch_sizes.push_back(e.line_count);
            for (const auto& line : split_lines(e.text)) {
                delivered.push_back(line);
            }
        });

    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));

    ASSERT_TRUE(wait_until([&] {
        std::lock_guard lock(mutex);
        return delivered.size() >= 250;
    }));

    std::lock_guard lock(mutex);
    ASSERT_EQ(delivered.size(), 250u);
    EXPECT_GE(batch_sizes.size(), 2u);
    for (auto size : batch_sizes) {
        EXPECT_LE(size, 200u);
    }
    for (std::size_t i = 0; i < delivered.size(); ++i) {
        EXPECT_EQ(strip_stamp(delivered[i]), "line " + std::to_string(i + 1));
    }
}

TEST_F(SessionManagerTest, LinesAreStampedAndWrittenToFile) {
    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    ASSERT_TRUE(wait_until([&] { return session->line_count() == 250; }));
    manager().stop_capture(session);

    auto lines = split_lines(qadt::test_support::read_file(session->log_file_path()));
    ASSERT_EQ(lines.size(), 250u);
    const std::regex stamped(R"(^\[\d{2}:\d{2}:\d{2}\.\d{3}\] line 1$)");
    EXPECT_TRUE(std::regex_match(lines.front(), stamped)) << lines.front();
    EXPECT_EQ(strip_stamp(lines.back()), "line 250");
    EXPECT_EQ(session->info().line_count, 250u);
}

TEST_F(SessionManagerTest, StderrLinesAreCaptured) {
    backend_->set_log_script("echo out; echo err 1>&2; exec sleep 30");
    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    ASSERT_TRUE(wait_until([&] { return session->line_count() == 2; }));
    manager().stop_capture(session);

    const auto content = qadt::test_support::read_file(session->log_file_path());
    EXPECT_NE(content.find("] out"), std::string::npos);
    EXPECT_NE(content.find("] err"), std::string::npos);
}

TEST_F(SessionManagerTest, BatchSinkReceivesBatches) {
    std::atomic<std::size_t> total{0};
    manager().set_batch_sink([&](const std::string&, std::size_t count) { total += count; });

    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    EXPECT_TRUE(wait_until([&] { return total.load() == 250; }));
}

TEST_F(SessionManagerTest, ProcessExitStopsSessionInBackground) {
    backend_->set_log_script("echo one; echo two");

    std::mutex mutex;
    std::vector<std::string> reasons;
    auto sub = bus_.subscribe_scoped<qadt::events::CaptureStoppedEvent>(
        [&](const qadt::events::CaptureStoppedEvent& e) {
            std::lock_guard lock(mutex);
            reasons.push_back(e.reason);
        });

    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));

    ASSERT_TRUE(wait_until([&] { return session->status() == SessionStatus::Stopped; }));
    EXPECT_TRUE(session->end_time().has_value());
    EXPECT_EQ(session->line_count(), 2u);
    EXPECT_TRUE(wait_until([&] { return !manager().has_active_capture(); }));

    std::lock_guard lock(mutex);
    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons.front(), qadt::session::stop_reason::kProcessExited);
}

TEST_F(SessionManagerTest, SpawnFailureLeavesSessionIdle) {
    backend_->fail_spawn = true;
    auto session = create();

    EXPECT_FALSE(manager().start_capture(session));
    EXPECT_EQ(session->status(), SessionStatus::Idle);
    EXPECT_FALSE(manager().has_active_capture());
}

TEST_F(SessionManagerTest, MissingBackendRefusesStart) {
    auto created = manager().create_session(make_device("UDID1", PlatformKind::iOS));
    ASSERT_TRUE(created.is_ok());

    EXPECT_FALSE(manager().start_capture(created.value()));
    EXPECT_EQ(created.value()->status(), SessionStatus::Idle);
}

TEST_F(SessionManagerTest, WriterFailureKillsSpawnedProcess) {
    auto session = create();
    // A directory where the log file should be makes the open fail
    fs::create_directories(session->log_file_path());

    EXPECT_FALSE(manager().start_capture(session));
    EXPECT_EQ(session->status(), SessionStatus::Idle);
    EXPECT_FALSE(manager().has_active_capture());

    auto process = backend_->last_process();
    ASSERT_NE(process, nullptr);
    EXPECT_TRUE(wait_until([&] { return !process->running(); }));
}

TEST_F(SessionManagerTest, StubbornProcessIsKilledAfterGrace) {
    backend_->set_log_script("trap '' TERM PIPE; while true; do sleep 1; done");
    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    auto process = backend_->last_process();

    const auto started = std::chrono::steady_clock::now();
    manager().stop_capture(session);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(process->running());
    EXPECT_LT(elapsed, 4s);
    EXPECT_EQ(session->status(), SessionStatus::Stopped);
}

TEST_F(SessionManagerTest, OverflowDropsDeliveryButNotFileLines) {
    config_.delivery_capacity = 10;
    config_.flush_interval = 10s;
    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    ASSERT_TRUE(wait_until([&] { return session->line_count() == 250; }));

    EXPECT_EQ(manager().dropped_line_count(), 240u);
    manager().stop_capture(session);
    EXPECT_EQ(split_lines(qadt::test_support::read_file(session->log_file_path())).size(), 250u);
}

TEST_F(SessionManagerTest, StopAllCapturesStopsEverySession) {
    auto a = create("A1");
    auto b = create("B2");
    ASSERT_TRUE(manager().start_capture(a));
    ASSERT_TRUE(manager().start_capture(b));

    manager().stop_all_captures();

    EXPECT_EQ(a->status(), SessionStatus::Stopped);
    EXPECT_EQ(b->status(), SessionStatus::Stopped);
    EXPECT_TRUE(manager().active_sessions().empty());
    EXPECT_EQ(supervisor_.tracked_count(), 0u);
}

TEST_F(SessionManagerTest, StopCaptureForDeviceMatchesCapturingSession) {
    auto idle = create("SER123");
    auto capturing = create("SER123");
    ASSERT_TRUE(manager().start_capture(capturing));

    auto stopped = manager().stop_capture_for_device("SER123", {idle, capturing});
    EXPECT_EQ(stopped, capturing);
    EXPECT_EQ(capturing->status(), SessionStatus::Stopped);
    EXPECT_EQ(idle->status(), SessionStatus::Idle);

    EXPECT_EQ(manager().stop_capture_for_device("SER123", {idle, capturing}), nullptr);
}

TEST_F(SessionManagerTest, SavedSessionsSurviveRestart) {
    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    ASSERT_TRUE(wait_until([&] { return session->line_count() == 250; }));
    manager().stop_capture(session);
    manager_.reset();

    auto saved = manager().get_saved_sessions();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0]->session_id(), session->session_id());
    EXPECT_EQ(saved[0]->session_directory(), session->session_directory());
    EXPECT_EQ(saved[0]->log_file_path(), session->log_file_path());
    EXPECT_EQ(saved[0]->device_id(), "SER123");
    EXPECT_EQ(saved[0]->status(), SessionStatus::Stopped);
    EXPECT_EQ(saved[0]->line_count(), 250u);
}

TEST_F(SessionManagerTest, ReadLogContentReturnsTail) {
    auto session = create();
    EXPECT_FALSE(manager().read_log_content(session).has_value());

    ASSERT_TRUE(manager().start_capture(session));
    ASSERT_TRUE(wait_until([&] { return session->line_count() == 250; }));
    manager().stop_capture(session);

    auto tail = manager().read_log_content(session, 10);
    ASSERT_TRUE(tail.has_value());
    auto lines = split_lines(*tail);
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_EQ(strip_stamp(lines.front()), "line 241");
    EXPECT_EQ(strip_stamp(lines.back()), "line 250");
}

TEST_F(SessionManagerTest, SaveLogContentWritesSessionFileOrManualLog) {
    auto session = create();
    auto written = manager().save_log_content(session, "edited\n");
    ASSERT_TRUE(written.is_ok());
    EXPECT_EQ(written.value(), session->log_file_path());
    EXPECT_EQ(qadt::test_support::read_file(session->log_file_path()), "edited\n");

    auto manual = manager().save_log_content(nullptr, "scratch");
    ASSERT_TRUE(manual.is_ok());
    EXPECT_EQ(manual.value().parent_path(), manager().sessions_root());
    EXPECT_EQ(manual.value().filename().string().rfind("manual_log_", 0), 0u);
    EXPECT_EQ(qadt::test_support::read_file(manual.value()), "scratch");
}

TEST_F(SessionManagerTest, DeleteSessionStopsAndRemovesDirectory) {
    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));

    EXPECT_TRUE(manager().delete_session(session));
    EXPECT_EQ(session->status(), SessionStatus::Stopped);
    EXPECT_FALSE(fs::exists(session->session_directory()));
    EXPECT_FALSE(manager().delete_session(session));
    EXPECT_FALSE(manager().delete_session(nullptr));
}

TEST_F(SessionManagerTest, EmitsLifecycleEvents) {
    std::atomic<int> started{0};
    std::atomic<int> list_changes{0};
    std::string stop_reason;
    std::mutex mutex;
    auto s1 = bus_.subscribe_scoped<qadt::events::CaptureStartedEvent>(
        [&](const qadt::events::CaptureStartedEvent& e) {
            EXPECT_EQ(e.session.status, SessionStatus::Capturing);
            ++started;
        });
    auto s2 = bus_.subscribe_scoped<qadt::events::CaptureStoppedEvent>(
        [&](const qadt::events::CaptureStoppedEvent& e) {
            std::lock_guard lock(mutex);
            stop_reason = e.reason;
        });
    auto s3 = bus_.subscribe_scoped<qadt::events::SessionListChangedEvent>(
        [&](const qadt::events::SessionListChangedEvent&) { ++list_changes; });

    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    manager().stop_capture(session);

    EXPECT_EQ(started, 1);
    EXPECT_EQ(list_changes, 3);  // create, start, stop
    std::lock_guard lock(mutex);
    EXPECT_EQ(stop_reason, qadt::session::stop_reason::kRequested);
}

TEST_F(SessionManagerTest, StartedHandlerCanStartAnotherDevice) {
    auto first = create("SER123");
    auto second = create("SER999");
    std::atomic<bool> nested_started{false};
    auto sub = bus_.subscribe_scoped<qadt::events::CaptureStartedEvent>(
        [&](const qadt::events::CaptureStartedEvent& e) {
            if (e.session.device_id == "SER123") {
                nested_started = manager().start_capture(second);
            }
        });

    auto outer = std::async(std::launch::async, [&] { return manager().start_capture(first); });
    ASSERT_EQ(outer.wait_for(5s), std::future_status::ready);

    EXPECT_TRUE(outer.get());
    EXPECT_TRUE(nested_started);
    EXPECT_EQ(first->status(), SessionStatus::Capturing);
    EXPECT_EQ(second->status(), SessionStatus::Capturing);
    EXPECT_EQ(manager().active_sessions().size(), 2u);
}

TEST_F(SessionManagerTest, DestructorStopsActiveCaptures) {
    auto session = create();
    ASSERT_TRUE(manager().start_capture(session));
    auto process = backend_->last_process();

    manager_.reset();

    EXPECT_EQ(session->status(), SessionStatus::Stopped);
    EXPECT_FALSE(process->running());
}
