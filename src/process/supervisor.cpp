#include "qadt/process/supervisor.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <vector>

namespace qadt::process {
namespace {

constexpr auto kReapTimeout = std::chrono::milliseconds(500);

} // namespace

ProcessSupervisor::ProcessSupervisor() : registry_(std::make_shared<Registry>()) {}

void ProcessSupervisor::track(const ProcessPtr& process) {
    if (!process) {
        return;
    }
    {
        std::lock_guard lock(registry_->mutex);
        registry_->processes[process->pid()] = process;
    }

    // Outside the lock: the observer runs inline if the child already exited
    std::weak_ptr<Registry> weak_registry = registry_;
    const ChildProcess* raw = process.get();
    process->on_exit([weak_registry, raw](pid_t pid, int) {
        auto registry = weak_registry.lock();
        if (!registry) {
            return;
        }
        std::lock_guard lock(registry->mutex);
        auto it = registry->processes.find(pid);
        if (it == registry->processes.end()) {
            return;
        }
        // The pid may have been reused by a newer child
        auto current = it->second.lock();
        if (!current || current.get() == raw) {
            registry->processes.erase(it);
        }
    });
}

std::size_t ProcessSupervisor::tracked_count() {
    std::vector<ProcessPtr> live;
    {
        std::lock_guard lock(registry_->mutex);
        for (auto it = registry_->processes.begin(); it != registry_->processes.end();) {
            if (auto process = it->second.lock()) {
                live.push_back(std::move(process));
                ++it;
            } else {
                it = registry_->processes.erase(it);
            }
        }
    }

    // Reaping fires the exit observers, which drop the entries
    for (auto& process : live) {
        (void)process->running();
    }
    live.clear();

    std::lock_guard lock(registry_->mutex);
    return registry_->processes.size();
}

std::size_t ProcessSupervisor::kill_all_tracked() {
    std::vector<ProcessPtr> live;
    {
        std::lock_guard lock(registry_->mutex);
        for (auto& [pid, weak] : registry_->processes) {
            if (auto process = weak.lock()) {
                live.push_back(std::move(process));
            }
        }
    }

    std::size_t killed = 0;
    for (auto& process : live) {
        if (!process->running()) {
            continue;
        }
        auto result = process->kill_tree();
        if (result.is_error()) {
            spdlog::warn("[Supervisor] Could not kill {} (pid {}): {}",
                         process->program(), process->pid(), result.error().message);
            continue;
        }
        if (!process->wait_for_exit(kReapTimeout)) {
            spdlog::warn("[Supervisor] {} (pid {}) did not exit after SIGKILL", process->program(), process->pid());
            continue;
        }
        ++killed;
    }

    if (killed > 0) {
        spdlog::info("[Supervisor] Killed {} tracked process tree(s)", killed);
    }
    return killed;
}

} // namespace qadt::process
