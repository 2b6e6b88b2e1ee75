#pragma once

#include "qadt/process/child_process.hpp"

#include <sys/types.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace qadt::process {

/**
 * @brief Registry of every child the application spawned
 *
 * An explicit object owned by the application root and handed to whoever
 * spawns processes. Entries are weak: the supervisor never keeps a child
 * handle alive, and an entry disappears when its child is reaped or its
 * handle is destroyed.
 *
 * On shutdown kill_all_tracked() SIGKILLs the process group of every child
 * still registered, so no helper outlives the application.
 */
class ProcessSupervisor {
public:
    ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    void track(const ProcessPtr& process);

    // Live children; prunes entries whose child exited or was released
    [[nodiscard]] std::size_t tracked_count();

    /**
     * @brief Kill every registered process tree
     *
     * Failures are logged and skipped. Returns the number of trees killed.
     */
    std::size_t kill_all_tracked();

private:
    struct Registry {
        std::mutex mutex;
        std::unordered_map<pid_t, std::weak_ptr<ChildProcess>> processes;
    };

    std::shared_ptr<Registry> registry_;
};

} // namespace qadt::process
