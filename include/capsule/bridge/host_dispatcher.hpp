/**
 * @file host_dispatcher.hpp
 * @brief Worker pool that runs host-side capability calls
 *
 * Capability calls leave the sandbox thread immediately and run here, so a
 * program can keep several calls in flight and the runner thread stays free
 * to wait on its completion channel. The pool is shared by every invocation
 * of an engine; each invocation submits under its own task group.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace capsule {
namespace bridge {

/**
 * @class HostDispatcher
 * @brief FIFO thread pool with a fixed number of serving workers
 *
 * **Released groups**: once an invocation ends it releases its group. A
 * worker busy with a task of a released group stops counting as a serving
 * worker and a replacement is started, so a store call that never returns
 * cannot starve later invocations. The detached worker exits when its task
 * finishes.
 *
 * **Shutdown**: the destructor lets running tasks finish, drops tasks that
 * never started and joins every worker.
 *
 * **Usage Example**:
 * @code
 * HostDispatcher dispatcher(8);
 * auto group = dispatcher.OpenGroup();
 * dispatcher.Submit(group, [channel, caps, id]() {
 *     channel->Post({id, true, caps->FindAllStories().dump()});
 * });
 * dispatcher.ReleaseGroup(group);
 * @endcode
 */
class HostDispatcher {
public:
    /**
     * @param worker_count Number of serving worker threads (at least 1)
     * @throws std::invalid_argument if @p worker_count is 0
     */
    explicit HostDispatcher(std::size_t worker_count);

    ~HostDispatcher();

    HostDispatcher(const HostDispatcher&) = delete;
    HostDispatcher& operator=(const HostDispatcher&) = delete;

    /// New task group id, never 0
    std::uint64_t OpenGroup();

    /**
     * @brief Queue a task under @p group
     * @throws std::runtime_error if the dispatcher is shutting down
     */
    void Submit(std::uint64_t group, std::function<void()> task);

    /**
     * @brief Stop counting workers busy with @p group against the pool
     *
     * Idempotent. Tasks of the group that are still queued run as usual, each
     * on a worker that is replaced while it runs.
     */
    void ReleaseGroup(std::uint64_t group);

    /// Workers currently serving the queue
    std::size_t WorkerCount() const;

    /// Worker threads alive, detached ones included
    std::size_t ThreadCount() const;

    std::size_t QueueDepth() const;
    std::uint64_t CompletedTasks() const { return completed_.load(); }

private:
    struct Task {
        std::uint64_t group;
        std::function<void()> run;
    };

    struct Worker {
        std::size_t index{0};
        std::thread thread;
        std::uint64_t group{0};
        bool busy{false};
        bool detached{false};
        bool exited{false};
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::list<Worker> workers_;
    std::unordered_map<std::uint64_t, std::size_t> outstanding_;
    std::unordered_set<std::uint64_t> released_;
    bool stopping_{false};
    std::size_t next_index_{0};
    std::atomic<std::uint64_t> next_group_{1};
    std::atomic<std::uint64_t> completed_{0};

    void StartWorkerLocked();
    void DetachLocked(Worker& worker);
    void ReapLocked();
    void WorkerLoop(Worker* self);
};

} // namespace bridge
} // namespace capsule
