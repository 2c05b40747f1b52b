/**
 * @file host_dispatcher.cpp
 * @brief Implementation of the capability worker pool
 *
 * @date 2025
 */

#include "capsule/bridge/host_dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace capsule {
namespace bridge {

// Constructor
HostDispatcher::HostDispatcher(std::size_t worker_count) {
    if (worker_count == 0) {
        throw std::invalid_argument("Host dispatcher needs at least one worker");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < worker_count; ++i) {
        StartWorkerLocked();
    }

    spdlog::debug("Host dispatcher started with {} workers", worker_count);
}

// Destructor
HostDispatcher::~HostDispatcher() {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        dropped = tasks_.size();
        tasks_.clear();
    }
    cv_.notify_all();

    // No worker is started once stopping_ is set, so the list is stable here
    for (auto& worker : workers_) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    spdlog::debug("Host dispatcher stopped ({} tasks completed, {} dropped)",
                  completed_.load(), dropped);
}

std::uint64_t HostDispatcher::OpenGroup() {
    return next_group_++;
}

void HostDispatcher::Submit(std::uint64_t group, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Host dispatcher is shutting down");
        }
        ++outstanding_[group];
        tasks_.push_back(Task{group, std::move(task)});
    }
    cv_.notify_one();
}

void HostDispatcher::ReleaseGroup(std::uint64_t group) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || outstanding_.find(group) == outstanding_.end()) {
        return;
    }
    released_.insert(group);

    for (auto& worker : workers_) {
        if (worker.busy && !worker.detached && worker.group == group) {
            DetachLocked(worker);
        }
    }
}

std::size_t HostDispatcher::WorkerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t serving = 0;
    for (const auto& worker : workers_) {
        if (!worker.detached) {
            ++serving;
        }
    }
    return serving;
}

std::size_t HostDispatcher::ThreadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t alive = 0;
    for (const auto& worker : workers_) {
        if (!worker.exited) {
            ++alive;
        }
    }
    return alive;
}

std::size_t HostDispatcher::QueueDepth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void HostDispatcher::StartWorkerLocked() {
    workers_.emplace_back();
    Worker& worker = workers_.back();
    worker.index = next_index_++;
    worker.thread = std::thread(&HostDispatcher::WorkerLoop, this, &worker);
}

void HostDispatcher::DetachLocked(Worker& worker) {
    worker.detached = true;
    spdlog::debug("Host dispatcher worker {} detached by released group {}, starting a replacement",
                  worker.index, worker.group);
    ReapLocked();
    StartWorkerLocked();
}

void HostDispatcher::ReapLocked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->exited) {
            // Set just before the thread returns; it never takes the lock again
            it->thread.join();
            it = workers_.erase(it);
        }
        else {
            ++it;
        }
    }
}

void HostDispatcher::WorkerLoop(Worker* self) {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (stopping_) {
                self->exited = true;
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            self->busy = true;
            self->group = task.group;
            if (released_.count(task.group) > 0) {
                DetachLocked(*self);
            }
        }

        try {
            task.run();
        }
        catch (const std::exception& e) {
            spdlog::error("Host dispatcher worker {}: task failed: {}", self->index, e.what());
        }
        ++completed_;

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = outstanding_.find(task.group);
        if (it != outstanding_.end() && --it->second == 0) {
            outstanding_.erase(it);
            released_.erase(task.group);
        }
        self->busy = false;
        self->group = 0;
        if (self->detached) {
            self->exited = true;
            return;
        }
    }
}

} // namespace bridge
} // namespace capsule
