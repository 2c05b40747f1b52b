/**
 * @file completion_channel.cpp
 * @brief Implementation of the per-invocation completion queue
 * 
 * @date 2025
 */

#include "capsule/bridge/completion_channel.hpp"

#include <spdlog/spdlog.h>

namespace capsule {
namespace bridge {

bool CompletionChannel::Post(CallCompletion completion) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            ++discarded_;
            spdlog::debug("Discarding late completion for call #{}", completion.call_id);
            return false;
        }
        queue_.push_back(std::move(completion));
    }
    cv_.notify_one();
    return true;
}

std::vector<CallCompletion> CompletionChannel::WaitUntil(
    std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this]() { return closed_ || !queue_.empty(); });
    return TakeAllLocked();
}

void CompletionChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        discarded_ += queue_.size();
        queue_.clear();
    }
    cv_.notify_all();
}

void CompletionChannel::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    Close();
}

bool CompletionChannel::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool CompletionChannel::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::uint64_t CompletionChannel::DiscardedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarded_;
}

std::vector<CallCompletion> CompletionChannel::TakeAllLocked() {
    std::vector<CallCompletion> taken;
    if (closed_) {
        return taken;
    }
    taken.reserve(queue_.size());
    while (!queue_.empty()) {
        taken.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    return taken;
}

} // namespace bridge
} // namespace capsule
