/**
 * @file completion_channel.hpp
 * @brief Per-invocation queue of finished capability calls
 * 
 * Dispatcher threads post completions; the invocation's runner thread
 * waits on them with the overall deadline. Closing the channel ends the
 * invocation's interest in its results: later posts are discarded, but calls
 * still queued in the dispatcher run. Cancelling also closes the channel and
 * makes queued calls skip the store.
 * 
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace capsule {
namespace bridge {

/**
 * @struct CallCompletion
 * @brief Outcome of one host-side capability call
 */
struct CallCompletion {
    std::uint64_t call_id{0};   ///< Correlates with the sandbox-side promise
    bool ok{false};             ///< false: @c payload is the error message
    std::string payload;        ///< JSON text of the result, or error message
};

/**
 * @class CompletionChannel
 * @brief Closable multi-producer, single-consumer completion queue
 */
class CompletionChannel {
public:
    CompletionChannel() = default;

    CompletionChannel(const CompletionChannel&) = delete;
    CompletionChannel& operator=(const CompletionChannel&) = delete;

    /**
     * @brief Deliver a completion
     * @return false if the channel is closed and the completion was dropped
     */
    bool Post(CallCompletion completion);

    /**
     * @brief Block until at least one completion is available or the deadline passes
     * @return Every completion available at wake-up, in posting order; empty
     *         on deadline or when closed
     */
    std::vector<CallCompletion> WaitUntil(std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Stop accepting completions and drop anything queued
     */
    void Close();

    /**
     * @brief Close, and tell calls that have not started yet to skip their work
     */
    void Cancel();

    bool IsClosed() const;
    bool IsCancelled() const;

    std::uint64_t DiscardedCount() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<CallCompletion> queue_;
    bool closed_{false};
    bool cancelled_{false};
    std::uint64_t discarded_{0};

    std::vector<CallCompletion> TakeAllLocked();
};

} // namespace bridge
} // namespace capsule
