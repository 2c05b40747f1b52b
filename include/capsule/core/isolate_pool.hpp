/**
 * @file isolate_pool.hpp
 * @brief Bounded pool of reusable isolated execution environments
 * 
 * An Isolate is one QuickJS runtime with its own heap, memory limit and
 * stack limit. Programs never share a scope: each invocation creates a
 * fresh context inside a leased isolate and destroys it before the lease
 * returns. Isolates that end an invocation in a suspicious state (memory
 * limit hit, jobs still queued) are destroyed instead of returned.
 * 
 * @date 2025
 */

#pragma once

extern "C" {
#include <quickjs.h>
}

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace capsule {
namespace core {

/**
 * @class PoolExhaustedError
 * @brief No isolate became free before the caller's deadline
 */
class PoolExhaustedError : public std::runtime_error {
public:
    explicit PoolExhaustedError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class Isolate
 * @brief Owns one QuickJS runtime
 * 
 * The runtime allocates through the isolate's own malloc hooks, which
 * enforce the memory limit and record when an allocation was refused. That
 * record, not the text of an error, is what identifies a memory limit
 * breach.
 */
class Isolate {
public:
    /**
     * @throws std::runtime_error if the runtime cannot be created
     */
    Isolate(std::uint64_t id, std::size_t memory_limit_mb, std::size_t max_stack_kb);

    ~Isolate();

    Isolate(const Isolate&) = delete;
    Isolate& operator=(const Isolate&) = delete;

    JSRuntime* Runtime() const { return runtime_; }
    std::uint64_t Id() const { return id_; }
    std::size_t MemoryLimitMb() const { return memory_limit_mb_; }

    /// Invocations served so far
    std::uint64_t Uses() const { return uses_; }
    void MarkUsed() { ++uses_; }

    /// Jobs left in the runtime's queue (none after a clean teardown)
    bool HasPendingJobs() const;

    /// Bytes currently allocated by the runtime
    std::int64_t MemoryUsed() const;

    /// An allocation was refused at the memory limit since the last clear
    bool MemoryLimitHit() const { return memory_limit_hit_; }
    void ClearMemoryLimitHit() { memory_limit_hit_ = false; }

private:
    JSRuntime* runtime_{nullptr};
    std::uint64_t id_;
    std::size_t memory_limit_mb_;
    std::uint64_t uses_{0};
    bool memory_limit_hit_{false};

    static const JSMallocFunctions kAllocator;

    static void* Allocate(JSMallocState* state, size_t size);
    static void Free(JSMallocState* state, void* ptr);
    static void* Reallocate(JSMallocState* state, void* ptr, size_t size);
    static size_t UsableSize(const void* ptr);
    static void RefuseAllocation(JSMallocState* state, size_t size);
};

class IsolatePool;

/**
 * @class IsolateLease
 * @brief Exclusive, move-only use of one isolate
 * 
 * Returns the isolate to its pool on destruction unless Discard() was
 * called, in which case the isolate is destroyed.
 */
class IsolateLease {
public:
    IsolateLease() = default;
    IsolateLease(IsolatePool* pool, std::unique_ptr<Isolate> isolate);
    ~IsolateLease();

    IsolateLease(IsolateLease&& other) noexcept;
    IsolateLease& operator=(IsolateLease&& other) noexcept;

    IsolateLease(const IsolateLease&) = delete;
    IsolateLease& operator=(const IsolateLease&) = delete;

    Isolate& Get() const { return *isolate_; }
    Isolate* operator->() const { return isolate_.get(); }
    explicit operator bool() const { return static_cast<bool>(isolate_); }

    /// Destroy the isolate instead of returning it
    void Discard() { discard_ = true; }

private:
    IsolatePool* pool_{nullptr};
    std::unique_ptr<Isolate> isolate_;
    bool discard_{false};

    void Return();
};

/**
 * @struct IsolatePoolStats
 * @brief Pool counters
 */
struct IsolatePoolStats {
    std::size_t capacity{0};       ///< Maximum isolates alive at once
    std::size_t idle{0};           ///< Isolates waiting in the pool
    std::size_t leased{0};         ///< Isolates currently in use
    std::uint64_t created{0};      ///< Isolates created since start
    std::uint64_t discarded{0};    ///< Isolates destroyed after a lease
    std::uint64_t acquisitions{0}; ///< Successful Acquire() calls
};

/**
 * @class IsolatePool
 * @brief Lazily populated pool of at most @c capacity isolates
 * 
 * **Thread Safety**: thread-safe. Leases must not outlive the pool.
 */
class IsolatePool {
public:
    /**
     * @throws std::invalid_argument if @p capacity is 0
     */
    IsolatePool(std::size_t capacity, std::size_t memory_limit_mb, std::size_t max_stack_kb);

    ~IsolatePool();

    IsolatePool(const IsolatePool&) = delete;
    IsolatePool& operator=(const IsolatePool&) = delete;

    /**
     * @brief Lease an isolate, creating one if under capacity
     * 
     * @param deadline Give up waiting for a free isolate at this point
     * @throws PoolExhaustedError if none became free in time
     * @throws std::runtime_error if a new runtime cannot be created
     */
    IsolateLease Acquire(std::chrono::steady_clock::time_point deadline);

    IsolatePoolStats GetStats() const;

private:
    friend class IsolateLease;

    const std::size_t capacity_;
    const std::size_t memory_limit_mb_;
    const std::size_t max_stack_kb_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Isolate>> idle_;
    std::size_t leased_{0};
    std::uint64_t next_id_{1};
    std::uint64_t created_{0};
    std::uint64_t discarded_{0};
    std::uint64_t acquisitions_{0};

    void Release(std::unique_ptr<Isolate> isolate, bool discard);
};

} // namespace core
} // namespace capsule
