/**
 * @file isolate_pool.cpp
 * @brief Implementation of the isolate pool
 * 
 * @date 2025
 */

#include "capsule/core/isolate_pool.hpp"

#include <spdlog/spdlog.h>

#include <malloc.h>

#include <cstdlib>
#include <utility>

namespace capsule {
namespace core {

// ============================================================================
// Isolate
// ============================================================================

namespace {

// Per-allocation bookkeeping charged against the limit, as in QuickJS's own allocator
constexpr std::size_t MALLOC_OVERHEAD = 8;

} // namespace

const JSMallocFunctions Isolate::kAllocator = {
    &Isolate::Allocate,
    &Isolate::Free,
    &Isolate::Reallocate,
    &Isolate::UsableSize,
};

Isolate::Isolate(std::uint64_t id, std::size_t memory_limit_mb, std::size_t max_stack_kb)
    : id_(id)
    , memory_limit_mb_(memory_limit_mb) {
    runtime_ = JS_NewRuntime2(&kAllocator, this);
    if (!runtime_) {
        throw std::runtime_error("Failed to create JavaScript runtime");
    }
    JS_SetMemoryLimit(runtime_, memory_limit_mb * 1024 * 1024);
    JS_SetMaxStackSize(runtime_, max_stack_kb * 1024);
    spdlog::debug("Created isolate #{} ({} MB heap, {} KB stack)", id, memory_limit_mb, max_stack_kb);
}

Isolate::~Isolate() {
    JS_RunGC(runtime_);
    JS_FreeRuntime(runtime_);
    spdlog::debug("Destroyed isolate #{} after {} use(s)", id_, uses_);
}

bool Isolate::HasPendingJobs() const {
    return JS_IsJobPending(runtime_) != 0;
}

std::int64_t Isolate::MemoryUsed() const {
    JSMemoryUsage usage;
    JS_ComputeMemoryUsage(runtime_, &usage);
    return usage.malloc_size;
}

// ============================================================================
// Allocator hooks
// ============================================================================

size_t Isolate::UsableSize(const void* ptr) {
    return malloc_usable_size(const_cast<void*>(ptr));
}

void Isolate::RefuseAllocation(JSMallocState* state, size_t size) {
    auto* self = static_cast<Isolate*>(state->opaque);
    if (!self->memory_limit_hit_) {
        spdlog::debug("Isolate #{} refused {} byte allocation at {} of {} bytes",
                      self->id_, size, state->malloc_size, state->malloc_limit);
    }
    self->memory_limit_hit_ = true;
}

void* Isolate::Allocate(JSMallocState* state, size_t size) {
    if (state->malloc_size + size > state->malloc_limit) {
        RefuseAllocation(state, size);
        return nullptr;
    }
    void* ptr = std::malloc(size);
    if (!ptr) {
        return nullptr;
    }
    state->malloc_count++;
    state->malloc_size += UsableSize(ptr) + MALLOC_OVERHEAD;
    return ptr;
}

void Isolate::Free(JSMallocState* state, void* ptr) {
    if (!ptr) {
        return;
    }
    state->malloc_count--;
    state->malloc_size -= UsableSize(ptr) + MALLOC_OVERHEAD;
    std::free(ptr);
}

void* Isolate::Reallocate(JSMallocState* state, void* ptr, size_t size) {
    if (!ptr) {
        return size == 0 ? nullptr : Allocate(state, size);
    }
    std::size_t old_size = UsableSize(ptr);
    if (size == 0) {
        Free(state, ptr);
        return nullptr;
    }
    if (state->malloc_size + size - old_size > state->malloc_limit) {
        RefuseAllocation(state, size);
        return nullptr;
    }
    void* grown = std::realloc(ptr, size);
    if (!grown) {
        return nullptr;
    }
    state->malloc_size += UsableSize(grown) - old_size;
    return grown;
}

// ============================================================================
// IsolateLease
// ============================================================================

IsolateLease::IsolateLease(IsolatePool* pool, std::unique_ptr<Isolate> isolate)
    : pool_(pool)
    , isolate_(std::move(isolate)) {
}

IsolateLease::~IsolateLease() {
    Return();
}

IsolateLease::IsolateLease(IsolateLease&& other) noexcept
    : pool_(other.pool_)
    , isolate_(std::move(other.isolate_))
    , discard_(other.discard_) {
    other.pool_ = nullptr;
}

IsolateLease& IsolateLease::operator=(IsolateLease&& other) noexcept {
    if (this != &other) {
        Return();
        pool_ = other.pool_;
        isolate_ = std::move(other.isolate_);
        discard_ = other.discard_;
        other.pool_ = nullptr;
    }
    return *this;
}

void IsolateLease::Return() {
    if (pool_ && isolate_) {
        pool_->Release(std::move(isolate_), discard_);
    }
    pool_ = nullptr;
    discard_ = false;
}

// ============================================================================
// IsolatePool
// ============================================================================

IsolatePool::IsolatePool(std::size_t capacity, std::size_t memory_limit_mb, std::size_t max_stack_kb)
    : capacity_(capacity)
    , memory_limit_mb_(memory_limit_mb)
    , max_stack_kb_(max_stack_kb) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Isolate pool capacity must be at least 1");
    }
}

IsolatePool::~IsolatePool() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (leased_ > 0) {
        spdlog::error("Isolate pool destroyed with {} isolate(s) still leased", leased_);
    }
    idle_.clear();
}

IsolateLease IsolatePool::Acquire(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);

    bool available = cv_.wait_until(lock, deadline, [this] {
        return !idle_.empty() || leased_ + idle_.size() < capacity_;
    });
    if (!available) {
        throw PoolExhaustedError("No isolate became available within the deadline");
    }

    ++leased_;
    ++acquisitions_;
    if (!idle_.empty()) {
        std::unique_ptr<Isolate> isolate = std::move(idle_.back());
        idle_.pop_back();
        return IsolateLease(this, std::move(isolate));
    }

    std::uint64_t id = next_id_++;
    lock.unlock();

    std::unique_ptr<Isolate> isolate;
    try {
        isolate = std::make_unique<Isolate>(id, memory_limit_mb_, max_stack_kb_);
    }
    catch (const std::exception&) {
        lock.lock();
        --leased_;
        --acquisitions_;
        lock.unlock();
        cv_.notify_one();
        throw;
    }

    lock.lock();
    ++created_;
    return IsolateLease(this, std::move(isolate));
}

void IsolatePool::Release(std::unique_ptr<Isolate> isolate, bool discard) {
    std::unique_ptr<Isolate> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --leased_;
        if (discard) {
            ++discarded_;
            doomed = std::move(isolate);
        }
        else {
            idle_.push_back(std::move(isolate));
        }
    }
    cv_.notify_one();

    if (doomed) {
        spdlog::info("Discarding isolate #{} instead of returning it to the pool", doomed->Id());
    }
}

IsolatePoolStats IsolatePool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    IsolatePoolStats stats;
    stats.capacity = capacity_;
    stats.idle = idle_.size();
    stats.leased = leased_;
    stats.created = created_;
    stats.discarded = discarded_;
    stats.acquisitions = acquisitions_;
    return stats;
}

} // namespace core
} // namespace capsule
