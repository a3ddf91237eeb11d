#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <memory>
#include <mutex>
#include <new>
#include <utility>
#include <vector>

#include "cache.hpp"
#include "resettable.hpp"

namespace recycling::core {

/**
 * FreeStore - Bounded idle-value store shared by a Recycler and its Leases
 *
 * Holds values that no Lease currently owns. Each value lives behind its own
 * std::unique_ptr, so a value keeps its address while it circulates between
 * the store and successive leases.
 *
 * Design:
 * - One mutex serializes take/put; the critical section is a vector
 *   push_back/pop_back, nothing else
 * - LIFO order: the most recently returned value is the warmest in cache
 * - Capacity check and insert happen under the same lock, so concurrent
 *   returns can never over-fill the store
 * - Values rejected at capacity (or after close()) are destroyed outside
 *   the lock
 * - Statistics are relaxed atomics kept off the mutex's cache line
 *
 * Neither operation reports errors: take either hits or misses, put either
 * keeps or discards.
 */
template <Poolable T>
class FreeStore {
  public:
    using Value = std::unique_ptr<T>;

    static constexpr std::size_t UNBOUNDED = std::numeric_limits<std::size_t>::max();

    // Slots reserved at construction; larger stores grow on demand
    static constexpr std::size_t INITIAL_RESERVE = 4096;

    struct Stats {
        std::size_t idle;
        std::size_t capacity;
        uint64_t hits;      // try_take returned a value
        uint64_t misses;    // try_take found the store empty
        uint64_t kept;      // try_put stored the value
        uint64_t discarded; // try_put destroyed the value (full or closed)
        uint64_t reset_failures;
    };

    explicit FreeStore(std::size_t capacity = UNBOUNDED) : capacity_(capacity) {
        // Stores up to INITIAL_RESERVE never allocate on the return path
        items_.reserve(std::min(capacity_, INITIAL_RESERVE));
    }

    ~FreeStore() = default;

    // Non-copyable, non-movable: Leases hold it by shared_ptr
    FreeStore(const FreeStore&) = delete;
    FreeStore& operator=(const FreeStore&) = delete;
    FreeStore(FreeStore&&) = delete;
    FreeStore& operator=(FreeStore&&) = delete;

    // Remove one idle value, or nullptr when none is available
    [[nodiscard]] Value try_take() noexcept {
        Value value;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!items_.empty()) [[likely]] {
                value = std::move(items_.back());
                items_.pop_back();
            }
        }

        if (value) [[likely]] {
            hits_.fetch_add(1, std::memory_order_relaxed);
        } else {
            misses_.fetch_add(1, std::memory_order_relaxed);
        }
        return value;
    }

    // Store an idle value. Returns true if kept, false if it was destroyed
    // because the store is full or closed. A null value is ignored.
    bool try_put(Value value) noexcept {
        if (!value) [[unlikely]] {
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_ && items_.size() < capacity_) [[likely]] {
                try {
                    items_.push_back(std::move(value));
                } catch (const std::bad_alloc&) {
                    // Growth past INITIAL_RESERVE failed; treat it as full
                }
            }
        }

        // push_back leaves value intact when it throws
        if (value) [[unlikely]] {
            discarded_.fetch_add(1, std::memory_order_relaxed);
            return false;  // value destroyed on scope exit, outside the lock
        }

        kept_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    // Destroy idle values beyond `keep`; returns how many were destroyed
    std::size_t trim(std::size_t keep) noexcept {
        std::vector<Value> victims;
        std::size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.size() <= keep) {
                return 0;
            }
            removed = items_.size() - keep;
            const auto first = items_.begin() + static_cast<std::ptrdiff_t>(keep);
            try {
                victims.assign(std::make_move_iterator(first), std::make_move_iterator(items_.end()));
            } catch (const std::bad_alloc&) {
                // No room to defer destruction; the erase below destroys under the lock
            }
            items_.erase(first, items_.end());
        }
        return removed;
    }

    std::size_t clear() noexcept {
        return trim(0);
    }

    // Stop accepting values and destroy everything idle. Idempotent.
    void close() noexcept {
        std::vector<Value> victims;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            victims.swap(items_);
        }
    }

    void record_reset_failure() noexcept {
        reset_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]] bool bounded() const noexcept {
        return capacity_ != UNBOUNDED;
    }

    [[nodiscard]] bool empty() const noexcept {
        return size() == 0;
    }

    [[nodiscard]] bool full() const noexcept {
        return size() >= capacity_;
    }

    [[nodiscard]] bool is_closed() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] Stats stats() const noexcept {
        return Stats{.idle = size(),
                     .capacity = capacity_,
                     .hits = hits_.load(std::memory_order_relaxed),
                     .misses = misses_.load(std::memory_order_relaxed),
                     .kept = kept_.load(std::memory_order_relaxed),
                     .discarded = discarded_.load(std::memory_order_relaxed),
                     .reset_failures = reset_failures_.load(std::memory_order_relaxed)};
    }

  private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::vector<Value> items_;
    bool closed_{false};

    // Statistics (for monitoring) - separated from the lock to avoid false sharing
    CACHE_ALIGNED std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    CACHE_ALIGNED std::atomic<uint64_t> kept_{0};
    std::atomic<uint64_t> discarded_{0};
    std::atomic<uint64_t> reset_failures_{0};
};

}  // namespace recycling::core
