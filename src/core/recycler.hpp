#pragma once

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "cache.hpp"
#include "free_store.hpp"
#include "lease.hpp"
#include "recycler_config.hpp"
#include "resettable.hpp"

namespace recycling::core {

// Snapshot of a Recycler's counters
struct RecyclerStats {
    std::size_t idle;          // Values waiting in the store right now
    std::size_t capacity;      // Store bound (RecyclerConfig::UNBOUNDED if none)
    uint64_t constructed;      // Factory calls, prefill included
    uint64_t reused;           // allocate() calls served from the store
    uint64_t returned;         // Values accepted into the store, prefill included
    uint64_t discarded;        // Values destroyed on return (full or closed)
    uint64_t reset_failures;   // Values destroyed because reset() threw

    [[nodiscard]] double reuse_ratio() const noexcept {
        const uint64_t total = constructed + reused;
        return total > 0 ? static_cast<double>(reused) / static_cast<double>(total) : 0.0;
    }
};

/**
 * Recycler - Reuse cache for values of type T
 *
 * allocate() hands out a Lease over an idle value when one is available and
 * constructs a fresh one with the factory otherwise. When the Lease ends, the
 * value is reset (if T supports it, see ResetTraits) and offered back to the
 * store; a full store destroys it instead.
 *
 * Thread Safety:
 * - allocate(), prefill(), trim() and stats() may be called concurrently
 * - The factory is invoked concurrently and must be safe for that
 * - Leases may be released on any thread, and may outlive the Recycler
 *
 * Example usage:
 * @code
 *   Recycler<std::vector<char>> buffers(
 *       [] { return std::vector<char>(64 * 1024); },
 *       RecyclerConfig::with_max_idle(256));
 *
 *   {
 *       auto buffer = buffers.allocate();
 *       buffer->assign(payload.begin(), payload.end());
 *   }  // buffer goes back to the pool here
 * @endcode
 */
template <Poolable T>
class Recycler {
  public:
    using Factory = std::function<T()>;
    using value_type = T;
    using lease_type = Lease<T>;

  private:
    using Store = FreeStore<T>;
    using Construct = std::function<std::unique_ptr<T>()>;

    RecyclerConfig config_;
    Construct construct_;
    std::shared_ptr<Store> store_;

    CACHE_ALIGNED std::atomic<uint64_t> constructed_{0};

    static std::string describe_capacity(std::size_t capacity) {
        return capacity == RecyclerConfig::UNBOUNDED ? std::string("unbounded") : std::to_string(capacity);
    }

    Recycler(Construct construct, const RecyclerConfig& config)
        : config_(config), construct_(std::move(construct)) {
        config_.validate();
        store_ = std::make_shared<Store>(config_.max_idle);

        spdlog::debug("Recycler created: max_idle={}, prefill={}", describe_capacity(config_.max_idle),
                      config_.prefill);

        if (config_.prefill > 0) {
            prefill(config_.prefill);
        }
    }

    static Construct wrap_factory(Factory factory) {
        if (!factory) {
            throw std::invalid_argument("Recycler factory must not be empty");
        }
        return [factory = std::move(factory)] { return std::unique_ptr<T>(new T(factory())); };
    }

    [[nodiscard]] std::unique_ptr<T> construct_value() {
        std::unique_ptr<T> value = construct_();
        constructed_.fetch_add(1, std::memory_order_relaxed);
        return value;
    }

  public:
    // Values built by T's default constructor
    explicit Recycler(const RecyclerConfig& config = RecyclerConfig{})
        requires std::default_initializable<T>
        : Recycler(Construct([] { return std::make_unique<T>(); }), config) {}

    // Values built by `factory`; its exceptions propagate out of allocate()
    explicit Recycler(Factory factory, const RecyclerConfig& config = RecyclerConfig{})
        : Recycler(wrap_factory(std::move(factory)), config) {}

    ~Recycler() {
        // Idle values die with the Recycler; leases still out will find the
        // store closed and destroy their values on return
        store_->close();

        const RecyclerStats final_stats = stats();
        spdlog::debug("Recycler destroyed: constructed={}, reused={}, discarded={}, reset_failures={}",
                      final_stats.constructed, final_stats.reused, final_stats.discarded,
                      final_stats.reset_failures);
    }

    // Non-copyable, non-movable; share by reference
    Recycler(const Recycler&) = delete;
    Recycler& operator=(const Recycler&) = delete;
    Recycler(Recycler&&) = delete;
    Recycler& operator=(Recycler&&) = delete;

    // Lease an idle value, or a freshly constructed one if none is idle
    [[nodiscard]] Lease<T> allocate() {
        std::unique_ptr<T> value = store_->try_take();
        if (!value) {
            value = construct_value();
        }
        return Lease<T>(std::move(value), store_);
    }

    // Construct values straight into the store, up to its free room.
    // Returns how many were stored.
    std::size_t prefill(std::size_t count) {
        const std::size_t idle = store_->size();
        const std::size_t room = store_->capacity() > idle ? store_->capacity() - idle : 0;
        const std::size_t target = std::min(count, room);

        std::size_t stored = 0;
        for (std::size_t i = 0; i < target; ++i) {
            if (!store_->try_put(construct_value())) {
                break;  // Filled concurrently by returning leases
            }
            ++stored;
        }

        spdlog::debug("Recycler prefilled {} of {} requested values", stored, count);
        return stored;
    }

    // Destroy idle values beyond `keep`
    std::size_t trim(std::size_t keep) noexcept {
        return store_->trim(keep);
    }

    // Destroy every idle value
    std::size_t clear() noexcept {
        return store_->clear();
    }

    [[nodiscard]] std::size_t idle_count() const noexcept {
        return store_->size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return store_->capacity();
    }

    [[nodiscard]] const RecyclerConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]] RecyclerStats stats() const noexcept {
        const typename Store::Stats store_stats = store_->stats();
        return RecyclerStats{.idle = store_stats.idle,
                             .capacity = store_stats.capacity,
                             .constructed = constructed_.load(std::memory_order_relaxed),
                             .reused = store_stats.hits,
                             .returned = store_stats.kept,
                             .discarded = store_stats.discarded,
                             .reset_failures = store_stats.reset_failures};
    }
};

}  // namespace recycling::core
