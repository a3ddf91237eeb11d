#pragma once

#include <cassert>
#include <exception>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "free_store.hpp"
#include "resettable.hpp"

namespace recycling::core {

// RAII handle over one pooled value. The value goes back to its FreeStore
// when the lease is destroyed, reassigned, or explicitly returned.
//
// A lease shares ownership of the store, so it may outlive the Recycler
// that issued it; once the Recycler is gone the store is closed and the
// returned value is simply destroyed.
template <Poolable T>
class Lease {
  private:
    using Store = FreeStore<T>;

    std::unique_ptr<T> value_;
    std::shared_ptr<Store> store_;

    // Hand the value back exactly once. Never throws.
    void surrender() noexcept {
        if (!value_) {
            store_.reset();
            return;
        }

        std::shared_ptr<Store> store = std::move(store_);
        std::unique_ptr<T> value = std::move(value_);

        if (!store) [[unlikely]] {
            return;  // Unbound lease: value dies here
        }

        if constexpr (is_resettable_v<T>) {
            if constexpr (is_nothrow_resettable_v<T>) {
                ResetTraits<T>::reset(*value);
            } else {
                try {
                    ResetTraits<T>::reset(*value);
                } catch (const std::exception& e) {
                    // State is unknown; keep it out of circulation
                    store->record_reset_failure();
                    spdlog::warn("Discarding recycled value: reset failed: {}", e.what());
                    return;
                } catch (...) {
                    store->record_reset_failure();
                    spdlog::warn("Discarding recycled value: reset threw a non-standard exception");
                    return;
                }
            }
        }

        store->try_put(std::move(value));
    }

  public:
    Lease(std::unique_ptr<T> value, std::shared_ptr<Store> store) noexcept
        : value_(std::move(value)), store_(std::move(store)) {}

    ~Lease() {
        surrender();
    }

    // Move-only semantics
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept : value_(std::move(other.value_)), store_(std::move(other.store_)) {}

    Lease& operator=(Lease&& other) noexcept {
        if (this != &other) [[likely]] {
            surrender();
            value_ = std::move(other.value_);
            store_ = std::move(other.store_);
        }
        return *this;
    }

    // Access operators; the lease must still hold its value
    T* operator->() noexcept {
        assert(value_ && "lease already returned or detached");
        return value_.get();
    }
    const T* operator->() const noexcept {
        assert(value_ && "lease already returned or detached");
        return value_.get();
    }

    T& operator*() noexcept {
        assert(value_ && "lease already returned or detached");
        return *value_;
    }
    const T& operator*() const noexcept {
        assert(value_ && "lease already returned or detached");
        return *value_;
    }

    [[nodiscard]] T* get() noexcept {
        return value_.get();
    }
    [[nodiscard]] const T* get() const noexcept {
        return value_.get();
    }

    [[nodiscard]] bool valid() const noexcept {
        return value_ != nullptr;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
        return valid();
    }

    // Return the value now instead of at scope exit. Consumes the lease:
    //   std::move(lease).return_to_pool();
    // Calling it again on the emptied lease does nothing.
    void return_to_pool() && noexcept {
        surrender();
    }

    // Take the value out of circulation for good; it will never be pooled.
    [[nodiscard]] std::unique_ptr<T> detach() && noexcept {
        store_.reset();
        return std::move(value_);
    }
};

}  // namespace recycling::core
