#pragma once

#include <cstddef>
#include <limits>

namespace recycling::core {

/**
 * @brief Per-pool settings for a Recycler
 *
 * The idle store is bounded by default. max_idle is a retention bound only:
 * the store reserves at most FreeStore::INITIAL_RESERVE slots up front and
 * grows past that on demand.
 */
struct RecyclerConfig {
    static constexpr std::size_t UNBOUNDED = std::numeric_limits<std::size_t>::max();
    static constexpr std::size_t DEFAULT_MAX_IDLE = 1024;

    // Idle values retained; returns beyond this are destroyed. 0 retains
    // nothing, UNBOUNDED (TOML: "unbounded") retains everything.
    std::size_t max_idle{DEFAULT_MAX_IDLE};

    // Values constructed eagerly when the Recycler is created
    std::size_t prefill{0};

    [[nodiscard]] bool bounded() const noexcept {
        return max_idle != UNBOUNDED;
    }

    /**
     * @brief Check the settings are consistent
     * @throws std::runtime_error if prefill exceeds max_idle
     */
    void validate() const;

    [[nodiscard]] static RecyclerConfig unbounded(std::size_t prefill_count = 0) noexcept {
        return RecyclerConfig{.max_idle = UNBOUNDED, .prefill = prefill_count};
    }

    // max_idle_count is taken literally: 0 disables retention
    [[nodiscard]] static RecyclerConfig with_max_idle(std::size_t max_idle_count,
                                                      std::size_t prefill_count = 0) noexcept {
        return RecyclerConfig{.max_idle = max_idle_count, .prefill = prefill_count};
    }
};

}  // namespace recycling::core
