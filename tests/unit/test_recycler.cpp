#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "core/recycler.hpp"

using namespace recycling::core;

namespace {

struct Counters {
    std::atomic<int> created{0};
    std::atomic<int> live{0};
};

// Value that records its own construction and destruction
struct Tracked {
    Counters* counters;
    int payload{0};

    explicit Tracked(Counters& c) : counters(&c) {
        counters->created.fetch_add(1, std::memory_order_relaxed);
        counters->live.fetch_add(1, std::memory_order_relaxed);
    }
    Tracked(Tracked&& other) noexcept : counters(other.counters), payload(other.payload) {
        counters->live.fetch_add(1, std::memory_order_relaxed);
    }
    ~Tracked() {
        counters->live.fetch_sub(1, std::memory_order_relaxed);
    }

    Tracked(const Tracked&) = delete;
    Tracked& operator=(const Tracked&) = delete;
    Tracked& operator=(Tracked&&) = delete;
};

struct Scratch {
    std::vector<int> tokens;
    int cursor{0};

    void reset() noexcept {
        tokens.clear();
        cursor = 0;
    }
};

struct Plain {
    int value{0};
};

// Neither copyable nor movable; only the default-construct path can build it
struct Pinned {
    std::mutex guard;
    int value{0};
};

}  // anonymous namespace

class RecyclerTest : public ::testing::Test {
  protected:
    Recycler<Tracked>::Factory tracked_factory() {
        return [this] { return Tracked(counters_); };
    }

    Counters counters_;
};

TEST_F(RecyclerTest, EmptyPoolConstructsExactlyOnce) {
    Recycler<Tracked> recycler(tracked_factory());

    auto lease = recycler.allocate();

    ASSERT_TRUE(lease.valid());
    EXPECT_EQ(counters_.created.load(), 1);
    EXPECT_EQ(recycler.stats().constructed, 1);
    EXPECT_EQ(recycler.stats().reused, 0);
}

TEST_F(RecyclerTest, ReleasedValueIsReused) {
    Recycler<Tracked> recycler(tracked_factory());

    Tracked* address = nullptr;
    {
        auto lease = recycler.allocate();
        address = lease.get();
    }
    EXPECT_EQ(recycler.idle_count(), 1);

    auto lease = recycler.allocate();
    EXPECT_EQ(lease.get(), address);
    EXPECT_EQ(counters_.created.load(), 1);  // No second construction
    EXPECT_EQ(recycler.stats().reused, 1);
}

TEST_F(RecyclerTest, CapacityTwoScenario) {
    Recycler<Tracked> recycler(tracked_factory(), RecyclerConfig::with_max_idle(2));

    auto l1 = recycler.allocate();
    auto l2 = recycler.allocate();
    auto l3 = recycler.allocate();
    EXPECT_EQ(counters_.created.load(), 3);

    Tracked* a1 = l1.get();
    Tracked* a2 = l2.get();

    std::move(l1).return_to_pool();
    std::move(l2).return_to_pool();
    EXPECT_EQ(recycler.idle_count(), 2);

    auto l4 = recycler.allocate();
    EXPECT_TRUE(l4.get() == a1 || l4.get() == a2);
    EXPECT_EQ(counters_.created.load(), 3);
    EXPECT_EQ(recycler.idle_count(), 1);

    // Put l4 back so the store is full again, then release l3
    std::move(l4).return_to_pool();
    EXPECT_EQ(recycler.idle_count(), 2);

    std::move(l3).return_to_pool();
    EXPECT_EQ(recycler.idle_count(), 2);
    EXPECT_EQ(counters_.live.load(), 2);  // l3's value destroyed
    EXPECT_EQ(recycler.stats().discarded, 1);
}

TEST_F(RecyclerTest, ResetBeforeReuse) {
    Recycler<Scratch> recycler;

    {
        auto scratch = recycler.allocate();
        scratch->tokens = {4, 5, 6};
        scratch->cursor = 2;
    }

    auto scratch = recycler.allocate();
    EXPECT_TRUE(scratch->tokens.empty());
    EXPECT_EQ(scratch->cursor, 0);
    EXPECT_EQ(recycler.stats().reused, 1);
}

TEST_F(RecyclerTest, ValueWithoutResetArrivesAsLeft) {
    Recycler<Plain> recycler;

    {
        auto plain = recycler.allocate();
        plain->value = 99;
    }

    auto plain = recycler.allocate();
    EXPECT_EQ(plain->value, 99);
}

TEST_F(RecyclerTest, FactoryFailurePropagates) {
    int calls = 0;
    Recycler<Plain> recycler([&calls]() -> Plain {
        if (++calls == 1) {
            throw std::runtime_error("out of handles");
        }
        return Plain{7};
    });

    EXPECT_THROW((void)recycler.allocate(), std::runtime_error);
    EXPECT_EQ(recycler.stats().constructed, 0);

    auto lease = recycler.allocate();
    EXPECT_EQ(lease->value, 7);
    EXPECT_EQ(calls, 2);
}

TEST_F(RecyclerTest, EmptyFactoryIsRejected) {
    EXPECT_THROW(Recycler<Plain>(Recycler<Plain>::Factory{}), std::invalid_argument);
}

TEST_F(RecyclerTest, InvalidConfigIsRejected) {
    RecyclerConfig config;
    config.max_idle = 2;
    config.prefill = 3;

    EXPECT_THROW(Recycler<Tracked>(tracked_factory(), config), std::runtime_error);
    EXPECT_EQ(counters_.created.load(), 0);
}

TEST_F(RecyclerTest, NonMovableTypeIsSupported) {
    Recycler<Pinned> recycler;

    Pinned* address = nullptr;
    {
        auto pinned = recycler.allocate();
        std::lock_guard<std::mutex> lock(pinned->guard);
        pinned->value = 1;
        address = pinned.get();
    }

    auto pinned = recycler.allocate();
    EXPECT_EQ(pinned.get(), address);
    EXPECT_EQ(pinned->value, 1);
}

TEST_F(RecyclerTest, PrefillFromConfig) {
    Recycler<Tracked> recycler(tracked_factory(), RecyclerConfig::with_max_idle(8, 5));

    EXPECT_EQ(recycler.idle_count(), 5);
    EXPECT_EQ(counters_.created.load(), 5);

    auto lease = recycler.allocate();
    EXPECT_EQ(counters_.created.load(), 5);  // Served from the warm store
    EXPECT_EQ(recycler.stats().reused, 1);
}

TEST_F(RecyclerTest, PrefillStopsAtCapacity) {
    Recycler<Tracked> recycler(tracked_factory(), RecyclerConfig::with_max_idle(4));

    EXPECT_EQ(recycler.prefill(10), 4);
    EXPECT_EQ(recycler.idle_count(), 4);
    EXPECT_EQ(counters_.created.load(), 4);

    EXPECT_EQ(recycler.prefill(1), 0);
    EXPECT_EQ(counters_.created.load(), 4);
}

TEST_F(RecyclerTest, TrimAndClearDestroyIdleValues) {
    Recycler<Tracked> recycler(tracked_factory(), RecyclerConfig::with_max_idle(8, 6));

    EXPECT_EQ(recycler.trim(2), 4);
    EXPECT_EQ(recycler.idle_count(), 2);
    EXPECT_EQ(counters_.live.load(), 2);

    EXPECT_EQ(recycler.clear(), 2);
    EXPECT_EQ(counters_.live.load(), 0);
}

TEST_F(RecyclerTest, UnboundedConfigRetainsEverything) {
    Recycler<Tracked> recycler(tracked_factory(), RecyclerConfig::unbounded());
    EXPECT_EQ(recycler.capacity(), RecyclerConfig::UNBOUNDED);

    {
        std::vector<Lease<Tracked>> leases;
        for (int i = 0; i < 3000; ++i) {
            leases.push_back(recycler.allocate());
        }
    }

    EXPECT_EQ(recycler.idle_count(), 3000);
    EXPECT_EQ(recycler.stats().discarded, 0);
}

TEST_F(RecyclerTest, DefaultCapacityIsBounded) {
    Recycler<Plain> recycler;
    EXPECT_EQ(recycler.capacity(), RecyclerConfig::DEFAULT_MAX_IDLE);
    EXPECT_TRUE(recycler.config().bounded());
}

TEST_F(RecyclerTest, HugeMaxIdleIsOnlyARetentionBound) {
    const auto config = RecyclerConfig::with_max_idle(std::size_t{1} << 61);
    EXPECT_NO_THROW(config.validate());

    std::unique_ptr<Recycler<Plain>> recycler;
    ASSERT_NO_THROW(recycler = std::make_unique<Recycler<Plain>>(config));
    EXPECT_EQ(recycler->capacity(), std::size_t{1} << 61);

    {
        auto lease = recycler->allocate();
        lease->value = 3;
    }
    EXPECT_EQ(recycler->idle_count(), 1);
    EXPECT_EQ(recycler->allocate()->value, 3);
}

TEST_F(RecyclerTest, ZeroMaxIdleRetainsNothing) {
    Recycler<Tracked> recycler(tracked_factory(), RecyclerConfig::with_max_idle(0));

    {
        auto lease = recycler.allocate();
    }
    EXPECT_EQ(recycler.idle_count(), 0);
    EXPECT_EQ(counters_.live.load(), 0);
    EXPECT_EQ(recycler.stats().discarded, 1);
}

TEST_F(RecyclerTest, DestroyingRecyclerDestroysIdleValues) {
    {
        Recycler<Tracked> recycler(tracked_factory(), RecyclerConfig::with_max_idle(4, 3));
        EXPECT_EQ(counters_.live.load(), 3);
    }
    EXPECT_EQ(counters_.live.load(), 0);
}

TEST_F(RecyclerTest, LeaseMayOutliveRecycler) {
    std::unique_ptr<Lease<Tracked>> survivor;
    {
        Recycler<Tracked> recycler(tracked_factory());
        survivor = std::make_unique<Lease<Tracked>>(recycler.allocate());
        (*survivor)->payload = 12;
    }

    // Still usable after the Recycler is gone
    EXPECT_EQ((*survivor)->payload, 12);
    EXPECT_EQ(counters_.live.load(), 1);

    survivor.reset();
    EXPECT_EQ(counters_.live.load(), 0);
}

TEST_F(RecyclerTest, StatsTrackReuseRatio) {
    Recycler<Plain> recycler;

    for (int i = 0; i < 4; ++i) {
        auto lease = recycler.allocate();
    }

    auto stats = recycler.stats();
    EXPECT_EQ(stats.constructed, 1);
    EXPECT_EQ(stats.reused, 3);
    EXPECT_EQ(stats.returned, 4);
    EXPECT_DOUBLE_EQ(stats.reuse_ratio(), 0.75);
}
