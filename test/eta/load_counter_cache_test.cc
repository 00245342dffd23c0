#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "eta/load_counter_cache.h"
#include "counter_store/in_memory_counter_store.h"
#include "../fakes.h"

#include <thread>
#include <vector>

using namespace KitchenEta;
using namespace KitchenEta::testing_support;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

namespace {
constexpr LocationId kLocation = 42;
}

class LoadCounterCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<InMemoryCounterStore>([this]() { return clock_.Now(); });
        cache_ = std::make_unique<LoadCounterCache>(*store_, source_);
    }

    ManualClock clock_;
    FakeActiveOrderSource source_;
    std::unique_ptr<InMemoryCounterStore> store_;
    std::unique_ptr<LoadCounterCache> cache_;
};

TEST_F(LoadCounterCacheTest, KeysShareThePrefix) {
    EXPECT_EQ(cache_->CountKey(kLocation), "location_load:42");
    EXPECT_EQ(cache_->LockKey(kLocation), "location_load:42:lock");
}

TEST_F(LoadCounterCacheTest, MissPopulatesFromSourceThenHits) {
    source_.SetCount(kLocation, 7);
    EXPECT_EQ(cache_->Get(kLocation), 7);
    EXPECT_EQ(store_->Get("location_load:42"), 7);

    source_.SetCount(kLocation, 9);
    EXPECT_EQ(cache_->Get(kLocation), 7);
    EXPECT_EQ(source_.calls(), 1);
}

TEST_F(LoadCounterCacheTest, MissReleasesLock) {
    source_.SetCount(kLocation, 3);
    cache_->Get(kLocation);
    EXPECT_FALSE(store_->Get("location_load:42:lock").has_value());
}

TEST_F(LoadCounterCacheTest, HitRefreshesExpiry) {
    source_.SetCount(kLocation, 7);
    cache_->Get(kLocation);
    source_.SetCount(kLocation, 1);

    clock_.Advance(3000s);
    EXPECT_EQ(cache_->Get(kLocation), 7);
    clock_.Advance(3000s);
    EXPECT_EQ(cache_->Get(kLocation), 7);
}

TEST_F(LoadCounterCacheTest, ExpiredEntryIsRepopulated) {
    source_.SetCount(kLocation, 7);
    cache_->Get(kLocation);
    source_.SetCount(kLocation, 2);

    clock_.Advance(3600s);
    EXPECT_EQ(cache_->Get(kLocation), 2);
    EXPECT_EQ(source_.calls(), 2);
}

TEST_F(LoadCounterCacheTest, LockContentionReadsSourceWithoutCaching) {
    source_.SetCount(kLocation, 4);
    ASSERT_TRUE(store_->SetIfAbsent("location_load:42:lock", 1, 10s));

    EXPECT_EQ(cache_->Get(kLocation), 4);
    EXPECT_FALSE(store_->Get("location_load:42").has_value());
    // Someone else's lock is left alone
    EXPECT_TRUE(store_->Get("location_load:42:lock").has_value());
}

TEST_F(LoadCounterCacheTest, AbandonedLockExpires) {
    source_.SetCount(kLocation, 4);
    ASSERT_TRUE(store_->SetIfAbsent("location_load:42:lock", 1, 10s));
    clock_.Advance(10s);

    EXPECT_EQ(cache_->Get(kLocation), 4);
    EXPECT_EQ(store_->Get("location_load:42"), 4);
}

TEST_F(LoadCounterCacheTest, LockReleasedWhenSourceFails) {
    source_.SetUnavailable(true);

    EXPECT_EQ(cache_->Get(kLocation), 0);
    EXPECT_FALSE(store_->Get("location_load:42").has_value());
    EXPECT_FALSE(store_->Get("location_load:42:lock").has_value());
}

TEST_F(LoadCounterCacheTest, IncrementAndDecrementAreExact) {
    cache_->Set(kLocation, 2);
    EXPECT_EQ(cache_->Increment(kLocation), 3);
    EXPECT_EQ(cache_->Increment(kLocation), 4);
    EXPECT_EQ(cache_->Decrement(kLocation), 3);
    EXPECT_EQ(cache_->Get(kLocation), 3);
    EXPECT_EQ(source_.calls(), 0);
}

TEST_F(LoadCounterCacheTest, FirstIncrementCreatesEntry) {
    EXPECT_EQ(cache_->Increment(kLocation), 1);
    EXPECT_EQ(store_->Get("location_load:42"), 1);
}

TEST_F(LoadCounterCacheTest, ClampedDecrementResyncsFromSource) {
    cache_->Set(kLocation, 0);
    source_.SetCount(kLocation, 3);

    EXPECT_EQ(cache_->Decrement(kLocation), 3);
    EXPECT_EQ(store_->Get("location_load:42"), 3);
}

TEST_F(LoadCounterCacheTest, ClampedDecrementNeverStoresNegative) {
    cache_->Set(kLocation, 0);
    source_.SetUnavailable(true);

    EXPECT_EQ(cache_->Decrement(kLocation), 0);
    EXPECT_EQ(store_->Get("location_load:42"), 0);
}

TEST_F(LoadCounterCacheTest, SetClampsNegativeCounts) {
    cache_->Set(kLocation, -5);
    EXPECT_EQ(store_->Get("location_load:42"), 0);
}

TEST_F(LoadCounterCacheTest, ResyncOverwritesWithSourceValue) {
    cache_->Set(kLocation, 10);
    cache_->Increment(kLocation);
    source_.SetCount(kLocation, 4);

    EXPECT_EQ(cache_->Resync(kLocation), 4);
    EXPECT_EQ(cache_->Get(kLocation), 4);
}

TEST_F(LoadCounterCacheTest, ResyncWithSourceDownKeepsEntry) {
    cache_->Set(kLocation, 10);
    source_.SetUnavailable(true);

    EXPECT_FALSE(cache_->Resync(kLocation).has_value());
    EXPECT_EQ(store_->Get("location_load:42"), 10);
}

TEST_F(LoadCounterCacheTest, InvalidateForcesRepopulation) {
    cache_->Set(kLocation, 10);
    source_.SetCount(kLocation, 6);

    cache_->Invalidate(kLocation);
    EXPECT_EQ(cache_->Get(kLocation), 6);
}

TEST_F(LoadCounterCacheTest, StatsCountLocationsNotLocks) {
    cache_->Set(1, 3);
    cache_->Set(2, 4);
    ASSERT_TRUE(store_->SetIfAbsent("location_load:3:lock", 1, 10s));
    store_->SetWithExpiry("unrelated", 100, 10s);

    LoadCacheStats stats = cache_->GetStats();
    EXPECT_TRUE(stats.healthy);
    EXPECT_EQ(stats.cached_locations, 2u);
    EXPECT_EQ(stats.total_cached_orders, 7);
}

TEST_F(LoadCounterCacheTest, ConcurrentIncrementsFromZeroYieldExactCount) {
    const int num_threads = 8;
    const int ops_per_thread = 250;
    cache_->Set(kLocation, 0);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                cache_->Increment(kLocation);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(cache_->Get(kLocation), num_threads * ops_per_thread);
}

TEST_F(LoadCounterCacheTest, ConcurrentTransitionsNetOut) {
    const int num_threads = 8;
    const int pairs_per_thread = 200;
    cache_->Set(kLocation, 5);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < pairs_per_thread; ++i) {
                cache_->Increment(kLocation);
                cache_->Decrement(kLocation);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(cache_->Get(kLocation), 5);
    EXPECT_EQ(source_.calls(), 0);
}

TEST_F(LoadCounterCacheTest, ConcurrentColdReadsAgree) {
    const int num_threads = 16;
    source_.SetCount(kLocation, 11);

    std::vector<int64_t> results(num_threads, -1);
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, &results]() {
            results[t] = cache_->Get(kLocation);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int64_t result : results) {
        EXPECT_EQ(result, 11);
    }
    EXPECT_EQ(store_->Get("location_load:42"), 11);
    EXPECT_FALSE(store_->Get("location_load:42:lock").has_value());
}

class LoadCounterCacheUnreachableStoreTest : public ::testing::Test {
protected:
    UnreachableCounterStore store_;
    FakeActiveOrderSource source_;
    LoadCounterCache cache_{store_, source_};
};

TEST_F(LoadCounterCacheUnreachableStoreTest, GetFallsBackToSource) {
    source_.SetCount(kLocation, 8);
    EXPECT_EQ(cache_.Get(kLocation), 8);
}

TEST_F(LoadCounterCacheUnreachableStoreTest, WritesFallBackToResync) {
    source_.SetCount(kLocation, 8);
    EXPECT_EQ(cache_.Increment(kLocation), 8);
    EXPECT_EQ(cache_.Decrement(kLocation), 8);
    EXPECT_EQ(source_.calls(), 2);
}

TEST_F(LoadCounterCacheUnreachableStoreTest, NothingEscapes) {
    EXPECT_NO_THROW(cache_.Set(kLocation, 3));
    EXPECT_NO_THROW(cache_.Invalidate(kLocation));
    EXPECT_NO_THROW(cache_.Resync(kLocation));

    source_.SetUnavailable(true);
    EXPECT_EQ(cache_.Get(kLocation), 0);
    EXPECT_EQ(cache_.Increment(kLocation), 0);
    EXPECT_EQ(cache_.Decrement(kLocation), 0);
}

TEST_F(LoadCounterCacheUnreachableStoreTest, StatsReportUnhealthy) {
    LoadCacheStats stats = cache_.GetStats();
    EXPECT_FALSE(stats.healthy);
    EXPECT_EQ(stats.cached_locations, 0u);
}

TEST(LoadCounterCacheLockTest, RechecksEntryAfterTakingLock) {
    MockCounterStore store;
    FakeActiveOrderSource source;
    LoadCounterCache cache(store, source);

    EXPECT_CALL(store, GetAndExpire("location_load:42", _)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, SetIfAbsent("location_load:42:lock", 1, std::chrono::seconds(10))).WillOnce(Return(true));
    EXPECT_CALL(store, Get("location_load:42")).WillOnce(Return(std::optional<int64_t>(5)));
    EXPECT_CALL(store, SetWithExpiry(_, _, _)).Times(0);
    EXPECT_CALL(store, Delete("location_load:42:lock")).WillOnce(Return(true));

    EXPECT_EQ(cache.Get(kLocation), 5);
    EXPECT_EQ(source.calls(), 0);
}

TEST(LoadCounterCacheLockTest, WritesWithSafetyNetTtl) {
    MockCounterStore store;
    FakeActiveOrderSource source;
    source.SetCount(kLocation, 6);
    LoadCounterCache cache(store, source);

    EXPECT_CALL(store, GetAndExpire("location_load:42", std::chrono::seconds(3600))).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, SetIfAbsent("location_load:42:lock", 1, std::chrono::seconds(10))).WillOnce(Return(true));
    EXPECT_CALL(store, Get("location_load:42")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, SetWithExpiry("location_load:42", 6, std::chrono::seconds(3600))).Times(1);
    EXPECT_CALL(store, Delete("location_load:42:lock")).WillOnce(Return(true));

    EXPECT_EQ(cache.Get(kLocation), 6);
}

TEST(LoadCounterCacheLockTest, FailedPopulateWriteReturnsSourceCount) {
    MockCounterStore store;
    FakeActiveOrderSource source;
    source.SetCount(kLocation, 6);
    LoadCounterCache cache(store, source);

    EXPECT_CALL(store, GetAndExpire(_, _)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, SetIfAbsent(_, _, _)).WillOnce(Return(true));
    EXPECT_CALL(store, Get(_)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, SetWithExpiry(_, _, _))
        .WillOnce(::testing::Throw(StoreUnavailableError("write timed out")));
    EXPECT_CALL(store, Delete("location_load:42:lock")).WillOnce(Return(true));

    EXPECT_EQ(cache.Get(kLocation), 6);
    // The count already read is returned, not read again
    EXPECT_EQ(source.calls(), 1);
}
