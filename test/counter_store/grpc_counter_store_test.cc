#include <gtest/gtest.h>
#include "counter_store/counter_store_service.h"
#include "counter_store/grpc_counter_store.h"

#include <thread>
#include <vector>

using namespace KitchenEta;
using namespace std::chrono_literals;

class GrpcCounterStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<CounterStoreServer>("127.0.0.1:0", 60s);
        ASSERT_TRUE(server_->IsRunning());
        address_ = "127.0.0.1:" + std::to_string(server_->SelectedPort());
        client_ = std::make_unique<GrpcCounterStore>(address_, 2000ms);
    }

    void TearDown() override {
        client_.reset();
        server_->Shutdown();
        server_.reset();
    }

    std::unique_ptr<CounterStoreServer> server_;
    std::string address_;
    std::unique_ptr<GrpcCounterStore> client_;
};

TEST_F(GrpcCounterStoreTest, SetAndGetRoundTripThroughServer) {
    EXPECT_FALSE(client_->Get("location_load:1").has_value());

    client_->SetWithExpiry("location_load:1", 12, 60s);
    EXPECT_EQ(client_->Get("location_load:1"), 12);
    EXPECT_EQ(client_->GetAndExpire("location_load:1", 60s), 12);
    EXPECT_EQ(server_->store().Get("location_load:1"), 12);
}

TEST_F(GrpcCounterStoreTest, CounterPrimitives) {
    EXPECT_EQ(client_->IncrementWithExpiry("k", 60s), 1);
    EXPECT_EQ(client_->IncrementWithExpiry("k", 60s), 2);

    DecrementResult down = client_->DecrementClampedWithExpiry("k", 60s);
    EXPECT_EQ(down.value, 1);
    EXPECT_FALSE(down.clamped);

    client_->DecrementClampedWithExpiry("k", 60s);
    DecrementResult clamped = client_->DecrementClampedWithExpiry("k", 60s);
    EXPECT_EQ(clamped.value, 0);
    EXPECT_TRUE(clamped.clamped);
}

TEST_F(GrpcCounterStoreTest, LockPrimitives) {
    EXPECT_TRUE(client_->SetIfAbsent("location_load:1:lock", 1, 10s));
    EXPECT_FALSE(client_->SetIfAbsent("location_load:1:lock", 1, 10s));
    EXPECT_TRUE(client_->Delete("location_load:1:lock"));
    EXPECT_FALSE(client_->Delete("location_load:1:lock"));
}

TEST_F(GrpcCounterStoreTest, ScanReturnsPrefixedEntries) {
    client_->SetWithExpiry("location_load:1", 2, 60s);
    client_->SetWithExpiry("location_load:2", 3, 60s);
    client_->SetWithExpiry("unrelated", 5, 60s);

    auto entries = client_->ScanPrefix("location_load:");
    EXPECT_EQ(entries.size(), 2u);
}

TEST_F(GrpcCounterStoreTest, RejectedRequestRaisesStoreUnavailable) {
    EXPECT_THROW(client_->IncrementWithExpiry("k", 0s), StoreUnavailableError);
    EXPECT_THROW(client_->Get(""), StoreUnavailableError);
}

TEST_F(GrpcCounterStoreTest, ConcurrentClientsShareOneCounter) {
    const int num_clients = 4;
    const int ops_per_client = 100;

    std::vector<std::thread> threads;
    for (int c = 0; c < num_clients; ++c) {
        threads.emplace_back([this]() {
            GrpcCounterStore client(address_, 2000ms);
            for (int i = 0; i < ops_per_client; ++i) {
                client.IncrementWithExpiry("shared", 60s);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(client_->Get("shared"), num_clients * ops_per_client);
}

TEST(GrpcCounterStoreUnreachableTest, CallsFailWithinDeadline) {
    // Nothing listens on the discard port
    GrpcCounterStore client("127.0.0.1:9", 100ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.Get("location_load:1"), StoreUnavailableError);
    EXPECT_THROW(client.IncrementWithExpiry("location_load:1", 60s), StoreUnavailableError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}
