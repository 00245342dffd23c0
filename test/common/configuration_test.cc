#include <gtest/gtest.h>
#include "common/configuration.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace KitchenEta;

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("KITCHEN_ETA_LOAD_THRESHOLD");
        unsetenv("KITCHEN_ETA_CACHE_PREFIX");
        unsetenv("KITCHEN_ETA_LOAD_STEP");
    }

    Configuration configuration_;
};

TEST_F(ConfigurationTest, DefaultsMatchServingValues) {
    const KitchenEtaConfig& config = configuration_.config();
    EXPECT_EQ(config.cache.key_prefix.get(), "location_load:");
    EXPECT_EQ(config.cache.ttl_seconds.get(), 3600);
    EXPECT_EQ(config.cache.lock_ttl_seconds.get(), 10);
    EXPECT_EQ(config.store.address.get(), "");
    EXPECT_EQ(config.store.rpc_timeout_ms.get(), 200);
    EXPECT_EQ(config.estimator.minimum_ready_seconds.get(), 600);
    EXPECT_EQ(config.estimator.load_threshold.get(), 5);
    EXPECT_DOUBLE_EQ(config.estimator.load_step.get(), 1.2);
    EXPECT_DOUBLE_EQ(config.estimator.max_multiplier.get(), 3.0);
    EXPECT_DOUBLE_EQ(config.estimator.high_load_multiplier.get(), 2.0);
    EXPECT_TRUE(configuration_.validate());
}

TEST_F(ConfigurationTest, YamlOverridesOnlyWhatItNames) {
    ASSERT_TRUE(configuration_.loadFromString(R"(
kitchen_eta:
  cache:
    key_prefix: "staging_load:"
    ttl_seconds: 120
  store:
    address: "counterd:50061"
)"));
    const KitchenEtaConfig& config = configuration_.config();
    EXPECT_EQ(config.cache.key_prefix.get(), "staging_load:");
    EXPECT_EQ(config.cache.ttl_seconds.get(), 120);
    EXPECT_EQ(config.cache.lock_ttl_seconds.get(), 10);
    EXPECT_EQ(config.store.address.get(), "counterd:50061");
    EXPECT_EQ(config.estimator.minimum_ready_seconds.get(), 600);
}

TEST_F(ConfigurationTest, MissingRootKeepsDefaults) {
    EXPECT_TRUE(configuration_.loadFromString("other_service:\n  port: 1\n"));
    EXPECT_EQ(configuration_.config().cache.ttl_seconds.get(), 3600);
}

TEST_F(ConfigurationTest, EnvironmentWinsOverYaml) {
    ASSERT_TRUE(configuration_.loadFromString(R"(
kitchen_eta:
  estimator:
    load_threshold: 8
)"));
    setenv("KITCHEN_ETA_LOAD_THRESHOLD", "3", 1);
    setenv("KITCHEN_ETA_CACHE_PREFIX", "env_load:", 1);

    EXPECT_EQ(configuration_.config().estimator.load_threshold.get(), 3);
    EXPECT_EQ(configuration_.config().cache.key_prefix.get(), "env_load:");
}

TEST_F(ConfigurationTest, UnparsableEnvironmentIsIgnored) {
    setenv("KITCHEN_ETA_LOAD_STEP", "steep", 1);
    EXPECT_DOUBLE_EQ(configuration_.config().estimator.load_step.get(), 1.2);
}

TEST_F(ConfigurationTest, InvalidValuesAreReported) {
    EXPECT_FALSE(configuration_.loadFromString(R"(
kitchen_eta:
  cache:
    key_prefix: ""
    lock_ttl_seconds: 0
  estimator:
    load_threshold: 0
    load_step: 0.5
)"));
    EXPECT_EQ(configuration_.getValidationErrors().size(), 4u);
}

TEST_F(ConfigurationTest, MalformedYamlFailsToLoad) {
    EXPECT_FALSE(configuration_.loadFromString("kitchen_eta: [unterminated"));
    EXPECT_FALSE(configuration_.loadFromString(R"(
kitchen_eta:
  cache:
    ttl_seconds: forever
)"));
}

TEST_F(ConfigurationTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "kitchen_eta_config_test.yaml";
    {
        std::ofstream file(path);
        file << "kitchen_eta:\n  estimator:\n    minimum_ready_seconds: 300\n";
    }
    EXPECT_TRUE(configuration_.loadFromFile(path));
    EXPECT_EQ(configuration_.config().estimator.minimum_ready_seconds.get(), 300);
    std::remove(path.c_str());

    EXPECT_FALSE(configuration_.loadFromFile(path));
}
