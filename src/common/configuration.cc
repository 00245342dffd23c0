#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace KitchenEta {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["kitchen_eta"]) {
        LOG(WARNING) << "Configuration has no kitchen_eta root, keeping defaults";
        return;
    }
    auto root = yaml["kitchen_eta"];

    // Cache
    if (root["cache"]) {
        auto cache = root["cache"];
        if (cache["key_prefix"]) config_.cache.key_prefix.set(cache["key_prefix"].as<std::string>());
        if (cache["ttl_seconds"]) config_.cache.ttl_seconds.set(cache["ttl_seconds"].as<int>());
        if (cache["lock_ttl_seconds"]) config_.cache.lock_ttl_seconds.set(cache["lock_ttl_seconds"].as<int>());
    }

    // Store
    if (root["store"]) {
        auto store = root["store"];
        if (store["address"]) config_.store.address.set(store["address"].as<std::string>());
        if (store["listen_address"]) config_.store.listen_address.set(store["listen_address"].as<std::string>());
        if (store["rpc_timeout_ms"]) config_.store.rpc_timeout_ms.set(store["rpc_timeout_ms"].as<int>());
        if (store["eviction_interval_seconds"]) config_.store.eviction_interval_seconds.set(store["eviction_interval_seconds"].as<int>());
    }

    // Estimator
    if (root["estimator"]) {
        auto estimator = root["estimator"];
        if (estimator["minimum_ready_seconds"]) config_.estimator.minimum_ready_seconds.set(estimator["minimum_ready_seconds"].as<int>());
        if (estimator["load_threshold"]) config_.estimator.load_threshold.set(estimator["load_threshold"].as<int>());
        if (estimator["load_step"]) config_.estimator.load_step.set(estimator["load_step"].as<double>());
        if (estimator["max_multiplier"]) config_.estimator.max_multiplier.set(estimator["max_multiplier"].as<double>());
        if (estimator["high_load_multiplier"]) config_.estimator.high_load_multiplier.set(estimator["high_load_multiplier"].as<double>());
    }

    // Logging
    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["verbosity"]) config_.logging.verbosity.set(logging["verbosity"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.cache.key_prefix.get().empty()) {
        validation_errors_.push_back("Cache key prefix must not be empty");
    }

    if (config_.cache.ttl_seconds.get() < 1) {
        validation_errors_.push_back("Cache TTL must be at least 1 second");
    }

    if (config_.cache.lock_ttl_seconds.get() < 1) {
        validation_errors_.push_back("Cache lock TTL must be at least 1 second");
    }

    if (config_.store.rpc_timeout_ms.get() < 1) {
        validation_errors_.push_back("Store RPC timeout must be at least 1ms");
    }

    if (config_.store.eviction_interval_seconds.get() < 1) {
        validation_errors_.push_back("Store eviction interval must be at least 1 second");
    }

    if (config_.estimator.minimum_ready_seconds.get() < 0) {
        validation_errors_.push_back("Minimum ready time cannot be negative");
    }

    if (config_.estimator.load_threshold.get() < 1) {
        validation_errors_.push_back("Load threshold must be at least 1 order");
    }

    if (config_.estimator.load_step.get() < 1.0) {
        validation_errors_.push_back("Load step must be at least 1.0");
    }

    if (config_.estimator.max_multiplier.get() < 1.0) {
        validation_errors_.push_back("Max multiplier must be at least 1.0");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace KitchenEta
