#ifndef KITCHEN_ETA_CONFIGURATION_H_
#define KITCHEN_ETA_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace KitchenEta {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct KitchenEtaConfig {
    // Fast counter cache keys and expiry
    struct Cache {
        ConfigValue<std::string> key_prefix{"location_load:", "KITCHEN_ETA_CACHE_PREFIX"};
        // Safety-net expiry of a count entry, refreshed on every read and write.
        ConfigValue<int> ttl_seconds{3600, "KITCHEN_ETA_CACHE_TTL"};
        // Miss-resolution lock; a crashed holder releases it by expiry.
        ConfigValue<int> lock_ttl_seconds{10, "KITCHEN_ETA_CACHE_LOCK_TTL"};
    } cache;

    // Shared counter store
    struct Store {
        // Empty address means the store lives in-process.
        ConfigValue<std::string> address{"", "KITCHEN_ETA_STORE_ADDR"};
        ConfigValue<std::string> listen_address{"0.0.0.0:50061", "KITCHEN_ETA_STORE_LISTEN"};
        ConfigValue<int> rpc_timeout_ms{200, "KITCHEN_ETA_STORE_RPC_TIMEOUT_MS"};
        ConfigValue<int> eviction_interval_seconds{60, "KITCHEN_ETA_STORE_EVICTION_INTERVAL"};
    } store;

    // Prep-time estimation
    struct Estimator {
        ConfigValue<int> minimum_ready_seconds{600, "KITCHEN_ETA_MIN_READY_SECONDS"};
        ConfigValue<int> load_threshold{5, "KITCHEN_ETA_LOAD_THRESHOLD"};
        ConfigValue<double> load_step{1.2, "KITCHEN_ETA_LOAD_STEP"};
        ConfigValue<double> max_multiplier{3.0, "KITCHEN_ETA_MAX_MULTIPLIER"};
        ConfigValue<double> high_load_multiplier{2.0, "KITCHEN_ETA_HIGH_LOAD_MULTIPLIER"};
    } estimator;

    struct Logging {
        ConfigValue<int> verbosity{0, "KITCHEN_ETA_LOG_LEVEL"};
    } logging;
};

/**
 * Configuration manager
 */
class Configuration {
public:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    // Process-wide instance used by the binaries
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const KitchenEtaConfig& config() const { return config_; }
    KitchenEtaConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    KitchenEtaConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace KitchenEta

#endif // KITCHEN_ETA_CONFIGURATION_H_
