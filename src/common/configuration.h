#ifndef GIFTCHAIN_CONFIGURATION_H_
#define GIFTCHAIN_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace Giftchain {

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
struct GiftchainConfig {
    // Bag of presents drained by the servants
    struct Presents {
        ConfigValue<int64_t> max_item{static_cast<int64_t>(kDefaultMaxItem), "GIFTCHAIN_MAX_ITEM"};
        ConfigValue<int> servants{kDefaultServants, "GIFTCHAIN_SERVANTS"};
        // 0 seeds the shuffle from std::random_device
        ConfigValue<int64_t> seed{0, "GIFTCHAIN_SEED"};
        // Alternate adding presents with removing the head of the chain for a card
        ConfigValue<bool> thank_you_cards{false, "GIFTCHAIN_THANK_YOU_CARDS"};
        // Every n-th servant iteration asks whether a random present is on the chain. 0 = never.
        ConfigValue<int> query_every{0, "GIFTCHAIN_QUERY_EVERY"};
        ConfigValue<bool> verify{true, "GIFTCHAIN_VERIFY"};
    } presents;

    // Temperature sensors and the hourly report
    struct Telemetry {
        ConfigValue<int> sensors{kDefaultSensors, "GIFTCHAIN_SENSORS"};
        ConfigValue<int64_t> speedup{kDefaultSpeedup, "GIFTCHAIN_SPEEDUP"};
        ConfigValue<int> reports{1, "GIFTCHAIN_REPORTS"};
        ConfigValue<int64_t> min_temp{kDefaultMinTemp, "GIFTCHAIN_MIN_TEMP"};
        ConfigValue<int64_t> max_temp{kDefaultMaxTemp, "GIFTCHAIN_MAX_TEMP"};
        ConfigValue<int> window_minutes{kDefaultWindowMinutes, "GIFTCHAIN_WINDOW_MINUTES"};
        ConfigValue<int> top_n{kDefaultTopN, "GIFTCHAIN_TOP_N"};
    } telemetry;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const GiftchainConfig& config() const { return config_; }
    GiftchainConfig& config() { return config_; }

    // Restore every value to its built-in default
    void reset() { config_ = GiftchainConfig{}; }

    // Helper methods for common access patterns
    Item getMaxItem() const { return static_cast<Item>(config_.presents.max_item.get()); }
    int getServants() const { return config_.presents.servants.get(); }
    int getSensors() const { return config_.telemetry.sensors.get(); }
    int64_t getSpeedup() const { return config_.telemetry.speedup.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

private:
    Configuration() = default;

    GiftchainConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Giftchain

#endif // GIFTCHAIN_CONFIGURATION_H_
