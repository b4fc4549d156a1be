#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Giftchain {

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
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
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

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["giftchain"]) {
        LOG(WARNING) << "Configuration has no top-level 'giftchain' section, keeping defaults";
        return;
    }
    auto root = yaml["giftchain"];

    // Presents
    if (root["presents"]) {
        auto presents = root["presents"];
        if (presents["max_item"]) config_.presents.max_item.set(presents["max_item"].as<int64_t>());
        if (presents["servants"]) config_.presents.servants.set(presents["servants"].as<int>());
        if (presents["seed"]) config_.presents.seed.set(presents["seed"].as<int64_t>());
        if (presents["thank_you_cards"]) config_.presents.thank_you_cards.set(presents["thank_you_cards"].as<bool>());
        if (presents["query_every"]) config_.presents.query_every.set(presents["query_every"].as<int>());
        if (presents["verify"]) config_.presents.verify.set(presents["verify"].as<bool>());
    }

    // Telemetry
    if (root["telemetry"]) {
        auto telemetry = root["telemetry"];
        if (telemetry["sensors"]) config_.telemetry.sensors.set(telemetry["sensors"].as<int>());
        if (telemetry["speedup"]) config_.telemetry.speedup.set(telemetry["speedup"].as<int64_t>());
        if (telemetry["reports"]) config_.telemetry.reports.set(telemetry["reports"].as<int>());
        if (telemetry["min_temp"]) config_.telemetry.min_temp.set(telemetry["min_temp"].as<int64_t>());
        if (telemetry["max_temp"]) config_.telemetry.max_temp.set(telemetry["max_temp"].as<int64_t>());
        if (telemetry["window_minutes"]) config_.telemetry.window_minutes.set(telemetry["window_minutes"].as<int>());
        if (telemetry["top_n"]) config_.telemetry.top_n.set(telemetry["top_n"].as<int>());
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

    // Presents
    if (config_.presents.max_item.get() < 1) {
        validation_errors_.push_back("max_item must be at least 1");
    }
    if (config_.presents.servants.get() < 1) {
        validation_errors_.push_back("Servants must be at least 1");
    }
    if (config_.presents.query_every.get() < 0) {
        validation_errors_.push_back("query_every cannot be negative");
    }

    // Telemetry
    if (config_.telemetry.sensors.get() < 1) {
        validation_errors_.push_back("Sensors must be at least 1");
    }
    if (config_.telemetry.speedup.get() < 1) {
        validation_errors_.push_back("Speedup must be at least 1");
    }
    if (config_.telemetry.reports.get() < 1) {
        validation_errors_.push_back("Reports must be at least 1");
    }
    if (config_.telemetry.min_temp.get() > config_.telemetry.max_temp.get()) {
        validation_errors_.push_back("min_temp cannot exceed max_temp");
    }
    if (config_.telemetry.window_minutes.get() < 1) {
        validation_errors_.push_back("window_minutes must be at least 1");
    }
    if (config_.telemetry.top_n.get() < 1) {
        validation_errors_.push_back("top_n must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Giftchain
