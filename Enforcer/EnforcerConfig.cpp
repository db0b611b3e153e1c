#include "EnforcerConfig.h"
#include "AuditLog.h"
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Reads a whole number of seconds without letting an oversized value wrap into range.
int readSeconds(const json& document, const char* key, int fallback) {
    if (!document.contains(key)) {
        return fallback;
    }
    const json& value = document.at(key);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " must be an integer number of seconds");
    }
    if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(std::string(key) + " is out of range");
    }
    const std::int64_t seconds = value.get<std::int64_t>();
    if (seconds < std::numeric_limits<int>::min() || seconds > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string(key) + " is out of range");
    }
    return static_cast<int>(seconds);
}

} // namespace

void EnforcerConfig::validate() const {
    if (!(entropyThreshold >= 0.0 && entropyThreshold <= 8.0)) {
        throw std::invalid_argument("entropy_threshold must be within [0, 8] bits/byte");
    }
    if (!(temperatureVarianceThreshold > 0.0)) {
        throw std::invalid_argument("temperature_variance_threshold must be positive");
    }
    if (checkIntervalSeconds < 1) {
        throw std::invalid_argument("check_interval must be at least 1 second");
    }
    if (stopTimeoutSeconds < 1) {
        throw std::invalid_argument("stop_timeout must be at least 1 second");
    }
    for (const auto& shardId : shardIds) {
        if (shardId.empty()) {
            throw std::invalid_argument("shard_files must not contain empty identifiers");
        }
    }
    AuditLog::parseLevel(logLevel);
}

EnforcerConfig EnforcerConfig::fromJson(const json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    EnforcerConfig config;
    try {
        config.entropyThreshold = document.value("entropy_threshold", config.entropyThreshold);
        config.temperatureVarianceThreshold = document.value("temperature_variance_threshold", config.temperatureVarianceThreshold);
        config.checkIntervalSeconds = readSeconds(document, "check_interval", config.checkIntervalSeconds);
        config.stopTimeoutSeconds = readSeconds(document, "stop_timeout", config.stopTimeoutSeconds);
        config.shardIds = document.value("shard_files", config.shardIds);
        config.logFile = document.value("log_file", config.logFile);
        config.logLevel = document.value("log_level", config.logLevel);
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
}

EnforcerConfig EnforcerConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("Could not open configuration file: " + path);
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Could not parse configuration file " + path + ": " + e.what());
    }
    return fromJson(document);
}
