#ifndef ENFORCER_CONFIG_H
#define ENFORCER_CONFIG_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Construction-time settings of a ThermodynamicEnforcer.
 */
struct EnforcerConfig {
    double entropyThreshold = 7.2;             // bits/byte
    double temperatureVarianceThreshold = 1.0; // same unit as the probe
    int checkIntervalSeconds = 60;
    std::vector<std::string> shardIds;         // checked in this order
    int stopTimeoutSeconds = 5;                // bounded wait in stop()

    // Only read by the daemon.
    std::string logFile;
    std::string logLevel = "info";

    /**
     * @brief Checks ranges.
     * @throws std::invalid_argument describing the first invalid field.
     */
    void validate() const;

    /**
     * @brief Builds a configuration from a JSON object. Absent keys keep
     * their defaults. The result is validated.
     * @throws std::invalid_argument on wrong types or invalid values.
     */
    static EnforcerConfig fromJson(const nlohmann::json& document);

    /**
     * @brief Reads and parses a JSON configuration file.
     * @throws std::invalid_argument if the file is missing or malformed.
     */
    static EnforcerConfig loadFromFile(const std::string& path);
};

#endif // ENFORCER_CONFIG_H
