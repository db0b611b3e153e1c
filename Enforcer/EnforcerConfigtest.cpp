#include <iostream>
#include <fstream>
#include <string>
#include <stdexcept>
#include <filesystem>
#include "EnforcerConfig.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

// Helper function to print test results
bool check(const std::string& testName, bool condition) {
    std::cout << "  [TEST] " << testName << "... "
              << (condition ? "PASSED" : "FAILED") << std::endl;
    return condition;
}

bool rejects(const EnforcerConfig& config) {
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    std::cout << "--- Starting Enforcer Config Test ---" << std::endl;
    bool allTestsPassed = true;

    // --- 1. Defaults ---
    std::cout << "\n--- 1. Defaults ---" << std::endl;
    EnforcerConfig defaults;
    if (!check("Default entropy threshold is 7.2", defaults.entropyThreshold == 7.2)) allTestsPassed = false;
    if (!check("Default temperature threshold is 1.0", defaults.temperatureVarianceThreshold == 1.0)) allTestsPassed = false;
    if (!check("Default interval is 60s", defaults.checkIntervalSeconds == 60)) allTestsPassed = false;
    if (!check("Default stop timeout is 5s", defaults.stopTimeoutSeconds == 5)) allTestsPassed = false;
    if (!check("Defaults are valid", !rejects(defaults))) allTestsPassed = false;

    // --- 2. Validation ---
    std::cout << "\n--- 2. Validation ---" << std::endl;
    EnforcerConfig badInterval;
    badInterval.checkIntervalSeconds = 0;
    if (!check("Interval below 1s is rejected", rejects(badInterval))) allTestsPassed = false;

    EnforcerConfig badEntropy;
    badEntropy.entropyThreshold = 8.5;
    if (!check("Entropy threshold above 8 is rejected", rejects(badEntropy))) allTestsPassed = false;

    EnforcerConfig badTemperature;
    badTemperature.temperatureVarianceThreshold = 0.0;
    if (!check("Zero temperature threshold is rejected", rejects(badTemperature))) allTestsPassed = false;

    EnforcerConfig badShard;
    badShard.shardIds = {"ok.bin", ""};
    if (!check("Empty shard id is rejected", rejects(badShard))) allTestsPassed = false;

    EnforcerConfig badLevel;
    badLevel.logLevel = "verbose";
    if (!check("Unknown log level is rejected", rejects(badLevel))) allTestsPassed = false;

    // --- 3. JSON ---
    std::cout << "\n--- 3. JSON ---" << std::endl;
    json partial = {{"entropy_threshold", 6.5}, {"shard_files", {"a.bin", "b.bin"}}};
    EnforcerConfig fromPartial = EnforcerConfig::fromJson(partial);
    if (!check("Given keys are read", fromPartial.entropyThreshold == 6.5 && fromPartial.shardIds.size() == 2 && fromPartial.shardIds[1] == "b.bin")) allTestsPassed = false;
    if (!check("Absent keys keep defaults", fromPartial.checkIntervalSeconds == 60 && fromPartial.temperatureVarianceThreshold == 1.0)) allTestsPassed = false;

    bool wrongType = false;
    try {
        EnforcerConfig::fromJson(json{{"check_interval", "often"}});
    } catch (const std::invalid_argument&) {
        wrongType = true;
    }
    if (!check("Wrong value type is rejected", wrongType)) allTestsPassed = false;

    // 4294967297 would wrap to 1 if narrowed to int
    bool wrappedInterval = false;
    try {
        EnforcerConfig::fromJson(json{{"check_interval", 4294967297ULL}});
    } catch (const std::invalid_argument&) {
        wrappedInterval = true;
    }
    if (!check("Oversized check interval is rejected", wrappedInterval)) allTestsPassed = false;

    bool wrappedTimeout = false;
    try {
        EnforcerConfig::fromJson(json{{"stop_timeout", 4294967301LL}});
    } catch (const std::invalid_argument&) {
        wrappedTimeout = true;
    }
    if (!check("Oversized stop timeout is rejected", wrappedTimeout)) allTestsPassed = false;

    bool fractionalInterval = false;
    try {
        EnforcerConfig::fromJson(json{{"check_interval", 1.5}});
    } catch (const std::invalid_argument&) {
        fractionalInterval = true;
    }
    if (!check("Fractional check interval is rejected", fractionalInterval)) allTestsPassed = false;

    EnforcerConfig largeButValid = EnforcerConfig::fromJson(json{{"check_interval", 86400}});
    if (!check("In-range interval is read", largeButValid.checkIntervalSeconds == 86400)) allTestsPassed = false;

    bool notObject = false;
    try {
        EnforcerConfig::fromJson(json::array({1, 2}));
    } catch (const std::invalid_argument&) {
        notObject = true;
    }
    if (!check("Non-object document is rejected", notObject)) allTestsPassed = false;

    // --- 4. Files ---
    std::cout << "\n--- 4. Files ---" << std::endl;
    const std::string path = (fs::temp_directory_path() / "thermoguard_config_test.json").string();
    {
        std::ofstream out(path);
        out << R"({"check_interval": 5, "temperature_variance_threshold": 1.5, "shard_files": ["temp_shard.bin"], "log_level": "debug"})";
    }
    EnforcerConfig fromFile = EnforcerConfig::loadFromFile(path);
    if (!check("File values are read", fromFile.checkIntervalSeconds == 5 && fromFile.temperatureVarianceThreshold == 1.5 && fromFile.logLevel == "debug")) allTestsPassed = false;

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool malformed = false;
    try {
        EnforcerConfig::loadFromFile(path);
    } catch (const std::invalid_argument&) {
        malformed = true;
    }
    if (!check("Malformed file is rejected", malformed)) allTestsPassed = false;
    fs::remove(path);

    bool missing = false;
    try {
        EnforcerConfig::loadFromFile(path);
    } catch (const std::invalid_argument&) {
        missing = true;
    }
    if (!check("Missing file is rejected", missing)) allTestsPassed = false;

    // --- Summary ---
    std::cout << "\n--- Test Summary ---" << std::endl;
    std::cout << (allTestsPassed ? "RESULT: All tests PASSED!" : "RESULT: One or more tests FAILED!") << std::endl;
    return allTestsPassed ? 0 : 1;
}
