#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include "AlertBus.h"

// Helper function to print test results
bool check(const std::string& testName, bool condition) {
    std::cout << "  [TEST] " << testName << "... "
              << (condition ? "PASSED" : "FAILED") << std::endl;
    return condition;
}

int main() {
    std::cout << "--- Starting Alert Bus Test ---" << std::endl;
    bool allTestsPassed = true;

    // --- 1. Payload ---
    std::cout << "\n--- 1. Alert Payload ---" << std::endl;
    Alert entropyAlert{AlertKind::EntropyViolation};
    entropyAlert.shard = "shard_a.bin";
    entropyAlert.entropy = 1.5;
    entropyAlert.threshold = 7.2;
    entropyAlert.severity = "critical";
    auto payload = entropyAlert.toJson();
    if (!check("Kind is serialized by name", payload["kind"] == "entropy_violation")) allTestsPassed = false;
    if (!check("Present fields are serialized", payload["shard"] == "shard_a.bin" && payload["entropy"] == 1.5)) allTestsPassed = false;
    if (!check("Absent fields are omitted", !payload.contains("baseline") && !payload.contains("reason"))) allTestsPassed = false;
    if (!check("Kind names", alertKindName(AlertKind::TemperatureViolation) == "temperature_violation" &&
                             alertKindName(AlertKind::RegularityDetected) == "regularity_detected" &&
                             alertKindName(AlertKind::CryptographicApoptosis) == "cryptographic_apoptosis")) allTestsPassed = false;

    // --- 2. Ordering ---
    std::cout << "\n--- 2. Delivery Order ---" << std::endl;
    AlertBus bus;
    std::vector<std::string> calls;
    bus.registerCallback([&calls](const Alert&) { calls.push_back("first"); });
    bus.registerCallback([&calls](const Alert&) { calls.push_back("second"); });
    bus.registerCallback(AlertCallback());
    if (!check("Empty callback is not registered", bus.callbackCount() == 2)) allTestsPassed = false;

    size_t failures = bus.publish(entropyAlert);
    if (!check("Callbacks run in registration order", calls == std::vector<std::string>{"first", "second"})) allTestsPassed = false;
    if (!check("No failures reported", failures == 0)) allTestsPassed = false;

    // --- 3. Fault Isolation ---
    std::cout << "\n--- 3. Fault Isolation ---" << std::endl;
    AlertBus faulty;
    int delivered = 0;
    faulty.registerCallback([](const Alert&) { throw std::runtime_error("callback exploded"); });
    faulty.registerCallback([&delivered](const Alert&) { delivered++; });
    faulty.registerCallback([](const Alert&) { throw 42; });
    faulty.registerCallback([&delivered](const Alert&) { delivered++; });

    failures = faulty.publish(entropyAlert);
    if (!check("Callbacks after a throwing one still run", delivered == 2)) allTestsPassed = false;
    if (!check("Both failures are counted", failures == 2)) allTestsPassed = false;

    failures = faulty.publish(entropyAlert);
    if (!check("Bus keeps delivering on later alerts", delivered == 4 && failures == 2)) allTestsPassed = false;

    // --- Summary ---
    std::cout << "\n--- Test Summary ---" << std::endl;
    std::cout << (allTestsPassed ? "RESULT: All tests PASSED!" : "RESULT: One or more tests FAILED!") << std::endl;
    return allTestsPassed ? 0 : 1;
}
