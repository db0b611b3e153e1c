#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <thread>
#include <functional>
#include <condition_variable>
#include <stdexcept>
#include "ThermodynamicEnforcer.h"
#include "EntropyAnalyzer.h"

using namespace std::chrono_literals;

// Helper function to print test results
bool check(const std::string& testName, bool condition) {
    std::cout << "  [TEST] " << testName << "... "
              << (condition ? "PASSED" : "FAILED") << std::endl;
    return condition;
}

// Probe whose reading is set by the test.
class ScriptedProbe : public EnvironmentProbe {
public:
    explicit ScriptedProbe(double value) : value_(value) {}
    void set(double value) { value_.store(value); }
    double read() override { return value_.load(); }

private:
    std::atomic<double> value_;
};

// In-memory shards; records every overwrite attempt.
class MemoryShardStore : public ShardStore {
public:
    void put(const std::string& id, const std::vector<unsigned char>& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        shards_[id] = data;
    }

    std::vector<unsigned char> readAll(const std::string& id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = shards_.find(id);
        if (it == shards_.end()) {
            throw ShardNotFoundError(id);
        }
        return it->second;
    }

    void overwrite(const std::string& id, const std::vector<unsigned char>& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        attempts_.push_back({id, data.size()});
        if (failWrites) {
            throw ShardIOError(id, "simulated write failure");
        }
        shards_[id] = data;
    }

    std::vector<std::pair<std::string, size_t>> attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    std::atomic<bool> failWrites{false};

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<unsigned char>> shards_;
    std::vector<std::pair<std::string, size_t>> attempts_;
};

// Thread-safe alert log shared with a callback.
class AlertRecorder {
public:
    AlertCallback callback() {
        return [this](const Alert& alert) {
            std::lock_guard<std::mutex> lock(mutex_);
            alerts_.push_back(alert);
        };
    }

    std::vector<Alert> alerts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alerts_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alerts_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        alerts_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Alert> alerts_;
};

std::vector<unsigned char> lowEntropyShard() {
    std::string pattern;
    for (int i = 0; i < 300; ++i) pattern += "abc";
    return std::vector<unsigned char>(pattern.begin(), pattern.end());
}

// 99 distinct values: entropy log2(99) ~ 6.63 and too short to be screened for regularity.
std::vector<unsigned char> passingShard() {
    std::vector<unsigned char> data;
    for (int i = 0; i < 99; ++i) data.push_back(static_cast<unsigned char>(i * 2 + 1));
    return data;
}

bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return condition();
}

// Every apoptosis must follow a triggering alert for the same shard.
bool apoptosisIsPreceded(const std::vector<Alert>& alerts) {
    for (size_t i = 0; i < alerts.size(); ++i) {
        if (alerts[i].kind != AlertKind::CryptographicApoptosis) continue;
        if (i == 0) return false;
        const Alert& trigger = alerts[i - 1];
        bool triggerKind = trigger.kind == AlertKind::EntropyViolation || trigger.kind == AlertKind::RegularityDetected;
        if (!triggerKind || trigger.shard != alerts[i].shard) return false;
    }
    return true;
}

bool testEntropyViolation() {
    std::cout << "\n--- 1. Entropy Violation ---" << std::endl;
    bool ok = true;

    MemoryShardStore store;
    store.put("low.bin", lowEntropyShard());
    ScriptedProbe probe(22.0);

    EnforcerConfig config;
    config.shardIds = {"low.bin"};
    ThermodynamicEnforcer enforcer(config, store, probe);
    AlertRecorder recorder;
    enforcer.registerAlertCallback(recorder.callback());

    enforcer.runCycle();
    auto alerts = recorder.alerts();

    ok &= check("Alerts were published", alerts.size() >= 2);
    if (alerts.size() >= 2) {
        ok &= check("First alert is entropy_violation", alerts[0].kind == AlertKind::EntropyViolation);
        ok &= check("Entropy alert names the shard", alerts[0].shard == std::string("low.bin"));
        ok &= check("Entropy alert carries the threshold", alerts[0].threshold == 7.2);
        ok &= check("Entropy alert carries the measured entropy", alerts[0].entropy.has_value() && *alerts[0].entropy < 2.0);
        ok &= check("Second alert is cryptographic_apoptosis", alerts[1].kind == AlertKind::CryptographicApoptosis);
        ok &= check("Apoptosis reason is entropy_violation", alerts[1].reason == std::string("entropy_violation"));
    }

    auto attempts = store.attempts();
    ok &= check("Entropy remediation writes 1024 bytes", !attempts.empty() && attempts[0].first == "low.bin" && attempts[0].second == 1024);

    // The regularity pass re-reads the fresh bytes; at 1024 bytes every
    // 4-byte substring already exceeds its expected count, so it is replaced again.
    ok &= check("Regularity pass replaces it with 2048 bytes", attempts.size() == 2 && attempts[1].second == 2048);
    ok &= check("Four alerts in total", alerts.size() == 4);
    ok &= check("Every apoptosis follows its trigger", apoptosisIsPreceded(alerts));

    auto replaced = store.readAll("low.bin");
    ok &= check("Shard content was replaced", replaced != lowEntropyShard());
    ok &= check("Replacement content is high entropy", EntropyAnalyzer::entropy(replaced) >= 7.2);
    ok &= check("Cycle was counted", enforcer.getCycleCount() == 1);
    return ok;
}

bool testPassingShard() {
    std::cout << "\n--- 2. Passing Shard ---" << std::endl;
    bool ok = true;

    MemoryShardStore store;
    store.put("good.bin", passingShard());
    ScriptedProbe probe(22.0);

    EnforcerConfig config;
    config.entropyThreshold = 6.0;
    config.shardIds = {"good.bin"};
    ThermodynamicEnforcer enforcer(config, store, probe);
    AlertRecorder recorder;
    enforcer.registerAlertCallback(recorder.callback());

    enforcer.runCycle();
    enforcer.runCycle();

    ok &= check("No alerts for a passing shard", recorder.count() == 0);
    ok &= check("No overwrite attempted", store.attempts().empty());
    ok &= check("Content unchanged", store.readAll("good.bin") == passingShard());
    ok &= check("Both cycles counted", enforcer.getCycleCount() == 2);
    return ok;
}

bool testMissingShardAndWriteFailure() {
    std::cout << "\n--- 3. Missing Shard and Failed Remediation ---" << std::endl;
    bool ok = true;

    MemoryShardStore store;
    store.put("low.bin", lowEntropyShard());
    store.put("good.bin", passingShard());
    store.failWrites = true;
    ScriptedProbe probe(22.0);

    EnforcerConfig config;
    config.entropyThreshold = 6.0;
    config.shardIds = {"missing.bin", "low.bin", "good.bin"};
    ThermodynamicEnforcer enforcer(config, store, probe);
    AlertRecorder recorder;
    enforcer.registerAlertCallback(recorder.callback());

    enforcer.runCycle();
    auto alerts = recorder.alerts();

    ok &= check("Cycle completes despite missing shard and failed writes", enforcer.getCycleCount() == 1);
    ok &= check("Both remediation attempts were made once", store.attempts().size() == 2);
    ok &= check("Alerts are still published", alerts.size() == 4 && apoptosisIsPreceded(alerts));
    bool goodUntouched = true;
    for (const auto& alert : alerts) {
        if (alert.shard == std::string("good.bin")) goodUntouched = false;
    }
    ok &= check("Passing shard after the failure is untouched", goodUntouched);
    ok &= check("Failed write leaves the shard content", store.readAll("low.bin") == lowEntropyShard());

    // No retry within the cycle; the next pass tries again.
    enforcer.runCycle();
    ok &= check("Next cycle re-attempts remediation", store.attempts().size() == 4);
    return ok;
}

bool testTemperatureBaseline() {
    std::cout << "\n--- 4. Temperature Baseline ---" << std::endl;
    bool ok = true;

    MemoryShardStore store;
    ScriptedProbe probe(20.0);
    EnforcerConfig config;
    config.temperatureVarianceThreshold = 1.0;
    ThermodynamicEnforcer enforcer(config, store, probe);
    AlertRecorder recorder;
    enforcer.registerAlertCallback(recorder.callback());

    ok &= check("Baseline captured at construction", enforcer.getBaseline() == 20.0);

    probe.set(20.5);
    enforcer.runCycle();
    ok &= check("Drift within threshold raises nothing", recorder.count() == 0 && enforcer.getBaseline() == 20.0);

    probe.set(21.5);
    enforcer.runCycle();
    auto alerts = recorder.alerts();
    ok &= check("Moderate drift raises temperature_violation", alerts.size() == 1 && alerts[0].kind == AlertKind::TemperatureViolation);
    if (alerts.size() == 1) {
        ok &= check("Payload carries baseline, current and delta",
                    alerts[0].baseline == 20.0 && alerts[0].current == 21.5 && alerts[0].delta == 1.5 && alerts[0].threshold == 1.0);
        ok &= check("Moderate drift is a warning", alerts[0].severity == std::string("warning"));
    }
    ok &= check("Moderate drift moves the baseline", enforcer.getBaseline() == 21.5);

    recorder.clear();
    probe.set(25.0);
    enforcer.runCycle();
    alerts = recorder.alerts();
    ok &= check("Large drift raises temperature_violation", alerts.size() == 1 && alerts[0].kind == AlertKind::TemperatureViolation);
    if (alerts.size() == 1) {
        ok &= check("Large drift is critical", alerts[0].severity == std::string("critical"));
    }
    ok &= check("Large drift keeps the baseline", enforcer.getBaseline() == 21.5);

    recorder.clear();
    probe.set(22.5);
    enforcer.runCycle();
    ok &= check("Drift equal to the threshold raises nothing", recorder.count() == 0);

    ok &= check("Baseline can be set while stopped", enforcer.setBaseline(30.0) && enforcer.getBaseline() == 30.0);
    return ok;
}

bool testThrowingCallback() {
    std::cout << "\n--- 5. Throwing Callback ---" << std::endl;
    bool ok = true;

    MemoryShardStore store;
    store.put("low.bin", lowEntropyShard());
    ScriptedProbe probe(22.0);
    EnforcerConfig config;
    config.shardIds = {"low.bin"};
    ThermodynamicEnforcer enforcer(config, store, probe);

    AlertRecorder recorder;
    enforcer.registerAlertCallback([](const Alert&) { throw std::runtime_error("callback always fails"); });
    enforcer.registerAlertCallback(recorder.callback());

    enforcer.runCycle();
    size_t afterFirst = recorder.count();
    ok &= check("Later callback still receives alerts", afterFirst > 0);

    store.put("low.bin", lowEntropyShard());
    enforcer.runCycle();
    ok &= check("Subsequent cycles keep running", enforcer.getCycleCount() == 2 && recorder.count() > afterFirst);
    return ok;
}

bool testLifecycle() {
    std::cout << "\n--- 6. Lifecycle ---" << std::endl;
    bool ok = true;

    MemoryShardStore store;
    store.put("good.bin", passingShard());
    ScriptedProbe probe(22.0);
    EnforcerConfig config;
    config.entropyThreshold = 6.0;
    config.checkIntervalSeconds = 1;
    config.shardIds = {"good.bin"};
    ThermodynamicEnforcer enforcer(config, store, probe);

    ok &= check("Initially stopped", !enforcer.isRunning());
    ok &= check("Stop while stopped is a no-op", !enforcer.stop());

    ok &= check("First start succeeds", enforcer.start());
    ok &= check("Second start is a no-op", !enforcer.start());
    ok &= check("Running after start", enforcer.isRunning());
    ok &= check("Baseline is locked while running", !enforcer.setBaseline(10.0));

    ok &= check("First cycle runs", waitFor([&] { return enforcer.getCycleCount() >= 1; }, 2000ms));
    std::this_thread::sleep_for(200ms);
    ok &= check("Only one background cycle exists", enforcer.getCycleCount() == 1);

    ok &= check("Stop succeeds", enforcer.stop());
    ok &= check("Stopped after stop", !enforcer.isRunning());
    ok &= check("Second stop is a no-op", !enforcer.stop());

    ok &= check("Restart succeeds", enforcer.start());
    ok &= check("Restarted cycle runs", waitFor([&] { return enforcer.getCycleCount() >= 2; }, 2000ms));
    ok &= check("Stop after restart succeeds", enforcer.stop());
    return ok;
}

bool testPromptStop() {
    std::cout << "\n--- 7. Stop Interrupts the Sleep ---" << std::endl;
    bool ok = true;

    MemoryShardStore store;
    ScriptedProbe probe(22.0);
    EnforcerConfig config;
    config.checkIntervalSeconds = 60;
    ThermodynamicEnforcer enforcer(config, store, probe);

    enforcer.start();
    ok &= check("First cycle runs", waitFor([&] { return enforcer.getCycleCount() >= 1; }, 2000ms));

    auto begin = std::chrono::steady_clock::now();
    bool stopped = enforcer.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    ok &= check("Stop returns true", stopped);
    ok &= check("Stop does not wait out the interval", elapsed < 2s);
    return ok;
}

bool testNoAlertsAfterStop() {
    std::cout << "\n--- 8. No Alerts After Stop ---" << std::endl;
    bool ok = true;

    // Every cycle flags this shard again: it is replaced with random bytes,
    // which the regularity pass always reports at these lengths.
    MemoryShardStore store;
    store.put("low.bin", lowEntropyShard());
    ScriptedProbe probe(22.0);
    EnforcerConfig config;
    config.checkIntervalSeconds = 1;
    config.shardIds = {"low.bin"};
    ThermodynamicEnforcer enforcer(config, store, probe);
    AlertRecorder recorder;
    enforcer.registerAlertCallback(recorder.callback());

    enforcer.start();
    ok &= check("Alerts arrive while running", waitFor([&] { return recorder.count() > 0; }, 2000ms));
    ok &= check("Stop succeeds", enforcer.stop());

    size_t atStop = recorder.count();
    size_t writesAtStop = store.attempts().size();
    std::this_thread::sleep_for(1500ms);
    ok &= check("No alerts after stop returned", recorder.count() == atStop);
    ok &= check("No shard writes after stop returned", store.attempts().size() == writesAtStop);
    return ok;
}

bool testBlockingCallbackTimeout() {
    std::cout << "\n--- 9. Bounded Stop With a Blocking Callback ---" << std::endl;
    bool ok = true;

    MemoryShardStore store;
    store.put("low.bin", lowEntropyShard());
    ScriptedProbe probe(22.0);
    EnforcerConfig config;
    config.checkIntervalSeconds = 1;
    config.stopTimeoutSeconds = 1;
    config.shardIds = {"low.bin"};

    std::mutex gateMutex;
    std::condition_variable gateCv;
    bool released = false;
    std::atomic<bool> entered{false};

    {
        ThermodynamicEnforcer enforcer(config, store, probe);
        enforcer.registerAlertCallback([&](const Alert&) {
            entered = true;
            std::unique_lock<std::mutex> lock(gateMutex);
            gateCv.wait_for(lock, 5s, [&] { return released; });
        });

        enforcer.start();
        ok &= check("Callback is blocking the cycle", waitFor([&] { return entered.load(); }, 2000ms));

        auto begin = std::chrono::steady_clock::now();
        bool stopped = enforcer.stop();
        auto elapsed = std::chrono::steady_clock::now() - begin;

        ok &= check("Stop reports the timeout", !stopped);
        ok &= check("Stop returned within the bounded wait", elapsed < 3s);
        ok &= check("Lifecycle is stopped", !enforcer.isRunning());

        {
            std::lock_guard<std::mutex> lock(gateMutex);
            released = true;
        }
        gateCv.notify_all();
        // Destructor joins the released cycle.
    }
    ok &= check("Enforcer destroyed after the callback returned", true);
    return ok;
}

bool testInvalidConfiguration() {
    std::cout << "\n--- 10. Invalid Configuration ---" << std::endl;
    MemoryShardStore store;
    ScriptedProbe probe(22.0);
    EnforcerConfig config;
    config.checkIntervalSeconds = 0;

    bool rejected = false;
    try {
        ThermodynamicEnforcer enforcer(config, store, probe);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    return check("Constructor rejects an invalid configuration", rejected);
}

bool testReentrantCalls() {
    std::cout << "\n--- 12. Calls From Inside a Callback ---" << std::endl;
    bool ok = true;

    MemoryShardStore store;
    store.put("low.bin", lowEntropyShard());
    ScriptedProbe probe(22.0);
    EnforcerConfig config;
    config.checkIntervalSeconds = 60;
    config.stopTimeoutSeconds = 2;
    config.shardIds = {"low.bin"};
    ThermodynamicEnforcer enforcer(config, store, probe);

    std::atomic<bool> inBackground{false};
    std::atomic<int> nestedRuns{0};
    std::atomic<int> refusedRuns{0};
    std::atomic<int> refusedStops{0};
    enforcer.registerAlertCallback([&](const Alert&) {
        nestedRuns++;
        if (!enforcer.runCycle()) refusedRuns++;
        if (inBackground && !enforcer.stop()) refusedStops++;
    });

    // Synchronous iteration: a nested runCycle() must not wait on its own cycle.
    auto begin = std::chrono::steady_clock::now();
    bool ran = enforcer.runCycle();
    ok &= check("Outer runCycle completes", ran && enforcer.getCycleCount() == 1);
    ok &= check("Nested runCycle is refused", nestedRuns > 0 && refusedRuns == nestedRuns);
    ok &= check("No wait on a nested call", std::chrono::steady_clock::now() - begin < 1s);

    // Background iteration: a nested stop() returns at once and leaves monitoring running.
    store.put("low.bin", lowEntropyShard());
    inBackground = true;
    enforcer.start();
    ok &= check("Background cycle completes", waitFor([&] { return enforcer.getCycleCount() >= 2; }, 3000ms));
    ok &= check("Nested stop is refused", refusedStops > 0);
    ok &= check("Monitoring is still running", enforcer.isRunning());
    ok &= check("Stop from the owning thread succeeds", enforcer.stop());
    return ok;
}

bool testSimulatedProbe() {
    std::cout << "\n--- 11. Simulated Temperature Probe ---" << std::endl;
    SimulatedTemperatureProbe probe;
    bool inRange = true;
    for (int i = 0; i < 1000; ++i) {
        double reading = probe.read();
        if (reading < SimulatedTemperatureProbe::kMinimum ||
            reading >= SimulatedTemperatureProbe::kMinimum + SimulatedTemperatureProbe::kSpan) {
            inRange = false;
        }
    }
    return check("Readings stay within 20.0 and 25.0", inRange);
}

int main() {
    std::cout << "--- Starting Thermodynamic Enforcer Test ---" << std::endl;
    bool allTestsPassed = true;

    allTestsPassed &= testEntropyViolation();
    allTestsPassed &= testPassingShard();
    allTestsPassed &= testMissingShardAndWriteFailure();
    allTestsPassed &= testTemperatureBaseline();
    allTestsPassed &= testThrowingCallback();
    allTestsPassed &= testLifecycle();
    allTestsPassed &= testPromptStop();
    allTestsPassed &= testNoAlertsAfterStop();
    allTestsPassed &= testBlockingCallbackTimeout();
    allTestsPassed &= testInvalidConfiguration();
    allTestsPassed &= testSimulatedProbe();
    allTestsPassed &= testReentrantCalls();

    std::cout << "\n--- Test Summary ---" << std::endl;
    std::cout << (allTestsPassed ? "RESULT: All tests PASSED!" : "RESULT: One or more tests FAILED!") << std::endl;
    return allTestsPassed ? 0 : 1;
}
