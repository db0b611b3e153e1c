#include "ThermodynamicEnforcer.h"
#include "AuditLog.h"
#include "CryptoEngine.h"
#include "EntropyAnalyzer.h"
#include "RegularityDetector.h"
#include <chrono>
#include <cmath>
#include <exception>

namespace {
const char* kComponent = "ThermodynamicEnforcer";
const char* kSeverityWarning = "warning";
const char* kSeverityCritical = "critical";

// Marks the calling thread as the one running an iteration.
class CycleOwner {
public:
    explicit CycleOwner(std::atomic<std::thread::id>& owner) : owner_(owner) {
        owner_ = std::this_thread::get_id();
    }
    ~CycleOwner() { owner_ = std::thread::id(); }

private:
    std::atomic<std::thread::id>& owner_;
};
}

ThermodynamicEnforcer::ThermodynamicEnforcer(const EnforcerConfig& config, ShardStore& store, EnvironmentProbe& probe)
    : config_(config), store_(store), probe_(probe) {
    config_.validate();

    // Store baseline temperature reading
    baseline_ = probe_.read();

    AuditLog::info(kComponent, "ThermodynamicEnforcer initialized with entropy threshold: " +
                   AuditLog::formatValue(config_.entropyThreshold) + " bits/byte, monitoring " +
                   std::to_string(config_.shardIds.size()) + " shard(s)");
    AuditLog::info(kComponent, "Temperature baseline: " + AuditLog::formatValue(baseline_));
}

ThermodynamicEnforcer::~ThermodynamicEnforcer() {
    if (isRunning()) {
        stop();
    }

    // A cycle that outlived the bounded wait in stop() is still joined here.
    std::thread remaining;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        stopRequested_ = true;
        remaining = std::move(worker_);
    }
    stateCv_.notify_all();
    if (remaining.joinable()) {
        remaining.join();
    }
}

void ThermodynamicEnforcer::registerAlertCallback(AlertCallback callback) {
    alertBus_.registerCallback(std::move(callback));
}

bool ThermodynamicEnforcer::isRunning() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return running_;
}

double ThermodynamicEnforcer::getBaseline() const {
    std::lock_guard<std::mutex> lock(baselineMutex_);
    return baseline_;
}

bool ThermodynamicEnforcer::setBaseline(double value) {
    if (isRunning()) {
        AuditLog::warning(kComponent, "Baseline cannot be changed while monitoring is active");
        return false;
    }
    std::lock_guard<std::mutex> lock(baselineMutex_);
    baseline_ = value;
    AuditLog::info(kComponent, "Temperature baseline set to: " + AuditLog::formatValue(value));
    return true;
}

bool ThermodynamicEnforcer::start() {
    std::thread stale;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (running_) {
            AuditLog::warning(kComponent, "Monitoring is already active");
            return false;
        }
        stale = std::move(worker_);
    }

    // Left behind by a stop() whose wait timed out; it has been told to exit.
    if (stale.joinable()) {
        AuditLog::info(kComponent, "Waiting for the previous monitoring cycle to exit");
        stale.join();
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (running_) {
        AuditLog::warning(kComponent, "Monitoring is already active");
        return false;
    }
    running_ = true;
    loopExited_ = false;
    stopRequested_ = false;
    worker_ = std::thread(&ThermodynamicEnforcer::monitoringLoop, this);

    AuditLog::info(kComponent, "Thermodynamic monitoring started");
    return true;
}

bool ThermodynamicEnforcer::stop() {
    if (calledFromCycle()) {
        AuditLog::error(kComponent, "stop() called from an alert callback; refused");
        return false;
    }

    std::unique_lock<std::mutex> lock(stateMutex_);
    if (!running_) {
        AuditLog::warning(kComponent, "Monitoring is not active");
        return false;
    }

    running_ = false;
    stopRequested_ = true;
    stateCv_.notify_all();

    bool exited = stateCv_.wait_for(lock, std::chrono::seconds(config_.stopTimeoutSeconds),
                                    [this] { return loopExited_; });
    std::thread finished;
    if (exited) {
        finished = std::move(worker_);
    }
    lock.unlock();

    if (!exited) {
        AuditLog::error(kComponent, "Monitoring cycle did not exit within " +
                        std::to_string(config_.stopTimeoutSeconds) + "s; an alert callback may be blocking");
        return false;
    }

    finished.join();
    AuditLog::info(kComponent, "Thermodynamic monitoring stopped");
    return true;
}

void ThermodynamicEnforcer::monitoringLoop() {
    AuditLog::info(kComponent, "Monitoring loop started");

    std::unique_lock<std::mutex> lock(stateMutex_);
    while (!stopRequested_) {
        lock.unlock();
        try {
            runIteration(true);
        } catch (const std::exception& e) {
            AuditLog::error(kComponent, std::string("Error in monitoring loop: ") + e.what());
        } catch (...) {
            AuditLog::error(kComponent, "Error in monitoring loop: non-standard exception");
        }
        lock.lock();

        // Wait for next check interval
        stateCv_.wait_for(lock, std::chrono::seconds(config_.checkIntervalSeconds),
                          [this] { return stopRequested_.load(); });
    }

    loopExited_ = true;
    lock.unlock();
    stateCv_.notify_all();
}

bool ThermodynamicEnforcer::runCycle() {
    if (calledFromCycle()) {
        AuditLog::error(kComponent, "runCycle() called from an alert callback; refused");
        return false;
    }
    runIteration(false);
    return true;
}

bool ThermodynamicEnforcer::runIteration(bool background) {
    std::lock_guard<std::mutex> cycleLock(cycleMutex_);
    CycleOwner owner(cycleThread_);
    AuditLog::debug(kComponent, "Check cycle " + std::to_string(cycleCount_.load() + 1) + " started");

    try {
        checkAmbientTemperature();
    } catch (const std::exception& e) {
        AuditLog::error(kComponent, std::string("Error checking ambient temperature: ") + e.what());
    }

    if (!checkShardEntropy(background) || !checkShardRegularities(background)) {
        AuditLog::info(kComponent, "Stop requested, check cycle abandoned");
        return false;
    }

    cycleCount_++;
    return true;
}

void ThermodynamicEnforcer::checkAmbientTemperature() {
    const double current = probe_.read();
    const double baseline = getBaseline();
    const double delta = std::fabs(current - baseline);
    const double threshold = config_.temperatureVarianceThreshold;

    AuditLog::debug(kComponent, "Current temperature: " + AuditLog::formatValue(current) +
                    ", delta: " + AuditLog::formatValue(delta));

    if (delta <= threshold) {
        return;
    }

    // Moderate drift is absorbed into the baseline, large drift is only reported.
    const bool benignDrift = delta < threshold * 2.0;

    Alert alert{AlertKind::TemperatureViolation};
    alert.baseline = baseline;
    alert.current = current;
    alert.delta = delta;
    alert.threshold = threshold;
    alert.severity = benignDrift ? kSeverityWarning : kSeverityCritical;
    alertBus_.publish(alert);

    AuditLog::warning(kComponent, "Temperature violation detected: " + AuditLog::formatValue(current) +
                      " vs baseline " + AuditLog::formatValue(baseline));

    if (benignDrift) {
        std::lock_guard<std::mutex> lock(baselineMutex_);
        baseline_ = current;
        AuditLog::info(kComponent, "Updating temperature baseline to: " + AuditLog::formatValue(current));
    } else {
        AuditLog::critical(kComponent, "Temperature drift of " + AuditLog::formatValue(delta) +
                           " exceeds twice the threshold; baseline kept at " + AuditLog::formatValue(baseline));
    }
}

bool ThermodynamicEnforcer::readShard(const std::string& shardId, std::vector<unsigned char>& content) const {
    try {
        content = store_.readAll(shardId);
        return true;
    } catch (const ShardNotFoundError&) {
        AuditLog::warning(kComponent, "Shard file not found: " + shardId);
    } catch (const ShardIOError& e) {
        AuditLog::error(kComponent, "Error reading shard " + shardId + ": " + e.what());
    }
    return false;
}

bool ThermodynamicEnforcer::checkShardEntropy(bool background) {
    for (const auto& shardId : config_.shardIds) {
        if (abandonRequested(background)) {
            return false;
        }

        try {
            std::vector<unsigned char> content;
            if (!readShard(shardId, content)) {
                continue;
            }

            const double entropy = EntropyAnalyzer::entropy(content);
            AuditLog::debug(kComponent, "Shard " + shardId + " entropy: " + AuditLog::formatValue(entropy) + " bits/byte");

            if (entropy < config_.entropyThreshold) {
                Alert alert{AlertKind::EntropyViolation};
                alert.shard = shardId;
                alert.entropy = entropy;
                alert.threshold = config_.entropyThreshold;
                alert.severity = kSeverityCritical;
                alertBus_.publish(alert);

                AuditLog::critical(kComponent, "ENTROPY VIOLATION on shard " + shardId + ": " +
                                   AuditLog::formatValue(entropy) + " bits/byte");
                triggerApoptosis(shardId, "entropy_violation", kEntropyRemediationBytes, entropy);
            }
        } catch (const std::exception& e) {
            AuditLog::error(kComponent, "Error checking shard " + shardId + ": " + e.what());
        }
    }
    return true;
}

bool ThermodynamicEnforcer::checkShardRegularities(bool background) {
    for (const auto& shardId : config_.shardIds) {
        if (abandonRequested(background)) {
            return false;
        }

        try {
            std::vector<unsigned char> content;
            if (!readShard(shardId, content)) {
                continue;
            }

            if (RegularityDetector::detect(content)) {
                Alert alert{AlertKind::RegularityDetected};
                alert.shard = shardId;
                alert.severity = kSeverityCritical;
                alertBus_.publish(alert);

                AuditLog::critical(kComponent, "MATHEMATICAL BACKDOOR DETECTED in shard " + shardId);
                triggerApoptosis(shardId, "mathematical_backdoor", kBackdoorRemediationBytes, std::nullopt);
            }
        } catch (const std::exception& e) {
            AuditLog::error(kComponent, "Error checking regularities in " + shardId + ": " + e.what());
        }
    }
    return true;
}

void ThermodynamicEnforcer::triggerApoptosis(const std::string& shardId, const std::string& reason,
                                             std::size_t replacementSize, std::optional<double> entropy) {
    AuditLog::critical(kComponent, "CRYPTOGRAPHIC APOPTOSIS INITIATED on shard " + shardId + " (" + reason + ")");

    Alert alert{AlertKind::CryptographicApoptosis};
    alert.reason = reason;
    alert.shard = shardId;
    alert.entropy = entropy;
    alert.severity = kSeverityCritical;
    alertBus_.publish(alert);

    // Best effort: a failed overwrite is retried only if the next pass flags the shard again.
    try {
        store_.overwrite(shardId, CryptoEngine::generateRandomBytes(replacementSize));
        AuditLog::info(kComponent, "Shard " + shardId + " has been invalidated (" + reason + ")");
    } catch (const std::exception& e) {
        AuditLog::error(kComponent, "Failed to invalidate shard " + shardId + ": " + e.what());
    }
}
