#ifndef THERMODYNAMIC_ENFORCER_H
#define THERMODYNAMIC_ENFORCER_H

#include "AlertBus.h"
#include "EnforcerConfig.h"
#include "EnvironmentProbe.h"
#include "ShardStore.h"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * @class ThermodynamicEnforcer
 * @brief Background integrity monitor for stored key shards.
 *
 * Every check interval the enforcer compares the ambient signal against its
 * baseline, then screens every configured shard for low entropy and for
 * statistical regularities. A shard that fails either screen is destroyed
 * ("cryptographic apoptosis"): its content is overwritten with fresh random
 * bytes after the triggering alert has been published.
 *
 * The store and the probe are borrowed and must outlive the enforcer.
 */
class ThermodynamicEnforcer {
public:
    static constexpr std::size_t kEntropyRemediationBytes = 1024;
    static constexpr std::size_t kBackdoorRemediationBytes = 2048;

    /**
     * @brief Validates the configuration and captures the initial baseline
     * from the probe.
     * @throws std::invalid_argument if the configuration is invalid.
     */
    ThermodynamicEnforcer(const EnforcerConfig& config, ShardStore& store, EnvironmentProbe& probe);
    ~ThermodynamicEnforcer();

    ThermodynamicEnforcer(const ThermodynamicEnforcer&) = delete;
    ThermodynamicEnforcer& operator=(const ThermodynamicEnforcer&) = delete;

    /**
     * @brief Spawns the background cycle.
     * @return false (with a warning) if monitoring is already active.
     */
    bool start();

    /**
     * @brief Signals the cycle to exit and waits, up to the configured stop
     * timeout, until it has stopped touching shard content and the baseline.
     * @return false if monitoring was not active, if the wait timed out, or
     * if called from an alert callback (refused, nothing changes).
     */
    bool stop();

    bool isRunning() const;

    /**
     * @brief Adds a callback that receives every alert on the thread running
     * the iteration. Callbacks must not call back into runCycle() or stop();
     * such calls are refused and return false.
     */
    void registerAlertCallback(AlertCallback callback);

    /**
     * @brief Runs one check iteration on the calling thread. Never overlaps
     * with an iteration of the background cycle.
     * @return false, without running, if called from an alert callback.
     */
    bool runCycle();

    double getBaseline() const;

    /**
     * @brief Replaces the baseline. Only allowed while monitoring is stopped.
     */
    bool setBaseline(double value);

    // Number of completed check iterations.
    std::uint64_t getCycleCount() const { return cycleCount_.load(); }

    const EnforcerConfig& getConfig() const { return config_; }

private:
    void monitoringLoop();

    // One check iteration. A background iteration is abandoned between
    // shards once stop() has been requested; returns false in that case.
    bool runIteration(bool background);

    void checkAmbientTemperature();
    bool checkShardEntropy(bool background);
    bool checkShardRegularities(bool background);

    // Reads a shard; logs and returns false when it cannot be read.
    bool readShard(const std::string& shardId, std::vector<unsigned char>& content) const;

    void triggerApoptosis(const std::string& shardId, const std::string& reason,
                          std::size_t replacementSize, std::optional<double> entropy);

    bool abandonRequested(bool background) const { return background && stopRequested_.load(); }

    // True on the thread currently running an iteration, i.e. inside a callback.
    bool calledFromCycle() const { return cycleThread_.load() == std::this_thread::get_id(); }

    const EnforcerConfig config_;
    ShardStore& store_;
    EnvironmentProbe& probe_;
    AlertBus alertBus_;

    // Held for a whole iteration; serializes runCycle() with the background cycle.
    std::mutex cycleMutex_;
    std::atomic<std::thread::id> cycleThread_{std::thread::id()};
    mutable std::mutex baselineMutex_;
    double baseline_;

    // Lifecycle
    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    bool running_ = false;
    bool loopExited_ = true;
    std::atomic<bool> stopRequested_{false};
    std::thread worker_;
    std::atomic<std::uint64_t> cycleCount_{0};
};

#endif // THERMODYNAMIC_ENFORCER_H
