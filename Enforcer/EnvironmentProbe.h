#ifndef ENVIRONMENT_PROBE_H
#define ENVIRONMENT_PROBE_H

#include <mutex>

/**
 * @class EnvironmentProbe
 * @brief Source of ambient-signal readings (a temperature proxy).
 *
 * Implementations must not block indefinitely and must not throw: on an
 * internal failure they return a previous good reading or a fixed fallback.
 */
class EnvironmentProbe {
public:
    virtual ~EnvironmentProbe() = default;
    virtual double read() = 0;
};

/**
 * @class SimulatedTemperatureProbe
 * @brief Stand-in for a hardware sensor: maps 4 bytes from the OpenSSL RNG to
 * a temperature between 20.0 and 25.0 degrees C.
 */
class SimulatedTemperatureProbe : public EnvironmentProbe {
public:
    static constexpr double kMinimum = 20.0;
    static constexpr double kSpan = 5.0;
    static constexpr double kFallback = 22.5;

    double read() override;

private:
    std::mutex mutex_;
    bool hasReading_ = false;
    double lastReading_ = kFallback;
};

#endif // ENVIRONMENT_PROBE_H
