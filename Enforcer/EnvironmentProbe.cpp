#include "EnvironmentProbe.h"
#include "AuditLog.h"
#include <cstdint>
#include <openssl/rand.h>

double SimulatedTemperatureProbe::read() {
    unsigned char raw[4];
    std::lock_guard<std::mutex> lock(mutex_);

    if (RAND_bytes(raw, sizeof(raw)) != 1) {
        AuditLog::warning("EnvironmentProbe", "Random source unavailable, using last known reading");
        return hasReading_ ? lastReading_ : kFallback;
    }

    std::uint32_t value = (static_cast<std::uint32_t>(raw[0]) << 24) |
                          (static_cast<std::uint32_t>(raw[1]) << 16) |
                          (static_cast<std::uint32_t>(raw[2]) << 8) |
                          static_cast<std::uint32_t>(raw[3]);
    double fraction = static_cast<double>(value) / 4294967296.0;

    lastReading_ = kMinimum + fraction * kSpan;
    hasReading_ = true;
    return lastReading_;
}
