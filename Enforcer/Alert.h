#ifndef ALERT_H
#define ALERT_H

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

enum class AlertKind {
    EntropyViolation,
    TemperatureViolation,
    RegularityDetected,
    CryptographicApoptosis
};

// "entropy_violation", "temperature_violation", ...
std::string alertKindName(AlertKind kind);

/**
 * @brief An alert delivered to every registered callback. Which optional
 * fields are present depends on the kind.
 */
struct Alert {
    AlertKind kind;
    std::optional<std::string> shard;
    std::optional<double> entropy;
    std::optional<double> threshold;
    std::optional<double> baseline;
    std::optional<double> current;
    std::optional<double> delta;
    std::optional<std::string> severity;
    std::optional<std::string> reason;

    // {"kind": ..., plus every field that is present}
    nlohmann::json toJson() const;
};

#endif // ALERT_H
