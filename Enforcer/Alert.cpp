#include "Alert.h"

using json = nlohmann::json;

std::string alertKindName(AlertKind kind) {
    switch (kind) {
        case AlertKind::EntropyViolation:       return "entropy_violation";
        case AlertKind::TemperatureViolation:   return "temperature_violation";
        case AlertKind::RegularityDetected:     return "regularity_detected";
        case AlertKind::CryptographicApoptosis: return "cryptographic_apoptosis";
    }
    return "unknown";
}

json Alert::toJson() const {
    json payload;
    payload["kind"] = alertKindName(kind);
    if (shard) payload["shard"] = *shard;
    if (entropy) payload["entropy"] = *entropy;
    if (threshold) payload["threshold"] = *threshold;
    if (baseline) payload["baseline"] = *baseline;
    if (current) payload["current"] = *current;
    if (delta) payload["delta"] = *delta;
    if (severity) payload["severity"] = *severity;
    if (reason) payload["reason"] = *reason;
    return payload;
}
