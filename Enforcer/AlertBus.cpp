#include "AlertBus.h"
#include "AuditLog.h"
#include <exception>

namespace {
const char* kComponent = "AlertBus";
}

void AlertBus::registerCallback(AlertCallback callback) {
    if (!callback) {
        AuditLog::warning(kComponent, "Ignoring empty alert callback");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

std::size_t AlertBus::callbackCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.size();
}

std::size_t AlertBus::publish(const Alert& alert) {
    AuditLog::warning(kComponent, "ALERT TRIGGERED: " + alertKindName(alert.kind));
    AuditLog::warning(kComponent, "Alert data: " + alert.toJson().dump());

    // Snapshot so callbacks run without the lock held.
    std::vector<AlertCallback> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = callbacks_;
    }

    std::size_t failures = 0;
    for (const auto& callback : snapshot) {
        try {
            callback(alert);
        } catch (const std::exception& e) {
            failures++;
            AuditLog::error(kComponent, std::string("Error in alert callback: ") + e.what());
        } catch (...) {
            failures++;
            AuditLog::error(kComponent, "Error in alert callback: non-standard exception");
        }
    }
    return failures;
}
