#ifndef ALERT_BUS_H
#define ALERT_BUS_H

#include "Alert.h"
#include <functional>
#include <mutex>
#include <vector>
#include <cstddef>

using AlertCallback = std::function<void(const Alert&)>;

/**
 * @class AlertBus
 * @brief Ordered list of alert callbacks.
 *
 * publish() runs every callback synchronously on the calling thread, in
 * registration order. A callback that throws is logged and skipped; the
 * remaining callbacks still run. Registration is safe while a publish is in
 * progress on another thread; the new callback sees the next alert.
 */
class AlertBus {
public:
    void registerCallback(AlertCallback callback);

    /**
     * @brief Logs the alert and delivers it to every callback.
     * @return The number of callbacks that failed.
     */
    std::size_t publish(const Alert& alert);

    std::size_t callbackCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<AlertCallback> callbacks_;
};

#endif // ALERT_BUS_H
