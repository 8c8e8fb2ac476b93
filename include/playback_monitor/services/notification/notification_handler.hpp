#pragma once

#include "playback_monitor/core/models.hpp"
#include <expected>
#include <string>

namespace playback_monitor {
namespace services {

enum class DeliveryError {
    Rejected,       // receiver answered with an error
    Unreachable,
    InvalidPayload
};

std::string to_string(DeliveryError error);

// Receiver of notification actions. Implementations may throw; the
// dispatcher isolates each handler from the others.
class NotificationHandler {
public:
    virtual ~NotificationHandler() = default;

    virtual std::string name() const = 0;
    virtual std::expected<void, DeliveryError> handle(const core::Notification& notification) = 0;
};

} // namespace services
} // namespace playback_monitor
