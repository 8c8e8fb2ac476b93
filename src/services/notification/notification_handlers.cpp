#include "playback_monitor/services/notification/notification_handlers.hpp"
#include "playback_monitor/utils/logger.hpp"

namespace playback_monitor {
namespace services {

std::string to_string(DeliveryError error) {
    switch (error) {
        case DeliveryError::Rejected: return "rejected";
        case DeliveryError::Unreachable: return "unreachable";
        case DeliveryError::InvalidPayload: return "invalid payload";
    }
    return "unknown";
}

std::expected<void, DeliveryError> LogNotificationHandler::handle(const core::Notification& notification) {
    std::string line = core::to_string(notification.action) + " " + notification.session_key.get();
    if (!notification.snapshot.user_name.empty()) {
        line += " user=" + notification.snapshot.user_name;
    }
    line += " item=" + notification.item_id;
    if (!notification.snapshot.title.empty()) {
        line += " \"" + notification.snapshot.title + "\"";
    }
    if (notification.action == core::NotificationAction::OnStop ||
        notification.action == core::NotificationAction::OnWatched) {
        line += " watched=" + std::to_string(notification.watched_percent) + "%";
    }

    LOG_INFO("Notification", line);
    return {};
}

WebhookNotificationHandler::WebhookNotificationHandler(std::shared_ptr<HttpClient> http_client, std::string url)
    : m_http_client(std::move(http_client))
    , m_url(std::move(url)) {}

nlohmann::json WebhookNotificationHandler::to_json(const core::Notification& notification) {
    const auto& snapshot = notification.snapshot;
    return {
        {"action", core::to_string(notification.action)},
        {"session_key", notification.session_key.get()},
        {"user_id", notification.user_id},
        {"user_name", snapshot.user_name},
        {"item_id", notification.item_id},
        {"title", snapshot.title},
        {"timestamp", core::to_epoch_ms(notification.timestamp)},
        {"state", core::to_string(snapshot.state)},
        {"position_ms", snapshot.position_ms},
        {"duration_ms", snapshot.duration_ms},
        {"watched_percent", notification.watched_percent}
    };
}

std::expected<void, DeliveryError> WebhookNotificationHandler::handle(const core::Notification& notification) {
    if (!m_http_client) {
        return std::unexpected(DeliveryError::Unreachable);
    }

    std::string body;
    try {
        body = to_json(notification).dump();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("WebhookNotification", "Cannot encode notification: " + std::string(e.what()));
        return std::unexpected(DeliveryError::InvalidPayload);
    }

    auto response = m_http_client->post_json(m_url, body);
    if (!response) {
        LOG_WARNING("WebhookNotification", "POST to " + m_url + " failed: " + to_string(response.error()));
        return std::unexpected(DeliveryError::Unreachable);
    }
    if (!response->is_success()) {
        LOG_WARNING("WebhookNotification", "POST to " + m_url + " returned " +
                    std::to_string(response->status_code));
        return std::unexpected(DeliveryError::Rejected);
    }
    return {};
}

CallbackNotificationHandler::CallbackNotificationHandler(std::string name, Callback callback)
    : m_name(std::move(name))
    , m_callback(std::move(callback)) {}

std::expected<void, DeliveryError> CallbackNotificationHandler::handle(const core::Notification& notification) {
    if (!m_callback) {
        return {};
    }
    return m_callback(notification);
}

} // namespace services
} // namespace playback_monitor
