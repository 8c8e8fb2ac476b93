#pragma once

#include "playback_monitor/services/network/http_client.hpp"
#include "playback_monitor/services/notification/notification_handler.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>

namespace playback_monitor {
namespace services {

// Writes one log line per action
class LogNotificationHandler : public NotificationHandler {
public:
    std::string name() const override { return "log"; }
    std::expected<void, DeliveryError> handle(const core::Notification& notification) override;
};

// POSTs each action as JSON to a fixed URL; any non-2xx answer is a failure
class WebhookNotificationHandler : public NotificationHandler {
public:
    WebhookNotificationHandler(std::shared_ptr<HttpClient> http_client, std::string url);

    std::string name() const override { return "webhook:" + m_url; }
    std::expected<void, DeliveryError> handle(const core::Notification& notification) override;

    static nlohmann::json to_json(const core::Notification& notification);

private:
    std::shared_ptr<HttpClient> m_http_client;
    std::string m_url;
};

class CallbackNotificationHandler : public NotificationHandler {
public:
    using Callback = std::function<std::expected<void, DeliveryError>(const core::Notification&)>;

    CallbackNotificationHandler(std::string name, Callback callback);

    std::string name() const override { return m_name; }
    std::expected<void, DeliveryError> handle(const core::Notification& notification) override;

private:
    std::string m_name;
    Callback m_callback;
};

} // namespace services
} // namespace playback_monitor
