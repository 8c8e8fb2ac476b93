#pragma once

#include "playback_monitor/services/connector/backend_connector.hpp"
#include "playback_monitor/services/network/http_client.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <optional>
#include <stop_token>

namespace playback_monitor {
namespace services {

// Shared HTTP plumbing for connectors: error mapping, retry with
// exponential backoff for transient failures, and the Unauthorized latch.
class HttpConnectorBase : public BackendConnector {
public:
    HttpConnectorBase(std::string name,
                      core::ConnectorConfig config,
                      std::shared_ptr<HttpClient> http_client);

    std::string backend_name() const override { return m_name; }

    void reconfigure(const core::ConnectorConfig& config) override;
    void shutdown() override;

    bool is_unauthorized() const { return m_unauthorized.load(); }

    static core::ConnectorError map_network_error(NetworkError error);
    static std::optional<core::ConnectorError> map_status(int status_code);

protected:
    virtual HttpHeaders auth_headers(const core::ConnectorConfig& config) const = 0;

    core::ConnectorConfig config() const;
    std::shared_ptr<HttpClient> http_client() const { return m_http_client; }
    std::string url_for(const std::string& path) const;
    HttpRequest build_request(HttpMethod method, const std::string& path,
                              const std::string& body = {}) const;

    // Runs the request, retrying Unreachable and Timeout failures
    std::expected<HttpResponse, core::ConnectorError> execute_with_retry(
        const HttpRequest& request, const std::string& operation);

    std::expected<nlohmann::json, core::ConnectorError> get_json(
        const std::string& path, const std::string& operation);

    std::expected<void, core::ConnectorError> send(
        HttpMethod method, const std::string& path, const std::string& operation,
        const std::string& body = {});

    std::stop_token shutdown_token() const { return m_shutdown.get_token(); }

private:
    std::expected<HttpResponse, core::ConnectorError> execute_once(const HttpRequest& request);

    std::string m_name;
    mutable std::mutex m_config_mutex;
    core::ConnectorConfig m_config;
    std::shared_ptr<HttpClient> m_http_client;
    std::atomic<bool> m_unauthorized{false};
    std::stop_source m_shutdown;
};

} // namespace services
} // namespace playback_monitor
