#include "playback_monitor/services/connector/http_connector_base.hpp"
#include "playback_monitor/services/network/request_builder.hpp"
#include "playback_monitor/utils/json_helper.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/utils/threading.hpp"
#include "playback_monitor/utils/url_utils.hpp"

namespace playback_monitor {
namespace services {

using core::ConnectorError;

HttpConnectorBase::HttpConnectorBase(std::string name,
                                     core::ConnectorConfig config,
                                     std::shared_ptr<HttpClient> http_client)
    : m_name(std::move(name))
    , m_config(std::move(config))
    , m_http_client(std::move(http_client)) {
    m_config.server_url = utils::UrlUtils::trim_trailing_slash(m_config.server_url);
}

void HttpConnectorBase::reconfigure(const core::ConnectorConfig& config) {
    {
        std::lock_guard lock(m_config_mutex);
        m_config = config;
        m_config.server_url = utils::UrlUtils::trim_trailing_slash(m_config.server_url);
    }
    if (m_unauthorized.exchange(false)) {
        LOG_INFO(m_name, "Credentials updated, clearing unauthorized state");
    }
}

void HttpConnectorBase::shutdown() {
    m_shutdown.request_stop();
}

core::ConnectorConfig HttpConnectorBase::config() const {
    std::lock_guard lock(m_config_mutex);
    return m_config;
}

std::string HttpConnectorBase::url_for(const std::string& path) const {
    return utils::UrlUtils::join_path(config().server_url, path);
}

HttpRequest HttpConnectorBase::build_request(HttpMethod method, const std::string& path,
                                             const std::string& body) const {
    const auto cfg = config();
    RequestBuilder builder(utils::UrlUtils::join_path(cfg.server_url, path));
    builder.method(method)
           .headers(auth_headers(cfg))
           .timeout(cfg.request_timeout)
           .verify_ssl(cfg.verify_ssl);
    if (!body.empty()) {
        builder.json_body(body);
    }
    return builder.build();
}

ConnectorError HttpConnectorBase::map_network_error(NetworkError error) {
    switch (error) {
        case NetworkError::Timeout:
            return ConnectorError::Timeout;
        case NetworkError::BadResponse:
            return ConnectorError::MalformedResponse;
        case NetworkError::ConnectionFailed:
        case NetworkError::DNSResolutionFailed:
        case NetworkError::SSLError:
        case NetworkError::InvalidUrl:
        case NetworkError::TooManyRedirects:
        case NetworkError::Cancelled:
            return ConnectorError::Unreachable;
    }
    return ConnectorError::Unreachable;
}

std::optional<ConnectorError> HttpConnectorBase::map_status(int status_code) {
    if (status_code >= 200 && status_code < 300) {
        return std::nullopt;
    }
    if (status_code == 401 || status_code == 403) {
        return ConnectorError::Unauthorized;
    }
    if (status_code == 404) {
        return ConnectorError::NotFound;
    }
    if (status_code == 408 || status_code == 504) {
        return ConnectorError::Timeout;
    }
    if (status_code >= 500 || status_code == 429) {
        return ConnectorError::Unreachable;
    }
    return ConnectorError::MalformedResponse;
}

std::expected<HttpResponse, ConnectorError> HttpConnectorBase::execute_once(const HttpRequest& request) {
    auto response = m_http_client->execute(request);
    if (!response) {
        return std::unexpected(map_network_error(response.error()));
    }
    if (auto error = map_status(response->status_code)) {
        return std::unexpected(*error);
    }
    return std::move(*response);
}

std::expected<HttpResponse, ConnectorError> HttpConnectorBase::execute_with_retry(
    const HttpRequest& request, const std::string& operation) {

    if (m_unauthorized) {
        return std::unexpected(ConnectorError::Unauthorized);
    }

    const auto cfg = config();
    for (int attempt = 0;; ++attempt) {
        auto result = execute_once(request);
        if (result) {
            return result;
        }

        const auto error = result.error();
        if (error == ConnectorError::Unauthorized) {
            if (!m_unauthorized.exchange(true)) {
                LOG_ERROR(m_name, operation + " rejected credentials; connector disabled until reconfigured");
            }
            return result;
        }

        if (!core::is_transient(error) || attempt >= cfg.max_retries) {
            LOG_DEBUG(m_name, operation + " failed: " + core::to_string(error));
            return result;
        }

        const auto delay = utils::exponential_backoff(attempt, cfg.retry_initial_backoff, cfg.retry_max_backoff);
        LOG_DEBUG(m_name, operation + " failed (" + core::to_string(error) + "), retry " +
                  std::to_string(attempt + 1) + "/" + std::to_string(cfg.max_retries) +
                  " in " + std::to_string(delay.count()) + "ms");

        if (!utils::interruptible_sleep(delay, m_shutdown.get_token())) {
            return result;
        }
    }
}

std::expected<nlohmann::json, ConnectorError> HttpConnectorBase::get_json(
    const std::string& path, const std::string& operation) {

    auto response = execute_with_retry(build_request(HttpMethod::GET, path), operation);
    if (!response) {
        return std::unexpected(response.error());
    }

    auto parsed = utils::JsonHelper::safe_parse(response->body);
    if (!parsed) {
        LOG_WARNING(m_name, operation + " returned malformed body: " + parsed.error());
        return std::unexpected(ConnectorError::MalformedResponse);
    }
    return std::move(*parsed);
}

std::expected<void, ConnectorError> HttpConnectorBase::send(
    HttpMethod method, const std::string& path, const std::string& operation,
    const std::string& body) {

    auto response = execute_with_retry(build_request(method, path, body), operation);
    if (!response) {
        return std::unexpected(response.error());
    }
    return {};
}

} // namespace services
} // namespace playback_monitor
