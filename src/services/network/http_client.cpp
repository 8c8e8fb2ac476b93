#include "playback_monitor/services/network/http_client.hpp"
#include "playback_monitor/services/network/request_builder.hpp"
#include "playback_monitor/utils/url_utils.hpp"

namespace playback_monitor {
namespace services {

bool HttpRequest::is_valid() const {
    return utils::UrlUtils::is_valid_url(url) && timeout.count() >= 0 && max_redirects >= 0;
}

std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::ConnectionFailed: return "connection failed";
        case NetworkError::Timeout: return "timeout";
        case NetworkError::DNSResolutionFailed: return "DNS resolution failed";
        case NetworkError::SSLError: return "SSL error";
        case NetworkError::InvalidUrl: return "invalid URL";
        case NetworkError::TooManyRedirects: return "too many redirects";
        case NetworkError::BadResponse: return "bad response";
        case NetworkError::Cancelled: return "cancelled";
    }
    return "unknown network error";
}

bool HttpClientConfig::is_valid() const {
    return default_timeout.count() > 0 && connect_timeout.count() > 0 && stream_idle_timeout.count() > 0;
}

RequestBuilder::RequestBuilder(std::string url) {
    m_request.url = std::move(url);
}

RequestBuilder& RequestBuilder::method(HttpMethod method) {
    m_request.method = method;
    return *this;
}

// Later values win, so per-call headers can override backend defaults
RequestBuilder& RequestBuilder::headers(const HttpHeaders& headers) {
    for (const auto& [name, value] : headers) {
        m_request.headers.insert_or_assign(name, value);
    }
    return *this;
}

RequestBuilder& RequestBuilder::json_body(std::string json) {
    m_request.body = std::move(json);
    m_request.headers["Content-Type"] = "application/json";
    return *this;
}

RequestBuilder& RequestBuilder::timeout(std::chrono::seconds timeout) {
    m_request.timeout = timeout;
    return *this;
}

RequestBuilder& RequestBuilder::verify_ssl(bool verify) {
    m_request.verify_ssl = verify;
    return *this;
}

} // namespace services
} // namespace playback_monitor
