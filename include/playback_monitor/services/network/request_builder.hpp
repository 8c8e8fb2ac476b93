#pragma once

#include "playback_monitor/services/network/http_types.hpp"
#include <chrono>
#include <string>

namespace playback_monitor {
namespace services {

// Fluent construction of HttpRequest
class RequestBuilder {
public:
    explicit RequestBuilder(std::string url);

    RequestBuilder& method(HttpMethod method);
    RequestBuilder& headers(const HttpHeaders& headers);
    RequestBuilder& json_body(std::string json);
    RequestBuilder& timeout(std::chrono::seconds timeout);
    RequestBuilder& verify_ssl(bool verify);

    HttpRequest build() const { return m_request; }

private:
    HttpRequest m_request;
};

} // namespace services
} // namespace playback_monitor
