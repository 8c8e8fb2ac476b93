#include "playback_monitor/services/network/http_client.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/version.hpp"

#include <curl/curl.h>
#include <chrono>
#include <memory>
#include <mutex>

namespace playback_monitor {
namespace services {

namespace {

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlHeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlHeaderListDeleter>;

constexpr const char* DEFAULT_USER_AGENT = "playback-monitor/" PLAYBACK_MONITOR_VERSION_STRING;

size_t collect_body(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), total);
    return total;
}

struct StreamState {
    const StreamingCallback* on_chunk = nullptr;
    long status_code = 0;
    bool established = false;
    std::string rejected_body;
};

long parse_status_line(const std::string& line) {
    const auto first_space = line.find(' ');
    if (first_space == std::string::npos) {
        return 0;
    }
    try {
        return std::stol(line.substr(first_space + 1, 3));
    } catch (const std::exception&) {
        return 0;
    }
}

// Announces a 2xx status line to the consumer before the first body byte;
// redirects and error statuses are collected instead of streamed.
size_t on_stream_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* state = static_cast<StreamState*>(userdata);

    const std::string line(buffer, total);
    if (line.rfind("HTTP/", 0) != 0) {
        return total;
    }

    state->status_code = parse_status_line(line);
    if (state->status_code >= 200 && state->status_code < 300 && !state->established) {
        state->established = true;
        if (*state->on_chunk) {
            (*state->on_chunk)(": connection established\n\n");
        }
    }
    return total;
}

size_t on_stream_body(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    auto* state = static_cast<StreamState*>(userp);

    if (!state->established) {
        state->rejected_body.append(static_cast<const char*>(contents), total);
    } else if (*state->on_chunk) {
        (*state->on_chunk)(std::string(static_cast<const char*>(contents), total));
    }
    return total;
}

int abort_when_stopped(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* keep_running = static_cast<const std::atomic<bool>*>(clientp);
    return keep_running->load() ? 0 : 1;
}

NetworkError to_network_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return NetworkError::DNSResolutionFailed;
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return NetworkError::ConnectionFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_PEER_FAILED_VERIFICATION:
            return NetworkError::SSLError;
        case CURLE_TOO_MANY_REDIRECTS:
            return NetworkError::TooManyRedirects;
        case CURLE_URL_MALFORMAT:
            return NetworkError::InvalidUrl;
        case CURLE_ABORTED_BY_CALLBACK:
            return NetworkError::Cancelled;
        default:
            return NetworkError::BadResponse;
    }
}

std::once_flag g_curl_global_init;

} // namespace

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientConfig config) : m_config(std::move(config)) {
        std::call_once(g_curl_global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        if (m_config.user_agent.empty()) {
            m_config.user_agent = DEFAULT_USER_AGENT;
        }
    }

    std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) override {
        auto handle = open_handle(request);
        if (!handle) {
            return std::unexpected(handle.error());
        }
        CURL* curl = handle->first.get();

        std::string body;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

        const auto timeout = request.timeout.count() > 0 ? request.timeout : m_config.default_timeout;
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));

        const auto started = std::chrono::steady_clock::now();
        const CURLcode result = curl_easy_perform(curl);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (result != CURLE_OK) {
            LOG_DEBUG("CurlHttpClient", request.url + " failed after " + std::to_string(elapsed.count()) +
                      "ms: " + curl_easy_strerror(result));
            return std::unexpected(to_network_error(result));
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        LOG_DEBUG("CurlHttpClient", request.url + " -> " + std::to_string(status) + " in " +
                  std::to_string(elapsed.count()) + "ms");

        HttpResponse response;
        response.status_code = static_cast<int>(status);
        response.body = std::move(body);
        response.response_time = elapsed;
        return response;
    }

    std::expected<HttpResponse, NetworkError> post_json(
        const std::string& url,
        const std::string& json_body,
        const HttpHeaders& headers) override {
        HttpRequest request;
        request.method = HttpMethod::POST;
        request.url = url;
        request.body = json_body;
        request.headers = headers;
        request.headers["Content-Type"] = "application/json";
        request.timeout = m_config.default_timeout;
        return execute(request);
    }

    std::expected<HttpResponse, NetworkError> execute_streaming(
        const HttpRequest& request,
        StreamingCallback callback,
        const std::atomic<bool>* keep_running) override {

        auto handle = open_handle(request);
        if (!handle) {
            return std::unexpected(handle.error());
        }
        CURL* curl = handle->first.get();

        StreamState state;
        state.on_chunk = &callback;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_stream_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_stream_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);

        if (keep_running) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_when_stopped);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, keep_running);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        // The transfer lives as long as the server keeps sending; only the
        // connect phase and silence are bounded
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, 0L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(m_config.stream_idle_timeout.count()));

        LOG_DEBUG("CurlHttpClient", "Opening stream " + request.url);
        const CURLcode result = curl_easy_perform(curl);

        if (result != CURLE_OK) {
            LOG_DEBUG("CurlHttpClient", "Stream " + request.url + " ended: " + curl_easy_strerror(result));
            return std::unexpected(to_network_error(result));
        }

        HttpResponse response;
        response.status_code = static_cast<int>(state.status_code);
        response.body = std::move(state.rejected_body);
        return response;
    }

private:
    // Easy handle with URL, method, headers and TLS applied. The header list
    // must outlive the transfer, so it travels with the handle.
    std::expected<std::pair<CurlHandle, CurlHeaderList>, NetworkError> open_handle(const HttpRequest& request) {
        if (!request.is_valid()) {
            LOG_ERROR("CurlHttpClient", "Refusing request to invalid URL: " + request.url);
            return std::unexpected(NetworkError::InvalidUrl);
        }

        CurlHandle handle(curl_easy_init());
        if (!handle) {
            LOG_ERROR("CurlHttpClient", "curl_easy_init failed");
            return std::unexpected(NetworkError::ConnectionFailed);
        }
        CURL* curl = handle.get();

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, m_config.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_config.connect_timeout.count()));

        if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }

        CurlHeaderList headers;
        for (const auto& [name, value] : request.headers) {
            const std::string line = name + ": " + value;
            headers.reset(curl_slist_append(headers.release(), line.c_str()));
        }
        if (headers) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        }

        const bool verify = request.verify_ssl && m_config.verify_ssl;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        return std::make_pair(std::move(handle), std::move(headers));
    }

    HttpClientConfig m_config;
};

std::shared_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    if (!config.is_valid()) {
        LOG_WARNING("CurlHttpClient", "Invalid HTTP client settings, using defaults");
        return std::make_shared<CurlHttpClient>(HttpClientConfig{});
    }
    return std::make_shared<CurlHttpClient>(config);
}

} // namespace services
} // namespace playback_monitor
