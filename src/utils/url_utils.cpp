#include "playback_monitor/utils/url_utils.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace playback_monitor {
namespace utils {

std::string UrlUtils::encode(const std::string& str) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;

    for (char c : str) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(uc);
        }
    }

    return encoded.str();
}

std::string UrlUtils::join_path(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;

    const bool base_slash = base.back() == '/';
    const bool path_slash = path.front() == '/';

    if (base_slash && path_slash) {
        return base + path.substr(1);
    }
    if (!base_slash && !path_slash) {
        return base + "/" + path;
    }
    return base + path;
}

std::string UrlUtils::build_query_string(const std::map<std::string, std::string>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += '&';
        query += encode(key) + "=" + encode(value);
    }
    return query;
}

bool UrlUtils::is_valid_url(const std::string& url) {
    auto scheme = get_scheme(url);
    if (!scheme || (*scheme != "http" && *scheme != "https")) {
        return false;
    }
    const auto host_start = scheme->size() + 3;
    return host_start < url.size() && url[host_start] != '/' && url[host_start] != ':';
}

std::optional<std::string> UrlUtils::get_scheme(const std::string& url) {
    const auto pos = url.find("://");
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }
    return url.substr(0, pos);
}

std::string UrlUtils::trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace utils
} // namespace playback_monitor
