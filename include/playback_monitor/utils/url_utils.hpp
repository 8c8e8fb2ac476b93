#pragma once

#include <optional>
#include <string>
#include <map>

namespace playback_monitor {
namespace utils {

class UrlUtils {
public:
    static std::string encode(const std::string& str);
    static std::string join_path(const std::string& base, const std::string& path);
    static std::string build_query_string(const std::map<std::string, std::string>& params);
    static bool is_valid_url(const std::string& url);
    static std::optional<std::string> get_scheme(const std::string& url);
    static std::string trim_trailing_slash(std::string url);
};

} // namespace utils
} // namespace playback_monitor
