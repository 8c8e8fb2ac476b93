#include "playback_monitor/utils/json_helper.hpp"

namespace playback_monitor::utils {

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(const std::string& json_string) {
    if (json_string.empty()) {
        return std::unexpected("Empty JSON string");
    }

    // Error pages from proxies and older servers arrive as XML/HTML
    if (json_string[0] == '<') {
        return std::unexpected("Response appears to be XML/HTML, not JSON");
    }

    try {
        return nlohmann::json::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    }
}

std::string JsonHelper::get_id(const nlohmann::json& json, const std::string& field) {
    if (!has_field(json, field)) {
        return {};
    }
    const auto& value = json[field];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<std::int64_t>());
    }
    return {};
}

std::int64_t JsonHelper::get_int(const nlohmann::json& json, const std::string& field, std::int64_t default_value) {
    if (!has_field(json, field)) {
        return default_value;
    }
    const auto& value = json[field];
    if (value.is_number()) {
        return value.get<std::int64_t>();
    }
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (const std::exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool JsonHelper::has_field(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && !json[field].is_null();
}

bool JsonHelper::has_array(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && json[field].is_array() && !json[field].empty();
}

} // namespace playback_monitor::utils
