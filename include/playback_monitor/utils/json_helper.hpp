#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace playback_monitor::utils {

/**
 * @brief Helpers for tolerant extraction of fields from backend payloads
 */
class JsonHelper {
public:
    /**
     * @brief Safely parse a JSON string
     *
     * @param json_string The JSON string to parse
     * @return Parsed JSON or an error message
     */
    static std::expected<nlohmann::json, std::string> safe_parse(const std::string& json_string);

    /**
     * @brief Get an optional field from JSON with a default value
     *
     * Type mismatches yield the default rather than throwing.
     */
    template<typename T>
    static T get_optional(const nlohmann::json& json, const std::string& field, const T& default_value);

    /**
     * @brief Read an identifier that backends send either as a string or a number
     */
    static std::string get_id(const nlohmann::json& json, const std::string& field);

    /**
     * @brief Read an integer that may be encoded as a string
     */
    static std::int64_t get_int(const nlohmann::json& json, const std::string& field, std::int64_t default_value = 0);

    static bool has_field(const nlohmann::json& json, const std::string& field);
    static bool has_array(const nlohmann::json& json, const std::string& field);

    template<typename Func>
    static void for_each_in_array(const nlohmann::json& json, const std::string& field, Func&& func);
};

template<typename T>
T JsonHelper::get_optional(const nlohmann::json& json, const std::string& field, const T& default_value) {
    if (!json.is_object() || !json.contains(field) || json[field].is_null()) {
        return default_value;
    }

    try {
        return json[field].get<T>();
    } catch (const nlohmann::json::exception&) {
        return default_value;
    }
}

template<typename Func>
void JsonHelper::for_each_in_array(const nlohmann::json& json, const std::string& field, Func&& func) {
    if (!has_array(json, field)) {
        return;
    }

    for (const auto& element : json[field]) {
        func(element);
    }
}

} // namespace playback_monitor::utils
