#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace roon_mpris::utils {

/**
 * @brief Helpers for reading loosely shaped JSON bodies from the Roon core
 */
class JsonHelper {
public:
    /**
     * @brief Parse a JSON document without throwing
     * @return Parsed JSON or a description of the parse failure
     */
    static std::expected<nlohmann::json, std::string> safe_parse(std::string_view json_string);

    /**
     * @brief Read a field, falling back to a default when missing, null or mistyped
     */
    template<typename T>
    static T get_optional(const nlohmann::json& json, const std::string& field, const T& default_value);

    /**
     * @brief Read a field that may be absent
     * @return nullopt when missing, null or mistyped
     */
    template<typename T>
    static std::optional<T> get_if_present(const nlohmann::json& json, const std::string& field);

    static bool has_field(const nlohmann::json& json, const std::string& field);

    /// True if the field is a non-empty array
    static bool has_array(const nlohmann::json& json, const std::string& field);

    template<typename Func>
    static void for_each_in_array(const nlohmann::json& json, const std::string& field, Func&& func);
};

template<typename T>
T JsonHelper::get_optional(const nlohmann::json& json, const std::string& field, const T& default_value) {
    return get_if_present<T>(json, field).value_or(default_value);
}

template<typename T>
std::optional<T> JsonHelper::get_if_present(const nlohmann::json& json, const std::string& field) {
    if (!has_field(json, field)) {
        return std::nullopt;
    }

    try {
        return json.at(field).get<T>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

template<typename Func>
void JsonHelper::for_each_in_array(const nlohmann::json& json, const std::string& field, Func&& func) {
    if (!has_array(json, field)) {
        return;
    }

    for (const auto& element : json.at(field)) {
        func(element);
    }
}

} // namespace roon_mpris::utils
