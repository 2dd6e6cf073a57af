#include "roon_mpris/utils/json_helper.hpp"

namespace roon_mpris::utils {

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(std::string_view json_string) {
    if (json_string.empty()) {
        return std::unexpected("Empty JSON document");
    }

    try {
        return nlohmann::json::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    }
}

bool JsonHelper::has_field(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && !json.at(field).is_null();
}

bool JsonHelper::has_array(const nlohmann::json& json, const std::string& field) {
    return has_field(json, field) && json.at(field).is_array() && !json.at(field).empty();
}

} // namespace roon_mpris::utils
