#pragma once

#include "roon_mpris/core/models.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace roon_mpris::services {

enum class MooVerb {
    Request,
    Continue,
    Complete
};

std::string_view to_string(MooVerb verb);
std::optional<MooVerb> moo_verb_from_string(std::string_view value);

/**
 * @brief One frame of the Roon extension protocol
 *
 * For requests, name is "<service>/<method>"; for responses it is the status
 * ("Success", "Subscribed", "Changed", ...). Request-Id, Content-Type and
 * Content-Length are kept out of headers and derived from the other fields.
 */
struct MooMessage {
    MooVerb verb = MooVerb::Request;
    std::string name;
    std::uint64_t request_id = 0;
    std::map<std::string, std::string> headers;
    std::string content_type;
    std::string body;

    // Service part of a request name ("com.roonlabs.ping:1/ping" -> "com.roonlabs.ping:1")
    std::string service() const;
    std::string method() const;

    bool has_json_body() const;
    std::expected<nlohmann::json, std::string> json_body() const;
    void set_json_body(const nlohmann::json& json);

    static MooMessage request(std::uint64_t request_id, std::string name,
                              const std::optional<nlohmann::json>& body = std::nullopt);
    static MooMessage response(MooVerb verb, std::uint64_t request_id, std::string name,
                               const std::optional<nlohmann::json>& body = std::nullopt);
};

std::expected<MooMessage, core::RoonError> parse_moo_message(std::string_view data);
std::string serialize_moo_message(const MooMessage& message);

} // namespace roon_mpris::services
