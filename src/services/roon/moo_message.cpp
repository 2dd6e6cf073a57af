#include "roon_mpris/services/roon/moo_message.hpp"
#include "roon_mpris/utils/json_helper.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <charconv>

namespace roon_mpris::services {

namespace {
    constexpr std::string_view COMPONENT = "MooCodec";
    constexpr std::string_view PROTOCOL_PREFIX = "MOO/1 ";
    constexpr std::string_view JSON_CONTENT_TYPE = "application/json";

    std::string_view trim(std::string_view value) {
        auto start = value.find_first_not_of(" \t\r");
        if (start == std::string_view::npos) {
            return {};
        }
        auto end = value.find_last_not_of(" \t\r");
        return value.substr(start, end - start + 1);
    }

    std::optional<std::uint64_t> parse_number(std::string_view value) {
        std::uint64_t result = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
            return std::nullopt;
        }
        return result;
    }

    std::expected<MooMessage, core::RoonError> reject(const std::string& reason) {
        LOG_WARNING(COMPONENT, "Rejecting frame: " + reason);
        return std::unexpected(core::RoonError::InvalidMessage);
    }
}

std::string_view to_string(MooVerb verb) {
    switch (verb) {
        case MooVerb::Request: return "REQUEST";
        case MooVerb::Continue: return "CONTINUE";
        case MooVerb::Complete: return "COMPLETE";
        default: return "UNKNOWN";
    }
}

std::optional<MooVerb> moo_verb_from_string(std::string_view value) {
    if (value == "REQUEST") return MooVerb::Request;
    if (value == "CONTINUE") return MooVerb::Continue;
    if (value == "COMPLETE") return MooVerb::Complete;
    return std::nullopt;
}

std::string MooMessage::service() const {
    auto slash = name.rfind('/');
    return slash == std::string::npos ? std::string{} : name.substr(0, slash);
}

std::string MooMessage::method() const {
    auto slash = name.rfind('/');
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

bool MooMessage::has_json_body() const {
    return !body.empty() && content_type == JSON_CONTENT_TYPE;
}

std::expected<nlohmann::json, std::string> MooMessage::json_body() const {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    return utils::JsonHelper::safe_parse(body);
}

void MooMessage::set_json_body(const nlohmann::json& json) {
    content_type = JSON_CONTENT_TYPE;
    body = json.dump();
}

MooMessage MooMessage::request(std::uint64_t request_id, std::string name,
                               const std::optional<nlohmann::json>& body) {
    MooMessage message;
    message.verb = MooVerb::Request;
    message.request_id = request_id;
    message.name = std::move(name);
    if (body) {
        message.set_json_body(*body);
    }
    return message;
}

MooMessage MooMessage::response(MooVerb verb, std::uint64_t request_id, std::string name,
                                const std::optional<nlohmann::json>& body) {
    MooMessage message = request(request_id, std::move(name), body);
    message.verb = verb;
    return message;
}

std::expected<MooMessage, core::RoonError> parse_moo_message(std::string_view data) {
    auto header_end = data.find("\n\n");
    if (header_end == std::string_view::npos) {
        return reject("no header terminator");
    }

    std::string_view head = data.substr(0, header_end);
    std::string_view body = data.substr(header_end + 2);

    auto line_end = head.find('\n');
    std::string_view first_line = trim(head.substr(0, line_end));
    head = line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 1);

    if (!first_line.starts_with(PROTOCOL_PREFIX)) {
        return reject("missing MOO/1 prefix");
    }
    first_line.remove_prefix(PROTOCOL_PREFIX.size());

    auto space = first_line.find(' ');
    if (space == std::string_view::npos) {
        return reject("missing message name");
    }

    MooMessage message;
    auto verb = moo_verb_from_string(first_line.substr(0, space));
    if (!verb) {
        return reject("unknown verb '" + std::string(first_line.substr(0, space)) + "'");
    }
    message.verb = *verb;
    message.name = std::string(trim(first_line.substr(space + 1)));
    if (message.name.empty()) {
        return reject("empty message name");
    }

    std::optional<std::uint64_t> request_id;
    std::optional<std::uint64_t> content_length;

    while (!head.empty()) {
        line_end = head.find('\n');
        std::string_view line = head.substr(0, line_end);
        head = line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 1);

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return reject("malformed header line");
        }
        std::string key(trim(line.substr(0, colon)));
        std::string_view value = trim(line.substr(colon + 1));

        if (key == "Request-Id") {
            request_id = parse_number(value);
            if (!request_id) {
                return reject("non-numeric Request-Id");
            }
        } else if (key == "Content-Length") {
            content_length = parse_number(value);
            if (!content_length) {
                return reject("non-numeric Content-Length");
            }
        } else if (key == "Content-Type") {
            message.content_type = std::string(value);
        } else {
            message.headers[key] = std::string(value);
        }
    }

    if (!request_id) {
        return reject("missing Request-Id");
    }
    message.request_id = *request_id;

    if (content_length) {
        if (*content_length != body.size()) {
            return reject("Content-Length " + std::to_string(*content_length) +
                          " does not match body of " + std::to_string(body.size()) + " bytes");
        }
    } else if (!body.empty()) {
        return reject("body without Content-Length");
    }
    message.body = std::string(body);

    return message;
}

std::string serialize_moo_message(const MooMessage& message) {
    std::string result;
    result.append(PROTOCOL_PREFIX);
    result.append(to_string(message.verb));
    result.append(" ").append(message.name).append("\n");
    result.append("Request-Id: ").append(std::to_string(message.request_id)).append("\n");
    for (const auto& [key, value] : message.headers) {
        result.append(key).append(": ").append(value).append("\n");
    }
    if (!message.body.empty()) {
        result.append("Content-Length: ").append(std::to_string(message.body.size())).append("\n");
        result.append("Content-Type: ")
              .append(message.content_type.empty() ? std::string(JSON_CONTENT_TYPE) : message.content_type)
              .append("\n");
    }
    result.append("\n");
    result.append(message.body);
    return result;
}

} // namespace roon_mpris::services
