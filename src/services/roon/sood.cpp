#include "roon_mpris/services/roon/sood.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <charconv>

namespace roon_mpris::services::sood {

namespace {
    constexpr std::string_view MAGIC = "SOOD";
    constexpr std::uint8_t VERSION = 2;
    constexpr std::uint16_t NULL_LENGTH = 0xFFFF;
    constexpr std::size_t HEADER_SIZE = 6;
}

std::vector<std::uint8_t> encode(const Packet& packet) {
    std::vector<std::uint8_t> out(MAGIC.begin(), MAGIC.end());
    out.push_back(VERSION);
    out.push_back(static_cast<std::uint8_t>(packet.type));

    for (const auto& [key, value] : packet.properties) {
        if (key.empty() || key.size() > 255) {
            LOG_WARNING("Sood", "Skipping property with unencodable key '" + key + "'");
            continue;
        }
        if (value && value->size() >= NULL_LENGTH) {
            LOG_WARNING("Sood", "Skipping oversized value for '" + key + "'");
            continue;
        }

        out.push_back(static_cast<std::uint8_t>(key.size()));
        out.insert(out.end(), key.begin(), key.end());

        std::uint16_t length = value ? static_cast<std::uint16_t>(value->size()) : NULL_LENGTH;
        out.push_back(static_cast<std::uint8_t>(length >> 8));
        out.push_back(static_cast<std::uint8_t>(length & 0xFF));
        if (value) {
            out.insert(out.end(), value->begin(), value->end());
        }
    }
    return out;
}

std::optional<Packet> decode(const std::uint8_t* data, std::size_t size) {
    if (size < HEADER_SIZE ||
        std::string_view(reinterpret_cast<const char*>(data), MAGIC.size()) != MAGIC ||
        data[4] != VERSION) {
        return std::nullopt;
    }

    Packet packet;
    switch (static_cast<char>(data[5])) {
        case 'Q': packet.type = PacketType::Query; break;
        case 'R': packet.type = PacketType::Reply; break;
        default: return std::nullopt;
    }

    std::size_t pos = HEADER_SIZE;
    while (pos < size) {
        std::size_t key_length = data[pos++];
        if (key_length == 0 || pos + key_length + 2 > size) {
            return std::nullopt;
        }
        std::string key(reinterpret_cast<const char*>(data + pos), key_length);
        pos += key_length;

        std::uint16_t value_length = static_cast<std::uint16_t>((data[pos] << 8) | data[pos + 1]);
        pos += 2;

        if (value_length == NULL_LENGTH) {
            packet.properties[key] = std::nullopt;
            continue;
        }
        if (pos + value_length > size) {
            return std::nullopt;
        }
        packet.properties[key] = std::string(reinterpret_cast<const char*>(data + pos), value_length);
        pos += value_length;
    }
    return packet;
}

std::vector<std::uint8_t> encode_query(const std::string& transaction_id) {
    Packet query;
    query.type = PacketType::Query;
    query.properties["query_service_id"] = std::string(ROON_SERVICE_ID);
    query.properties["_tid"] = transaction_id;
    return encode(query);
}

std::optional<CoreEndpoint> endpoint_from_reply(const Packet& packet, const std::string& sender) {
    if (packet.type != PacketType::Reply) {
        return std::nullopt;
    }

    auto property = [&packet](const std::string& key) -> std::optional<std::string> {
        auto it = packet.properties.find(key);
        if (it == packet.properties.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    auto service_id = property("service_id");
    auto http_port = property("http_port");
    if (!service_id || *service_id != ROON_SERVICE_ID || !http_port) {
        return std::nullopt;
    }

    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(http_port->data(), http_port->data() + http_port->size(), port);
    if (ec != std::errc{} || ptr != http_port->data() + http_port->size() || port == 0 || port > 65535) {
        LOG_WARNING("Sood", "Core at " + sender + " advertised invalid http_port '" + *http_port + "'");
        return std::nullopt;
    }

    CoreEndpoint endpoint;
    endpoint.host = sender;
    endpoint.http_port = static_cast<std::uint16_t>(port);
    endpoint.unique_id = property("unique_id").value_or("");
    endpoint.display_name = property("name").value_or("");
    return endpoint;
}

} // namespace roon_mpris::services::sood
