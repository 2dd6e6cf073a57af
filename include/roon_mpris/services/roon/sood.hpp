#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace roon_mpris::services::sood {

inline constexpr std::string_view MULTICAST_ADDRESS = "239.255.90.90";
inline constexpr std::uint16_t PORT = 9003;
inline constexpr std::string_view ROON_SERVICE_ID = "00720724-5143-4a9b-abac-0e50cba674bb";

enum class PacketType : char {
    Query = 'Q',
    Reply = 'R'
};

// A null property (length 0xFFFF on the wire) is stored as nullopt
using Properties = std::map<std::string, std::optional<std::string>>;

struct Packet {
    PacketType type = PacketType::Query;
    Properties properties;
};

std::vector<std::uint8_t> encode(const Packet& packet);
std::optional<Packet> decode(const std::uint8_t* data, std::size_t size);

// "query_service_id" for the Roon core plus a transaction id
std::vector<std::uint8_t> encode_query(const std::string& transaction_id);

struct CoreEndpoint {
    std::string host;
    std::uint16_t http_port = 0;
    std::string unique_id;
    std::string display_name;

    bool operator==(const CoreEndpoint&) const = default;
};

// Extracts the endpoint from a reply sent by a Roon core; other packets yield nullopt
std::optional<CoreEndpoint> endpoint_from_reply(const Packet& packet, const std::string& sender);

} // namespace roon_mpris::services::sood
