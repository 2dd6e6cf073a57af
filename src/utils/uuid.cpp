#include "roon_mpris/utils/uuid.hpp"

#include <iomanip>
#include <mutex>
#include <sstream>

namespace roon_mpris::utils {

namespace {
std::mutex g_rng_mutex;
}

Uuid::Uuid(const std::array<std::uint8_t, 16>& bytes) : m_bytes(bytes) {}

Uuid Uuid::generate_v4() {
    std::array<std::uint8_t, 16> bytes{};
    {
        std::lock_guard lock(g_rng_mutex);
        auto& rng = get_rng();
        std::uniform_int_distribution<std::uint16_t> dist(0, 255);
        for (auto& byte : bytes) {
            byte = static_cast<std::uint8_t>(dist(rng));
        }
    }

    bytes[6] = (bytes[6] & 0x0F) | 0x40;  // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80;  // RFC 4122 variant

    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < m_bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<unsigned>(m_bytes[i]);
    }

    return oss.str();
}

std::mt19937& Uuid::get_rng() {
    static std::random_device device;
    static std::mt19937 rng(device());
    return rng;
}

}
