#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace roon_mpris::utils {

// RFC 4122 random identifier, used for SOOD transaction ids
class Uuid {
public:
    Uuid() = default;
    explicit Uuid(const std::array<std::uint8_t, 16>& bytes);

    [[nodiscard]] static Uuid generate_v4();

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] const std::array<std::uint8_t, 16>& bytes() const { return m_bytes; }

    bool operator==(const Uuid& other) const { return m_bytes == other.m_bytes; }

private:
    std::array<std::uint8_t, 16> m_bytes{};

    static std::mt19937& get_rng();
};

}
