#include "roon_mpris/services/bridge/image_resolver.hpp"

namespace roon_mpris::services {

std::optional<std::string> resolve_image_url(const std::string& base_address,
                                             const std::optional<std::string>& image_key) {
    if (!image_key) {
        return std::nullopt;
    }
    return "http://" + base_address + "/image/" + *image_key;
}

} // namespace roon_mpris::services
