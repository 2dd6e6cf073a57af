#pragma once

#include <optional>
#include <string>

namespace roon_mpris::services {

// Cover art URL on the core's image endpoint. The address is not validated.
std::optional<std::string> resolve_image_url(const std::string& base_address,
                                             const std::optional<std::string>& image_key);

} // namespace roon_mpris::services
