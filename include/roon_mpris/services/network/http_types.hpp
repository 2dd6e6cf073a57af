#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>

namespace roon_mpris {
namespace services {

enum class NetworkError {
    ConnectionFailed,
    Timeout,
    DNSResolutionFailed,
    InvalidUrl,
    TooManyRedirects,
    HttpError,
    FileWriteFailed,
    BadResponse,
    Cancelled
};

std::string to_string(NetworkError error);

using HttpHeaders = std::unordered_map<std::string, std::string>;

using ProgressCallback = std::function<void(size_t downloaded, size_t total)>;

} // namespace services
} // namespace roon_mpris
