#include "roon_mpris/services/network/http_types.hpp"
#include "roon_mpris/services/network/http_client.hpp"

namespace roon_mpris {
namespace services {

std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::ConnectionFailed: return "connection failed";
        case NetworkError::Timeout: return "timed out";
        case NetworkError::DNSResolutionFailed: return "DNS resolution failed";
        case NetworkError::InvalidUrl: return "invalid URL";
        case NetworkError::TooManyRedirects: return "too many redirects";
        case NetworkError::HttpError: return "HTTP error status";
        case NetworkError::FileWriteFailed: return "file write failed";
        case NetworkError::BadResponse: return "bad response";
        case NetworkError::Cancelled: return "cancelled";
    }
    return "unknown network error";
}

bool HttpClientConfig::is_valid() const {
    return default_timeout.count() > 0 && connect_timeout.count() > 0;
}

} // namespace services
} // namespace roon_mpris
