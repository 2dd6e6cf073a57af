#pragma once

#include "roon_mpris/services/network/http_types.hpp"
#include <chrono>
#include <expected>
#include <memory>

namespace roon_mpris {
namespace services {

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Streams the body of a GET into file_path, truncating it first.
    // HTTP error statuses count as failures; the caller owns cleanup of
    // whatever was written.
    virtual std::expected<void, NetworkError> download_file(
        const std::string& url,
        const std::string& file_path,
        ProgressCallback progress = nullptr) = 0;
};

struct HttpClientConfig {
    std::chrono::seconds default_timeout{30};
    std::chrono::seconds connect_timeout{10};
    HttpHeaders default_headers;
    std::string user_agent = "roon-mpris";

    bool is_valid() const;
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

} // namespace services
} // namespace roon_mpris
