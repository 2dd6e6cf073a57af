#include "roon_mpris/services/network/http_client.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <curl/curl.h>
#include <fstream>
#include <mutex>

namespace roon_mpris {
namespace services {

namespace {

std::once_flag g_curl_init_flag;

// Returning less than total_size makes curl abort with CURLE_WRITE_ERROR
size_t write_file_callback(void* contents, size_t size, size_t nmemb, std::ofstream* file) {
    size_t total_size = size * nmemb;
    file->write(static_cast<char*>(contents), static_cast<std::streamsize>(total_size));
    return file->good() ? total_size : 0;
}

int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* callback = static_cast<ProgressCallback*>(clientp);
    if (callback && *callback && dltotal > 0) {
        (*callback)(static_cast<size_t>(dlnow), static_cast<size_t>(dltotal));
    }
    return 0;
}

NetworkError curl_error_to_network_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return NetworkError::DNSResolutionFailed;
        case CURLE_COULDNT_CONNECT:
            return NetworkError::ConnectionFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError::Timeout;
        case CURLE_TOO_MANY_REDIRECTS:
            return NetworkError::TooManyRedirects;
        case CURLE_URL_MALFORMAT:
            return NetworkError::InvalidUrl;
        case CURLE_HTTP_RETURNED_ERROR:
            return NetworkError::HttpError;
        case CURLE_WRITE_ERROR:
            return NetworkError::FileWriteFailed;
        case CURLE_ABORTED_BY_CALLBACK:
            return NetworkError::Cancelled;
        default:
            return NetworkError::BadResponse;
    }
}

} // namespace

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientConfig config) : m_config(std::move(config)) {
        std::call_once(g_curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        });
    }

    std::expected<void, NetworkError> download_file(
        const std::string& url,
        const std::string& file_path,
        ProgressCallback progress) override {
        LOG_DEBUG("CurlHttpClient", "Downloading " + url + " to " + file_path);

        if (!url.starts_with("http://") && !url.starts_with("https://")) {
            LOG_ERROR("CurlHttpClient", "Invalid URL: " + url);
            return std::unexpected(NetworkError::InvalidUrl);
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            LOG_ERROR("CurlHttpClient", "Failed to initialize curl handle for download");
            return std::unexpected(NetworkError::ConnectionFailed);
        }

        std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("CurlHttpClient", "Failed to open file for writing: " + file_path);
            curl_easy_cleanup(curl);
            return std::unexpected(NetworkError::FileWriteFailed);
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_file_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &file);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(m_config.default_timeout.count()));
        if (progress) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }
        struct curl_slist* header_list = apply_common_options(curl);

        CURLcode res = curl_easy_perform(curl);

        if (header_list) {
            curl_slist_free_all(header_list);
        }
        curl_easy_cleanup(curl);
        file.close();

        if (res != CURLE_OK) {
            LOG_ERROR("CurlHttpClient", "Download of " + url + " failed: " + curl_easy_strerror(res));
            return std::unexpected(curl_error_to_network_error(res));
        }
        if (file.fail()) {
            return std::unexpected(NetworkError::FileWriteFailed);
        }

        LOG_DEBUG("CurlHttpClient", "Download complete: " + file_path);
        return {};
    }

private:
    struct curl_slist* apply_common_options(CURL* curl) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_config.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (!m_config.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, m_config.user_agent.c_str());
        }

        struct curl_slist* header_list = nullptr;
        for (const auto& [key, value] : m_config.default_headers) {
            header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
        }
        if (header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }
        return header_list;
    }

    HttpClientConfig m_config;
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    if (!config.is_valid()) {
        LOG_WARNING("CurlHttpClient", "Invalid HTTP client configuration, using defaults");
        return std::make_unique<CurlHttpClient>(HttpClientConfig{});
    }
    return std::make_unique<CurlHttpClient>(config);
}

} // namespace services
} // namespace roon_mpris
