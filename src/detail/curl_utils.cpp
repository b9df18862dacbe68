#include "rtufetch/detail/curl_utils.hpp"
#include "rtufetch/error.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

namespace rtufetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw FetchError(ErrorCode::ConnectionFailed, "Failed to allocate curl handle");
    }
    return curl;
}

std::vector<CurlOption> timeoutOptions(std::chrono::seconds timeout) {
    const long seconds = static_cast<long>(timeout.count());
    return {
        {CURLOPT_CONNECTTIMEOUT, seconds},
        // 1 byte/s over the window; 0 would disable the check.
        {CURLOPT_LOW_SPEED_LIMIT, 1L},
        {CURLOPT_LOW_SPEED_TIME, seconds},
        {CURLOPT_SERVER_RESPONSE_TIMEOUT, seconds},
    };
}

ListStatus classifyListResult(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return ListStatus::Listed;
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return ListStatus::NotFound;
        default:
            return ListStatus::TransportError;
    }
}

std::string buildFtpUrl(CURL* curl, const std::string& host, int port, const std::string& path) {
    std::string url = fmt::format("ftp://{}:{}", host, port);
    if (path.empty() || path.front() != '/') {
        url += '/';
    }

    std::size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const std::string segment =
            path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (!segment.empty()) {
            char* escaped = curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.size()));
            if (!escaped) {
                throw FetchError(ErrorCode::InvalidInput, path, "Cannot escape remote path");
            }
            url += escaped;
            curl_free(escaped);
        }
        if (slash == std::string::npos) {
            break;
        }
        url += '/';
        start = slash + 1;
    }
    return url;
}

} // namespace rtufetch::detail
