#pragma once

#include "rtufetch/remote_transport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace rtufetch::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Runs curl_global_init once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

// Fresh easy handle. Throws FetchError(ConnectionFailed) when curl cannot allocate one.
CurlHandle makeCurlHandle();

struct CurlOption {
    CURLoption option;
    long value;
};

// Per-request timeouts: connect, server response and stalled transfer. There is
// no cap on the total duration of a transfer that keeps receiving data.
[[nodiscard]] std::vector<CurlOption> timeoutOptions(std::chrono::seconds timeout);

// Outcome of a directory listing request. A refused CWD means the directory
// does not exist; every other failure is a transport error.
[[nodiscard]] ListStatus classifyListResult(CURLcode code);

// ftp://host:port/<path> with each path segment URL-escaped and the separators kept.
[[nodiscard]] std::string buildFtpUrl(CURL* curl, const std::string& host, int port, const std::string& path);

} // namespace rtufetch::detail
