#include "rtufetch/ftp_transport.hpp"
#include "rtufetch/detail/curl_utils.hpp"
#include "rtufetch/error.hpp"

#include <cstdint>
#include <cstdio>
#include <sstream>
#include <thread>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rtufetch {

class FtpTransport::Impl {
public:
    Impl(ServerConfig server, TransportOptions options)
        : server_(std::move(server)),
        options_(options),
        curl_(nullptr, &curl_easy_cleanup) {}

    ~Impl() { disconnect(); }

    void connect() {
        std::string last_error;
        for (int attempt = 1; attempt <= options_.connect_retries; ++attempt) {
            if (!curl_) {
                curl_ = detail::makeCurlHandle();
            }

            prepare(buildUrl("/"));
            curl_easy_setopt(curl_.get(), CURLOPT_NOBODY, 1L);

            const CURLcode res = curl_easy_perform(curl_.get());
            if (res == CURLE_OK) {
                spdlog::debug("[ftp] connected to {}:{} as '{}'", server_.host, server_.port, server_.username);
                return;
            }

            last_error = errorText(res);
            spdlog::warn("[ftp] connect attempt {}/{} to {}:{} failed: {}",
                         attempt, options_.connect_retries, server_.host, server_.port, last_error);
            curl_.reset();

            if (attempt < options_.connect_retries) {
                std::this_thread::sleep_for(options_.retry_delay);
            }
        }

        throw FetchError(ErrorCode::ConnectionFailed,
                         fmt::format("{}:{}", server_.host, server_.port),
                         fmt::format("FTP connection failed after {} attempts: {}",
                                     options_.connect_retries, last_error));
    }

    [[nodiscard]] ListResult listDirectory(const std::string& path) {
        ListResult result;
        if (!curl_) {
            result.status = ListStatus::TransportError;
            result.error_message = "Not connected";
            return result;
        }

        std::string directory = path;
        if (directory.empty() || directory.back() != '/') {
            directory += '/';
        }

        std::string listing;
        prepare(buildUrl(directory));
        curl_easy_setopt(curl_.get(), CURLOPT_DIRLISTONLY, 1L);
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, &Impl::appendToString);
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &listing);

        const CURLcode res = curl_easy_perform(curl_.get());
        result.status = detail::classifyListResult(res);
        if (result.status == ListStatus::TransportError) {
            result.error_message = errorText(res);
        }
        if (result.status != ListStatus::Listed) {
            return result;
        }

        std::istringstream lines(listing);
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                result.entries.push_back(line);
            }
        }
        return result;
    }

    void retrieveFile(const std::string& remote_path, const std::filesystem::path& destination,
                      const TransferObserver& observer) {
        if (!curl_) {
            throw FetchError(ErrorCode::TransferFailed, remote_path, "Not connected");
        }

        std::unique_ptr<FILE, FileDeleter> file{std::fopen(destination.c_str(), "wb")};
        if (!file) {
            throw FetchError(ErrorCode::TransferFailed, destination.string(),
                             "Cannot create destination file");
        }

        WriteTarget target{file.get(), curl_.get(), &observer, 0};
        prepare(buildUrl(remote_path));
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, &Impl::writeToFile);
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &target);

        const CURLcode res = curl_easy_perform(curl_.get());
        if (res != CURLE_OK) {
            throw FetchError(ErrorCode::TransferFailed, remote_path, errorText(res));
        }

        if (std::fflush(file.get()) != 0 || std::ferror(file.get()) != 0) {
            throw FetchError(ErrorCode::TransferFailed, destination.string(),
                             "Failed to write output file");
        }
    }

    void disconnect() noexcept {
        if (curl_) {
            spdlog::debug("[ftp] disconnecting from {}:{}", server_.host, server_.port);
        }
        curl_.reset();
    }

private:
    struct WriteTarget {
        FILE* file;
        CURL* curl;
        const TransferObserver* observer;
        std::uint64_t received;
    };

    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    // Resets per-request options while keeping the live connection.
    void prepare(const std::string& url) {
        CURL* c = curl_.get();
        curl_easy_reset(c);
        error_buffer_[0] = '\0';

        curl_easy_setopt(c, CURLOPT_URL, url.c_str());
        curl_easy_setopt(c, CURLOPT_USERNAME, server_.username.c_str());
        curl_easy_setopt(c, CURLOPT_PASSWORD, server_.password.c_str());
        for (const auto& option : detail::timeoutOptions(options_.timeout)) {
            curl_easy_setopt(c, option.option, option.value);
        }
        curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(c, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(c, CURLOPT_ERRORBUFFER, error_buffer_);
    }

    std::string buildUrl(const std::string& path) const {
        return detail::buildFtpUrl(curl_.get(), server_.host, server_.port, path);
    }

    std::string errorText(CURLcode res) const {
        if (error_buffer_[0] != '\0') {
            return fmt::format("{} ({})", curl_easy_strerror(res), error_buffer_);
        }
        return curl_easy_strerror(res);
    }

    static size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* out = static_cast<std::string*>(userdata);
        if (!out) {
            return 0;
        }
        out->append(ptr, size * nmemb);
        return size * nmemb;
    }

    static size_t writeToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* target = static_cast<WriteTarget*>(userdata);
        if (!target || !target->file) {
            return 0;
        }
        const size_t written = std::fwrite(ptr, size, nmemb, target->file) * size;
        target->received += written;

        if (target->observer && *target->observer) {
            curl_off_t total = 0;
            if (curl_easy_getinfo(target->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &total) != CURLE_OK || total < 0) {
                total = 0;
            }
            (*target->observer)(target->received, static_cast<std::uint64_t>(total));
        }
        return written;
    }

    ServerConfig server_;
    TransportOptions options_;
    detail::CurlHandle curl_;
    char error_buffer_[CURL_ERROR_SIZE]{};
};

FtpTransport::FtpTransport(ServerConfig server, TransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(server), options)) {}

FtpTransport::~FtpTransport() = default;

void FtpTransport::connect() { impl_->connect(); }

ListResult FtpTransport::listDirectory(const std::string& path) { return impl_->listDirectory(path); }

void FtpTransport::retrieveFile(const std::string& remote_path, const std::filesystem::path& destination,
                               const TransferObserver& observer) {
    impl_->retrieveFile(remote_path, destination, observer);
}

void FtpTransport::disconnect() noexcept { impl_->disconnect(); }

RemoteTransportPtr makeFtpTransport(const ServerConfig& server, const TransportOptions& options) {
    return std::make_unique<FtpTransport>(server, options);
}

} // namespace rtufetch
