#include "rtufetch/transfer_engine.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace rtufetch {

namespace fs = std::filesystem;

namespace {

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("[transfer] could not remove {}: {}", path.string(), ec.message());
    }
}

FetchResult failure(std::string reason) {
    FetchResult result;
    result.status = FetchStatus::Failed;
    result.reason = std::move(reason);
    return result;
}

} // namespace

TransferEngine::TransferEngine(RemoteTransport& transport)
    : transport_(transport) {}

fs::path TransferEngine::temporaryPathFor(const fs::path& local_path) {
    fs::path temporary = local_path;
    temporary += ".part";
    return temporary;
}

FetchResult TransferEngine::fetch(const std::string& remote_path, const fs::path& local_path,
                                  const TransferObserver& observer) {
    std::error_code ec;
    if (fs::exists(local_path, ec)) {
        FetchResult result;
        result.status = FetchStatus::SkippedExisting;
        return result;
    }

    if (local_path.has_parent_path()) {
        fs::create_directories(local_path.parent_path(), ec);
        if (ec) {
            return failure("Failed to create directory " + local_path.parent_path().string() +
                           ": " + ec.message());
        }
    }

    const fs::path temporary = temporaryPathFor(local_path);
    try {
        transport_.retrieveFile(remote_path, temporary, observer);
    } catch (const std::exception& e) {
        removeQuietly(temporary);
        return failure(e.what());
    }

    const auto bytes = fs::file_size(temporary, ec);
    if (ec) {
        removeQuietly(temporary);
        return failure("Downloaded file is missing: " + ec.message());
    }

    fs::rename(temporary, local_path, ec);
    if (ec) {
        removeQuietly(temporary);
        return failure("Failed to move file into place: " + ec.message());
    }

    FetchResult result;
    result.status = FetchStatus::Fetched;
    result.bytes = static_cast<std::uint64_t>(bytes);
    return result;
}

} // namespace rtufetch
