#pragma once

#include "remote_transport.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace rtufetch {

enum class FetchStatus {
    Fetched,
    SkippedExisting,
    Failed
};

struct FetchResult {
    FetchStatus status{FetchStatus::Failed};
    std::uint64_t bytes{0};
    std::string reason;
};

// Retrieves single files into the local tree. A file present at the final path
// is complete by construction: data is written under a temporary name beside it
// and renamed into place only after the transfer succeeded.
class TransferEngine {
public:
    explicit TransferEngine(RemoteTransport& transport);

    // Never throws; every failure is reported as FetchStatus::Failed. observer
    // sees the bytes of the temporary file as they arrive.
    [[nodiscard]] FetchResult fetch(const std::string& remote_path,
                                    const std::filesystem::path& local_path,
                                    const TransferObserver& observer = {});

    [[nodiscard]] static std::filesystem::path temporaryPathFor(const std::filesystem::path& local_path);

private:
    RemoteTransport& transport_;
};

} // namespace rtufetch
