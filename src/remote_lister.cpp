#include "rtufetch/remote_lister.hpp"

#include <exception>
#include <utility>

namespace rtufetch {

std::string entryBaseName(const std::string& entry) {
    std::string name = entry;
    while (!name.empty() && (name.back() == '\r' || name.back() == '\n' || name.back() == '/')) {
        name.pop_back();
    }
    const auto slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    return name;
}

ListResult listRemoteDirectory(RemoteTransport& transport, const std::string& path) {
    ListResult raw;
    try {
        raw = transport.listDirectory(path);
    } catch (const std::exception& e) {
        ListResult failed;
        failed.status = ListStatus::TransportError;
        failed.error_message = e.what();
        return failed;
    }

    if (raw.status != ListStatus::Listed) {
        raw.entries.clear();
        return raw;
    }

    ListResult result;
    result.status = ListStatus::Listed;
    result.entries.reserve(raw.entries.size());
    for (const auto& entry : raw.entries) {
        std::string name = entryBaseName(entry);
        if (name.empty() || name == "." || name == "..") {
            continue;
        }
        result.entries.push_back(std::move(name));
    }
    return result;
}

} // namespace rtufetch
