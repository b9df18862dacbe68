#pragma once

#include "remote_transport.hpp"

#include <string>

namespace rtufetch {

// Lists a remote directory and normalizes the entries to bare file names:
// path prefixes, trailing CR/LF, blank lines, "." and ".." are dropped.
// Any exception thrown by the transport is reported as TransportError.
[[nodiscard]] ListResult listRemoteDirectory(RemoteTransport& transport, const std::string& path);

// Last path component of a listing entry.
[[nodiscard]] std::string entryBaseName(const std::string& entry);

} // namespace rtufetch
