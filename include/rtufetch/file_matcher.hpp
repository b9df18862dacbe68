#pragma once

#include <string>

namespace rtufetch {

// True when file_name starts with station_id and carries a ".txt" extension.
// Both comparisons ignore case. No separator is required after the prefix, so a
// station id that prefixes another station's id also matches that station's files.
[[nodiscard]] bool matchesStation(const std::string& station_id, const std::string& file_name);

} // namespace rtufetch
