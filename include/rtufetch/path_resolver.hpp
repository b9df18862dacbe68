#pragma once

#include "calendar.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace rtufetch {

// Remote directory layouts for one day, in probing order:
//   <base>/<YYYY>/<MM>/<DD>/
//   <base>/<YYYY>/<MM>/<DDMMYYYY>/
// When include_bare_forms is set the same paths without the trailing slash are
// appended, for transports that treat the two spellings differently.
[[nodiscard]] std::vector<std::string> candidatePaths(const std::string& base_path,
                                                      const Date& date,
                                                      bool include_bare_forms = false);

// <local_base>/<state_label>/<station>/<YYYY>/<MM>/<DD>/<filename>
[[nodiscard]] std::filesystem::path localFilePath(const std::filesystem::path& local_base,
                                                  const std::string& state_label,
                                                  const std::string& station,
                                                  const Date& date,
                                                  const std::string& filename);

// Joins a remote directory and a file name with exactly one separator.
[[nodiscard]] std::string joinRemotePath(const std::string& directory, const std::string& name);

} // namespace rtufetch
