#include "rtufetch/path_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>

namespace rtufetch {

namespace {

std::string stripTrailingSlashes(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string trimmed(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string{};
}

} // namespace

std::vector<std::string> candidatePaths(const std::string& base_path, const Date& date,
                                        bool include_bare_forms) {
    const std::string base = stripTrailingSlashes(base_path);

    const std::string day_folder = fmt::format("{}/{:04}/{:02}/{:02}/",
                                               base, date.year, date.month, date.day);
    const std::string dated_folder = fmt::format("{}/{:04}/{:02}/{:02}{:02}{:04}/",
                                                 base, date.year, date.month,
                                                 date.day, date.month, date.year);

    std::vector<std::string> forms{day_folder, dated_folder};
    if (include_bare_forms) {
        forms.push_back(stripTrailingSlashes(day_folder));
        forms.push_back(stripTrailingSlashes(dated_folder));
    }

    std::vector<std::string> candidates;
    candidates.reserve(forms.size());
    for (auto& form : forms) {
        if (form.empty()) {
            continue;
        }
        if (std::find(candidates.begin(), candidates.end(), form) == candidates.end()) {
            candidates.push_back(std::move(form));
        }
    }
    return candidates;
}

std::filesystem::path localFilePath(const std::filesystem::path& local_base,
                                    const std::string& state_label,
                                    const std::string& station,
                                    const Date& date,
                                    const std::string& filename) {
    std::filesystem::path path = local_base;
    const std::string state = trimmed(state_label);
    if (!state.empty()) {
        path /= state;
    }
    path /= station;
    path /= fmt::format("{:04}", date.year);
    path /= fmt::format("{:02}", date.month);
    path /= fmt::format("{:02}", date.day);
    path /= filename;
    return path;
}

std::string joinRemotePath(const std::string& directory, const std::string& name) {
    if (directory.empty()) {
        return name;
    }
    if (directory.back() == '/') {
        return directory + name;
    }
    return directory + "/" + name;
}

} // namespace rtufetch
