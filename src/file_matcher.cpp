#include "rtufetch/file_matcher.hpp"

#include <algorithm>
#include <cctype>

namespace rtufetch {

namespace {

constexpr char kDataExtension[] = ".txt";

bool equalsIgnoreCase(char lhs, char rhs) {
    return std::tolower(static_cast<unsigned char>(lhs)) ==
           std::tolower(static_cast<unsigned char>(rhs));
}

bool startsWithIgnoreCase(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), text.begin(), equalsIgnoreCase);
}

bool endsWithIgnoreCase(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           std::equal(suffix.rbegin(), suffix.rend(), text.rbegin(), equalsIgnoreCase);
}

} // namespace

bool matchesStation(const std::string& station_id, const std::string& file_name) {
    if (station_id.empty()) {
        return false;
    }
    return startsWithIgnoreCase(file_name, station_id) &&
           endsWithIgnoreCase(file_name, kDataExtension);
}

} // namespace rtufetch
