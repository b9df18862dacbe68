#include "rtufetch/calendar.hpp"
#include "rtufetch/error.hpp"

#include <cctype>
#include <ctime>
#include <tuple>

#include <fmt/format.h>

namespace rtufetch {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool allDigits(const std::string& text) {
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return !text.empty();
}

} // namespace

bool Date::isValid() const {
    return month >= 1 && month <= 12 && day >= 1 && day <= daysInMonth(year, month);
}

// Civil-from-days conversions on 400-year eras, valid for any proleptic Gregorian date.
long Date::toDays() const {
    const int y = year - (month <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = static_cast<long>(y) - era * 400;
    const long mp = (month + 9) % 12;
    const long doy = (153 * mp + 2) / 5 + day - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::fromDays(long days) {
    days += 719468;
    const long era = (days >= 0 ? days : days - 146096) / 146097;
    const long doe = days - era * 146097;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const int y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    return Date{y, m, d};
}

Date Date::next() const { return fromDays(toDays() + 1); }

Date Date::previous() const { return fromDays(toDays() - 1); }

bool operator==(const Date& lhs, const Date& rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

bool operator!=(const Date& lhs, const Date& rhs) { return !(lhs == rhs); }

bool operator<(const Date& lhs, const Date& rhs) {
    return std::tie(lhs.year, lhs.month, lhs.day) < std::tie(rhs.year, rhs.month, rhs.day);
}

bool operator<=(const Date& lhs, const Date& rhs) { return !(rhs < lhs); }

bool DateTime::isValid() const {
    return date.isValid() && hour >= 0 && hour < 24 && minute >= 0 && minute < 60;
}

long DateTime::toMinutes() const {
    return date.toDays() * 24 * 60 + hour * 60 + minute;
}

bool operator==(const DateTime& lhs, const DateTime& rhs) {
    return lhs.date == rhs.date && lhs.hour == rhs.hour && lhs.minute == rhs.minute;
}

bool operator<(const DateTime& lhs, const DateTime& rhs) {
    return lhs.toMinutes() < rhs.toMinutes();
}

DateRange::DateRange(DateTime start, DateTime end)
    : start_(start), end_(end) {}

bool DateRange::isValid() const {
    return start_.isValid() && end_.isValid() && !(end_ < start_);
}

void DateRange::validate() const {
    if (!start_.isValid() || !end_.isValid()) {
        throw FetchError(ErrorCode::InvalidInput, "Date range contains an invalid date");
    }
    if (end_ < start_) {
        throw FetchError(ErrorCode::InvalidInput,
                         formatDateTime(start_) + " > " + formatDateTime(end_),
                         "Date range start is after its end");
    }
}

DateRange DateRange::singleDay(const Date& day) {
    return DateRange{DateTime{day, 0, 0}, DateTime{day, 23, 59}};
}

DateRange DateRange::singleInstant(const DateTime& instant) {
    return DateRange{instant, instant};
}

DateRange DateRange::days(const Date& first, const Date& last) {
    return DateRange{DateTime{first, 0, 0}, DateTime{last, 23, 59}};
}

long DateRange::lengthMinutes() const {
    return end_.toMinutes() - start_.toMinutes() + 1;
}

std::size_t DateRange::dayCount() const {
    return static_cast<std::size_t>(end_.date.toDays() - start_.date.toDays() + 1);
}

Date parseDate(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw FetchError(ErrorCode::InvalidInput, text, "Expected a date as YYYY-MM-DD");
    }
    const std::string y = text.substr(0, 4);
    const std::string m = text.substr(5, 2);
    const std::string d = text.substr(8, 2);
    if (!allDigits(y) || !allDigits(m) || !allDigits(d)) {
        throw FetchError(ErrorCode::InvalidInput, text, "Expected a date as YYYY-MM-DD");
    }

    const Date date{std::stoi(y), std::stoi(m), std::stoi(d)};
    if (!date.isValid()) {
        throw FetchError(ErrorCode::InvalidInput, text, "No such calendar day");
    }
    return date;
}

DateTime parseSingleTimestamp(const std::string& text) {
    if (text.size() != 10 || !allDigits(text)) {
        throw FetchError(ErrorCode::InvalidInput, text, "Expected a timestamp as YYMMDDHHMM");
    }

    const int yy = std::stoi(text.substr(0, 2));
    DateTime value;
    value.date.year = yy < 90 ? 2000 + yy : 1900 + yy;
    value.date.month = std::stoi(text.substr(2, 2));
    value.date.day = std::stoi(text.substr(4, 2));
    value.hour = std::stoi(text.substr(6, 2));
    value.minute = std::stoi(text.substr(8, 2));
    if (!value.isValid()) {
        throw FetchError(ErrorCode::InvalidInput, text, "Timestamp does not name a valid instant");
    }
    return value;
}

std::string formatDate(const Date& date) {
    return fmt::format("{:04}-{:02}-{:02}", date.year, date.month, date.day);
}

std::string formatDateTime(const DateTime& value) {
    return fmt::format("{} {:02}:{:02}", formatDate(value.date), value.hour, value.minute);
}

Date localDate(std::chrono::system_clock::time_point instant) {
    const std::time_t raw = std::chrono::system_clock::to_time_t(instant);
    std::tm local{};
    localtime_r(&raw, &local);
    return Date{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

Date yesterdayOf(std::chrono::system_clock::time_point now) {
    return localDate(now).previous();
}

} // namespace rtufetch
