#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace rtufetch {

// Proleptic Gregorian calendar day.
struct Date {
    int year{1970};
    int month{1};
    int day{1};

    [[nodiscard]] bool isValid() const;
    // Days since 1970-01-01.
    [[nodiscard]] long toDays() const;
    [[nodiscard]] Date next() const;
    [[nodiscard]] Date previous() const;

    static Date fromDays(long days);
};

bool operator==(const Date& lhs, const Date& rhs);
bool operator!=(const Date& lhs, const Date& rhs);
bool operator<(const Date& lhs, const Date& rhs);
bool operator<=(const Date& lhs, const Date& rhs);

struct DateTime {
    Date date;
    int hour{0};
    int minute{0};

    [[nodiscard]] bool isValid() const;
    [[nodiscard]] long toMinutes() const;
};

bool operator==(const DateTime& lhs, const DateTime& rhs);
bool operator<(const DateTime& lhs, const DateTime& rhs);

// Inclusive range of instants at minute granularity. A range whose start equals
// its end covers exactly one minute. Construction does not check start <= end;
// sessions call validate() when a download is requested.
class DateRange {
public:
    DateRange(DateTime start, DateTime end);

    [[nodiscard]] bool isValid() const;
    // Throws FetchError(InvalidInput) when start > end or either end is invalid.
    void validate() const;

    static DateRange singleDay(const Date& day);
    static DateRange singleInstant(const DateTime& instant);
    static DateRange days(const Date& first, const Date& last);

    [[nodiscard]] const DateTime& start() const noexcept { return start_; }
    [[nodiscard]] const DateTime& end() const noexcept { return end_; }
    [[nodiscard]] long lengthMinutes() const;
    [[nodiscard]] std::size_t dayCount() const;
    [[nodiscard]] Date firstDay() const noexcept { return start_.date; }
    [[nodiscard]] Date lastDay() const noexcept { return end_.date; }

private:
    DateTime start_;
    DateTime end_;
};

// "YYYY-MM-DD"
Date parseDate(const std::string& text);
// "YYMMDDHHMM"; two-digit years below 90 map to 20xx, the rest to 19xx.
DateTime parseSingleTimestamp(const std::string& text);

std::string formatDate(const Date& date);
std::string formatDateTime(const DateTime& value);

// Local calendar day of the given instant, and the day before it.
Date localDate(std::chrono::system_clock::time_point instant);
Date yesterdayOf(std::chrono::system_clock::time_point now);

} // namespace rtufetch
