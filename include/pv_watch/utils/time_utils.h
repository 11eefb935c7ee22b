#pragma once

#include <cstdint>

namespace pv_watch {
namespace utils {

// Timestamps are milliseconds since the Unix epoch, interpreted as UTC.
constexpr int64_t MS_PER_SECOND = 1000;
constexpr int64_t MS_PER_MINUTE = 60 * MS_PER_SECOND;
constexpr int64_t MS_PER_HOUR = 60 * MS_PER_MINUTE;
constexpr int64_t MS_PER_DAY = 24 * MS_PER_HOUR;

/**
 * @brief Calendar fields of a UTC timestamp
 */
struct CalendarDate {
    int year;
    int month;         // 1-12
    int day;           // 1-31
    int hour;          // 0-23
    int day_of_week;   // 0 = Sunday
    int day_of_year;   // 1-366
};

CalendarDate toCalendar(int64_t timestamp_ms);

/**
 * @brief Inverse of toCalendar() for the date part (midnight UTC)
 */
int64_t fromCivil(int year, int month, int day);

int hourOfDay(int64_t timestamp_ms);

int dayOfYear(int64_t timestamp_ms);

/**
 * @brief Number of days in the month containing the timestamp
 */
int daysInMonth(int64_t timestamp_ms);

/**
 * @brief Midnight UTC of the day containing the timestamp
 */
int64_t startOfDay(int64_t timestamp_ms);

/**
 * @brief Current wall-clock time in milliseconds
 */
int64_t nowMs();

} // namespace utils
} // namespace pv_watch
