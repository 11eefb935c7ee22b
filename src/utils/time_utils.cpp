#include "pv_watch/utils/time_utils.h"
#include <chrono>

namespace pv_watch {
namespace utils {

namespace {

// Floor division for negative timestamps
int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// Days since 1970-01-01 to civil date (Howard Hinnant's algorithm)
void civilFromDays(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = yoe + era * 400;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(month <= 2 ? y + 1 : y);
}

int64_t daysFromCivil(int year, int month, int day) {
    const int64_t y = month <= 2 ? year - 1 : year;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = month > 2 ? month - 3 : month + 9;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

} // anonymous namespace

CalendarDate toCalendar(int64_t timestamp_ms) {
    CalendarDate date{};
    int64_t days = floorDiv(timestamp_ms, MS_PER_DAY);
    int64_t ms_of_day = timestamp_ms - days * MS_PER_DAY;

    civilFromDays(days, date.year, date.month, date.day);
    date.hour = static_cast<int>(ms_of_day / MS_PER_HOUR);

    // 1970-01-01 was a Thursday
    int64_t dow = (days + 4) % 7;
    date.day_of_week = static_cast<int>(dow < 0 ? dow + 7 : dow);
    date.day_of_year = static_cast<int>(days - daysFromCivil(date.year, 1, 1)) + 1;
    return date;
}

int64_t fromCivil(int year, int month, int day) {
    return daysFromCivil(year, month, day) * MS_PER_DAY;
}

int hourOfDay(int64_t timestamp_ms) {
    return toCalendar(timestamp_ms).hour;
}

int dayOfYear(int64_t timestamp_ms) {
    return toCalendar(timestamp_ms).day_of_year;
}

int daysInMonth(int64_t timestamp_ms) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    CalendarDate date = toCalendar(timestamp_ms);
    if (date.month == 2 && isLeapYear(date.year)) {
        return 29;
    }
    return kDays[date.month - 1];
}

int64_t startOfDay(int64_t timestamp_ms) {
    return floorDiv(timestamp_ms, MS_PER_DAY) * MS_PER_DAY;
}

int64_t nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

} // namespace utils
} // namespace pv_watch
