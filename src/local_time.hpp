#pragma once
#include <string>
#include <cstdint>

namespace dosewatch {

// Calendar day as seen in some zone.
struct LocalDate {
    int year = 1970;
    int month = 1;    // 1..12
    int day = 1;      // 1..31
    int weekday = 4;  // 0 = Sunday, as tm_wday
};

// Zone strings are handed to the C library as TZ, so IANA ids
// ("Europe/Berlin") and POSIX rules ("<+02>-2") both work. An empty
// zone means the process's local zone.
LocalDate local_date_of(int64_t epoch_ms, const std::string& tz);

// Instant of date + hour:minute in tz; the day may overflow and is normalised.
int64_t local_instant(const LocalDate& date, int hour, int minute, const std::string& tz);

LocalDate add_days(const LocalDate& date, int days, const std::string& tz);

// "YYYY-MM-DD" -> local midnight of that day; throws ValidationError(field).
int64_t parse_local_date(const std::string& s, const std::string& tz, const std::string& field);
// Last millisecond of the local day that contains epoch_ms.
int64_t end_of_local_day(int64_t epoch_ms, const std::string& tz);

// "YYYY-MM-DD HH:MM" in tz.
std::string format_local(int64_t epoch_ms, const std::string& tz);

} // namespace dosewatch
