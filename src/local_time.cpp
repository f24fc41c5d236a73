#include "local_time.hpp"
#include "errors.hpp"
#include <ctime>
#include <cstdlib>
#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace dosewatch {

namespace {

std::mutex& tz_mutex() {
    static std::mutex m;
    return m;
}

void set_tz_env(const char* value) {
#ifdef _WIN32
    _putenv_s("TZ", value ? value : "");
    _tzset();
#else
    if (value) setenv("TZ", value, 1);
    else unsetenv("TZ");
    tzset();
#endif
}

// Holds the process-wide TZ lock and swaps TZ for the scope's lifetime.
// The lock only orders local_time callers. Other threads reading the
// environment meanwhile (getaddrinfo inside the webhook worker, for one) race
// with setenv, which POSIX leaves undefined. Under `serve` the dispatcher
// worker can overlap a runner tick; keep async webhook dispatch off where
// that matters.
class ScopedTimeZone {
public:
    explicit ScopedTimeZone(const std::string& tz) : lock_(tz_mutex()) {
        if (tz.empty()) return;
        const char* prev = std::getenv("TZ");
        had_prev_ = prev != nullptr;
        if (had_prev_) prev_ = prev;
        set_tz_env(tz.c_str());
        applied_ = true;
    }

    ~ScopedTimeZone() {
        if (!applied_) return;
        set_tz_env(had_prev_ ? prev_.c_str() : nullptr);
    }

    ScopedTimeZone(const ScopedTimeZone&) = delete;
    ScopedTimeZone& operator=(const ScopedTimeZone&) = delete;

private:
    std::lock_guard<std::mutex> lock_;
    std::string prev_;
    bool had_prev_ = false;
    bool applied_ = false;
};

std::time_t to_time_t(int64_t epoch_ms) {
    int64_t secs = epoch_ms / 1000;
    if (epoch_ms % 1000 < 0) secs -= 1;
    return static_cast<std::time_t>(secs);
}

std::tm local_tm(int64_t epoch_ms) {
    std::time_t t = to_time_t(epoch_ms);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

int64_t make_local(int year, int month, int day, int hour, int minute) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        throw std::runtime_error("Cannot represent local time " + std::to_string(year) + "-" +
                                 std::to_string(month) + "-" + std::to_string(day));
    }
    return static_cast<int64_t>(t) * 1000;
}

LocalDate date_from_tm(const std::tm& tm) {
    return LocalDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_wday};
}

} // namespace

LocalDate local_date_of(int64_t epoch_ms, const std::string& tz) {
    ScopedTimeZone zone(tz);
    return date_from_tm(local_tm(epoch_ms));
}

int64_t local_instant(const LocalDate& date, int hour, int minute, const std::string& tz) {
    ScopedTimeZone zone(tz);
    return make_local(date.year, date.month, date.day, hour, minute);
}

LocalDate add_days(const LocalDate& date, int days, const std::string& tz) {
    ScopedTimeZone zone(tz);
    // Noon keeps the day stable across DST shifts.
    int64_t noon = make_local(date.year, date.month, date.day + days, 12, 0);
    return date_from_tm(local_tm(noon));
}

int64_t parse_local_date(const std::string& s, const std::string& tz, const std::string& field) {
    int y = 0, m = 0, d = 0;
    char tail = 0;
    if (s.size() != 10 || std::sscanf(s.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3 ||
        m < 1 || m > 12 || d < 1 || d > 31) {
        throw ValidationError(field, "expected YYYY-MM-DD, got '" + s + "'");
    }
    return local_instant(LocalDate{y, m, d, 0}, 0, 0, tz);
}

int64_t end_of_local_day(int64_t epoch_ms, const std::string& tz) {
    LocalDate next = add_days(local_date_of(epoch_ms, tz), 1, tz);
    return local_instant(next, 0, 0, tz) - 1;
}

std::string format_local(int64_t epoch_ms, const std::string& tz) {
    ScopedTimeZone zone(tz);
    std::tm tm = local_tm(epoch_ms);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

} // namespace dosewatch
