#include "trigger_scheduler.hpp"
#include "local_time.hpp"

namespace dosewatch {

std::string to_string(TriggerOutcome o) {
    switch (o) {
        case TriggerOutcome::scheduled:           return "scheduled";
        case TriggerOutcome::prn:                 return "prn";
        case TriggerOutcome::expired:             return "expired";
        case TriggerOutcome::no_matching_weekday: return "no_matching_weekday";
    }
    return "scheduled";
}

TriggerResult TriggerScheduler::evaluate(const Schedule& schedule, const DoseTime& dose_time,
                                         int64_t now_ms) {
    if (dose_time.prn) return {std::nullopt, TriggerOutcome::prn};

    TimeOfDay tod = parse_time_local(dose_time.time_local);
    const std::string& tz = schedule.timezone;

    uint8_t mask = kEveryDay;
    if (!schedule.days_of_week.empty()) {
        mask = parse_weekday_mask(schedule.days_of_week);
        if (mask == 0) return {std::nullopt, TriggerOutcome::no_matching_weekday};
    }

    // Search from today, or from the first day of a window that has not opened yet.
    LocalDate anchor = local_date_of(now_ms, tz);
    if (schedule.start_date && *schedule.start_date > now_ms) {
        anchor = local_date_of(*schedule.start_date, tz);
    }

    // Offsets 0..7: when today's slot already passed, the next slot on the
    // same weekday is a full week away.
    for (int offset = 0; offset <= kMaxDaySearch; ++offset) {
        LocalDate day = offset == 0 ? anchor : add_days(anchor, offset, tz);
        int64_t candidate = local_instant(day, tod.hour, tod.minute, tz);

        if (schedule.end_date && candidate > *schedule.end_date) {
            return {std::nullopt, TriggerOutcome::expired};
        }
        if (!(mask & weekday_bit(day.weekday))) continue;
        if (candidate <= now_ms) continue;
        if (schedule.start_date && candidate < *schedule.start_date) continue;

        return {candidate, TriggerOutcome::scheduled};
    }
    return {std::nullopt, TriggerOutcome::no_matching_weekday};
}

} // namespace dosewatch
