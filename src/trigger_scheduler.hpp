#pragma once
#include "models.hpp"
#include <optional>
#include <cstdint>
#include <string>

namespace dosewatch {

enum class TriggerOutcome {
    scheduled,            // a future instant was found
    prn,                  // as-needed dose, never auto-scheduled
    expired,              // next candidate falls after end_date
    no_matching_weekday,  // days_of_week matches no day within a week
};

std::string to_string(TriggerOutcome o);

struct TriggerResult {
    std::optional<int64_t> next_trigger_ts;
    TriggerOutcome outcome = TriggerOutcome::scheduled;
};

// Stateless and deterministic in (schedule, dose_time, now_ms).
// time_local and now are both read in schedule.timezone.
class TriggerScheduler {
public:
    static constexpr int kMaxDaySearch = 7;

    // Throws ValidationError("time_local") for a malformed time.
    static TriggerResult evaluate(const Schedule& schedule, const DoseTime& dose_time, int64_t now_ms);

    static std::optional<int64_t> compute_next_trigger(const Schedule& schedule,
                                                       const DoseTime& dose_time, int64_t now_ms) {
        return evaluate(schedule, dose_time, now_ms).next_trigger_ts;
    }
};

} // namespace dosewatch
