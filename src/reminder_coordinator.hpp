#pragma once
#include "database.hpp"
#include "medication_store.hpp"
#include "schedule_store.hpp"
#include "dose_time_store.hpp"
#include "reminder_dispatcher.hpp"
#include "trigger_scheduler.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace dosewatch {

struct RecomputeResult {
    DoseTime dose_time;    // as persisted, next_trigger_ts included
    TriggerOutcome outcome = TriggerOutcome::scheduled;
    bool armed = false;    // an arm call was handed to the dispatcher

    // Valid but inert: the user should be told no reminder is active.
    bool degenerate() const { return outcome == TriggerOutcome::no_matching_weekday; }
};

struct ScheduleWrite {
    Schedule schedule;
    std::vector<RecomputeResult> results;
};

struct PlanImport {
    Medication medication;
    Schedule schedule;
    std::vector<RecomputeResult> results;
};

struct ScheduleWithTimes {
    Schedule schedule;
    std::vector<DoseTime> times;
};

struct MedicationAggregate {
    Medication medication;
    std::vector<ScheduleWithTimes> schedules;
};

void to_json(nlohmann::json& j, const MedicationAggregate& a);

// Single entry point for writes that affect reminders. Every write and the
// recomputed next_trigger_ts commit in one transaction; the dispatcher is
// called after commit and its failures never undo the write.
class ReminderCoordinator {
public:
    ReminderCoordinator(Database& db, MedicationStore& medications, ScheduleStore& schedules,
                        DoseTimeStore& dose_times, ReminderDispatcher& dispatcher,
                        Clock clock = epoch_now_ms);

    // Zone given to schedules created without one.
    void set_default_timezone(const std::string& tz) { default_timezone_ = tz; }
    const std::string& default_timezone() const { return default_timezone_; }

    RecomputeResult on_schedule_or_dose_time_written(const Schedule& schedule, const DoseTime& dose_time);

    Medication create_medication(Medication medication);
    Medication update_medication(const Medication& medication);
    bool remove_medication(const std::string& medication_id);

    Schedule add_schedule(Schedule schedule);
    ScheduleWrite update_schedule(const Schedule& schedule);
    ScheduleWrite set_reminder_enabled(const std::string& schedule_id, bool enabled);
    bool remove_schedule(const std::string& schedule_id);

    RecomputeResult add_dose_time(DoseTime dose_time);
    RecomputeResult update_dose_time(const DoseTime& dose_time);
    bool remove_dose_time(const std::string& dose_time_id);

    // Recomputes and re-dispatches the given dose-times (missing ids are skipped).
    std::vector<RecomputeResult> recompute(const std::vector<std::string>& dose_time_ids);
    std::vector<RecomputeResult> rearm_all();

    PlanImport import_plan(MedicationPlan plan);
    MedicationAggregate aggregate(const std::string& medication_id);

private:
    Database& db_;
    MedicationStore& medications_;
    ScheduleStore& schedules_;
    DoseTimeStore& dose_times_;
    ReminderDispatcher& dispatcher_;
    Clock clock_;
    std::string default_timezone_ = "UTC";

    RecomputeResult recompute_locked(const Schedule& schedule, DoseTime dose_time, int64_t now_ms);
    void dispatch(const Schedule& schedule, RecomputeResult& result);
    void cancel_all(const std::vector<DoseTime>& dose_times);
};

} // namespace dosewatch
