#include "reminder_coordinator.hpp"
#include "errors.hpp"
#include <iostream>
#include <map>

namespace dosewatch {

void to_json(nlohmann::json& j, const MedicationAggregate& a) {
    j = a.medication;
    auto schedules = nlohmann::json::array();
    for (auto& sw : a.schedules) {
        nlohmann::json s = sw.schedule;
        s["times"] = sw.times;
        schedules.push_back(std::move(s));
    }
    j["schedules"] = std::move(schedules);
}

ReminderCoordinator::ReminderCoordinator(Database& db, MedicationStore& medications,
                                         ScheduleStore& schedules, DoseTimeStore& dose_times,
                                         ReminderDispatcher& dispatcher, Clock clock)
    : db_(db)
    , medications_(medications)
    , schedules_(schedules)
    , dose_times_(dose_times)
    , dispatcher_(dispatcher)
    , clock_(std::move(clock))
{}

RecomputeResult ReminderCoordinator::recompute_locked(const Schedule& schedule, DoseTime dose_time,
                                                      int64_t now_ms) {
    TriggerResult trigger = TriggerScheduler::evaluate(schedule, dose_time, now_ms);
    dose_times_.set_next_trigger(dose_time.id, trigger.next_trigger_ts);
    dose_time.next_trigger_ts = trigger.next_trigger_ts;

    RecomputeResult result;
    result.dose_time = std::move(dose_time);
    result.outcome = trigger.outcome;
    return result;
}

void ReminderCoordinator::dispatch(const Schedule& schedule, RecomputeResult& result) {
    const DoseTime& t = result.dose_time;
    if (result.degenerate()) {
        std::cerr << "[warn] Schedule " << schedule.id << " matches no weekday ('"
                  << schedule.days_of_week << "'); dose-time " << t.id << " has no reminder\n";
    }

    try {
        if (!schedule.reminder_enabled || !t.next_trigger_ts) {
            dispatcher_.cancel(t.id);
            result.armed = false;
        } else {
            ReminderPayload payload{schedule.medication_id, schedule.id, t.id};
            dispatcher_.arm(t.id, *t.next_trigger_ts, payload);
            result.armed = true;
        }
    } catch (const std::exception& e) {
        result.armed = false;
        std::cerr << "[reminder] Dispatch via " << dispatcher_.name() << " failed for "
                  << t.id << ": " << e.what() << "\n";
    }
}

void ReminderCoordinator::cancel_all(const std::vector<DoseTime>& dose_times) {
    for (auto& t : dose_times) {
        try {
            dispatcher_.cancel(t.id);
        } catch (const std::exception& e) {
            std::cerr << "[reminder] Cancel via " << dispatcher_.name() << " failed for "
                      << t.id << ": " << e.what() << "\n";
        }
    }
}

RecomputeResult ReminderCoordinator::on_schedule_or_dose_time_written(const Schedule& schedule,
                                                                      const DoseTime& dose_time) {
    int64_t now = clock_();
    Transaction tx(db_);
    RecomputeResult result = recompute_locked(schedule, dose_time, now);
    tx.commit();
    dispatch(schedule, result);
    return result;
}

// ── Medications ─────────────────────────────────────────────────────

Medication ReminderCoordinator::create_medication(Medication medication) {
    return medications_.create(std::move(medication));
}

Medication ReminderCoordinator::update_medication(const Medication& medication) {
    return medications_.update(medication);
}

bool ReminderCoordinator::remove_medication(const std::string& medication_id) {
    cancel_all(dose_times_.list_by_medication(medication_id));
    return medications_.remove(medication_id);
}

// ── Schedules ───────────────────────────────────────────────────────

Schedule ReminderCoordinator::add_schedule(Schedule schedule) {
    if (trim(schedule.timezone).empty()) schedule.timezone = default_timezone_;
    return schedules_.create(std::move(schedule));
}

ScheduleWrite ReminderCoordinator::update_schedule(const Schedule& schedule) {
    Schedule next = schedule;
    if (trim(next.timezone).empty()) next.timezone = default_timezone_;

    int64_t now = clock_();
    ScheduleWrite write;
    {
        Transaction tx(db_);
        write.schedule = schedules_.update(next);
        for (auto& t : dose_times_.list_by_schedule(write.schedule.id)) {
            write.results.push_back(recompute_locked(write.schedule, t, now));
        }
        tx.commit();
    }
    for (auto& r : write.results) dispatch(write.schedule, r);
    return write;
}

ScheduleWrite ReminderCoordinator::set_reminder_enabled(const std::string& schedule_id, bool enabled) {
    Schedule schedule = schedules_.require(schedule_id);
    schedule.reminder_enabled = enabled;
    return update_schedule(schedule);
}

bool ReminderCoordinator::remove_schedule(const std::string& schedule_id) {
    cancel_all(dose_times_.list_by_schedule(schedule_id));
    return schedules_.remove(schedule_id);
}

// ── Dose-times ──────────────────────────────────────────────────────

RecomputeResult ReminderCoordinator::add_dose_time(DoseTime dose_time) {
    int64_t now = clock_();
    Schedule schedule;
    RecomputeResult result;
    {
        Transaction tx(db_);
        schedule = schedules_.require(dose_time.schedule_id);
        dose_time.next_trigger_ts.reset();
        DoseTime created = dose_times_.create(std::move(dose_time));
        result = recompute_locked(schedule, created, now);
        tx.commit();
    }
    dispatch(schedule, result);
    return result;
}

RecomputeResult ReminderCoordinator::update_dose_time(const DoseTime& dose_time) {
    int64_t now = clock_();
    Schedule schedule;
    RecomputeResult result;
    {
        Transaction tx(db_);
        DoseTime current = dose_times_.require(dose_time.id);
        schedule = schedules_.require(current.schedule_id);
        DoseTime next = dose_time;
        next.schedule_id = current.schedule_id;
        TriggerResult trigger = TriggerScheduler::evaluate(schedule, next, now);
        next.next_trigger_ts = trigger.next_trigger_ts;
        result.dose_time = dose_times_.update(next);
        result.outcome = trigger.outcome;
        tx.commit();
    }
    dispatch(schedule, result);
    return result;
}

bool ReminderCoordinator::remove_dose_time(const std::string& dose_time_id) {
    auto existing = dose_times_.get(dose_time_id);
    if (!existing) return false;
    cancel_all({*existing});
    return dose_times_.remove(dose_time_id);
}

// ── Bulk ────────────────────────────────────────────────────────────

std::vector<RecomputeResult> ReminderCoordinator::recompute(const std::vector<std::string>& dose_time_ids) {
    int64_t now = clock_();
    std::map<std::string, Schedule> schedules;
    std::vector<RecomputeResult> results;
    std::vector<DoseTime> skipped;
    {
        Transaction tx(db_);
        for (auto& id : dose_time_ids) {
            auto t = dose_times_.get(id);
            if (!t) continue;
            auto it = schedules.find(t->schedule_id);
            if (it == schedules.end()) {
                it = schedules.emplace(t->schedule_id, schedules_.require(t->schedule_id)).first;
            }
            try {
                results.push_back(recompute_locked(it->second, *t, now));
            } catch (const ValidationError& e) {
                // A row written before validation existed; leave it unscheduled.
                std::cerr << "[reminder] Skipping dose-time " << id << ": " << e.what() << "\n";
                dose_times_.set_next_trigger(id, std::nullopt);
                skipped.push_back(*t);
            }
        }
        tx.commit();
    }
    cancel_all(skipped);
    for (auto& r : results) dispatch(schedules.at(r.dose_time.schedule_id), r);
    return results;
}

std::vector<RecomputeResult> ReminderCoordinator::rearm_all() {
    std::vector<std::string> ids;
    for (auto& t : dose_times_.list_all()) ids.push_back(t.id);
    return recompute(ids);
}

PlanImport ReminderCoordinator::import_plan(MedicationPlan plan) {
    int64_t now = clock_();
    PlanImport out;
    {
        Transaction tx(db_);
        out.medication = medications_.create(std::move(plan.medication));

        Schedule schedule = std::move(plan.schedule);
        schedule.id.clear();
        schedule.medication_id = out.medication.id;
        if (trim(schedule.timezone).empty()) schedule.timezone = default_timezone_;
        out.schedule = schedules_.create(std::move(schedule));

        for (auto& t : plan.times) {
            t.id.clear();
            t.schedule_id = out.schedule.id;
            t.next_trigger_ts.reset();
            DoseTime created = dose_times_.create(std::move(t));
            out.results.push_back(recompute_locked(out.schedule, created, now));
        }
        tx.commit();
    }
    for (auto& r : out.results) dispatch(out.schedule, r);
    return out;
}

MedicationAggregate ReminderCoordinator::aggregate(const std::string& medication_id) {
    MedicationAggregate agg;
    agg.medication = medications_.require(medication_id);
    for (auto& s : schedules_.list_by_medication(medication_id)) {
        ScheduleWithTimes sw;
        sw.times = dose_times_.list_by_schedule(s.id);
        sw.schedule = std::move(s);
        agg.schedules.push_back(std::move(sw));
    }
    return agg;
}

} // namespace dosewatch
