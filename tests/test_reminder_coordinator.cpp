#include "test_support.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace dosewatch;
using namespace dosewatch::test;

class ReminderCoordinatorTest : public StoreTest {
protected:
    void SetUp() override {
        med = make_medication();
        schedule = coordinator.add_schedule(make_schedule(med.id));
    }

    Medication med;
    Schedule schedule;
};

TEST_F(ReminderCoordinatorTest, AddDoseTimePersistsAndArms) {
    RecomputeResult r = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00"));

    EXPECT_EQ(r.outcome, TriggerOutcome::scheduled);
    EXPECT_TRUE(r.armed);
    EXPECT_FALSE(r.degenerate());
    ASSERT_TRUE(r.dose_time.next_trigger_ts.has_value());
    EXPECT_EQ(*r.dose_time.next_trigger_ts, utc_ms(2024, 1, 2, 8, 0));
    EXPECT_EQ(dose_times.require(r.dose_time.id).next_trigger_ts, utc_ms(2024, 1, 2, 8, 0));

    ASSERT_EQ(dispatcher.calls.size(), 1u);
    const auto& call = dispatcher.calls[0];
    EXPECT_EQ(call.action, "arm");
    EXPECT_EQ(call.reminder_id, r.dose_time.id);
    EXPECT_EQ(call.fires_at, utc_ms(2024, 1, 2, 8, 0));
    EXPECT_EQ(call.payload.medication_id, med.id);
    EXPECT_EQ(call.payload.schedule_id, schedule.id);
    EXPECT_EQ(call.payload.dose_time_id, r.dose_time.id);
}

TEST_F(ReminderCoordinatorTest, PrnDoseIsCancelledNotArmed) {
    DoseTime t = make_dose_time(schedule.id, "08:00");
    t.prn = true;
    RecomputeResult r = coordinator.add_dose_time(t);

    EXPECT_EQ(r.outcome, TriggerOutcome::prn);
    EXPECT_FALSE(r.armed);
    EXPECT_FALSE(dose_times.require(r.dose_time.id).next_trigger_ts.has_value());
    EXPECT_EQ(dispatcher.count("arm"), 0u);
    EXPECT_EQ(dispatcher.count("cancel"), 1u);
}

TEST_F(ReminderCoordinatorTest, AddDoseTimeToMissingScheduleWritesNothing) {
    EXPECT_THROW(coordinator.add_dose_time(make_dose_time("missing", "08:00")), NotFoundError);
    EXPECT_THROW(coordinator.add_dose_time(make_dose_time(schedule.id, "noon")), ValidationError);
    EXPECT_EQ(db.count("medication_schedule_times"), 0);
    EXPECT_TRUE(dispatcher.calls.empty());
}

TEST_F(ReminderCoordinatorTest, DispatchFailureDoesNotUndoWrite) {
    dispatcher.fail = true;
    RecomputeResult r = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00"));

    EXPECT_FALSE(r.armed);
    auto stored = dose_times.get(r.dose_time.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->next_trigger_ts, utc_ms(2024, 1, 2, 8, 0));

    // Removal still goes through with a broken dispatcher.
    EXPECT_TRUE(coordinator.remove_dose_time(r.dose_time.id));
    EXPECT_FALSE(dose_times.get(r.dose_time.id).has_value());
}

TEST_F(ReminderCoordinatorTest, ExpiredWindowHasNoTrigger) {
    Schedule ended = make_schedule(med.id);
    ended.is_forever = false;
    ended.start_date = utc_ms(2023, 12, 1);
    ended.end_date = utc_ms(2023, 12, 31);
    ended = coordinator.add_schedule(ended);

    RecomputeResult r = coordinator.add_dose_time(make_dose_time(ended.id, "08:00"));
    EXPECT_EQ(r.outcome, TriggerOutcome::expired);
    EXPECT_FALSE(r.dose_time.next_trigger_ts.has_value());
    EXPECT_FALSE(r.armed);
    EXPECT_EQ(dispatcher.calls.back().action, "cancel");
}

TEST_F(ReminderCoordinatorTest, UpdateDoseTimeRecomputes) {
    DoseTime t = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00")).dose_time;
    dispatcher.calls.clear();

    t.time_local = "10:30";
    t.dosage = "2 tablets";
    RecomputeResult r = coordinator.update_dose_time(t);

    EXPECT_EQ(r.dose_time.next_trigger_ts, utc_ms(2024, 1, 1, 10, 30));
    DoseTime stored = dose_times.require(t.id);
    EXPECT_EQ(stored.time_local, "10:30");
    EXPECT_EQ(stored.dosage, "2 tablets");
    EXPECT_EQ(stored.next_trigger_ts, utc_ms(2024, 1, 1, 10, 30));
    ASSERT_EQ(dispatcher.calls.size(), 1u);
    EXPECT_EQ(dispatcher.calls[0].fires_at, utc_ms(2024, 1, 1, 10, 30));
}

TEST_F(ReminderCoordinatorTest, UpdateScheduleRecomputesEveryDoseTime) {
    DoseTime a = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00")).dose_time;
    DoseTime b = coordinator.add_dose_time(make_dose_time(schedule.id, "20:00")).dose_time;
    dispatcher.calls.clear();

    Schedule edit = schedule;
    edit.days_of_week = "SAT,SUN";
    ScheduleWrite w = coordinator.update_schedule(edit);

    ASSERT_EQ(w.results.size(), 2u);
    EXPECT_EQ(dose_times.require(a.id).next_trigger_ts, utc_ms(2024, 1, 6, 8, 0));
    EXPECT_EQ(dose_times.require(b.id).next_trigger_ts, utc_ms(2024, 1, 6, 20, 0));
    EXPECT_EQ(dispatcher.count("arm"), 2u);
}

TEST_F(ReminderCoordinatorTest, InvalidScheduleUpdateLeavesTriggersAlone) {
    DoseTime a = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00")).dose_time;
    dispatcher.calls.clear();

    Schedule edit = schedule;
    edit.days_of_week = "SAT,SUN";
    edit.end_date = utc_ms(2024, 6, 1);  // still is_forever
    EXPECT_THROW(coordinator.update_schedule(edit), ValidationError);

    EXPECT_EQ(schedules.require(schedule.id).days_of_week, "");
    EXPECT_EQ(dose_times.require(a.id).next_trigger_ts, utc_ms(2024, 1, 2, 8, 0));
    EXPECT_TRUE(dispatcher.calls.empty());
}

TEST_F(ReminderCoordinatorTest, DisablingRemindersCancelsAndEnablingRearms) {
    DoseTime a = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00")).dose_time;
    DoseTime b = coordinator.add_dose_time(make_dose_time(schedule.id, "20:00")).dose_time;
    dispatcher.calls.clear();

    ScheduleWrite off = coordinator.set_reminder_enabled(schedule.id, false);
    EXPECT_FALSE(off.schedule.reminder_enabled);
    EXPECT_FALSE(schedules.require(schedule.id).reminder_enabled);
    EXPECT_EQ(dispatcher.count("cancel"), 2u);
    EXPECT_EQ(dispatcher.count("arm"), 0u);
    for (auto& r : off.results) EXPECT_FALSE(r.armed);
    // The cached trigger stays current while muted.
    EXPECT_EQ(dose_times.require(a.id).next_trigger_ts, utc_ms(2024, 1, 2, 8, 0));

    dispatcher.calls.clear();
    coordinator.set_reminder_enabled(schedule.id, true);
    EXPECT_EQ(dispatcher.count("arm"), 2u);
    EXPECT_EQ(dose_times.require(b.id).next_trigger_ts, utc_ms(2024, 1, 1, 20, 0));
}

TEST_F(ReminderCoordinatorTest, RemoveMedicationCancelsThenCascades) {
    DoseTime a = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00")).dose_time;
    DoseTime b = coordinator.add_dose_time(make_dose_time(schedule.id, "20:00")).dose_time;
    intake.log_intake(a.id, IntakeStatus::taken, clock.now);
    dispatcher.calls.clear();

    EXPECT_TRUE(coordinator.remove_medication(med.id));

    ASSERT_EQ(dispatcher.calls.size(), 2u);
    EXPECT_EQ(dispatcher.count("cancel"), 2u);
    std::set<std::string> cancelled{dispatcher.calls[0].reminder_id, dispatcher.calls[1].reminder_id};
    EXPECT_EQ(cancelled, (std::set<std::string>{a.id, b.id}));

    EXPECT_EQ(db.count("medications"), 0);
    EXPECT_EQ(db.count("medication_schedules"), 0);
    EXPECT_EQ(db.count("medication_schedule_times"), 0);
    EXPECT_EQ(db.count("medication_intake_logs"), 0);
}

TEST_F(ReminderCoordinatorTest, RemoveScheduleAndDoseTime) {
    DoseTime a = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00")).dose_time;
    dispatcher.calls.clear();

    EXPECT_FALSE(coordinator.remove_dose_time("missing"));
    EXPECT_TRUE(dispatcher.calls.empty());

    EXPECT_TRUE(coordinator.remove_schedule(schedule.id));
    ASSERT_EQ(dispatcher.calls.size(), 1u);
    EXPECT_EQ(dispatcher.calls[0].action, "cancel");
    EXPECT_EQ(dispatcher.calls[0].reminder_id, a.id);
    EXPECT_TRUE(medications.get(med.id).has_value());
    EXPECT_FALSE(coordinator.remove_schedule(schedule.id));
}

TEST_F(ReminderCoordinatorTest, DefaultTimezoneFillsBlankZone) {
    coordinator.set_default_timezone("<+02>-2");
    Schedule s = make_schedule(med.id);
    s.timezone = "";
    s = coordinator.add_schedule(s);
    EXPECT_EQ(schedules.require(s.id).timezone, "<+02>-2");

    // 08:00 at +02:00 is 06:00 UTC; now is 09:00 UTC (11:00 local).
    RecomputeResult r = coordinator.add_dose_time(make_dose_time(s.id, "08:00"));
    EXPECT_EQ(r.dose_time.next_trigger_ts, utc_ms(2024, 1, 2, 6, 0));
}

TEST_F(ReminderCoordinatorTest, RearmAllAfterClockMoves) {
    DoseTime a = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00")).dose_time;
    dispatcher.calls.clear();

    clock.now = utc_ms(2024, 1, 3, 9, 0);
    auto results = coordinator.rearm_all();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(dose_times.require(a.id).next_trigger_ts, utc_ms(2024, 1, 4, 8, 0));
    EXPECT_EQ(dispatcher.count("arm"), 1u);
}

TEST_F(ReminderCoordinatorTest, LegacyRowsAreDegenerateOrSkipped) {
    DoseTime a = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00")).dose_time;
    DoseTime b = coordinator.add_dose_time(make_dose_time(schedule.id, "20:00")).dose_time;

    // Rows written by an older build bypass validation.
    db.exec("UPDATE medication_schedules SET days_of_week = '0-6' WHERE id = '" + schedule.id + "'");
    db.exec("UPDATE medication_schedule_times SET time_local = 'noon' WHERE id = '" + b.id + "'");
    dispatcher.calls.clear();

    auto results = coordinator.rearm_all();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].dose_time.id, a.id);
    EXPECT_TRUE(results[0].degenerate());
    EXPECT_FALSE(results[0].armed);
    EXPECT_FALSE(dose_times.require(a.id).next_trigger_ts.has_value());
    EXPECT_FALSE(dose_times.require(b.id).next_trigger_ts.has_value());
    EXPECT_EQ(dispatcher.count("cancel"), 2u);
    EXPECT_EQ(dispatcher.count("arm"), 0u);
}

TEST_F(ReminderCoordinatorTest, ImportPlanCreatesEverything) {
    MedicationPlan plan;
    plan.medication.owner_id = "user-1";
    plan.medication.profile_id = "profile-1";
    plan.medication.name = "Amoxicillin";
    plan.schedule.recurrence_label = "twice daily";
    plan.schedule.frequency_per_day = 2;
    plan.schedule.is_forever = true;
    plan.times.push_back(make_dose_time("", "08:00"));
    plan.times.push_back(make_dose_time("", "20:00"));
    plan.times.back().prn = true;
    dispatcher.calls.clear();

    PlanImport out = coordinator.import_plan(plan);

    EXPECT_EQ(out.schedule.medication_id, out.medication.id);
    EXPECT_EQ(out.schedule.timezone, "UTC");
    ASSERT_EQ(out.results.size(), 2u);
    EXPECT_EQ(out.results[0].dose_time.next_trigger_ts, utc_ms(2024, 1, 2, 8, 0));
    EXPECT_EQ(out.results[1].outcome, TriggerOutcome::prn);
    EXPECT_EQ(dispatcher.count("arm"), 1u);
    EXPECT_EQ(dispatcher.count("cancel"), 1u);

    MedicationAggregate agg = coordinator.aggregate(out.medication.id);
    ASSERT_EQ(agg.schedules.size(), 1u);
    EXPECT_EQ(agg.schedules[0].times.size(), 2u);

    nlohmann::json j = agg;
    EXPECT_EQ(j["name"], "Amoxicillin");
    EXPECT_EQ(j["schedules"][0]["schedule"], "twice daily");
    EXPECT_EQ(j["schedules"][0]["times"].size(), 2u);
}

TEST_F(ReminderCoordinatorTest, ImportPlanIsAllOrNothing) {
    int64_t meds_before = db.count("medications");

    MedicationPlan plan;
    plan.medication.owner_id = "user-1";
    plan.medication.profile_id = "profile-1";
    plan.medication.name = "Broken";
    plan.schedule.recurrence_label = "daily";
    plan.schedule.is_forever = true;
    plan.times.push_back(make_dose_time("", "08:00"));
    plan.times.push_back(make_dose_time("", "8pm"));
    dispatcher.calls.clear();

    EXPECT_THROW(coordinator.import_plan(plan), ValidationError);
    EXPECT_EQ(db.count("medications"), meds_before);
    EXPECT_EQ(db.count("medication_schedules"), 1);
    EXPECT_EQ(db.count("medication_schedule_times"), 0);
    EXPECT_TRUE(dispatcher.calls.empty());
}

TEST_F(ReminderCoordinatorTest, AggregateOfMissingMedicationThrows) {
    EXPECT_THROW(coordinator.aggregate("missing"), NotFoundError);
}
