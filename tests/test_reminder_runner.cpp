#include "reminder_runner.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace dosewatch;
using namespace dosewatch::test;

class ReminderRunnerTest : public StoreTest {
protected:
    void SetUp() override {
        Medication m = make_medication();
        schedule = coordinator.add_schedule(make_schedule(m.id));
        morning = coordinator.add_dose_time(make_dose_time(schedule.id, "08:00")).dose_time;
        evening = coordinator.add_dose_time(make_dose_time(schedule.id, "20:00")).dose_time;
        dispatcher.calls.clear();
    }

    Schedule schedule;
    DoseTime morning;
    DoseTime evening;
};

TEST_F(ReminderRunnerTest, NothingDueBeforeTrigger) {
    std::vector<std::string> fired;
    ReminderRunner runner(dose_times, coordinator,
                          [&](const DoseTime& t) { fired.push_back(t.id); }, 30, clock.fn());
    EXPECT_EQ(runner.tick(), 0u);
    EXPECT_TRUE(fired.empty());
    EXPECT_TRUE(dispatcher.calls.empty());
}

TEST_F(ReminderRunnerTest, DueDoseFiresOnceAndAdvances) {
    std::vector<std::string> fired;
    ReminderRunner runner(dose_times, coordinator,
                          [&](const DoseTime& t) { fired.push_back(t.id); }, 30, clock.fn());

    // Evening slot (2024-01-01 20:00) has passed, morning (01-02 08:00) has not.
    clock.now = utc_ms(2024, 1, 1, 20, 1);
    EXPECT_EQ(runner.tick(), 1u);
    ASSERT_EQ(fired.size(), 1u);
    EXPECT_EQ(fired[0], evening.id);
    EXPECT_EQ(dose_times.require(evening.id).next_trigger_ts, utc_ms(2024, 1, 2, 20, 0));
    EXPECT_EQ(dose_times.require(morning.id).next_trigger_ts, utc_ms(2024, 1, 2, 8, 0));
    ASSERT_EQ(dispatcher.calls.size(), 1u);
    EXPECT_EQ(dispatcher.calls[0].fires_at, utc_ms(2024, 1, 2, 20, 0));

    // Already advanced: a second pass finds nothing.
    EXPECT_EQ(runner.tick(), 0u);
    EXPECT_EQ(fired.size(), 1u);
}

TEST_F(ReminderRunnerTest, FailingHandlerStillAdvances) {
    ReminderRunner runner(dose_times, coordinator,
                          [](const DoseTime&) { throw std::runtime_error("notifier down"); },
                          30, clock.fn());

    clock.now = utc_ms(2024, 1, 2, 9, 0);
    EXPECT_EQ(runner.tick(), 2u);
    EXPECT_EQ(dose_times.require(morning.id).next_trigger_ts, utc_ms(2024, 1, 3, 8, 0));
    EXPECT_EQ(dose_times.require(evening.id).next_trigger_ts, utc_ms(2024, 1, 2, 20, 0));
}

TEST_F(ReminderRunnerTest, MutedScheduleIsAdvancedSilently) {
    coordinator.set_reminder_enabled(schedule.id, false);
    dispatcher.calls.clear();

    std::vector<std::string> fired;
    ReminderRunner runner(dose_times, coordinator,
                          [&](const DoseTime& t) { fired.push_back(t.id); }, 30, clock.fn());

    clock.now = utc_ms(2024, 1, 1, 20, 1);
    EXPECT_EQ(runner.tick(), 0u);
    EXPECT_TRUE(fired.empty());
    EXPECT_EQ(dispatcher.count("arm"), 0u);
    EXPECT_EQ(dose_times.require(evening.id).next_trigger_ts, utc_ms(2024, 1, 2, 20, 0));

    // Re-enabling reports again from the next slot on.
    coordinator.set_reminder_enabled(schedule.id, true);
    clock.now = utc_ms(2024, 1, 2, 8, 1);
    EXPECT_EQ(runner.tick(), 1u);
    ASSERT_EQ(fired.size(), 1u);
    EXPECT_EQ(fired[0], morning.id);
}

TEST_F(ReminderRunnerTest, StartStop) {
    std::atomic<int> fired{0};
    clock.now = utc_ms(2024, 1, 2, 9, 0);
    {
        ReminderRunner runner(dose_times, coordinator,
                              [&](const DoseTime&) { fired++; }, 1, clock.fn());
        runner.start();
        runner.start();
        for (int i = 0; i < 50 && fired.load() < 2; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        runner.stop();
    }
    EXPECT_EQ(fired.load(), 2);
}
