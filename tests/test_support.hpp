#pragma once
#include "database.hpp"
#include "medication_store.hpp"
#include "schedule_store.hpp"
#include "dose_time_store.hpp"
#include "intake_ledger.hpp"
#include "reminder_coordinator.hpp"
#include "reminder_dispatcher.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <mutex>

namespace dosewatch {
namespace test {

constexpr int64_t kMinuteMs = 60LL * 1000;
constexpr int64_t kHourMs = 60 * kMinuteMs;
constexpr int64_t kDayMs = 24 * kHourMs;

// UTC wall clock to epoch ms, independent of the C library's zone handling.
inline int64_t utc_ms(int y, int m, int d, int hh = 0, int mm = 0) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const int64_t days = era * 146097 + doe - 719468;
    return days * kDayMs + hh * kHourMs + mm * kMinuteMs;
}

struct FakeClock {
    int64_t now = 0;
    Clock fn() { return [this]() { return now; }; }
};

class RecordingDispatcher : public ReminderDispatcher {
public:
    struct Call {
        std::string action;       // "arm" or "cancel"
        std::string reminder_id;
        int64_t fires_at = 0;
        ReminderPayload payload;
    };

    std::string name() const override { return "recording"; }

    void arm(const std::string& reminder_id, int64_t fires_at_ms,
             const ReminderPayload& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) throw DispatchError("platform unavailable");
        calls.push_back({"arm", reminder_id, fires_at_ms, payload});
    }

    void cancel(const std::string& reminder_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) throw DispatchError("platform unavailable");
        calls.push_back({"cancel", reminder_id, 0, {}});
    }

    size_t count(const std::string& action) const {
        size_t n = 0;
        for (auto& c : calls) if (c.action == action) n++;
        return n;
    }

    bool fail = false;
    std::vector<Call> calls;

private:
    std::mutex mutex_;
};

// In-memory database with every store wired to one fake clock.
class StoreTest : public ::testing::Test {
protected:
    StoreTest()
        : db(":memory:")
        , medications(db, clock.fn())
        , schedules(db)
        , dose_times(db)
        , intake(db)
        , coordinator(db, medications, schedules, dose_times, dispatcher, clock.fn())
    {
        clock.now = utc_ms(2024, 1, 1, 9, 0);
    }

    Medication make_medication(const std::string& name = "Metformin") {
        Medication m;
        m.owner_id = "user-1";
        m.profile_id = "profile-1";
        m.name = name;
        return medications.create(m);
    }

    Schedule make_schedule(const std::string& medication_id) {
        Schedule s;
        s.medication_id = medication_id;
        s.recurrence_label = "daily";
        s.is_forever = true;
        s.timezone = "UTC";
        return s;
    }

    DoseTime make_dose_time(const std::string& schedule_id, const std::string& at) {
        DoseTime t;
        t.schedule_id = schedule_id;
        t.time_local = at;
        return t;
    }

    FakeClock clock;
    RecordingDispatcher dispatcher;
    Database db;
    MedicationStore medications;
    ScheduleStore schedules;
    DoseTimeStore dose_times;
    IntakeLedger intake;
    ReminderCoordinator coordinator;
};

} // namespace test
} // namespace dosewatch
