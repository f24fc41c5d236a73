#pragma once
#include "database.hpp"
#include "models.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace dosewatch {

constexpr int64_t kDefaultUpcomingHorizonMs = 24LL * 60 * 60 * 1000;

class DoseTimeStore {
public:
    explicit DoseTimeStore(Database& db);

    DoseTimeStore(const DoseTimeStore&) = delete;
    DoseTimeStore& operator=(const DoseTimeStore&) = delete;

    // Throws NotFoundError when the schedule does not exist.
    DoseTime create(DoseTime dose_time);
    std::optional<DoseTime> get(const std::string& id);
    DoseTime require(const std::string& id);
    std::vector<DoseTime> list_by_schedule(const std::string& schedule_id);
    std::vector<DoseTime> list_by_medication(const std::string& medication_id);
    std::vector<DoseTime> list_all();
    // Rows whose cached trigger is at or before now. With reminder_enabled=false
    // only rows of muted schedules are returned.
    std::vector<DoseTime> list_due(int64_t now_ms, bool reminder_enabled = true);
    // At most 10 rows with a cached trigger in [now, now + horizon], soonest first.
    std::vector<DoseTime> list_upcoming(const std::string& medication_id, int64_t now_ms,
                                        int64_t horizon_ms = kDefaultUpcomingHorizonMs);

    // Writes every editable column including next_trigger_ts; schedule_id is kept.
    DoseTime update(const DoseTime& dose_time);
    void set_next_trigger(const std::string& id, std::optional<int64_t> ts);
    // Deletes the dose-time and its intake logs.
    bool remove(const std::string& id);

    static void validate(const DoseTime& dose_time);

private:
    Database& db_;

    std::vector<DoseTime> query(const std::string& where, const std::vector<std::string>& args);
};

} // namespace dosewatch
