#pragma once
#include "database.hpp"
#include "models.hpp"
#include <string>
#include <vector>
#include <optional>

namespace dosewatch {

class ScheduleStore {
public:
    explicit ScheduleStore(Database& db);

    ScheduleStore(const ScheduleStore&) = delete;
    ScheduleStore& operator=(const ScheduleStore&) = delete;

    // Throws NotFoundError when the medication does not exist.
    Schedule create(Schedule schedule);
    std::optional<Schedule> get(const std::string& id);
    Schedule require(const std::string& id);
    std::vector<Schedule> list_by_medication(const std::string& medication_id);
    // medication_id is never changed.
    Schedule update(const Schedule& schedule);
    // Deletes the schedule with its dose-times and their intake logs.
    bool remove(const std::string& id);

    static void validate(const Schedule& schedule);

private:
    Database& db_;
};

} // namespace dosewatch
