#pragma once
#include "database.hpp"
#include "models.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace dosewatch {

// Append-only adherence history. Logging an intake never touches the
// dose-time's cached trigger; the schedule keeps its own cadence.
class IntakeLedger {
public:
    explicit IntakeLedger(Database& db);

    IntakeLedger(const IntakeLedger&) = delete;
    IntakeLedger& operator=(const IntakeLedger&) = delete;

    // Throws NotFoundError when dose_time_id does not exist.
    IntakeLog log_intake(const std::string& dose_time_id, IntakeStatus status, int64_t taken_ts,
                         const IntakeDetails& details = {});

    // All logs under a medication, newest first; bounds are inclusive.
    std::vector<IntakeLog> list_intake_logs(const std::string& medication_id,
                                            std::optional<int64_t> from_ts = std::nullopt,
                                            std::optional<int64_t> to_ts = std::nullopt);

    std::vector<IntakeLog> list_by_dose_time(const std::string& dose_time_id);

private:
    Database& db_;
};

} // namespace dosewatch
