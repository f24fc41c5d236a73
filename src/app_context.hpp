#pragma once
#include "config.hpp"
#include "database.hpp"
#include "medication_store.hpp"
#include "schedule_store.hpp"
#include "dose_time_store.hpp"
#include "intake_ledger.hpp"
#include "reminder_dispatcher.hpp"
#include "reminder_coordinator.hpp"
#include <memory>

namespace dosewatch {

std::unique_ptr<ReminderDispatcher> make_dispatcher(const DispatcherConfig& cfg);

// Everything a command needs, wired from one Config. Member order is
// construction order: the coordinator refers to the members above it.
class AppContext {
public:
    explicit AppContext(Config cfg);

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    Config config;
    Database db;
    MedicationStore medications;
    ScheduleStore schedules;
    DoseTimeStore dose_times;
    IntakeLedger intake;
    std::unique_ptr<ReminderDispatcher> dispatcher;
    ReminderCoordinator coordinator;
};

} // namespace dosewatch
