#include "commands.hpp"
#include "app_context.hpp"
#include "local_time.hpp"
#include <iostream>

namespace dosewatch {

int cmd_init() {
    std::string config_path = default_config_path();

    if (!fs::exists(config_path)) {
        Config cfg = Config::make_default();
        cfg.save(config_path);
        std::cout << "[init] Created config: " << config_path << "\n";
    } else {
        std::cout << "[init] Config already exists: " << config_path << "\n";
    }

    // Opening the database creates the file and its schema.
    AppContext app(Config::load(config_path));
    std::cout << "[init] Database: " << app.config.database_path() << "\n";
    return 0;
}

int cmd_status() {
    std::string cfg_path = default_config_path();
    AppContext app(Config::load(cfg_path));
    const Config& cfg = app.config;

    std::cout << "=== dosewatch status ===\n";
    std::cout << "Config path  : " << cfg_path << (fs::exists(cfg_path) ? "" : " (missing)") << "\n";
    std::cout << "Database     : " << cfg.database_path() << "\n";
    std::cout << "Timezone     : " << cfg.resolve_timezone() << "\n";
    std::cout << "Profile      : " << cfg.user_id << "/" << cfg.profile_id << "\n";
    std::cout << "Dispatcher   : " << app.dispatcher->name();
    if (cfg.dispatcher.type == "webhook") std::cout << " (" << cfg.dispatcher.url << ")";
    std::cout << "\n";
    std::cout << "Poll interval: " << cfg.runner.poll_interval_s << "s\n";

    std::cout << "Medications  : " << app.db.count("medications") << "\n";
    std::cout << "Schedules    : " << app.db.count("medication_schedules") << "\n";
    std::cout << "Dose times   : " << app.db.count("medication_schedule_times") << "\n";
    std::cout << "Intake logs  : " << app.db.count("medication_intake_logs") << "\n";

    // Soonest armed dose across every medication.
    std::optional<DoseTime> next;
    for (auto& t : app.dose_times.list_all()) {
        if (!t.next_trigger_ts) continue;
        if (!next || *t.next_trigger_ts < *next->next_trigger_ts) next = t;
    }
    if (next) {
        auto s = app.schedules.require(next->schedule_id);
        auto m = app.medications.require(s.medication_id);
        std::cout << "Next dose    : " << format_local(*next->next_trigger_ts, s.timezone)
                  << " (" << s.timezone << ") " << m.name << "\n";
    } else {
        std::cout << "Next dose    : (none)\n";
    }
    return 0;
}

} // namespace dosewatch
