#include "commands.hpp"
#include "app_context.hpp"
#include "local_time.hpp"
#include "errors.hpp"
#include <iostream>

namespace dosewatch {

// "YYYY-MM-DD HH:MM" or "YYYY-MM-DD" in tz, or raw epoch ms.
static int64_t parse_when(const std::string& s, const std::string& tz, const std::string& field) {
    if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos) {
        return std::stoll(s);
    }
    if (s.size() == 16 && s[10] == ' ') {
        int64_t day = parse_local_date(s.substr(0, 10), tz, field);
        TimeOfDay t;
        try {
            t = parse_time_local(s.substr(11));
        } catch (const ValidationError&) {
            throw ValidationError(field, "expected YYYY-MM-DD HH:MM, got '" + s + "'");
        }
        return local_instant(local_date_of(day, tz), t.hour, t.minute, tz);
    }
    return parse_local_date(s, tz, field);
}

int cmd_log(const std::vector<std::string>& args) {
    Flags f = parse_flags(args, 0);
    if (!f.has("time") || !f.has("status")) {
        std::cerr << "Usage: dosewatch log --time DOSE_TIME_ID --status taken|missed|skipped|snoozed\n"
                  << "       [--at \"YYYY-MM-DD HH:MM\"] [--amount N --unit U] [--notes T]\n";
        return 1;
    }

    AppContext app(Config::load(default_config_path()));
    IntakeStatus status = parse_intake_status(f.get("status"));

    DoseTime t = app.dose_times.require(f.get("time"));
    Schedule s = app.schedules.require(t.schedule_id);
    int64_t taken_ts = f.has("at") ? parse_when(f.get("at"), s.timezone, "taken_ts") : epoch_now_ms();

    IntakeDetails details;
    if (f.has("amount")) {
        try {
            details.actual_dose_amount = std::stod(f.get("amount"));
        } catch (const std::exception&) {
            throw ValidationError("actual_dose_amount", "expected a number, got '" + f.get("amount") + "'");
        }
    }
    details.actual_dose_unit = f.opt("unit");
    details.notes = f.opt("notes");

    IntakeLog log = app.intake.log_intake(t.id, status, taken_ts, details);
    std::cout << "Logged intake: id=" << log.id << " status=" << to_string(log.status)
              << " at=" << format_local(log.taken_ts, s.timezone) << "\n";
    return 0;
}

int cmd_history(const std::vector<std::string>& args) {
    Flags f = parse_flags(args, 0, {"json"});
    if (!f.has("med")) {
        std::cerr << "Usage: dosewatch history --med ID [--from YYYY-MM-DD] [--to YYYY-MM-DD] [--json]\n";
        return 1;
    }

    AppContext app(Config::load(default_config_path()));
    std::string tz = app.coordinator.default_timezone();
    std::optional<int64_t> from, to;
    if (f.has("from")) from = parse_when(f.get("from"), tz, "from");
    if (f.has("to")) {
        std::string v = f.get("to");
        to = parse_when(v, tz, "to");
        if (v.size() == 10) to = end_of_local_day(*to, tz);
    }

    auto logs = app.intake.list_intake_logs(app.medications.require(f.get("med")).id, from, to);
    if (f.has("json")) {
        std::cout << nlohmann::json(logs).dump(2) << "\n";
        return 0;
    }
    if (logs.empty()) {
        std::cout << "No intake logs.\n";
        return 0;
    }
    for (auto& l : logs) {
        std::cout << format_local(l.taken_ts, tz) << "  " << to_string(l.status)
                  << "  time=" << l.dose_time_id;
        if (l.actual_dose_amount) {
            std::cout << "  dose=" << *l.actual_dose_amount;
            if (l.actual_dose_unit) std::cout << " " << *l.actual_dose_unit;
        }
        if (l.notes) std::cout << "  \"" << *l.notes << "\"";
        std::cout << "\n";
    }
    return 0;
}

int cmd_upcoming(const std::vector<std::string>& args) {
    Flags f = parse_flags(args, 0);
    if (!f.has("med")) {
        std::cerr << "Usage: dosewatch upcoming --med ID [--hours N]\n";
        return 1;
    }

    AppContext app(Config::load(default_config_path()));
    int hours = app.config.runner.upcoming_horizon_h;
    if (f.has("hours")) {
        try {
            hours = std::stoi(f.get("hours"));
        } catch (const std::exception&) {
            throw ValidationError("hours", "expected an integer, got '" + f.get("hours") + "'");
        }
    }

    Medication m = app.medications.require(f.get("med"));
    auto times = app.dose_times.list_upcoming(m.id, epoch_now_ms(), int64_t(hours) * 60 * 60 * 1000);
    if (times.empty()) {
        std::cout << "No doses due in the next " << hours << "h for " << m.name << ".\n";
        return 0;
    }
    std::map<std::string, std::string> zones;
    for (auto& t : times) {
        auto it = zones.find(t.schedule_id);
        if (it == zones.end()) {
            it = zones.emplace(t.schedule_id, app.schedules.require(t.schedule_id).timezone).first;
        }
        std::cout << format_local(*t.next_trigger_ts, it->second) << "  " << m.name
                  << "  time=" << t.id;
        if (t.dosage) std::cout << "  " << *t.dosage;
        if (t.instructions) std::cout << "  (" << *t.instructions << ")";
        std::cout << "\n";
    }
    return 0;
}

} // namespace dosewatch
