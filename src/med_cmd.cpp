#include "commands.hpp"
#include "app_context.hpp"
#include "local_time.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>

namespace dosewatch {

Flags parse_flags(const std::vector<std::string>& args, size_t start,
                  const std::set<std::string>& switch_names) {
    Flags f;
    for (size_t i = start; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a.rfind("--", 0) == 0 && a.size() > 2) {
            std::string key = a.substr(2);
            if (switch_names.count(key)) {
                f.switches.insert(key);
            } else if (i + 1 < args.size()) {
                f.values[key] = args[++i];
            } else {
                throw ValidationError(key, "missing value for --" + key);
            }
        } else {
            f.positional.push_back(a);
        }
    }
    return f;
}

std::string describe(const RecomputeResult& r, const std::string& tz) {
    const DoseTime& t = r.dose_time;
    std::string line = "id=" + t.id + " at=" + t.time_local;
    if (t.dosage) line += " dosage=\"" + *t.dosage + "\"";
    if (t.next_trigger_ts) {
        line += " next=" + format_local(*t.next_trigger_ts, tz) + " (" + tz + ")";
    } else {
        line += " next=none (" + to_string(r.outcome) + ")";
    }
    line += r.armed ? " reminder=armed" : " reminder=off";
    return line;
}

static void print_results(const std::vector<RecomputeResult>& results, const std::string& tz) {
    for (auto& r : results) {
        std::cout << "  " << describe(r, tz) << "\n";
        if (r.degenerate()) {
            std::cout << "  Warning: days_of_week matches no day; no reminder is active for "
                      << r.dose_time.id << "\n";
        }
    }
}

static std::optional<int> opt_int_flag(const Flags& f, const std::string& key) {
    auto v = f.opt(key);
    if (!v) return std::nullopt;
    try {
        return std::stoi(*v);
    } catch (const std::exception&) {
        throw ValidationError(key, "expected an integer, got '" + *v + "'");
    }
}

static std::optional<double> opt_double_flag(const Flags& f, const std::string& key) {
    auto v = f.opt(key);
    if (!v) return std::nullopt;
    try {
        return std::stod(*v);
    } catch (const std::exception&) {
        throw ValidationError(key, "expected a number, got '" + *v + "'");
    }
}

// ── med ─────────────────────────────────────────────────────────────

int cmd_med(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: dosewatch med <add|list|show|update|remove> [options]\n";
        return 1;
    }

    AppContext app(Config::load(default_config_path()));
    std::string subcmd = args[0];

    if (subcmd == "add") {
        Flags f = parse_flags(args, 1);
        if (!f.has("name")) {
            std::cerr << "Usage: dosewatch med add --name N [--notes T] [--url U]\n";
            return 1;
        }
        Medication m;
        m.owner_id = app.config.user_id;
        m.profile_id = app.config.profile_id;
        m.name = f.get("name");
        m.notes = f.opt("notes");
        m.url = f.opt("url");
        m = app.coordinator.create_medication(m);
        std::cout << "Added medication: id=" << m.id << " name=" << m.name << "\n";
        return 0;
    }
    else if (subcmd == "list") {
        Flags f = parse_flags(args, 1);
        auto meds = f.has("search")
            ? app.medications.find_by_name(app.config.user_id, app.config.profile_id, f.get("search"))
            : app.medications.list_by_profile(app.config.user_id, app.config.profile_id);
        if (meds.empty()) {
            std::cout << "No medications.\n";
            return 0;
        }
        for (auto& m : meds) {
            std::cout << "id=" << m.id << " name=" << m.name;
            if (m.notes) std::cout << " notes=\"" << *m.notes << "\"";
            std::cout << "\n";
        }
        return 0;
    }
    else if (subcmd == "show") {
        if (args.size() < 2) {
            std::cerr << "Usage: dosewatch med show <medication_id>\n";
            return 1;
        }
        nlohmann::json j = app.coordinator.aggregate(args[1]);
        std::cout << j.dump(2) << "\n";
        return 0;
    }
    else if (subcmd == "update") {
        if (args.size() < 2) {
            std::cerr << "Usage: dosewatch med update <medication_id> [--name N] [--notes T] [--url U]\n";
            return 1;
        }
        Flags f = parse_flags(args, 2);
        Medication m = app.medications.require(args[1]);
        if (f.has("name")) m.name = f.get("name");
        if (f.has("notes")) m.notes = f.get("notes");
        if (f.has("url")) m.url = f.get("url");
        m = app.coordinator.update_medication(m);
        std::cout << "Updated medication: id=" << m.id << " name=" << m.name << "\n";
        return 0;
    }
    else if (subcmd == "remove") {
        if (args.size() < 2) {
            std::cerr << "Usage: dosewatch med remove <medication_id>\n";
            return 1;
        }
        if (!app.coordinator.remove_medication(args[1])) {
            std::cerr << "Medication not found: id=" << args[1] << "\n";
            return 1;
        }
        std::cout << "Removed medication: id=" << args[1] << "\n";
        return 0;
    }

    std::cerr << "Unknown med subcommand: " << subcmd << "\n";
    return 1;
}

// ── schedule ────────────────────────────────────────────────────────

static const std::set<std::string> kScheduleSwitches = {"forever", "no-reminder"};

// Applies schedule flags on top of s. Dates are read in the resulting zone.
static void apply_schedule_flags(Schedule& s, const Flags& f) {
    if (f.has("label")) s.recurrence_label = f.get("label");
    if (f.has("per-day")) s.frequency_per_day = opt_int_flag(f, "per-day");
    if (f.has("tz")) s.timezone = f.get("tz");
    if (f.has("days")) s.days_of_week = normalize_days_of_week(f.get("days"));
    if (f.has("start")) s.start_date = parse_local_date(f.get("start"), s.timezone, "start_date");
    if (f.has("end")) {
        s.end_date = end_of_local_day(parse_local_date(f.get("end"), s.timezone, "end_date"), s.timezone);
        s.is_forever = false;
    }
    if (f.has("forever")) {
        s.is_forever = true;
        s.end_date.reset();
    }
    if (f.has("no-reminder")) s.reminder_enabled = false;
}

int cmd_schedule(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: dosewatch schedule <add|update|list|enable|disable|remove> [options]\n";
        return 1;
    }

    AppContext app(Config::load(default_config_path()));
    std::string subcmd = args[0];

    if (subcmd == "add") {
        Flags f = parse_flags(args, 1, kScheduleSwitches);
        if (!f.has("med")) {
            std::cerr << "Usage: dosewatch schedule add --med ID [--label daily] [--per-day N]\n"
                      << "       [--forever | --start YYYY-MM-DD --end YYYY-MM-DD]\n"
                      << "       [--days MON,WED,FRI] [--tz ZONE] [--no-reminder]\n";
            return 1;
        }
        Schedule s;
        s.medication_id = f.get("med");
        s.recurrence_label = "daily";
        s.timezone = app.coordinator.default_timezone();
        apply_schedule_flags(s, f);
        s = app.coordinator.add_schedule(s);
        std::cout << "Added schedule: id=" << s.id << " label=" << s.recurrence_label
                  << " tz=" << s.timezone << "\n";
        return 0;
    }
    else if (subcmd == "update") {
        if (args.size() < 2) {
            std::cerr << "Usage: dosewatch schedule update <schedule_id> [options as for add]\n";
            return 1;
        }
        Flags f = parse_flags(args, 2, kScheduleSwitches);
        Schedule s = app.schedules.require(args[1]);
        apply_schedule_flags(s, f);
        ScheduleWrite w = app.coordinator.update_schedule(s);
        std::cout << "Updated schedule: id=" << w.schedule.id << "\n";
        print_results(w.results, w.schedule.timezone);
        return 0;
    }
    else if (subcmd == "list") {
        Flags f = parse_flags(args, 1);
        if (!f.has("med")) {
            std::cerr << "Usage: dosewatch schedule list --med ID\n";
            return 1;
        }
        auto schedules = app.schedules.list_by_medication(f.get("med"));
        if (schedules.empty()) {
            std::cout << "No schedules.\n";
            return 0;
        }
        for (auto& s : schedules) {
            std::cout << "id=" << s.id << " label=" << s.recurrence_label << " tz=" << s.timezone;
            if (!s.days_of_week.empty()) std::cout << " days=" << s.days_of_week;
            if (s.start_date) std::cout << " start=" << format_local(*s.start_date, s.timezone);
            if (s.end_date) std::cout << " end=" << format_local(*s.end_date, s.timezone);
            if (s.is_forever) std::cout << " forever";
            std::cout << (s.reminder_enabled ? " reminders=on" : " reminders=off") << "\n";
        }
        return 0;
    }
    else if (subcmd == "enable" || subcmd == "disable") {
        if (args.size() < 2) {
            std::cerr << "Usage: dosewatch schedule " << subcmd << " <schedule_id>\n";
            return 1;
        }
        ScheduleWrite w = app.coordinator.set_reminder_enabled(args[1], subcmd == "enable");
        std::cout << "Reminders " << (subcmd == "enable" ? "enabled" : "disabled")
                  << " for schedule: id=" << w.schedule.id << "\n";
        print_results(w.results, w.schedule.timezone);
        return 0;
    }
    else if (subcmd == "remove") {
        if (args.size() < 2) {
            std::cerr << "Usage: dosewatch schedule remove <schedule_id>\n";
            return 1;
        }
        if (!app.coordinator.remove_schedule(args[1])) {
            std::cerr << "Schedule not found: id=" << args[1] << "\n";
            return 1;
        }
        std::cout << "Removed schedule: id=" << args[1] << "\n";
        return 0;
    }

    std::cerr << "Unknown schedule subcommand: " << subcmd << "\n";
    return 1;
}

// ── time ────────────────────────────────────────────────────────────

static const std::set<std::string> kTimeSwitches = {"prn", "no-prn"};

static void apply_time_flags(DoseTime& t, const Flags& f) {
    if (f.has("at")) t.time_local = f.get("at");
    if (f.has("dosage")) t.dosage = f.get("dosage");
    if (f.has("amount")) t.dose_amount = opt_double_flag(f, "amount");
    if (f.has("unit")) t.dose_unit = f.get("unit");
    if (f.has("instructions")) t.instructions = f.get("instructions");
    if (f.has("order")) t.sort_order = opt_int_flag(f, "order").value_or(0);
    if (f.has("prn")) t.prn = true;
    if (f.has("no-prn")) t.prn = false;
}

int cmd_time(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: dosewatch time <add|update|remove> [options]\n";
        return 1;
    }

    AppContext app(Config::load(default_config_path()));
    std::string subcmd = args[0];

    if (subcmd == "add") {
        Flags f = parse_flags(args, 1, kTimeSwitches);
        if (!f.has("schedule") || !f.has("at")) {
            std::cerr << "Usage: dosewatch time add --schedule ID --at HH:MM [--dosage D]\n"
                      << "       [--amount N --unit U] [--instructions T] [--order N] [--prn]\n";
            return 1;
        }
        DoseTime t;
        t.schedule_id = f.get("schedule");
        apply_time_flags(t, f);
        RecomputeResult r = app.coordinator.add_dose_time(t);
        Schedule s = app.schedules.require(r.dose_time.schedule_id);
        std::cout << "Added dose-time:\n";
        print_results({r}, s.timezone);
        return 0;
    }
    else if (subcmd == "update") {
        if (args.size() < 2) {
            std::cerr << "Usage: dosewatch time update <dose_time_id> [options as for add] [--no-prn]\n";
            return 1;
        }
        Flags f = parse_flags(args, 2, kTimeSwitches);
        DoseTime t = app.dose_times.require(args[1]);
        apply_time_flags(t, f);
        RecomputeResult r = app.coordinator.update_dose_time(t);
        Schedule s = app.schedules.require(r.dose_time.schedule_id);
        std::cout << "Updated dose-time:\n";
        print_results({r}, s.timezone);
        return 0;
    }
    else if (subcmd == "remove") {
        if (args.size() < 2) {
            std::cerr << "Usage: dosewatch time remove <dose_time_id>\n";
            return 1;
        }
        if (!app.coordinator.remove_dose_time(args[1])) {
            std::cerr << "Dose-time not found: id=" << args[1] << "\n";
            return 1;
        }
        std::cout << "Removed dose-time: id=" << args[1] << "\n";
        return 0;
    }

    std::cerr << "Unknown time subcommand: " << subcmd << "\n";
    return 1;
}

// ── import ──────────────────────────────────────────────────────────

int cmd_import(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: dosewatch import <plan.json>\n";
        return 1;
    }
    std::string content = read_file(args[0]);
    if (content.empty()) {
        std::cerr << "Cannot read plan file: " << args[0] << "\n";
        return 1;
    }

    AppContext app(Config::load(default_config_path()));
    MedicationPlan plan = nlohmann::json::parse(content).get<MedicationPlan>();
    if (plan.medication.owner_id.empty()) plan.medication.owner_id = app.config.user_id;
    if (plan.medication.profile_id.empty()) plan.medication.profile_id = app.config.profile_id;

    PlanImport imported = app.coordinator.import_plan(std::move(plan));
    std::cout << "Imported medication: id=" << imported.medication.id
              << " name=" << imported.medication.name << "\n"
              << "Schedule: id=" << imported.schedule.id << " label=" << imported.schedule.recurrence_label << "\n";
    print_results(imported.results, imported.schedule.timezone);
    return 0;
}

} // namespace dosewatch
