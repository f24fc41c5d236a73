#include "models.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <array>
#include <cctype>
#include <sstream>

namespace dosewatch {

static const std::array<const char*, 7> kWeekdayCodes = {
    "SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"
};

std::string to_string(IntakeStatus s) {
    switch (s) {
        case IntakeStatus::taken:   return "taken";
        case IntakeStatus::missed:  return "missed";
        case IntakeStatus::skipped: return "skipped";
        case IntakeStatus::snoozed: return "snoozed";
    }
    return "taken";
}

IntakeStatus parse_intake_status(const std::string& s) {
    if (s == "taken")   return IntakeStatus::taken;
    if (s == "missed")  return IntakeStatus::missed;
    if (s == "skipped") return IntakeStatus::skipped;
    if (s == "snoozed") return IntakeStatus::snoozed;
    throw ValidationError("status", "unknown intake status '" + s + "'");
}

TimeOfDay parse_time_local(const std::string& s) {
    auto fail = [&]() -> ValidationError {
        return ValidationError("time_local", "expected HH:MM, got '" + s + "'");
    };

    size_t colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2) throw fail();
    std::string h = s.substr(0, colon);
    std::string m = s.substr(colon + 1);
    if (m.size() != 2) throw fail();
    for (char c : h + m) {
        if (!std::isdigit(static_cast<unsigned char>(c))) throw fail();
    }

    TimeOfDay t{std::stoi(h), std::stoi(m)};
    if (t.hour > 23 || t.minute > 59) throw fail();
    return t;
}

uint8_t weekday_bit(int tm_wday) {
    return static_cast<uint8_t>(1u << (tm_wday % 7));
}

static int weekday_index(const std::string& code) {
    for (size_t i = 0; i < kWeekdayCodes.size(); i++) {
        if (code == kWeekdayCodes[i]) return static_cast<int>(i);
    }
    return -1;
}

static std::vector<std::string> split_csv(const std::string& csv) {
    std::vector<std::string> out;
    std::istringstream iss(csv);
    std::string tok;
    while (std::getline(iss, tok, ',')) {
        tok = to_upper(trim(tok));
        if (!tok.empty()) out.push_back(tok);
    }
    return out;
}

uint8_t parse_weekday_mask(const std::string& csv) {
    uint8_t mask = 0;
    for (auto& tok : split_csv(csv)) {
        int idx = weekday_index(tok);
        if (idx >= 0) mask |= weekday_bit(idx);
    }
    return mask;
}

void validate_days_of_week(const std::string& csv) {
    for (auto& tok : split_csv(csv)) {
        if (weekday_index(tok) < 0) {
            throw ValidationError("days_of_week", "unknown weekday code '" + tok + "'");
        }
    }
}

std::string normalize_days_of_week(const nlohmann::json& j) {
    std::vector<std::string> codes;
    if (j.is_string()) {
        codes = split_csv(j.get<std::string>());
    } else if (j.is_array()) {
        for (auto& item : j) {
            if (item.is_string()) {
                auto tok = to_upper(trim(item.get<std::string>()));
                if (!tok.empty()) codes.push_back(tok);
            }
        }
    }
    std::string out;
    for (auto& c : codes) {
        if (!out.empty()) out += ",";
        out += c;
    }
    return out;
}

// ── JSON ────────────────────────────────────────────────────────────

template <typename T>
static void put_opt(nlohmann::json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
    else j[key] = nullptr;
}

template <typename T>
static std::optional<T> get_opt(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

void to_json(nlohmann::json& j, const Medication& m) {
    j = nlohmann::json{
        {"id", m.id},
        {"user_id", m.owner_id},
        {"profile_id", m.profile_id},
        {"name", m.name},
        {"created_at", m.created_at},
        {"updated_at", m.updated_at},
    };
    put_opt(j, "notes", m.notes);
    put_opt(j, "medication_url", m.url);
}

void to_json(nlohmann::json& j, const Schedule& s) {
    j = nlohmann::json{
        {"id", s.id},
        {"medication_id", s.medication_id},
        {"schedule", s.recurrence_label},
        {"is_forever", s.is_forever},
        {"days_of_week", s.days_of_week},
        {"timezone", s.timezone},
        {"reminder_enabled", s.reminder_enabled},
    };
    put_opt(j, "frequency_per_day", s.frequency_per_day);
    put_opt(j, "start_date", s.start_date);
    put_opt(j, "end_date", s.end_date);
}

void to_json(nlohmann::json& j, const DoseTime& t) {
    j = nlohmann::json{
        {"id", t.id},
        {"schedule_id", t.schedule_id},
        {"time_local", t.time_local},
        {"prn", t.prn},
        {"sort_order", t.sort_order},
    };
    put_opt(j, "dosage", t.dosage);
    put_opt(j, "dose_amount", t.dose_amount);
    put_opt(j, "dose_unit", t.dose_unit);
    put_opt(j, "instructions", t.instructions);
    put_opt(j, "next_trigger_ts", t.next_trigger_ts);
}

void to_json(nlohmann::json& j, const IntakeLog& l) {
    j = nlohmann::json{
        {"id", l.id},
        {"schedule_time_id", l.dose_time_id},
        {"taken_ts", l.taken_ts},
        {"status", to_string(l.status)},
    };
    put_opt(j, "actual_dose_amount", l.actual_dose_amount);
    put_opt(j, "actual_dose_unit", l.actual_dose_unit);
    put_opt(j, "notes", l.notes);
}

void from_json(const nlohmann::json& j, Medication& m) {
    m.id = j.value("id", "");
    m.owner_id = j.value("user_id", "");
    m.profile_id = j.value("profile_id", "");
    m.name = j.value("name", "");
    m.notes = get_opt<std::string>(j, "notes");
    m.url = get_opt<std::string>(j, "medication_url");
    if (!m.url) m.url = get_opt<std::string>(j, "url");
}

void from_json(const nlohmann::json& j, Schedule& s) {
    s.id = j.value("id", "");
    s.medication_id = j.value("medication_id", "");
    s.recurrence_label = j.value("schedule", j.value("recurrence_label", ""));
    s.frequency_per_day = get_opt<int>(j, "frequency_per_day");
    s.is_forever = j.value("is_forever", false);
    s.start_date = get_opt<int64_t>(j, "start_date");
    s.end_date = get_opt<int64_t>(j, "end_date");
    s.days_of_week = j.contains("days_of_week") ? normalize_days_of_week(j["days_of_week"]) : "";
    s.timezone = j.value("timezone", "");
    s.reminder_enabled = j.value("reminder_enabled", true);
}

void from_json(const nlohmann::json& j, DoseTime& t) {
    t.id = j.value("id", "");
    t.schedule_id = j.value("schedule_id", "");
    t.time_local = j.value("time_local", "");
    t.dosage = get_opt<std::string>(j, "dosage");
    t.dose_amount = get_opt<double>(j, "dose_amount");
    t.dose_unit = get_opt<std::string>(j, "dose_unit");
    t.instructions = get_opt<std::string>(j, "instructions");
    t.prn = j.value("prn", false);
    t.sort_order = j.value("sort_order", 0);
}

void from_json(const nlohmann::json& j, MedicationPlan& p) {
    if (!j.contains("medication") || !j["medication"].is_object()) {
        throw ValidationError("medication", "plan has no medication object");
    }
    if (!j.contains("schedule") || !j["schedule"].is_object()) {
        throw ValidationError("schedule", "plan has no schedule object");
    }
    p.medication = j["medication"].get<Medication>();
    p.schedule = j["schedule"].get<Schedule>();
    p.times.clear();
    if (j.contains("times") && j["times"].is_array()) {
        int order = 0;
        for (auto& item : j["times"]) {
            DoseTime t = item.get<DoseTime>();
            if (!item.contains("sort_order")) t.sort_order = order;
            order++;
            p.times.push_back(std::move(t));
        }
    }
}

} // namespace dosewatch
