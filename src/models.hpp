#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace dosewatch {

struct Medication {
    std::string id;
    std::string owner_id;
    std::string profile_id;
    std::string name;
    std::optional<std::string> notes;
    std::optional<std::string> url;
    int64_t created_at = 0;   // epoch ms, set by the store
    int64_t updated_at = 0;
};

struct Schedule {
    std::string id;
    std::string medication_id;
    std::string recurrence_label;            // free text: "daily", "every 8 hours"
    std::optional<int> frequency_per_day;
    bool is_forever = false;
    std::optional<int64_t> start_date;       // epoch ms, inclusive
    std::optional<int64_t> end_date;         // epoch ms, inclusive; null when is_forever
    std::string days_of_week;                // "MON,WED,FRI"; empty = every day
    std::string timezone;                    // IANA id, applied to time_local
    bool reminder_enabled = true;
};

struct DoseTime {
    std::string id;
    std::string schedule_id;
    std::string time_local;                  // "HH:MM", 24h
    std::optional<std::string> dosage;
    std::optional<double> dose_amount;
    std::optional<std::string> dose_unit;
    std::optional<std::string> instructions;
    bool prn = false;
    int sort_order = 0;
    std::optional<int64_t> next_trigger_ts;  // cached, recomputed on write
};

enum class IntakeStatus { taken, missed, skipped, snoozed };

struct IntakeLog {
    std::string id;
    std::string dose_time_id;
    int64_t taken_ts = 0;
    IntakeStatus status = IntakeStatus::taken;
    std::optional<double> actual_dose_amount;
    std::optional<std::string> actual_dose_unit;
    std::optional<std::string> notes;
};

// Optional extras supplied with an intake event.
struct IntakeDetails {
    std::optional<double> actual_dose_amount;
    std::optional<std::string> actual_dose_unit;
    std::optional<std::string> notes;
};

struct TimeOfDay {
    int hour = 0;
    int minute = 0;
};

// Structure produced by the natural-language parser: one medication,
// one schedule and its dose-times.
struct MedicationPlan {
    Medication medication;
    Schedule schedule;
    std::vector<DoseTime> times;
};

std::string to_string(IntakeStatus s);
IntakeStatus parse_intake_status(const std::string& s);   // throws ValidationError

// Throws ValidationError("time_local") unless "H:MM"/"HH:MM" within 00:00..23:59.
TimeOfDay parse_time_local(const std::string& s);

// Weekday bitmask, bit index = tm_wday (0 = Sunday).
constexpr uint8_t kEveryDay = 0x7F;
uint8_t weekday_bit(int tm_wday);
// Unknown tokens are ignored; returns 0 if nothing recognised.
uint8_t parse_weekday_mask(const std::string& csv);
// Throws ValidationError("days_of_week") on any unknown token.
void validate_days_of_week(const std::string& csv);
// Accepts a CSV string or an array of codes; returns canonical "MON,WED".
std::string normalize_days_of_week(const nlohmann::json& j);

void to_json(nlohmann::json& j, const Medication& m);
void to_json(nlohmann::json& j, const Schedule& s);
void to_json(nlohmann::json& j, const DoseTime& t);
void to_json(nlohmann::json& j, const IntakeLog& l);

void from_json(const nlohmann::json& j, Medication& m);
void from_json(const nlohmann::json& j, Schedule& s);
void from_json(const nlohmann::json& j, DoseTime& t);
void from_json(const nlohmann::json& j, MedicationPlan& p);

} // namespace dosewatch
