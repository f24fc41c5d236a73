#include "schedule_store.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace dosewatch {

static const char* kScheduleColumns =
    "SELECT id, medication_id, schedule, frequency_per_day, is_forever, start_date, end_date, "
    "days_of_week, timezone, reminder_enabled FROM medication_schedules ";

static Schedule read_schedule(const Statement& stmt) {
    Schedule s;
    s.id = stmt.text(0);
    s.medication_id = stmt.text(1);
    s.recurrence_label = stmt.text(2);
    s.frequency_per_day = stmt.opt_int(3);
    s.is_forever = stmt.int64(4) != 0;
    s.start_date = stmt.opt_int64(5);
    s.end_date = stmt.opt_int64(6);
    s.days_of_week = stmt.text(7);
    s.timezone = stmt.text(8);
    s.reminder_enabled = stmt.is_null(9) || stmt.int64(9) != 0;
    return s;
}

ScheduleStore::ScheduleStore(Database& db) : db_(db) {}

void ScheduleStore::validate(const Schedule& s) {
    if (trim(s.recurrence_label).empty()) {
        throw ValidationError("schedule", "recurrence label must not be empty");
    }
    if (s.is_forever && s.end_date) {
        throw ValidationError("end_date", "must be empty when is_forever is set");
    }
    if (s.start_date && s.end_date && *s.end_date < *s.start_date) {
        throw ValidationError("end_date", "must not be before start_date");
    }
    if (s.frequency_per_day && *s.frequency_per_day <= 0) {
        throw ValidationError("frequency_per_day", "must be positive");
    }
    if (trim(s.timezone).empty()) {
        throw ValidationError("timezone", "must not be empty");
    }
    validate_days_of_week(s.days_of_week);
}

static void require_medication(Database& db, const std::string& medication_id) {
    Statement stmt(db, "SELECT 1 FROM medications WHERE id = ?");
    stmt.bind(1, medication_id);
    if (!stmt.step()) throw NotFoundError("medication", medication_id);
}

Schedule ScheduleStore::create(Schedule s) {
    validate(s);
    require_medication(db_, s.medication_id);
    if (s.id.empty()) s.id = generate_id();

    Statement stmt(db_, R"SQL(
        INSERT INTO medication_schedules (id, medication_id, schedule, frequency_per_day, is_forever,
            start_date, end_date, days_of_week, timezone, reminder_enabled)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL");
    stmt.bind(1, s.id)
        .bind(2, s.medication_id)
        .bind(3, s.recurrence_label)
        .bind(4, s.frequency_per_day)
        .bind(5, s.is_forever)
        .bind(6, s.start_date)
        .bind(7, s.end_date)
        .bind(8, s.days_of_week)
        .bind(9, s.timezone)
        .bind(10, s.reminder_enabled);
    stmt.run();
    return s;
}

std::optional<Schedule> ScheduleStore::get(const std::string& id) {
    std::string sql = std::string(kScheduleColumns) + "WHERE id = ?";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, id);
    if (!stmt.step()) return std::nullopt;
    return read_schedule(stmt);
}

Schedule ScheduleStore::require(const std::string& id) {
    auto s = get(id);
    if (!s) throw NotFoundError("schedule", id);
    return *s;
}

std::vector<Schedule> ScheduleStore::list_by_medication(const std::string& medication_id) {
    std::string sql = std::string(kScheduleColumns) +
        "WHERE medication_id = ? ORDER BY start_date ASC, id ASC";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, medication_id);
    std::vector<Schedule> out;
    while (stmt.step()) out.push_back(read_schedule(stmt));
    return out;
}

Schedule ScheduleStore::update(const Schedule& s) {
    Schedule current = require(s.id);
    Schedule next = s;
    next.medication_id = current.medication_id;
    validate(next);

    Statement stmt(db_, R"SQL(
        UPDATE medication_schedules SET schedule = ?, frequency_per_day = ?, is_forever = ?,
            start_date = ?, end_date = ?, days_of_week = ?, timezone = ?, reminder_enabled = ?
        WHERE id = ?
    )SQL");
    stmt.bind(1, next.recurrence_label)
        .bind(2, next.frequency_per_day)
        .bind(3, next.is_forever)
        .bind(4, next.start_date)
        .bind(5, next.end_date)
        .bind(6, next.days_of_week)
        .bind(7, next.timezone)
        .bind(8, next.reminder_enabled)
        .bind(9, next.id);
    stmt.run();
    return next;
}

bool ScheduleStore::remove(const std::string& id) {
    Transaction tx(db_);

    Statement logs(db_, R"SQL(
        DELETE FROM medication_intake_logs WHERE schedule_time_id IN (
            SELECT id FROM medication_schedule_times WHERE schedule_id = ?)
    )SQL");
    logs.bind(1, id).run();

    Statement times(db_, "DELETE FROM medication_schedule_times WHERE schedule_id = ?");
    times.bind(1, id).run();

    Statement schedule(db_, "DELETE FROM medication_schedules WHERE id = ?");
    schedule.bind(1, id).run();
    bool removed = schedule.changes() > 0;

    tx.commit();
    return removed;
}

} // namespace dosewatch
