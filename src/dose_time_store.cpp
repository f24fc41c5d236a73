#include "dose_time_store.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace dosewatch {

static const char* kDoseTimeColumns =
    "SELECT t.id, t.schedule_id, t.time_local, t.dosage, t.dose_amount, t.dose_unit, "
    "t.instructions, t.prn, t.sort_order, t.next_trigger_ts FROM medication_schedule_times t ";

static DoseTime read_dose_time(const Statement& stmt) {
    DoseTime t;
    t.id = stmt.text(0);
    t.schedule_id = stmt.text(1);
    t.time_local = stmt.text(2);
    t.dosage = stmt.opt_text(3);
    t.dose_amount = stmt.opt_double(4);
    t.dose_unit = stmt.opt_text(5);
    t.instructions = stmt.opt_text(6);
    t.prn = stmt.int64(7) != 0;
    t.sort_order = stmt.opt_int(8).value_or(0);
    t.next_trigger_ts = stmt.opt_int64(9);
    return t;
}

DoseTimeStore::DoseTimeStore(Database& db) : db_(db) {}

void DoseTimeStore::validate(const DoseTime& t) {
    parse_time_local(t.time_local);
    if (t.dose_amount && *t.dose_amount < 0) {
        throw ValidationError("dose_amount", "must not be negative");
    }
}

DoseTime DoseTimeStore::create(DoseTime t) {
    validate(t);
    {
        Statement check(db_, "SELECT 1 FROM medication_schedules WHERE id = ?");
        check.bind(1, t.schedule_id);
        if (!check.step()) throw NotFoundError("schedule", t.schedule_id);
    }
    if (t.id.empty()) t.id = generate_id();

    Statement stmt(db_, R"SQL(
        INSERT INTO medication_schedule_times (id, schedule_id, time_local, dosage, dose_amount,
            dose_unit, instructions, prn, sort_order, next_trigger_ts)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL");
    stmt.bind(1, t.id)
        .bind(2, t.schedule_id)
        .bind(3, t.time_local)
        .bind(4, t.dosage)
        .bind(5, t.dose_amount)
        .bind(6, t.dose_unit)
        .bind(7, t.instructions)
        .bind(8, t.prn)
        .bind(9, t.sort_order)
        .bind(10, t.next_trigger_ts);
    stmt.run();
    return t;
}

std::vector<DoseTime> DoseTimeStore::query(const std::string& where,
                                           const std::vector<std::string>& args) {
    std::string sql = std::string(kDoseTimeColumns) + where;
    Statement stmt(db_, sql.c_str());
    for (size_t i = 0; i < args.size(); i++) {
        stmt.bind(static_cast<int>(i + 1), args[i]);
    }
    std::vector<DoseTime> out;
    while (stmt.step()) out.push_back(read_dose_time(stmt));
    return out;
}

std::optional<DoseTime> DoseTimeStore::get(const std::string& id) {
    auto rows = query("WHERE t.id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

DoseTime DoseTimeStore::require(const std::string& id) {
    auto t = get(id);
    if (!t) throw NotFoundError("dose_time", id);
    return *t;
}

std::vector<DoseTime> DoseTimeStore::list_by_schedule(const std::string& schedule_id) {
    return query("WHERE t.schedule_id = ? ORDER BY t.sort_order ASC, t.time_local ASC", {schedule_id});
}

std::vector<DoseTime> DoseTimeStore::list_by_medication(const std::string& medication_id) {
    return query("JOIN medication_schedules s ON t.schedule_id = s.id "
                 "WHERE s.medication_id = ? ORDER BY t.sort_order ASC, t.time_local ASC",
                 {medication_id});
}

std::vector<DoseTime> DoseTimeStore::list_all() {
    return query("ORDER BY t.schedule_id ASC, t.sort_order ASC, t.time_local ASC", {});
}

std::vector<DoseTime> DoseTimeStore::list_due(int64_t now_ms, bool reminder_enabled) {
    std::string sql = std::string(kDoseTimeColumns) + R"SQL(
        JOIN medication_schedules s ON t.schedule_id = s.id
        WHERE t.next_trigger_ts IS NOT NULL AND t.next_trigger_ts <= ?
          AND (COALESCE(s.reminder_enabled, 1) != 0) = ?
        ORDER BY t.next_trigger_ts ASC
    )SQL";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, now_ms).bind(2, reminder_enabled);
    std::vector<DoseTime> out;
    while (stmt.step()) out.push_back(read_dose_time(stmt));
    return out;
}

std::vector<DoseTime> DoseTimeStore::list_upcoming(const std::string& medication_id,
                                                   int64_t now_ms, int64_t horizon_ms) {
    std::string sql = std::string(kDoseTimeColumns) + R"SQL(
        JOIN medication_schedules s ON t.schedule_id = s.id
        WHERE s.medication_id = ?
          AND t.next_trigger_ts IS NOT NULL
          AND t.next_trigger_ts BETWEEN ? AND ?
        ORDER BY t.next_trigger_ts ASC
        LIMIT 10
    )SQL";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, medication_id).bind(2, now_ms).bind(3, now_ms + horizon_ms);
    std::vector<DoseTime> out;
    while (stmt.step()) out.push_back(read_dose_time(stmt));
    return out;
}

DoseTime DoseTimeStore::update(const DoseTime& t) {
    DoseTime current = require(t.id);
    DoseTime next = t;
    next.schedule_id = current.schedule_id;
    validate(next);

    Statement stmt(db_, R"SQL(
        UPDATE medication_schedule_times SET time_local = ?, dosage = ?, dose_amount = ?,
            dose_unit = ?, instructions = ?, prn = ?, sort_order = ?, next_trigger_ts = ?
        WHERE id = ?
    )SQL");
    stmt.bind(1, next.time_local)
        .bind(2, next.dosage)
        .bind(3, next.dose_amount)
        .bind(4, next.dose_unit)
        .bind(5, next.instructions)
        .bind(6, next.prn)
        .bind(7, next.sort_order)
        .bind(8, next.next_trigger_ts)
        .bind(9, next.id);
    stmt.run();
    return next;
}

void DoseTimeStore::set_next_trigger(const std::string& id, std::optional<int64_t> ts) {
    Statement stmt(db_, "UPDATE medication_schedule_times SET next_trigger_ts = ? WHERE id = ?");
    stmt.bind(1, ts).bind(2, id);
    stmt.run();
    if (stmt.changes() == 0) throw NotFoundError("dose_time", id);
}

bool DoseTimeStore::remove(const std::string& id) {
    Transaction tx(db_);

    Statement logs(db_, "DELETE FROM medication_intake_logs WHERE schedule_time_id = ?");
    logs.bind(1, id).run();

    Statement time(db_, "DELETE FROM medication_schedule_times WHERE id = ?");
    time.bind(1, id).run();
    bool removed = time.changes() > 0;

    tx.commit();
    return removed;
}

} // namespace dosewatch
