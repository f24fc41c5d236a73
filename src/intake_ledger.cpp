#include "intake_ledger.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace dosewatch {

static IntakeLog read_intake_log(const Statement& stmt) {
    IntakeLog l;
    l.id = stmt.text(0);
    l.dose_time_id = stmt.text(1);
    l.taken_ts = stmt.int64(2);
    l.status = parse_intake_status(stmt.text(3));
    l.actual_dose_amount = stmt.opt_double(4);
    l.actual_dose_unit = stmt.opt_text(5);
    l.notes = stmt.opt_text(6);
    return l;
}

IntakeLedger::IntakeLedger(Database& db) : db_(db) {}

IntakeLog IntakeLedger::log_intake(const std::string& dose_time_id, IntakeStatus status,
                                   int64_t taken_ts, const IntakeDetails& details) {
    {
        Statement check(db_, "SELECT 1 FROM medication_schedule_times WHERE id = ?");
        check.bind(1, dose_time_id);
        if (!check.step()) throw NotFoundError("dose_time", dose_time_id);
    }
    if (details.actual_dose_amount && *details.actual_dose_amount < 0) {
        throw ValidationError("actual_dose_amount", "must not be negative");
    }

    IntakeLog log;
    log.id = generate_id();
    log.dose_time_id = dose_time_id;
    log.taken_ts = taken_ts;
    log.status = status;
    log.actual_dose_amount = details.actual_dose_amount;
    log.actual_dose_unit = details.actual_dose_unit;
    log.notes = details.notes;

    Statement stmt(db_, R"SQL(
        INSERT INTO medication_intake_logs (id, schedule_time_id, taken_ts, status,
            actual_dose_amount, actual_dose_unit, notes)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )SQL");
    stmt.bind(1, log.id)
        .bind(2, log.dose_time_id)
        .bind(3, log.taken_ts)
        .bind(4, to_string(log.status))
        .bind(5, log.actual_dose_amount)
        .bind(6, log.actual_dose_unit)
        .bind(7, log.notes);
    stmt.run();
    return log;
}

std::vector<IntakeLog> IntakeLedger::list_intake_logs(const std::string& medication_id,
                                                      std::optional<int64_t> from_ts,
                                                      std::optional<int64_t> to_ts) {
    std::string sql = R"SQL(
        SELECT l.id, l.schedule_time_id, l.taken_ts, l.status, l.actual_dose_amount,
               l.actual_dose_unit, l.notes
        FROM medication_intake_logs l
        JOIN medication_schedule_times t ON l.schedule_time_id = t.id
        JOIN medication_schedules s ON t.schedule_id = s.id
        WHERE s.medication_id = ?
    )SQL";
    if (from_ts) sql += " AND l.taken_ts >= ?";
    if (to_ts) sql += " AND l.taken_ts <= ?";
    sql += " ORDER BY l.taken_ts DESC";

    Statement stmt(db_, sql.c_str());
    int idx = 1;
    stmt.bind(idx++, medication_id);
    if (from_ts) stmt.bind(idx++, *from_ts);
    if (to_ts) stmt.bind(idx++, *to_ts);

    std::vector<IntakeLog> out;
    while (stmt.step()) out.push_back(read_intake_log(stmt));
    return out;
}

std::vector<IntakeLog> IntakeLedger::list_by_dose_time(const std::string& dose_time_id) {
    Statement stmt(db_, R"SQL(
        SELECT id, schedule_time_id, taken_ts, status, actual_dose_amount, actual_dose_unit, notes
        FROM medication_intake_logs WHERE schedule_time_id = ? ORDER BY taken_ts DESC
    )SQL");
    stmt.bind(1, dose_time_id);
    std::vector<IntakeLog> out;
    while (stmt.step()) out.push_back(read_intake_log(stmt));
    return out;
}

} // namespace dosewatch
