#include "medication_store.hpp"
#include "errors.hpp"

namespace dosewatch {

static const char* kMedicationColumns =
    "SELECT id, user_id, profile_id, name, notes, medication_url, created_at, updated_at FROM medications ";

static Medication read_medication(const Statement& stmt) {
    Medication m;
    m.id = stmt.text(0);
    m.owner_id = stmt.text(1);
    m.profile_id = stmt.text(2);
    m.name = stmt.text(3);
    m.notes = stmt.opt_text(4);
    m.url = stmt.opt_text(5);
    m.created_at = stmt.int64(6);
    m.updated_at = stmt.int64(7);
    return m;
}

MedicationStore::MedicationStore(Database& db, Clock clock)
    : db_(db), clock_(std::move(clock)) {}

void MedicationStore::validate(const Medication& med) {
    if (trim(med.name).empty()) throw ValidationError("name", "must not be empty");
    if (med.owner_id.empty()) throw ValidationError("user_id", "must not be empty");
    if (med.profile_id.empty()) throw ValidationError("profile_id", "must not be empty");
}

Medication MedicationStore::create(Medication med) {
    validate(med);
    if (med.id.empty()) med.id = generate_id();
    med.created_at = clock_();
    med.updated_at = med.created_at;

    Statement stmt(db_, "INSERT INTO medications (id, user_id, profile_id, name, notes, medication_url, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, med.id)
        .bind(2, med.owner_id)
        .bind(3, med.profile_id)
        .bind(4, med.name)
        .bind(5, med.notes)
        .bind(6, med.url)
        .bind(7, med.created_at)
        .bind(8, med.updated_at);
    stmt.run();
    return med;
}

std::optional<Medication> MedicationStore::get(const std::string& id) {
    std::string sql = std::string(kMedicationColumns) + "WHERE id = ?";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, id);
    if (!stmt.step()) return std::nullopt;
    return read_medication(stmt);
}

Medication MedicationStore::require(const std::string& id) {
    auto med = get(id);
    if (!med) throw NotFoundError("medication", id);
    return *med;
}

std::vector<Medication> MedicationStore::list_by_profile(const std::string& owner_id,
                                                         const std::string& profile_id) {
    std::string sql = std::string(kMedicationColumns) +
        "WHERE user_id = ? AND profile_id = ? ORDER BY name ASC";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, owner_id).bind(2, profile_id);
    std::vector<Medication> meds;
    while (stmt.step()) meds.push_back(read_medication(stmt));
    return meds;
}

std::vector<Medication> MedicationStore::find_by_name(const std::string& owner_id,
                                                      const std::string& profile_id,
                                                      const std::string& fragment) {
    std::string sql = std::string(kMedicationColumns) +
        "WHERE user_id = ? AND profile_id = ? AND name LIKE ? ORDER BY name ASC";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, owner_id).bind(2, profile_id).bind(3, "%" + fragment + "%");
    std::vector<Medication> meds;
    while (stmt.step()) meds.push_back(read_medication(stmt));
    return meds;
}

Medication MedicationStore::update(const Medication& med) {
    Medication current = require(med.id);
    Medication next = current;
    next.name = med.name;
    next.notes = med.notes;
    next.url = med.url;
    validate(next);
    next.updated_at = clock_();

    Statement stmt(db_, "UPDATE medications SET name = ?, notes = ?, medication_url = ?, updated_at = ? WHERE id = ?");
    stmt.bind(1, next.name)
        .bind(2, next.notes)
        .bind(3, next.url)
        .bind(4, next.updated_at)
        .bind(5, next.id);
    stmt.run();
    return next;
}

bool MedicationStore::remove(const std::string& id) {
    Transaction tx(db_);

    Statement logs(db_, R"SQL(
        DELETE FROM medication_intake_logs WHERE schedule_time_id IN (
            SELECT t.id FROM medication_schedule_times t
            JOIN medication_schedules s ON t.schedule_id = s.id
            WHERE s.medication_id = ?)
    )SQL");
    logs.bind(1, id).run();

    Statement times(db_, R"SQL(
        DELETE FROM medication_schedule_times WHERE schedule_id IN (
            SELECT id FROM medication_schedules WHERE medication_id = ?)
    )SQL");
    times.bind(1, id).run();

    Statement schedules(db_, "DELETE FROM medication_schedules WHERE medication_id = ?");
    schedules.bind(1, id).run();

    Statement med(db_, "DELETE FROM medications WHERE id = ?");
    med.bind(1, id).run();
    bool removed = med.changes() > 0;

    tx.commit();
    return removed;
}

} // namespace dosewatch
