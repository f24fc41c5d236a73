#include "database.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <iostream>

namespace dosewatch {

Database::Database(const std::string& db_path) {
    if (db_path != ":memory:") {
        auto parent = fs::path(db_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database " + db_path + ": " + msg);
    }
    exec("PRAGMA foreign_keys = ON;");
    init_schema();
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::exec(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void Database::init_schema() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS medications (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL,
            profile_id TEXT NOT NULL,
            name TEXT NOT NULL,
            notes TEXT,
            medication_url TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_medications_user_profile ON medications(user_id, profile_id);
        CREATE INDEX IF NOT EXISTS idx_medications_name ON medications(name);

        CREATE TABLE IF NOT EXISTS medication_schedules (
            id TEXT PRIMARY KEY,
            medication_id TEXT NOT NULL,
            schedule TEXT NOT NULL,
            frequency_per_day INTEGER,
            is_forever INTEGER DEFAULT 0,
            start_date INTEGER,
            end_date INTEGER,
            days_of_week TEXT,
            timezone TEXT,
            reminder_enabled INTEGER DEFAULT 1,
            FOREIGN KEY(medication_id) REFERENCES medications(id) ON DELETE CASCADE
        );
        CREATE INDEX IF NOT EXISTS idx_schedules_medication ON medication_schedules(medication_id);
        CREATE INDEX IF NOT EXISTS idx_schedules_active_window ON medication_schedules(start_date, end_date);

        CREATE TABLE IF NOT EXISTS medication_schedule_times (
            id TEXT PRIMARY KEY,
            schedule_id TEXT NOT NULL,
            time_local TEXT NOT NULL,
            dosage TEXT,
            dose_amount REAL,
            dose_unit TEXT,
            instructions TEXT,
            prn INTEGER DEFAULT 0,
            sort_order INTEGER,
            next_trigger_ts INTEGER,
            FOREIGN KEY(schedule_id) REFERENCES medication_schedules(id) ON DELETE CASCADE
        );
        CREATE INDEX IF NOT EXISTS idx_times_schedule ON medication_schedule_times(schedule_id);
        CREATE INDEX IF NOT EXISTS idx_times_trigger ON medication_schedule_times(next_trigger_ts);

        CREATE TABLE IF NOT EXISTS medication_intake_logs (
            id TEXT PRIMARY KEY,
            schedule_time_id TEXT NOT NULL,
            taken_ts INTEGER NOT NULL,
            status TEXT NOT NULL,
            actual_dose_amount REAL,
            actual_dose_unit TEXT,
            notes TEXT,
            FOREIGN KEY(schedule_time_id) REFERENCES medication_schedule_times(id) ON DELETE CASCADE
        );
        CREATE INDEX IF NOT EXISTS idx_intake_logs_time ON medication_intake_logs(taken_ts);
    )SQL";
    exec(sql);
}

int64_t Database::count(const std::string& table) {
    std::string sql = "SELECT COUNT(*) FROM " + table;
    Statement stmt(*this, sql.c_str());
    return stmt.step() ? stmt.int64(0) : 0;
}

// ── Transaction ─────────────────────────────────────────────────────

Transaction::Transaction(Database& db)
    : db_(db), lock_(db.mutex()) {
    name_ = "sp_" + std::to_string(db_.savepoint_depth_);
    db_.exec("SAVEPOINT " + name_ + ";");
    db_.savepoint_depth_++;
}

Transaction::~Transaction() {
    if (done_) return;
    db_.savepoint_depth_--;
    try {
        db_.exec("ROLLBACK TO " + name_ + "; RELEASE " + name_ + ";");
    } catch (const std::exception& e) {
        std::cerr << "[db] Rollback failed: " << e.what() << "\n";
    }
}

void Transaction::commit() {
    if (done_) return;
    db_.exec("RELEASE " + name_ + ";");
    db_.savepoint_depth_--;
    done_ = true;
}

// ── Statement ───────────────────────────────────────────────────────

Statement::Statement(Database& db, const char* sql)
    : db_(db), lock_(db.mutex()) {
    if (sqlite3_prepare_v2(db_.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(db_.handle());
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw std::runtime_error("SQLite prepare error: " + msg);
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement& Statement::bind(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, const char* v) {
    sqlite3_bind_text(stmt_, idx, v, -1, SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, int64_t v) {
    sqlite3_bind_int64(stmt_, idx, v);
    return *this;
}

Statement& Statement::bind(int idx, int v) {
    sqlite3_bind_int(stmt_, idx, v);
    return *this;
}

Statement& Statement::bind(int idx, double v) {
    sqlite3_bind_double(stmt_, idx, v);
    return *this;
}

Statement& Statement::bind(int idx, bool v) {
    sqlite3_bind_int(stmt_, idx, v ? 1 : 0);
    return *this;
}

Statement& Statement::bind_null(int idx) {
    sqlite3_bind_null(stmt_, idx);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error("SQLite step error: " + std::string(sqlite3_errmsg(db_.handle())));
}

void Statement::run() {
    while (step()) {}
}

int Statement::changes() const {
    return sqlite3_changes(db_.handle());
}

bool Statement::is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::string Statement::text(int col) const {
    const unsigned char* p = sqlite3_column_text(stmt_, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

std::optional<std::string> Statement::opt_text(int col) const {
    if (is_null(col)) return std::nullopt;
    return text(col);
}

int64_t Statement::int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::optional<int64_t> Statement::opt_int64(int col) const {
    if (is_null(col)) return std::nullopt;
    return sqlite3_column_int64(stmt_, col);
}

std::optional<int> Statement::opt_int(int col) const {
    if (is_null(col)) return std::nullopt;
    return sqlite3_column_int(stmt_, col);
}

std::optional<double> Statement::opt_double(int col) const {
    if (is_null(col)) return std::nullopt;
    return sqlite3_column_double(stmt_, col);
}

} // namespace dosewatch
