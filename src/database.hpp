#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <mutex>
#include <sqlite3.h>

namespace dosewatch {

// One sqlite3 connection shared by every store, so cascades and
// dose-time writes commit atomically.
class Database {
public:
    explicit Database(const std::string& db_path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void exec(const std::string& sql);
    sqlite3* handle() { return db_; }
    std::recursive_mutex& mutex() { return mutex_; }

    int64_t count(const std::string& table);

private:
    sqlite3* db_ = nullptr;
    std::recursive_mutex mutex_;
    int savepoint_depth_ = 0;

    void init_schema();

    friend class Transaction;
};

// Nestable transaction (SAVEPOINT). Rolls back unless commit() is called.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    std::string name_;
    bool done_ = false;
};

class Statement {
public:
    Statement(Database& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& v);
    Statement& bind(int idx, const char* v);
    Statement& bind(int idx, int64_t v);
    Statement& bind(int idx, int v);
    Statement& bind(int idx, double v);
    Statement& bind(int idx, bool v);
    Statement& bind_null(int idx);

    template <typename T>
    Statement& bind(int idx, const std::optional<T>& v) {
        if (v) return bind(idx, *v);
        return bind_null(idx);
    }

    // true while a row is available; throws on error
    bool step();
    // Runs a statement that returns no rows.
    void run();
    int changes() const;

    bool is_null(int col) const;
    std::string text(int col) const;
    std::optional<std::string> opt_text(int col) const;
    int64_t int64(int col) const;
    std::optional<int64_t> opt_int64(int col) const;
    std::optional<int> opt_int(int col) const;
    std::optional<double> opt_double(int col) const;

private:
    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace dosewatch
