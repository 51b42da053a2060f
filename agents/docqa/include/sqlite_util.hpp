#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

// Opens (creating the parent directory) in WAL mode with a busy timeout.
sqlite3* open_database(const std::string& path, int busy_timeout_ms);

// Throws StorageBusy when the database stays locked, StorageError otherwise.
void exec_sql(sqlite3* db, const std::string& sql);

// Prepared statement, finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql);
    ~Statement();
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int idx, const std::string& v);
    void bind_blob(int idx, const std::string& bytes);
    void bind_int64(int idx, std::int64_t v);

    // true on SQLITE_ROW, false on SQLITE_DONE.
    bool step();

    std::string column_text(int col) const;
    std::string column_blob(int col) const;
    std::int64_t column_int64(int col) const;

private:
    sqlite3* db_{nullptr};
    sqlite3_stmt* stmt_{nullptr};
};

// BEGIN IMMEDIATE; rolled back on scope exit unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    sqlite3* db_{nullptr};
    bool done_{false};
};
