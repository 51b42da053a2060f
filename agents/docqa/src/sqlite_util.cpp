#include "../include/sqlite_util.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <sqlite3.h>
#include <filesystem>

namespace fs = std::filesystem;

static bool is_busy(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

static void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
    std::string msg = "sqlite " + what + " failed: " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if (is_busy(rc)) throw StorageBusy(msg);
    throw StorageError(msg);
}

sqlite3* open_database(const std::string& path, int busy_timeout_ms) {
    if (path != ":memory:") {
        fs::path parent = fs::path(path).parent_path();
        std::error_code ec;
        if (!parent.empty()) fs::create_directories(parent, ec);
        if (ec) throw StorageError("cannot create directory " + parent.string() + ": " + ec.message());
    }
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) sqlite3_close(db);
        throw StorageError("Failed to open SQLite DB: " + path + ": " + msg);
    }
    sqlite3_busy_timeout(db, busy_timeout_ms);
    try {
        exec_sql(db, "PRAGMA journal_mode=WAL;");
        exec_sql(db, "PRAGMA foreign_keys=ON;");
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
    return db;
}

void exec_sql(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        if (is_busy(rc)) throw StorageBusy("SQLite busy: " + msg);
        throw StorageError("SQLite error: " + msg);
    }
}

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "prepare");
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::bind_text(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

void Statement::bind_blob(int idx, const std::string& bytes) {
    sqlite3_bind_blob(stmt_, idx, bytes.data(), (int)bytes.size(), SQLITE_TRANSIENT);
}

void Statement::bind_int64(int idx, std::int64_t v) {
    sqlite3_bind_int64(stmt_, idx, (sqlite3_int64)v);
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite(db_, rc, "step");
    return false;
}

std::string Statement::column_text(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    if (!t) return "";
    return std::string(reinterpret_cast<const char*>(t), (size_t)sqlite3_column_bytes(stmt_, col));
}

std::string Statement::column_blob(int col) const {
    const void* blob = sqlite3_column_blob(stmt_, col);
    int bytes = sqlite3_column_bytes(stmt_, col);
    if (!blob || bytes <= 0) return "";
    return std::string(static_cast<const char*>(blob), (size_t)bytes);
}

std::int64_t Statement::column_int64(int col) const {
    return (std::int64_t)sqlite3_column_int64(stmt_, col);
}

Transaction::Transaction(sqlite3* db) : db_(db) {
    exec_sql(db_, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        log_warn("sqlite", std::string("rollback failed: ") + (err ? err : "unknown"));
    }
    sqlite3_free(err);
}

void Transaction::commit() {
    exec_sql(db_, "COMMIT;");
    done_ = true;
}
