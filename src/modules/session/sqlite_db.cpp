// modules/session/sqlite_db.cpp
#include "session/sqlite_db.h"
#include "common/logging/logger.h"
#include "core/types/errors.h"

namespace agentrt {

namespace {

void throw_if(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        throw StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

} // namespace

// ————————————————————————
// SqliteDb
// ————————————————————————

SqliteDb::SqliteDb(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Cannot open session database '" + path_ + "': " + msg);
    }
    configure();
}

SqliteDb::~SqliteDb() {
    if (db_) sqlite3_close(db_);
}

void SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw StorageError(msg);
    }
}

void SqliteDb::configure() {
    // WAL lets readers proceed while a commit holds the write lock
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    exec("PRAGMA foreign_keys=ON;");
    throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

// ————————————————————————
// SqliteStatement
// ————————————————————————

SqliteStatement::SqliteStatement(SqliteDb& db, const std::string& sql) : db_(db) {
    throw_if(sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr), db_.handle(), "sqlite prepare");
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

SqliteStatement& SqliteStatement::bind(int index, const std::string& value) {
    throw_if(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
             db_.handle(), "sqlite bind text");
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, double value) {
    throw_if(sqlite3_bind_double(stmt_, index, value), db_.handle(), "sqlite bind double");
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, int64_t value) {
    throw_if(sqlite3_bind_int64(stmt_, index, value), db_.handle(), "sqlite bind int");
    return *this;
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db_.handle()));
}

void SqliteStatement::run() {
    while (step()) {
    }
}

std::string SqliteStatement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
}

double SqliteStatement::column_double(int index) const {
    return sqlite3_column_double(stmt_, index);
}

int64_t SqliteStatement::column_int(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

bool SqliteStatement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// ————————————————————————
// SqliteTransaction
// ————————————————————————

SqliteTransaction::SqliteTransaction(SqliteDb& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (done_) return;
    char* err = nullptr;
    int rc = sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        AGENTRT_LOG_ERROR("Rollback on '{}' failed: {}", db_.path(), err ? err : "unknown error");
    }
    sqlite3_free(err);
}

void SqliteTransaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace agentrt
