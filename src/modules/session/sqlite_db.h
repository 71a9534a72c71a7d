// modules/session/sqlite_db.h
#ifndef AGENTRT_MODULES_SESSION_SQLITE_DB_H
#define AGENTRT_MODULES_SESSION_SQLITE_DB_H

#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>

namespace agentrt {

// Thin RAII wrapper around sqlite3*
class SqliteDb {
public:
    explicit SqliteDb(std::string path);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    // Executes one or more statements without results (pragmas, schema)
    void exec(const std::string& sql);

private:
    void configure();

    sqlite3* db_ = nullptr;
    std::string path_;
};

// Prepared statement; finalized on destruction
class SqliteStatement {
public:
    SqliteStatement(SqliteDb& db, const std::string& sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    SqliteStatement& bind(int index, const std::string& value);
    SqliteStatement& bind(int index, double value);
    SqliteStatement& bind(int index, int64_t value);

    // true while a row is available
    bool step();
    // For statements that return no rows
    void run();

    std::string column_text(int index) const;
    double column_double(int index) const;
    int64_t column_int(int index) const;
    bool column_is_null(int index) const;

private:
    SqliteDb& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE takes the write lock up front. Rolls back unless committed.
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDb& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteDb& db_;
    bool done_ = false;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_SESSION_SQLITE_DB_H
