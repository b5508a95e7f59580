// ═══════════════════════════════════════════════════════════════════
//  database.cpp — SQLite driver implementation
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/database.h"
#include <sqlite3.h>

namespace quickshare::db {

namespace {

// Finalizes the statement on every exit path.
struct Statement {
    sqlite3_stmt* stmt = nullptr;
    ~Statement() {
        if (stmt) sqlite3_finalize(stmt);
    }
};

} // namespace

Database::Database(const std::string& path) : path_(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw DatabaseError("Failed to open database '" + path + "': " + err);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA synchronous=NORMAL");
    } catch (const DatabaseError&) {
        close();
        throw;
    }
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result Database::exec(const std::string& sql) {
    return exec(sql, {});
}

Result Database::exec(const std::string& sql, const std::vector<std::string>& params) {
    if (!db_) throw DatabaseError("Database is closed");

    Result result;

    Statement st;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &st.stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw DatabaseError("SQL error: " + std::string(sqlite3_errmsg(db_)));
    }

    // Bind parameters
    for (int i = 0; i < static_cast<int>(params.size()); i++) {
        sqlite3_bind_text(st.stmt, i + 1, params[i].c_str(),
                          static_cast<int>(params[i].size()), SQLITE_TRANSIENT);
    }

    // Get column names
    int colCount = sqlite3_column_count(st.stmt);
    result.columns.reserve(colCount);
    for (int i = 0; i < colCount; i++) {
        result.columns.push_back(sqlite3_column_name(st.stmt, i));
    }

    // Execute and fetch rows
    while ((rc = sqlite3_step(st.stmt)) == SQLITE_ROW) {
        Row row;
        for (int i = 0; i < colCount; i++) {
            auto text = sqlite3_column_text(st.stmt, i);
            auto len = sqlite3_column_bytes(st.stmt, i);
            row[result.columns[i]] = text
                ? std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(len))
                : "";
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        throw DatabaseError("SQL step error: " + std::string(sqlite3_errmsg(db_)));
    }

    result.affectedRows = sqlite3_changes(db_);
    result.lastInsertId = sqlite3_last_insert_rowid(db_);
    return result;
}

void Database::execMulti(const std::string& sql) {
    if (!db_) throw DatabaseError("Database is closed");

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string err = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw DatabaseError("SQL exec error: " + err);
    }
}

void Database::beginTransaction() {
    exec("BEGIN IMMEDIATE TRANSACTION");
}

void Database::commit() {
    exec("COMMIT");
}

void Database::rollback() {
    if (db_ && !sqlite3_get_autocommit(db_)) {
        exec("ROLLBACK");
    }
}

} // namespace quickshare::db
