#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/database.h — SQLite driver
// ═══════════════════════════════════════════════════════════════════
//
//  Thin RAII wrapper over one sqlite3 connection. All values are bound
//  and read back as text. Failures throw db::DatabaseError.
//  A Database is not thread-safe; callers serialize access.
// ═══════════════════════════════════════════════════════════════════

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

// Forward-declare sqlite3 types
struct sqlite3;
struct sqlite3_stmt;

namespace quickshare::db {

class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& msg) : std::runtime_error(msg) {}
};

// ── Query result row ──
using Row = std::unordered_map<std::string, std::string>;

// ── Query result ──
struct Result {
    std::vector<Row> rows;
    std::vector<std::string> columns;
    int affectedRows = 0;
    int64_t lastInsertId = 0;

    bool empty() const { return rows.empty(); }
    std::size_t size() const { return rows.size(); }
    Row& first() { return rows.front(); }
    const Row& first() const { return rows.front(); }
};

// ═══════════════════════════════════════════
//  SQLite Database Connection
// ═══════════════════════════════════════════
class Database {
public:
    explicit Database(const std::string& path = ":memory:");
    ~Database();

    // Non-copyable, movable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    // ── Execute a query ──
    Result exec(const std::string& sql);

    // ── Execute with bound parameters ──
    Result exec(const std::string& sql, const std::vector<std::string>& params);

    // ── Execute multiple statements (migrations, etc.) ──
    void execMulti(const std::string& sql);

    // ── Transaction helpers ──
    void beginTransaction();
    void commit();
    void rollback();

    // ── Transaction scope guard ──
    template <typename Func>
    auto transaction(Func&& fn) -> decltype(fn()) {
        beginTransaction();
        try {
            if constexpr (std::is_void_v<decltype(fn())>) {
                fn();
                commit();
            } else {
                auto result = fn();
                commit();
                return result;
            }
        } catch (...) {
            rollback();
            throw;
        }
    }

    bool isOpen() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }
    void close();

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace quickshare::db
