#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/metadata_store.h — Durable id -> Entry mapping
// ═══════════════════════════════════════════════════════════════════
//
//  Reads are served from an in-memory index under a shared lock.
//  Mutations write through to SQLite first and update the index only
//  once the row is committed, so a failed write leaves no trace.
//
//  Ids are reserved before the payload is written (reserveId) and
//  committed by create(); a reserved id is never handed out twice and
//  is never treated as an orphan by reconciliation.
// ═══════════════════════════════════════════════════════════════════

#include "database.h"
#include "entry.h"

#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace quickshare {

class MetadataStore {
public:
    // Opens (or creates) the database and loads every entry.
    // Throws errors::StorageError when the file cannot be used.
    explicit MetadataStore(const std::filesystem::path& dbFile);

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // ── Id allocation ──
    std::string reserveId();
    void releaseId(const std::string& id);
    bool isReserved(const std::string& id) const;

    // Persists the entry and returns its id. An empty entry.id gets a
    // fresh one; a reserved id is committed and its reservation dropped.
    std::string create(Entry entry);

    // ── Queries ──
    Entry get(const std::string& id) const;                  // throws errors::NotFound
    std::optional<Entry> find(const std::string& id) const;
    std::vector<Entry> list() const;                         // created_at asc, then id
    std::size_t size() const;

    // Idempotent. Returns true if a record was removed.
    bool remove(const std::string& id);

private:
    mutable std::shared_mutex indexMutex_;
    std::unordered_map<std::string, Entry> index_;
    std::unordered_set<std::string> reserved_;

    std::mutex writeMutex_;         // serializes access to db_
    db::Database db_;

    void migrate();
    void load();
    std::string freshIdLocked() const;
};

} // namespace quickshare
