// ═══════════════════════════════════════════════════════════════════
//  metadata_store.cpp — SQLite-backed entry index
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/metadata_store.h"
#include "quickshare/console.h"
#include "quickshare/crypto.h"
#include "quickshare/errors.h"

#include <algorithm>

namespace quickshare {

namespace {

constexpr int kSchemaVersion = 1;

db::Database openDatabase(const std::filesystem::path& dbFile) {
    try {
        return db::Database(dbFile.string());
    } catch (const db::DatabaseError& e) {
        throw errors::StorageError(e.what());
    }
}

std::int64_t parseInt(const std::string& text) {
    std::size_t used = 0;
    auto value = std::stoll(text, &used);
    if (used != text.size()) throw std::invalid_argument(text);
    return value;
}

} // namespace

MetadataStore::MetadataStore(const std::filesystem::path& dbFile)
    : db_(openDatabase(dbFile))
{
    try {
        migrate();
        load();
    } catch (const db::DatabaseError& e) {
        throw errors::StorageError(std::string("Metadata store unusable: ") + e.what());
    }
}

void MetadataStore::migrate() {
    auto version = db_.exec("PRAGMA user_version");
    int current = version.empty() ? 0 : std::stoi(version.first().at("user_version"));
    if (current > kSchemaVersion) {
        throw db::DatabaseError("metadata schema version " + std::to_string(current) +
                                " is newer than supported " + std::to_string(kSchemaVersion));
    }

    db_.transaction([this] {
        db_.execMulti(R"SQL(
            CREATE TABLE IF NOT EXISTS entries (
                id           TEXT PRIMARY KEY,
                kind         TEXT NOT NULL,
                display_name TEXT NOT NULL,
                stored_path  TEXT NOT NULL UNIQUE,
                size_bytes   INTEGER NOT NULL,
                created_at   INTEGER NOT NULL,
                content_type TEXT NOT NULL DEFAULT ''
            );
            CREATE INDEX IF NOT EXISTS idx_entries_created ON entries (created_at, id);
            PRAGMA user_version = 1;
        )SQL");
    });
}

void MetadataStore::load() {
    auto result = db_.exec(
        "SELECT id, kind, display_name, stored_path, size_bytes, created_at, content_type "
        "FROM entries");

    std::vector<std::string> broken;
    std::unordered_map<std::string, Entry> loaded;
    for (auto& row : result.rows) {
        auto kind = parseKind(row["kind"]);
        Entry entry;
        try {
            if (!kind) throw std::invalid_argument("kind");
            entry.id          = row["id"];
            entry.kind        = *kind;
            entry.displayName = row["display_name"];
            entry.storedPath  = row["stored_path"];
            entry.sizeBytes   = static_cast<std::uint64_t>(parseInt(row["size_bytes"]));
            entry.createdAt   = fromEpochMillis(parseInt(row["created_at"]));
            entry.contentType = row["content_type"];
        } catch (const std::exception&) {
            console::warn("Dropping unreadable metadata record", row["id"]);
            broken.push_back(row["id"]);
            continue;
        }
        loaded.emplace(entry.id, std::move(entry));
    }

    if (!broken.empty()) {
        db_.transaction([&] {
            for (auto& id : broken) {
                db_.exec("DELETE FROM entries WHERE id = ?", {id});
            }
        });
    }

    std::unique_lock lock(indexMutex_);
    index_ = std::move(loaded);
}

std::string MetadataStore::freshIdLocked() const {
    for (;;) {
        auto id = crypto::randomHex(kIdBytes);
        if (!index_.count(id) && !reserved_.count(id)) return id;
    }
}

std::string MetadataStore::reserveId() {
    std::unique_lock lock(indexMutex_);
    auto id = freshIdLocked();
    reserved_.insert(id);
    return id;
}

void MetadataStore::releaseId(const std::string& id) {
    std::unique_lock lock(indexMutex_);
    reserved_.erase(id);
}

bool MetadataStore::isReserved(const std::string& id) const {
    std::shared_lock lock(indexMutex_);
    return reserved_.count(id) > 0;
}

std::string MetadataStore::create(Entry entry) {
    if (entry.id.empty()) {
        entry.id = reserveId();
    } else {
        std::shared_lock lock(indexMutex_);
        if (index_.count(entry.id)) {
            throw errors::StorageError("Duplicate entry id " + entry.id);
        }
    }

    {
        std::lock_guard<std::mutex> write(writeMutex_);
        try {
            db_.exec(
                "INSERT INTO entries (id, kind, display_name, stored_path, size_bytes, "
                "created_at, content_type) VALUES (?, ?, ?, ?, ?, ?, ?)",
                {entry.id, toString(entry.kind), entry.displayName, entry.storedPath,
                 std::to_string(entry.sizeBytes),
                 std::to_string(toEpochMillis(entry.createdAt)),
                 entry.contentType});
        } catch (const db::DatabaseError& e) {
            throw errors::StorageError(std::string("Failed to record entry: ") + e.what());
        }
    }

    std::unique_lock lock(indexMutex_);
    reserved_.erase(entry.id);
    auto id = entry.id;
    index_.emplace(id, std::move(entry));
    return id;
}

Entry MetadataStore::get(const std::string& id) const {
    auto entry = find(id);
    if (!entry) throw errors::NotFound(id);
    return *entry;
}

std::optional<Entry> MetadataStore::find(const std::string& id) const {
    std::shared_lock lock(indexMutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<Entry> MetadataStore::list() const {
    std::vector<Entry> entries;
    {
        std::shared_lock lock(indexMutex_);
        entries.reserve(index_.size());
        for (auto& [_, entry] : index_) entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
        return a.id < b.id;
    });
    return entries;
}

std::size_t MetadataStore::size() const {
    std::shared_lock lock(indexMutex_);
    return index_.size();
}

bool MetadataStore::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> write(writeMutex_);
        try {
            db_.exec("DELETE FROM entries WHERE id = ?", {id});
        } catch (const db::DatabaseError& e) {
            throw errors::StorageError(std::string("Failed to remove entry: ") + e.what());
        }
    }

    std::unique_lock lock(indexMutex_);
    return index_.erase(id) > 0;
}

} // namespace quickshare
