#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/share_service.h — The storage-and-serving engine
// ═══════════════════════════════════════════════════════════════════
//
//  Owns the payload storage, the metadata store and the per-entry
//  lock table. One instance per process, created in main() and passed
//  by reference to the router and the sweeper.
//
//  Ordering rules:
//    create   payload written (temp + rename), then metadata committed
//    delete   metadata removed, then payload unlinked
//    download descriptor opened under the entry lock, streamed after
//
//  A download that opened its descriptor before a delete still
//  streams the complete payload.
// ═══════════════════════════════════════════════════════════════════

#include "entry.h"
#include "http.h"
#include "keyed_mutex.h"
#include "metadata_store.h"
#include "storage.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace quickshare {

struct ServiceOptions {
    std::filesystem::path     storageDir = "./shared_files";
    std::uint64_t             maxSizeBytes = 1024ull * 1000 * 1000;
    std::chrono::milliseconds retention = std::chrono::hours(24);
    int                       maxFilesPerUpload = 10;
    std::function<TimePoint()> clock;       // system_clock::now when empty
};

// ── Upload ──
struct UploadPart {
    std::string filename;
    std::string contentType;
    std::string data;
    std::optional<FileRange> spooled;   // bytes still in a spooled request body; wins over data

    PayloadSource source() const {
        return spooled ? PayloadSource(*spooled) : PayloadSource(std::string_view(data));
    }
    std::uint64_t size() const { return payloadSize(source()); }
};

struct UploadFailure {
    std::string displayName;
    std::string reason;             // errors::reason::*
    std::string message;
};

struct UploadResult {
    std::vector<Entry>         stored;
    std::vector<UploadFailure> failed;

    bool allStorageFailures() const;
};

// ── Download ──
struct Download {
    Entry            entry;
    http::FileStream file;
};

// ── Listing ──
struct Usage {
    std::size_t   totalEntries = 0;
    std::uint64_t totalBytes = 0;
};

struct ListedEntry {
    Entry                entry;
    TimePoint            expiresAt;
    std::chrono::seconds expiresIn{0};      // clamped at zero
};

struct Listing {
    std::vector<ListedEntry> entries;
    Usage                    usage;
};

// ── Maintenance ──
enum class RemoveOutcome { Deleted, Absent };

struct ReconcileReport {
    std::size_t droppedRecords = 0;     // metadata without payload
    std::size_t deletedPayloads = 0;    // payload without metadata
};

struct SweepReport {
    std::size_t     expired = 0;
    std::size_t     failed = 0;
    ReconcileReport reconcile;
};

class ShareService {
public:
    // Creates the layout, loads metadata, purges temporaries and
    // reconciles. Throws errors::ConfigError / errors::StorageError.
    explicit ShareService(ServiceOptions options);

    ShareService(const ShareService&) = delete;
    ShareService& operator=(const ShareService&) = delete;

    // Rejects the whole request (ValidationError) when there are no
    // parts, too many parts, or any part exceeds the size limit.
    // Otherwise each part succeeds or fails on its own.
    UploadResult upload(std::vector<UploadPart> parts);

    // Single file; throws on any failure.
    Entry storeFile(const std::string& filename, const std::string& contentType,
                    const PayloadSource& data);

    Entry shareText(const std::string& text);

    Download openDownload(const std::string& id);
    std::string fetchText(const std::string& id);

    Listing list() const;
    Usage stats() const;

    RemoveOutcome remove(const std::string& id);

    // Removes every entry with age >= retention, then reconciles.
    SweepReport sweepExpired();
    ReconcileReport reconcile();

    // ValidationError(payload_too_large) when `size` is over the limit;
    // `what` names the payload in the message.
    void checkSize(std::uint64_t size, const std::string& what) const;
    // ValidationError(too_many_files) when one upload carries too many.
    void checkFileCount(std::size_t count) const;

    TimePoint now() const;
    const ServiceOptions& options() const { return options_; }
    Storage& storage() { return storage_; }
    MetadataStore& metadata() { return metadata_; }

private:
    ServiceOptions options_;
    Storage        storage_;
    MetadataStore  metadata_;
    KeyedMutex     locks_;

    Entry store(const PayloadSource& payload, const std::string& displayName,
                const std::string& contentType, Kind kind);
    RemoveOutcome removeLocked(const std::string& id);
};

} // namespace quickshare
