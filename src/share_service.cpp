// ═══════════════════════════════════════════════════════════════════
//  share_service.cpp — Upload, download, delete, expiry
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/share_service.h"
#include "quickshare/console.h"
#include "quickshare/errors.h"
#include "quickshare/sendfile.h"

#include <algorithm>
#include <cstdio>
#include <ctime>

namespace quickshare {

namespace {

// Strict UTF-8: no overlongs, no surrogates, nothing above U+10FFFF.
bool isValidUtf8(const std::string& text) {
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char c = s[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t len;
        std::uint32_t cp;
        if ((c & 0xE0) == 0xC0)      { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string textLabel(TimePoint at) {
    auto t = std::chrono::system_clock::to_time_t(at);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::strftime(buf, sizeof(buf), "text_%Y%m%d_%H%M%S.txt", &tm);
    return buf;
}

std::string formatMb(std::uint64_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(bytes) / 1e6);
    return buf;
}

} // namespace

bool UploadResult::allStorageFailures() const {
    return !failed.empty() && std::all_of(failed.begin(), failed.end(), [](const UploadFailure& f) {
        return f.reason == errors::reason::StorageFailure;
    });
}

// ═══════════════════════════════════════════
//  Construction
// ═══════════════════════════════════════════

ShareService::ShareService(ServiceOptions options)
    : options_(std::move(options))
    , storage_(options_.storageDir)
    , metadata_(storage_.metadataDir() / "metadata.db")
{
    auto purged = storage_.purgeTemporaries();
    if (purged > 0) {
        console::info("Removed", purged, "interrupted upload(s) from", storage_.tempDir().string());
    }

    auto report = reconcile();
    console::info("Loaded", metadata_.size(), "entr(ies) from", storage_.root().string());
    if (report.droppedRecords || report.deletedPayloads) {
        console::warn("Reconciled storage:", report.droppedRecords, "record(s) without payload,",
                      report.deletedPayloads, "payload(s) without record");
    }
}

TimePoint ShareService::now() const {
    return options_.clock ? options_.clock() : std::chrono::system_clock::now();
}

void ShareService::checkSize(std::uint64_t size, const std::string& what) const {
    if (size > options_.maxSizeBytes) {
        throw errors::ValidationError(
            errors::reason::PayloadTooLarge,
            what + " exceeds the " + formatMb(options_.maxSizeBytes) + " MB limit");
    }
}

// ═══════════════════════════════════════════
//  Create
// ═══════════════════════════════════════════

void ShareService::checkFileCount(std::size_t count) const {
    if (count > static_cast<std::size_t>(options_.maxFilesPerUpload)) {
        throw errors::ValidationError(
            errors::reason::TooManyFiles,
            "At most " + std::to_string(options_.maxFilesPerUpload) + " files per upload");
    }
}

Entry ShareService::store(const PayloadSource& payload, const std::string& displayName,
                          const std::string& contentType, Kind kind) {
    auto id = metadata_.reserveId();

    std::string storedPath;
    try {
        storedPath = storage_.put(payload, displayName, id, kind);
    } catch (...) {
        metadata_.releaseId(id);
        throw;
    }

    Entry entry;
    entry.id          = id;
    entry.kind        = kind;
    entry.displayName = displayName;
    entry.storedPath  = storedPath;
    entry.sizeBytes   = payloadSize(payload);
    entry.createdAt   = now();
    entry.contentType = kind == Kind::File ? contentType : "";

    try {
        metadata_.create(entry);
    } catch (...) {
        try {
            storage_.remove(storedPath);
        } catch (const errors::StorageError& e) {
            console::error("Could not roll back payload", storedPath, ":", e.what());
        }
        metadata_.releaseId(id);
        throw;
    }

    console::debug("Stored", toString(kind), id, displayName, entry.sizeBytes, "bytes");
    return entry;
}

Entry ShareService::storeFile(const std::string& filename, const std::string& contentType,
                              const PayloadSource& data) {
    if (!isValidUtf8(filename)) {
        throw errors::ValidationError(errors::reason::InvalidFilename,
                                      "File name is not valid UTF-8");
    }
    const std::string displayName = filename.empty() ? "file" : filename;
    const auto size = payloadSize(data);
    if (size == 0) {
        throw errors::ValidationError(errors::reason::EmptyUpload,
                                      "'" + displayName + "' is empty");
    }
    checkSize(size, "'" + displayName + "'");

    auto type = contentType;
    if (type.empty() || type == "application/octet-stream") {
        type = sendfile::getMimeType(displayName);
    }
    return store(data, displayName, type, Kind::File);
}

UploadResult ShareService::upload(std::vector<UploadPart> parts) {
    if (parts.empty()) {
        throw errors::ValidationError(errors::reason::NoFiles, "No files in upload");
    }
    checkFileCount(parts.size());
    for (auto& part : parts) {
        checkSize(part.size(), "'" + (part.filename.empty() ? "file" : part.filename) + "'");
    }

    UploadResult result;
    for (auto& part : parts) {
        try {
            result.stored.push_back(storeFile(part.filename, part.contentType, part.source()));
        } catch (const errors::ValidationError& e) {
            result.failed.push_back({part.filename, e.reason(), e.what()});
        } catch (const errors::StorageError& e) {
            console::error("Failed to store", part.filename, ":", e.what());
            result.failed.push_back({part.filename, errors::reason::StorageFailure,
                                     "Could not store file"});
        }
    }
    return result;
}

Entry ShareService::shareText(const std::string& text) {
    if (text.empty()) {
        throw errors::ValidationError(errors::reason::EmptyText, "Text is empty");
    }
    checkSize(text.size(), "Text");
    if (!isValidUtf8(text)) {
        throw errors::ValidationError(errors::reason::InvalidText, "Text is not valid UTF-8");
    }
    return store(text, textLabel(now()), "", Kind::Text);
}

// ═══════════════════════════════════════════
//  Read
// ═══════════════════════════════════════════

Download ShareService::openDownload(const std::string& id) {
    auto guard = locks_.lock(id);
    auto entry = metadata_.get(id);
    try {
        auto file = storage_.open(entry.storedPath);
        return Download{std::move(entry), std::move(file)};
    } catch (const errors::NotFound&) {
        console::warn("Payload missing for entry", id);
        throw errors::NotFound(id);
    }
}

std::string ShareService::fetchText(const std::string& id) {
    auto guard = locks_.lock(id);
    auto entry = metadata_.get(id);
    if (entry.kind != Kind::Text) {
        throw errors::ValidationError(errors::reason::NotText,
                                      "Entry '" + id + "' is a file, not text");
    }
    try {
        return storage_.open(entry.storedPath).readAll();
    } catch (const errors::NotFound&) {
        console::warn("Payload missing for entry", id);
        throw errors::NotFound(id);
    } catch (const std::runtime_error& e) {
        throw errors::StorageError(e.what());
    }
}

Listing ShareService::list() const {
    const auto current = now();
    Listing listing;
    for (auto& entry : metadata_.list()) {
        ListedEntry listed;
        listed.expiresAt = entry.createdAt +
            std::chrono::duration_cast<TimePoint::duration>(options_.retention);
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(listed.expiresAt - current);
        listed.expiresIn = std::max(remaining, std::chrono::seconds(0));

        listing.usage.totalBytes += entry.sizeBytes;
        listed.entry = std::move(entry);
        listing.entries.push_back(std::move(listed));
    }
    listing.usage.totalEntries = listing.entries.size();
    return listing;
}

Usage ShareService::stats() const {
    Usage usage;
    for (auto& entry : metadata_.list()) {
        ++usage.totalEntries;
        usage.totalBytes += entry.sizeBytes;
    }
    return usage;
}

// ═══════════════════════════════════════════
//  Delete
// ═══════════════════════════════════════════

RemoveOutcome ShareService::remove(const std::string& id) {
    auto guard = locks_.lock(id);
    return removeLocked(id);
}

RemoveOutcome ShareService::removeLocked(const std::string& id) {
    auto entry = metadata_.find(id);
    if (!entry) return RemoveOutcome::Absent;

    metadata_.remove(id);
    try {
        storage_.remove(entry->storedPath);
    } catch (const errors::StorageError& e) {
        // The record is gone; the orphaned payload goes at the next reconcile.
        console::warn("Could not remove payload for", id, ":", e.what());
    }
    console::debug("Removed", toString(entry->kind), id, entry->displayName);
    return RemoveOutcome::Deleted;
}

// ═══════════════════════════════════════════
//  Maintenance
// ═══════════════════════════════════════════

SweepReport ShareService::sweepExpired() {
    SweepReport report;
    const auto current = now();

    for (auto& entry : metadata_.list()) {
        if (current - entry.createdAt < options_.retention) continue;
        try {
            auto guard = locks_.lock(entry.id);
            if (removeLocked(entry.id) == RemoveOutcome::Deleted) ++report.expired;
        } catch (const std::exception& e) {
            ++report.failed;
            console::warn("Failed to expire", entry.id, ":", e.what());
        }
    }

    report.reconcile = reconcile();
    if (report.expired > 0) {
        console::info("Expired", report.expired, "entr(ies) older than",
                      std::chrono::duration<double, std::ratio<3600>>(options_.retention).count(),
                      "hour(s)");
    }
    return report;
}

ReconcileReport ShareService::reconcile() {
    ReconcileReport report;

    // Records whose payload vanished
    for (auto& entry : metadata_.list()) {
        try {
            auto guard = locks_.lock(entry.id);
            auto current = metadata_.find(entry.id);
            if (!current || storage_.exists(current->storedPath)) continue;
            metadata_.remove(entry.id);
            ++report.droppedRecords;
            console::warn("Dropped record", entry.id, "whose payload is missing");
        } catch (const std::exception& e) {
            console::warn("Reconcile failed for record", entry.id, ":", e.what());
        }
    }

    // Payloads nobody owns
    for (auto& payload : storage_.listPayloads()) {
        try {
            if (!payload.id.empty()) {
                auto guard = locks_.lock(payload.id);
                if (metadata_.isReserved(payload.id)) continue;
                auto entry = metadata_.find(payload.id);
                if (entry && entry->storedPath == payload.storedPath) continue;
                if (storage_.remove(payload.storedPath)) ++report.deletedPayloads;
            } else if (storage_.remove(payload.storedPath)) {
                ++report.deletedPayloads;
            }
        } catch (const std::exception& e) {
            console::warn("Reconcile failed for payload", payload.storedPath, ":", e.what());
        }
    }
    return report;
}

} // namespace quickshare
