#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/storage.h — On-disk payload layout
// ═══════════════════════════════════════════════════════════════════
//
//  <root>/
//    uploads/<id>_<sanitized name>     FILE payloads
//    text_shares/<id>.txt              TEXT payloads
//    .metadata/metadata.db             metadata store
//    .metadata/tmp/                    payloads being written
//
//  Stored paths are relative to the root and always carry the entry
//  id, so two entries never share a file. Writes go to .metadata/tmp
//  first and are renamed into place after fsync.
// ═══════════════════════════════════════════════════════════════════

#include "entry.h"
#include "http.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quickshare {

// A slice of an open file, e.g. one part of a spooled request body.
struct FileRange {
    int           fd = -1;
    std::uint64_t offset = 0;
    std::uint64_t size = 0;
};

// Payload bytes, in memory or still on disk.
using PayloadSource = std::variant<std::string_view, FileRange>;

inline std::uint64_t payloadSize(const PayloadSource& source) {
    if (auto* bytes = std::get_if<std::string_view>(&source)) return bytes->size();
    return std::get<FileRange>(source).size;
}

class Storage {
public:
    static constexpr std::size_t kMaxNameLength = 128;

    struct Payload {
        std::string   storedPath;
        std::string   id;
        std::uint64_t sizeBytes = 0;
    };

    // Creates the directory tree; throws errors::ConfigError when the
    // root cannot be created or written.
    explicit Storage(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path metadataDir() const { return root_ / ".metadata"; }
    std::filesystem::path tempDir() const { return root_ / ".metadata" / "tmp"; }

    // Writes the payload and returns its stored path. Throws
    // errors::StorageError; no temp file survives a failure.
    std::string put(const PayloadSource& payload, const std::string& suggestedName,
                    const std::string& id, Kind kind);

    // Opens a payload for reading; errors::NotFound if it is missing or
    // the path leaves the root.
    http::FileStream open(const std::string& storedPath) const;

    bool exists(const std::string& storedPath) const;

    // Idempotent. Returns true if a file was removed.
    bool remove(const std::string& storedPath);

    std::vector<Payload> listPayloads() const;

    // Deletes leftovers from interrupted writes; returns how many.
    std::size_t purgeTemporaries();

    // "../../etc/passwd" -> "passwd", "" -> "file"
    static std::string sanitizeName(const std::string& name);

    // Id embedded in a payload file name, if it has one.
    static std::optional<std::string> idFromFileName(const std::string& fileName);

private:
    std::filesystem::path root_;

    // Absolute path for a stored path; nullopt if it escapes the root.
    std::optional<std::filesystem::path> resolve(const std::string& storedPath) const;
};

} // namespace quickshare
