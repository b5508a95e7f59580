#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/errors.h — Error taxonomy
// ═══════════════════════════════════════════════════════════════════
//
//  Every failure the engine reports is one of these. The router
//  translates them to HTTP in a single place (routes.cpp):
//
//    ValidationError  → 400 (413 for payload_too_large)
//    NotFound         → 404
//    StorageError     → 500, detail logged, never sent to the client
//    ConfigError      → fatal at startup
//
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>

namespace quickshare::errors {

// ── Machine-readable reasons carried in {"error": ...} ──
namespace reason {
inline constexpr const char* PayloadTooLarge    = "payload_too_large";
inline constexpr const char* EmptyUpload        = "empty_upload";
inline constexpr const char* NoFiles            = "no_files";
inline constexpr const char* TooManyFiles       = "too_many_files";
inline constexpr const char* InvalidContentType = "invalid_content_type";
inline constexpr const char* InvalidFilename    = "invalid_filename";
inline constexpr const char* EmptyText          = "empty_text";
inline constexpr const char* InvalidText        = "invalid_text";
inline constexpr const char* NotText            = "not_text";
inline constexpr const char* NotFound           = "not_found";
inline constexpr const char* StorageFailure     = "storage_error";
} // namespace reason

class ValidationError : public std::runtime_error {
public:
    ValidationError(std::string reason, const std::string& message)
        : std::runtime_error(message), reason_(std::move(reason)) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

class NotFound : public std::runtime_error {
public:
    explicit NotFound(const std::string& id)
        : std::runtime_error("No entry with id '" + id + "'") {}
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace quickshare::errors
