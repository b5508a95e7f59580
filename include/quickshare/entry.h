#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/entry.h — One shared item (file or text snippet)
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"

#include <cstdint>
#include <optional>
#include <string>

namespace quickshare {

// Entry ids are this many random bytes, hex encoded.
inline constexpr std::size_t kIdBytes = 16;

enum class Kind { File, Text };

inline const char* toString(Kind kind) {
    return kind == Kind::File ? "file" : "text";
}

inline std::optional<Kind> parseKind(const std::string& value) {
    if (value == "file") return Kind::File;
    if (value == "text") return Kind::Text;
    return std::nullopt;
}

struct Entry {
    std::string   id;
    Kind          kind = Kind::File;
    std::string   displayName;      // what the user called it
    std::string   storedPath;       // relative to the storage root
    std::uint64_t sizeBytes = 0;
    TimePoint     createdAt;
    std::string   contentType;      // FILE only
};

// Public view; storedPath stays on the server.
inline void to_json(nlohmann::json& j, const Entry& e) {
    j = nlohmann::json{
        {"id", e.id},
        {"display_name", e.displayName},
        {"kind", toString(e.kind)},
        {"size_bytes", e.sizeBytes},
        {"created_at", formatIsoUtc(e.createdAt)},
    };
    if (e.kind == Kind::File) {
        j["content_type"] = e.contentType;
    }
}

} // namespace quickshare
