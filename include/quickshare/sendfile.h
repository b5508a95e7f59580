#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/sendfile.h — Content types and attachment downloads
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace quickshare::sendfile {

namespace detail {

inline std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Quoted-string safe: printable ASCII without '"' and '\', and only
// the last path component ("../../etc/passwd" -> "passwd").
inline std::string asciiFallback(const std::string& name) {
    auto slash = name.find_last_of("/\\");
    const std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

    std::string out;
    out.reserve(base.size());
    for (unsigned char c : base) {
        if (c >= 0x20 && c < 0x7f && c != '"' && c != '\\') {
            out += static_cast<char>(c);
        } else {
            out += '_';
        }
    }
    if (out.find_first_not_of('.') == std::string::npos) return "download";
    return out;
}

// RFC 5987 attr-char encoding for filename*.
inline std::string rfc5987Encode(const std::string& value) {
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '!' || c == '#' || c == '$' || c == '&' ||
            c == '+' || c == '-' || c == '.' || c == '^' || c == '_' ||
            c == '`' || c == '|' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace detail

// ── Best-effort MIME type from a file name's extension ──
inline std::string getMimeType(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> mimeTypes = {
        {".html","text/html"}, {".htm","text/html"}, {".css","text/css"},
        {".js","application/javascript"}, {".json","application/json"},
        {".xml","text/xml"}, {".txt","text/plain"}, {".csv","text/csv"},
        {".md","text/markdown"},
        {".png","image/png"}, {".jpg","image/jpeg"}, {".jpeg","image/jpeg"},
        {".gif","image/gif"}, {".svg","image/svg+xml"}, {".ico","image/x-icon"},
        {".webp","image/webp"}, {".bmp","image/bmp"},
        {".mp3","audio/mpeg"}, {".wav","audio/wav"}, {".ogg","audio/ogg"},
        {".mp4","video/mp4"}, {".webm","video/webm"}, {".avi","video/x-msvideo"},
        {".pdf","application/pdf"}, {".zip","application/zip"},
        {".gz","application/gzip"}, {".tar","application/x-tar"},
        {".7z","application/x-7z-compressed"},
        {".doc","application/msword"},
        {".docx","application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xlsx","application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    };
    auto ext = detail::toLower(std::filesystem::path(filename).extension().string());
    auto it = mimeTypes.find(ext);
    return it != mimeTypes.end() ? it->second : "application/octet-stream";
}

// ── Content-Disposition for a download of `displayName` ──
//    attachment; filename="<ascii>"; filename*=UTF-8''<pct-encoded>
inline std::string contentDisposition(const std::string& displayName) {
    return "attachment; filename=\"" + detail::asciiFallback(displayName) +
           "\"; filename*=UTF-8''" + detail::rfc5987Encode(displayName);
}

// ── Trigger browser download of an open payload ──
inline void download(http::Response& res, http::FileStream file,
                     const std::string& displayName, const std::string& contentType) {
    res.set("Content-Type", contentType.empty() ? getMimeType(displayName) : contentType);
    res.set("Content-Disposition", contentDisposition(displayName));
    res.sendFile(std::move(file));
}

} // namespace quickshare::sendfile
