#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/crypto.h — CSPRNG tokens for entry ids
// ═══════════════════════════════════════════════════════════════════

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include <openssl/rand.h>

namespace quickshare::crypto {

inline std::string toHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

// ═══════════════════════════════════════════
//  Random bytes (OpenSSL RAND_bytes)
// ═══════════════════════════════════════════

inline std::string randomBytes(std::size_t length) {
    std::string buf(length, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(buf.data()),
                   static_cast<int>(length)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return buf;
}

// ── Lowercase hex token: 2 * length characters ──
inline std::string randomHex(std::size_t length) {
    auto bytes = randomBytes(length);
    return toHex(reinterpret_cast<const unsigned char*>(bytes.data()), length);
}

// ── True if `token` could have come from randomHex(length) ──
inline bool isHexToken(const std::string& token, std::size_t length) {
    if (token.size() != length * 2) return false;
    for (char c : token) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        if (std::isupper(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace quickshare::crypto
