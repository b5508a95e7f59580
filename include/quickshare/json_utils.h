#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/json_utils.h — JSON concepts and timestamp encoding
// ═══════════════════════════════════════════════════════════════════
//  Uses nlohmann/json + C++20 Concepts so res.json() accepts any
//  type nlohmann can convert.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

namespace quickshare {

// ─────────────────────────────────────────────
//  Macro: QUICKSHARE_SERIALIZE
//  Makes a plain struct serializable to JSON.
// ─────────────────────────────────────────────
#define QUICKSHARE_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  Concept: JsonSerializable
//  Any type T that nlohmann::json can construct from.
// ─────────────────────────────────────────────
template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

// ─────────────────────────────────────────────
//  ISO-8601 UTC timestamps ("2026-01-02T03:04:05Z")
// ─────────────────────────────────────────────
using TimePoint = std::chrono::system_clock::time_point;

inline std::string formatIsoUtc(TimePoint tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

inline std::optional<TimePoint> parseIsoUtc(const std::string& text) {
    std::tm tm{};
    char zone = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%c",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &zone);
    if (n != 7 || zone != 'Z') return std::nullopt;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

// Milliseconds since the Unix epoch; the persisted form of timestamps.
inline std::int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

inline TimePoint fromEpochMillis(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(ms)));
}

} // namespace quickshare
