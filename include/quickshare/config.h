#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/config.h — Server configuration
// ═══════════════════════════════════════════════════════════════════
//
//  Sources, lowest precedence first:
//    defaults  →  QUICKSHARE_* environment  →  command-line flags
//
//  Usage:
//    auto config = Config::defaults();
//    config::applyEnvironment(config);
//    if (config::applyArguments(config, argc, argv) == config::Action::ShowHelp) ...
//    config.validate();                    // throws errors::ConfigError
//
// ═══════════════════════════════════════════════════════════════════

#include "tls.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace quickshare {

struct Config {
    std::string           host          = "0.0.0.0";
    int                   port          = 8000;
    double                cleanupHours  = 24;
    double                maxSizeMb     = 1024;       // 1 MB = 1,000,000 bytes
    std::filesystem::path storageDir    = "./shared_files";
    std::string           sslCert;
    std::string           sslKey;
    std::chrono::seconds  sweepInterval{300};
    int                   threads       = 2;
    int                   maxFilesPerUpload = 10;
    bool                  quiet         = false;

    // Defaults with threads sized to the machine
    static Config defaults();

    void validate() const;

    std::uint64_t maxSizeBytes() const;
    std::chrono::milliseconds retention() const;

    bool tlsEnabled() const { return !sslCert.empty() || !sslKey.empty(); }
    tls::Options tlsOptions() const { return {sslCert, sslKey, ""}; }
};

namespace config {

inline constexpr std::uint64_t kMultipartOverheadBytes = 64 * 1024;

// Upper bounds keep byte and millisecond arithmetic inside 64 bits.
inline constexpr double kMaxSizeMb        = 1000.0 * 1000.0;      // 1 TB per file
inline constexpr double kMaxCleanupHours  = 24.0 * 365 * 100;
inline constexpr int    kMaxFilesPerUpload = 1000;

enum class Action { Run, ShowHelp };

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment
std::optional<std::string> processEnv(const std::string& name);

void applyEnvironment(Config& config, const EnvLookup& lookup = processEnv);

// Throws errors::ConfigError on unknown flags or malformed values.
Action applyArguments(Config& config, int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace config

} // namespace quickshare
