// ═══════════════════════════════════════════════════════════════════
//  config.cpp — Environment and command-line configuration
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/config.h"
#include "quickshare/errors.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <thread>
#include <vector>

namespace quickshare {

namespace {

double parseNumber(const std::string& name, const std::string& value) {
    std::size_t used = 0;
    double result = 0;
    try {
        result = std::stod(value, &used);
    } catch (const std::exception&) {
        throw errors::ConfigError("Invalid value for " + name + ": '" + value + "'");
    }
    if (used != value.size() || !std::isfinite(result)) {
        throw errors::ConfigError("Invalid value for " + name + ": '" + value + "'");
    }
    return result;
}

int parseInteger(const std::string& name, const std::string& value) {
    std::size_t used = 0;
    long result = 0;
    try {
        result = std::stol(value, &used);
    } catch (const std::exception&) {
        throw errors::ConfigError("Invalid value for " + name + ": '" + value + "'");
    }
    if (used != value.size() || result < INT_MIN || result > INT_MAX) {
        throw errors::ConfigError("Invalid value for " + name + ": '" + value + "'");
    }
    return static_cast<int>(result);
}

// One setting, addressable by flag and by environment variable.
struct Setting {
    const char* flag;
    const char* env;
    std::function<void(Config&, const std::string&)> apply;
};

const std::vector<Setting>& settings() {
    static const std::vector<Setting> table = {
        {"--port", "QUICKSHARE_PORT",
         [](Config& c, const std::string& v) { c.port = parseInteger("port", v); }},
        {"--host", "QUICKSHARE_HOST",
         [](Config& c, const std::string& v) { c.host = v; }},
        {"--cleanup-hours", "QUICKSHARE_CLEANUP_HOURS",
         [](Config& c, const std::string& v) { c.cleanupHours = parseNumber("cleanup-hours", v); }},
        {"--max-size", "QUICKSHARE_MAX_SIZE_MB",
         [](Config& c, const std::string& v) { c.maxSizeMb = parseNumber("max-size", v); }},
        {"--storage-dir", "QUICKSHARE_STORAGE_DIR",
         [](Config& c, const std::string& v) { c.storageDir = v; }},
        {"--ssl-cert", "QUICKSHARE_SSL_CERT",
         [](Config& c, const std::string& v) { c.sslCert = v; }},
        {"--ssl-key", "QUICKSHARE_SSL_KEY",
         [](Config& c, const std::string& v) { c.sslKey = v; }},
        {"--sweep-interval", "QUICKSHARE_SWEEP_INTERVAL",
         [](Config& c, const std::string& v) {
             c.sweepInterval = std::chrono::seconds(parseInteger("sweep-interval", v));
         }},
        {"--threads", "QUICKSHARE_THREADS",
         [](Config& c, const std::string& v) { c.threads = parseInteger("threads", v); }},
    };
    return table;
}

} // namespace

Config Config::defaults() {
    Config config;
    config.threads = std::max(2, static_cast<int>(std::thread::hardware_concurrency()));
    return config;
}

void Config::validate() const {
    if (port < 1 || port > 65535) {
        throw errors::ConfigError("Port must be between 1 and 65535, got " + std::to_string(port));
    }
    if (host.empty()) {
        throw errors::ConfigError("Host must not be empty");
    }
    if (!(cleanupHours > 0)) {
        throw errors::ConfigError("cleanup-hours must be positive");
    }
    if (cleanupHours > config::kMaxCleanupHours) {
        throw errors::ConfigError("cleanup-hours must be at most " +
                                  std::to_string(static_cast<long long>(config::kMaxCleanupHours)));
    }
    if (!(maxSizeMb > 0)) {
        throw errors::ConfigError("max-size must be positive");
    }
    if (maxSizeMb > config::kMaxSizeMb) {
        throw errors::ConfigError("max-size must be at most " +
                                  std::to_string(static_cast<long long>(config::kMaxSizeMb)) + " MB");
    }
    if (maxSizeBytes() == 0) {
        throw errors::ConfigError("max-size is smaller than one byte");
    }
    if (storageDir.empty()) {
        throw errors::ConfigError("storage-dir must not be empty");
    }
    if (sweepInterval.count() < 1) {
        throw errors::ConfigError("sweep-interval must be at least 1 second");
    }
    if (threads < 1) {
        throw errors::ConfigError("threads must be at least 1");
    }
    if (maxFilesPerUpload < 1 || maxFilesPerUpload > config::kMaxFilesPerUpload) {
        throw errors::ConfigError("max files per upload must be between 1 and " +
                                  std::to_string(config::kMaxFilesPerUpload));
    }
    if (sslCert.empty() != sslKey.empty()) {
        throw errors::ConfigError("Both --ssl-cert and --ssl-key are required for HTTPS");
    }
}

std::uint64_t Config::maxSizeBytes() const {
    return static_cast<std::uint64_t>(std::llround(maxSizeMb * 1000.0 * 1000.0));
}

std::chrono::milliseconds Config::retention() const {
    return std::chrono::milliseconds(
        static_cast<std::int64_t>(std::llround(cleanupHours * 3600.0 * 1000.0)));
}

namespace config {

std::optional<std::string> processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

void applyEnvironment(Config& config, const EnvLookup& lookup) {
    for (auto& setting : settings()) {
        auto value = lookup(setting.env);
        if (value && !value->empty()) {
            setting.apply(config, *value);
        }
    }
}

Action applyArguments(Config& config, int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return Action::ShowHelp;
        }
        if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
            continue;
        }

        // Accept both "--port 9000" and "--port=9000"
        std::string name = arg;
        std::optional<std::string> value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        auto it = std::find_if(settings().begin(), settings().end(),
                               [&](const Setting& s) { return name == s.flag; });
        if (it == settings().end()) {
            throw errors::ConfigError("Unknown argument: " + arg);
        }
        if (!value) {
            if (i + 1 >= argc) {
                throw errors::ConfigError("Missing value for " + name);
            }
            value = argv[++i];
        }
        it->apply(config, *value);
    }
    return Action::Run;
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "QuickShare - LAN file and text sharing server\n"
        << "Usage: " << program << " [options]\n\n"
        << "  --port <N>             Port to listen on (default 8000)\n"
        << "  --host <ADDR>          Address to bind (default 0.0.0.0)\n"
        << "  --cleanup-hours <H>    Hours before shared items expire (default 24)\n"
        << "  --max-size <MB>        Max size per file or text in MB (default 1024)\n"
        << "  --storage-dir <DIR>    Storage root (default ./shared_files)\n"
        << "  --ssl-cert <FILE>      PEM certificate, enables HTTPS with --ssl-key\n"
        << "  --ssl-key <FILE>       PEM private key\n"
        << "  --sweep-interval <S>   Seconds between expiry sweeps (default 300)\n"
        << "  --threads <N>          I/O threads (default: CPU count, min 2)\n"
        << "  --quiet                Only log warnings and errors\n"
        << "  --help                 Show this help\n\n"
        << "Every option can also be set through QUICKSHARE_<NAME> environment\n"
        << "variables (QUICKSHARE_PORT, QUICKSHARE_MAX_SIZE_MB, ...).\n";
    return oss.str();
}

} // namespace config

} // namespace quickshare
