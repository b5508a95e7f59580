// ═══════════════════════════════════════════════════════════════════
//  test_config.cpp — Tests for defaults, environment and flags
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <quickshare/config.h>
#include <quickshare/errors.h>

#include <limits>
#include <map>
#include <vector>

using namespace quickshare;

namespace {

config::EnvLookup fakeEnv(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

config::Action parseArgs(Config& config, std::vector<const char*> args) {
    args.insert(args.begin(), "quickshare");
    return config::applyArguments(config, static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(ConfigTest, Defaults) {
    auto config = Config::defaults();
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8000);
    EXPECT_DOUBLE_EQ(config.cleanupHours, 24);
    EXPECT_DOUBLE_EQ(config.maxSizeMb, 1024);
    EXPECT_GE(config.threads, 2);
    EXPECT_FALSE(config.tlsEnabled());
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, SizeUnitIsDecimalMegabytes) {
    Config config;
    config.maxSizeMb = 1;
    EXPECT_EQ(config.maxSizeBytes(), 1000000u);
    config.maxSizeMb = 0.002;
    EXPECT_EQ(config.maxSizeBytes(), 2000u);
}

TEST(ConfigTest, RetentionFromFractionalHours) {
    Config config;
    config.cleanupHours = 0.5;
    EXPECT_EQ(config.retention(), std::chrono::minutes(30));
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
    auto config = Config::defaults();
    config::applyEnvironment(config, fakeEnv({
        {"QUICKSHARE_PORT", "9100"},
        {"QUICKSHARE_CLEANUP_HOURS", "2.5"},
        {"QUICKSHARE_MAX_SIZE_MB", "10"},
        {"QUICKSHARE_STORAGE_DIR", "/tmp/qs"},
        {"QUICKSHARE_HOST", ""},
    }));
    EXPECT_EQ(config.port, 9100);
    EXPECT_DOUBLE_EQ(config.cleanupHours, 2.5);
    EXPECT_DOUBLE_EQ(config.maxSizeMb, 10);
    EXPECT_EQ(config.storageDir, "/tmp/qs");
    EXPECT_EQ(config.host, "0.0.0.0");
}

TEST(ConfigTest, FlagsOverrideEnvironment) {
    auto config = Config::defaults();
    config::applyEnvironment(config, fakeEnv({{"QUICKSHARE_PORT", "9100"}}));
    EXPECT_EQ(parseArgs(config, {"--port", "9200", "--max-size=5", "-q"}), config::Action::Run);
    EXPECT_EQ(config.port, 9200);
    EXPECT_DOUBLE_EQ(config.maxSizeMb, 5);
    EXPECT_TRUE(config.quiet);
}

TEST(ConfigTest, AllFlagsParse) {
    auto config = Config::defaults();
    parseArgs(config, {"--host", "127.0.0.1", "--cleanup-hours", "1", "--storage-dir", "data",
                       "--ssl-cert", "c.pem", "--ssl-key", "k.pem",
                       "--sweep-interval", "60", "--threads", "4"});
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_DOUBLE_EQ(config.cleanupHours, 1);
    EXPECT_EQ(config.storageDir, "data");
    EXPECT_EQ(config.sweepInterval, std::chrono::seconds(60));
    EXPECT_EQ(config.threads, 4);
    EXPECT_TRUE(config.tlsEnabled());
    EXPECT_EQ(config.tlsOptions().certFile, "c.pem");
}

TEST(ConfigTest, HelpFlag) {
    auto config = Config::defaults();
    EXPECT_EQ(parseArgs(config, {"--help"}), config::Action::ShowHelp);
    EXPECT_NE(config::usage("quickshare").find("--max-size"), std::string::npos);
}

TEST(ConfigTest, UnknownFlagThrows) {
    auto config = Config::defaults();
    EXPECT_THROW(parseArgs(config, {"--bogus", "1"}), errors::ConfigError);
}

TEST(ConfigTest, MissingValueThrows) {
    auto config = Config::defaults();
    EXPECT_THROW(parseArgs(config, {"--port"}), errors::ConfigError);
}

TEST(ConfigTest, MalformedNumbersThrow) {
    auto config = Config::defaults();
    EXPECT_THROW(parseArgs(config, {"--port", "80x"}), errors::ConfigError);
    EXPECT_THROW(parseArgs(config, {"--max-size", "lots"}), errors::ConfigError);
    EXPECT_THROW(config::applyEnvironment(config, fakeEnv({{"QUICKSHARE_PORT", "abc"}})),
                 errors::ConfigError);
}

TEST(ConfigTest, ValidateRejectsBadValues) {
    auto base = Config::defaults();

    auto c = base; c.port = 0;
    EXPECT_THROW(c.validate(), errors::ConfigError);
    c = base; c.port = 70000;
    EXPECT_THROW(c.validate(), errors::ConfigError);
    c = base; c.cleanupHours = 0;
    EXPECT_THROW(c.validate(), errors::ConfigError);
    c = base; c.maxSizeMb = -1;
    EXPECT_THROW(c.validate(), errors::ConfigError);
    c = base; c.maxSizeMb = 1e-9;
    EXPECT_THROW(c.validate(), errors::ConfigError);
    c = base; c.threads = 0;
    EXPECT_THROW(c.validate(), errors::ConfigError);
}

TEST(ConfigTest, ValidateRejectsValuesThatOverflow) {
    auto base = Config::defaults();

    auto c = base; c.maxSizeMb = 1e13;
    EXPECT_THROW(c.validate(), errors::ConfigError);
    c = base; c.maxSizeMb = std::numeric_limits<double>::infinity();
    EXPECT_THROW(c.validate(), errors::ConfigError);
    c = base; c.cleanupHours = 1e18;
    EXPECT_THROW(c.validate(), errors::ConfigError);
    c = base; c.maxFilesPerUpload = 1000000;
    EXPECT_THROW(c.validate(), errors::ConfigError);

    c = base;
    c.maxSizeMb = config::kMaxSizeMb;
    c.maxFilesPerUpload = config::kMaxFilesPerUpload;
    c.cleanupHours = config::kMaxCleanupHours;
    EXPECT_NO_THROW(c.validate());
    EXPECT_EQ(c.maxSizeBytes(), 1000ull * 1000 * 1000 * 1000);
    EXPECT_GT(c.retention().count(), 0);
}

TEST(ConfigTest, HugeMaxSizeFlagFailsValidation) {
    auto config = Config::defaults();
    parseArgs(config, {"--max-size", "1e13"});
    EXPECT_THROW(config.validate(), errors::ConfigError);
}

TEST(ConfigTest, HalfTlsPairIsRejected) {
    auto config = Config::defaults();
    config.sslCert = "cert.pem";
    EXPECT_THROW(config.validate(), errors::ConfigError);
}
