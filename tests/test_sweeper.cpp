// ═══════════════════════════════════════════════════════════════════
//  test_sweeper.cpp — Tests for the background expiry task
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <quickshare/console.h>
#include <quickshare/crypto.h>
#include <quickshare/sweeper.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

using namespace quickshare;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class SweeperTest : public ::testing::Test {
protected:
    fs::path root = fs::temp_directory_path() / ("quickshare_sweeper_" + crypto::randomHex(4));
    std::mutex clockMutex;
    TimePoint clock = fromEpochMillis(1700000000000);
    std::unique_ptr<ShareService> service;

    void SetUp() override {
        console::setLevel(console::Level::Off);
        ServiceOptions options;
        options.storageDir = root;
        options.retention = 1h;
        options.clock = [this] {
            std::lock_guard<std::mutex> lock(clockMutex);
            return clock;
        };
        service = std::make_unique<ShareService>(std::move(options));
    }

    void TearDown() override {
        service.reset();
        fs::remove_all(root);
        console::setLevel(console::Level::Info);
    }

    void advance(std::chrono::minutes by) {
        std::lock_guard<std::mutex> lock(clockMutex);
        clock += by;
    }
};

TEST_F(SweeperTest, RunOnceExpiresOldEntries) {
    ExpirySweeper sweeper(*service, 1h);
    service->storeFile("a.txt", "", "a");
    service->shareText("b");

    EXPECT_EQ(sweeper.runOnce().expired, 0u);
    advance(61min);
    EXPECT_EQ(sweeper.runOnce().expired, 2u);
    EXPECT_EQ(sweeper.totalExpired(), 2u);
    EXPECT_EQ(service->stats().totalEntries, 0u);
}

TEST_F(SweeperTest, BackgroundSweepsRunUntilStopped) {
    ExpirySweeper sweeper(*service, 20ms);
    service->storeFile("a.txt", "", "a");
    advance(2h);

    sweeper.start();
    EXPECT_TRUE(sweeper.running());
    for (int i = 0; i < 100 && service->stats().totalEntries > 0; i++) {
        std::this_thread::sleep_for(10ms);
    }
    sweeper.stop();

    EXPECT_FALSE(sweeper.running());
    EXPECT_EQ(service->stats().totalEntries, 0u);
    EXPECT_GE(sweeper.ticks(), 1u);
    EXPECT_EQ(sweeper.totalExpired(), 1u);
}

TEST_F(SweeperTest, EntriesCreatedAfterSweepAreKept) {
    ExpirySweeper sweeper(*service, 10ms);
    sweeper.start();
    auto entry = service->storeFile("new.txt", "", "fresh");
    std::this_thread::sleep_for(60ms);
    sweeper.stop();

    EXPECT_TRUE(service->metadata().find(entry.id));
}
