#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/sweeper.h — Background expiry of old entries
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    ExpirySweeper sweeper(service, config.sweepInterval);
//    sweeper.start();
//    ...
//    sweeper.stop();
//
// ═══════════════════════════════════════════════════════════════════

#include "scheduler.h"
#include "share_service.h"

#include <atomic>
#include <chrono>

namespace quickshare {

class ExpirySweeper {
public:
    ExpirySweeper(ShareService& service, std::chrono::milliseconds interval);

    void start();
    void stop();
    bool running() const { return task_.running(); }

    // One sweep on the calling thread (also used by POST /cleanup).
    SweepReport runOnce();

    std::size_t ticks() const { return task_.runs(); }
    std::size_t totalExpired() const { return totalExpired_.load(); }

private:
    ShareService& service_;
    std::atomic<std::size_t> totalExpired_{0};
    scheduler::PeriodicTask task_;
};

} // namespace quickshare
