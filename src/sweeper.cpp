// ═══════════════════════════════════════════════════════════════════
//  sweeper.cpp — Periodic expiry task
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/sweeper.h"
#include "quickshare/console.h"

namespace quickshare {

ExpirySweeper::ExpirySweeper(ShareService& service, std::chrono::milliseconds interval)
    : service_(service)
    , task_([this] { runOnce(); }, interval)
{}

void ExpirySweeper::start() {
    console::debug("Expiry sweeper every",
                   std::chrono::duration_cast<std::chrono::seconds>(task_.interval()).count(), "s");
    task_.start();
}

void ExpirySweeper::stop() {
    task_.stop();
}

SweepReport ExpirySweeper::runOnce() {
    auto report = service_.sweepExpired();
    totalExpired_ += report.expired;
    if (report.failed > 0) {
        console::warn("Sweep left", report.failed, "expired entr(ies) for the next run");
    }
    return report;
}

} // namespace quickshare
