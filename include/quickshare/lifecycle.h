#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/lifecycle.h — Graceful shutdown on SIGINT/SIGTERM
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    lifecycle::Shutdown shutdown;
//    shutdown.onShutdown([&](int) { sweeper.stop(); });
//    shutdown.attach(app);          // before app.listen(...)
//
//  Signals are delivered through the server's event loop, so hooks
//  run on an I/O thread and may take locks. The server is closed
//  after the last hook returns.
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <vector>

namespace quickshare::lifecycle {

class Shutdown {
public:
    // ── Register a shutdown handler (run in registration order) ──
    void onShutdown(std::function<void(int)> handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.push_back(std::move(handler));
    }

    // ── Route the server's SIGINT/SIGTERM through trigger() ──
    void attach(http::Server& server) {
        server.handleSignals([this](int sig) { trigger(sig); });
    }

    void trigger(int sig) {
        if (shuttingDown_.exchange(true)) return;
        console::info("Received", signalName(sig), "- shutting down gracefully...");
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& handler : handlers_) {
            try {
                handler(sig);
            } catch (const std::exception& e) {
                console::error("Shutdown hook failed:", e.what());
            }
        }
    }

    bool isShuttingDown() const { return shuttingDown_.load(); }

private:
    std::mutex mutex_;
    std::vector<std::function<void(int)>> handlers_;
    std::atomic<bool> shuttingDown_{false};

    static const char* signalName(int sig) {
        switch (sig) {
            case SIGINT:  return "SIGINT";
            case SIGTERM: return "SIGTERM";
            default:      return "signal";
        }
    }
};

} // namespace quickshare::lifecycle
