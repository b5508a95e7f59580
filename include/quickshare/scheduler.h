#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/scheduler.h — Cancellable periodic tasks
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    scheduler::PeriodicTask task([&] { sweep(); }, std::chrono::minutes(5));
//    task.start();
//    ...
//    task.stop();      // wakes the worker and joins it
//
//  The first run happens one interval after start(). A callback that
//  throws is logged and the schedule continues.
// ═══════════════════════════════════════════════════════════════════

#include "console.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace quickshare::scheduler {

class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(Callback callback, std::chrono::milliseconds interval)
        : callback_(std::move(callback)), interval_(interval) {}

    ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (worker_.joinable()) return;
        cancelled_ = false;
        worker_ = std::thread([this] { loop(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        wake_.notify_all();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

    bool running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return worker_.joinable() && !cancelled_;
    }

    std::chrono::milliseconds interval() const { return interval_; }

    // Number of completed runs (successful or not)
    std::size_t runs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return runs_;
    }

private:
    Callback callback_;
    std::chrono::milliseconds interval_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::thread worker_;
    bool cancelled_ = false;
    std::size_t runs_ = 0;

    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cancelled_) {
            if (wake_.wait_for(lock, interval_, [this] { return cancelled_; })) break;

            lock.unlock();
            try {
                callback_();
            } catch (const std::exception& e) {
                console::error("Periodic task failed:", e.what());
            }
            lock.lock();
            ++runs_;
        }
    }
};

} // namespace quickshare::scheduler
