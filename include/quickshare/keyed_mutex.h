#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/keyed_mutex.h — One mutex per key, created on demand
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    KeyedMutex locks;
//    {
//        auto guard = locks.lock(entryId);
//        ...                         // exclusive for this id only
//    }
//
//  Slots are reference-counted and dropped when the last holder or
//  waiter leaves, so the table only holds ids that are in use.
// ═══════════════════════════════════════════════════════════════════

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace quickshare {

class KeyedMutex {
    struct Slot {
        std::mutex mutex;
        std::size_t users = 0;
    };

public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key, std::shared_ptr<Slot> slot)
            : owner_(&owner), key_(std::move(key)), slot_(std::move(slot)) {
            slot_->mutex.lock();
        }

        ~Guard() { unlock(); }

        Guard(Guard&& other) noexcept
            : owner_(other.owner_), key_(std::move(other.key_)), slot_(std::move(other.slot_)) {
            other.owner_ = nullptr;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        void unlock() {
            if (!owner_ || !slot_) return;
            slot_->mutex.unlock();
            owner_->release(key_);
            slot_.reset();
            owner_ = nullptr;
        }

        const std::string& key() const { return key_; }

    private:
        KeyedMutex* owner_;
        std::string key_;
        std::shared_ptr<Slot> slot_;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    Guard lock(const std::string& key) {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard<std::mutex> lock(tableMutex_);
            auto& entry = slots_[key];
            if (!entry) entry = std::make_shared<Slot>();
            ++entry->users;
            slot = entry;
        }
        return Guard(*this, key, std::move(slot));
    }

    // Keys currently held or waited on
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(tableMutex_);
        return slots_.size();
    }

private:
    mutable std::mutex tableMutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

    void release(const std::string& key) {
        std::lock_guard<std::mutex> lock(tableMutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) return;
        if (--it->second->users == 0) {
            slots_.erase(it);
        }
    }
};

} // namespace quickshare
