#include "purge_scheduler.h"
#include "cloudless_log_macros.h"
#include <vector>

namespace cloudless {

DeferredPurgeScheduler::DeferredPurgeScheduler(std::chrono::milliseconds grace_period, PurgeHandler handler)
    : grace_period_(grace_period), handler_(std::move(handler)), running_(false) {
}

DeferredPurgeScheduler::~DeferredPurgeScheduler() {
    stop();
}

bool DeferredPurgeScheduler::start() {
    if (running_.exchange(true)) {
        return true;
    }
    reset_shutdown();
    add_managed_thread(std::thread(&DeferredPurgeScheduler::worker_loop, this), "purge-scheduler");
    LOG_REAPER_INFO("Deferred purge scheduler started (grace period " << grace_period_.count() << " ms)");
    return true;
}

void DeferredPurgeScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    shutdown_all_threads();
    join_all_active_threads();

    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (!pending_.empty()) {
        LOG_REAPER_INFO("Dropping " << pending_.size() << " pending room purges on shutdown");
        pending_.clear();
    }
}

void DeferredPurgeScheduler::schedule(const std::string& room_id, uint64_t epoch) {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        auto it = pending_.find(room_id);
        if (it != pending_.end() && it->second.epoch > epoch) {
            // An empty-room notification can arrive after a newer one; epochs only move forward
            LOG_REAPER_DEBUG("Keeping purge of room " << room_id << " at epoch " << it->second.epoch
                             << " over stale epoch " << epoch);
            return;
        }
        PendingPurge entry;
        entry.epoch = epoch;
        entry.deadline = std::chrono::steady_clock::now() + grace_period_;
        pending_[room_id] = entry;
    }
    notify_shutdown();
    LOG_REAPER_DEBUG("Scheduled purge of room " << room_id << " at epoch " << epoch
                     << " in " << grace_period_.count() << " ms");
}

bool DeferredPurgeScheduler::cancel(const std::string& room_id) {
    bool removed;
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        removed = pending_.erase(room_id) > 0;
    }
    if (removed) {
        LOG_REAPER_DEBUG("Cancelled pending purge of room " << room_id);
    }
    return removed;
}

bool DeferredPurgeScheduler::has_pending(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    return pending_.find(room_id) != pending_.end();
}

size_t DeferredPurgeScheduler::get_pending_count() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    return pending_.size();
}

void DeferredPurgeScheduler::worker_loop() {
    LOG_REAPER_DEBUG("Purge scheduler worker running");

    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    while (!shutdown_requested_.load()) {
        if (pending_.empty()) {
            shutdown_cv_.wait(lock, [this] { return shutdown_requested_.load() || !pending_.empty(); });
            continue;
        }

        auto earliest = pending_.begin()->second.deadline;
        for (const auto& entry : pending_) {
            if (entry.second.deadline < earliest) {
                earliest = entry.second.deadline;
            }
        }

        if (std::chrono::steady_clock::now() < earliest) {
            // Woken early by a schedule/cancel or shutdown; recompute either way
            shutdown_cv_.wait_until(lock, earliest);
            continue;
        }

        std::vector<std::pair<std::string, uint64_t>> due;
        auto now = std::chrono::steady_clock::now();
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                due.emplace_back(it->first, it->second.epoch);
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }

        lock.unlock();
        for (const auto& item : due) {
            LOG_REAPER_INFO("Grace period over for room " << item.first << " (epoch " << item.second << ")");
            try {
                handler_(item.first, item.second);
            } catch (const std::exception& e) {
                LOG_REAPER_ERROR("Purge of room " << item.first << " failed: " << e.what());
            }
        }
        lock.lock();
    }

    LOG_REAPER_DEBUG("Purge scheduler worker exiting");
}

} // namespace cloudless
