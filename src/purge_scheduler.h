#pragma once

#include "threadmanager.h"
#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>

namespace cloudless {

/**
 * Handler invoked when a room's grace period runs out.
 * @param room_id Room whose purge is due
 * @param epoch Room epoch captured when the purge was scheduled
 */
using PurgeHandler = std::function<void(const std::string& room_id, uint64_t epoch)>;

/**
 * Cancellable one-shot timers keyed by room id.
 *
 * Scheduling a room that already has a pending purge replaces it, so at most one
 * purge per room is ever pending. A single worker thread fires due entries in
 * deadline order; the handler runs without any scheduler lock held.
 */
class DeferredPurgeScheduler : public ThreadManager {
public:
    DeferredPurgeScheduler(std::chrono::milliseconds grace_period, PurgeHandler handler);
    ~DeferredPurgeScheduler();

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    /**
     * Arm (or re-arm) the purge timer of a room
     */
    void schedule(const std::string& room_id, uint64_t epoch);

    /**
     * Disarm a room's timer
     * @return true if a purge was pending
     */
    bool cancel(const std::string& room_id);

    bool has_pending(const std::string& room_id);
    size_t get_pending_count();

    std::chrono::milliseconds get_grace_period() const { return grace_period_; }

private:
    struct PendingPurge {
        uint64_t epoch;
        std::chrono::steady_clock::time_point deadline;
    };

    std::chrono::milliseconds grace_period_;
    PurgeHandler handler_;
    std::atomic<bool> running_;

    // Guarded by shutdown_mutex_; the worker sleeps on shutdown_cv_
    std::unordered_map<std::string, PendingPurge> pending_;

    void worker_loop();
};

} // namespace cloudless
