#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <string>

namespace cloudless {

/**
 * ThreadManager provides thread management capabilities for services that run
 * background loops (reaper sweeps, deferred purges, the realtime listener) and
 * need a coordinated, prompt shutdown.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Add a managed thread with a descriptive name
     * @param t Thread to be managed (moved)
     * @param name Descriptive name for logging purposes
     */
    void add_managed_thread(std::thread&& t, const std::string& name);

    /**
     * Signal all threads to shutdown and wake every waiter
     */
    void shutdown_all_threads();

    /**
     * Join all active threads and wait for them to finish
     */
    void join_all_active_threads();

    /**
     * Clear the shutdown flag so the manager can start threads again
     */
    void reset_shutdown();

    size_t get_active_thread_count() const;

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

protected:
    /**
     * Sleep for up to `duration`, returning early on shutdown.
     * @return false if shutdown was requested while waiting
     */
    template <typename Rep, typename Period>
    bool wait_for_shutdown_or(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock<std::mutex> lock(shutdown_mutex_);
        shutdown_cv_.wait_for(lock, duration, [this] { return shutdown_requested_.load(); });
        return !shutdown_requested_.load();
    }

    /**
     * Notify all waiting threads to wake up (typically for shutdown)
     */
    void notify_shutdown();

    std::condition_variable shutdown_cv_;
    std::mutex shutdown_mutex_;
    std::atomic<bool> shutdown_requested_;

private:
    std::vector<std::thread> active_threads_;
    mutable std::mutex active_threads_mutex_;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace cloudless
