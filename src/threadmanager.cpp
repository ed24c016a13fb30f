#include "threadmanager.h"

#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace cloudless {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
}

ThreadManager::~ThreadManager() {
    shutdown_all_threads();
    join_all_active_threads();
}

void ThreadManager::add_managed_thread(std::thread&& t, const std::string& name) {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);

    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Refusing new thread during shutdown: " << name);
        // The thread observes the shutdown flag and exits on its own
        if (t.joinable()) {
            t.join();
        }
        return;
    }

    active_threads_.emplace_back(std::move(t));
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
}

void ThreadManager::shutdown_all_threads() {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        shutdown_requested_.store(true);
    }
    notify_shutdown();
}

void ThreadManager::join_all_active_threads() {
    std::vector<std::thread> threads_to_join;
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            return;
        }
        LOG_THREAD_DEBUG("Waiting for " << active_threads_.size() << " managed threads to finish");
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    for (auto& t : threads_to_join) {
        if (!t.joinable()) {
            continue;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            // A managed thread tearing its own owner down cannot join itself
            t.detach();
            continue;
        }
        try {
            t.join();
        } catch (const std::exception& e) {
            LOG_THREAD_ERROR("Exception while joining thread: " << e.what());
        }
    }

    LOG_THREAD_DEBUG("All managed threads have been cleaned up");
}

void ThreadManager::reset_shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    shutdown_requested_.store(false);
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

void ThreadManager::notify_shutdown() {
    shutdown_cv_.notify_all();
}

} // namespace cloudless
