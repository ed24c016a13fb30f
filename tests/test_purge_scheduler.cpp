#include <gtest/gtest.h>
#include "purge_scheduler.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace cloudless;

class PurgeSchedulerTest : public ::testing::Test {
protected:
    void create_scheduler(std::chrono::milliseconds grace) {
        scheduler_.reset(new DeferredPurgeScheduler(grace, [this](const std::string& room_id, uint64_t epoch) {
            std::lock_guard<std::mutex> lock(mutex_);
            fired_.emplace_back(room_id, epoch);
        }));
        ASSERT_TRUE(scheduler_->start());
    }

    void TearDown() override {
        if (scheduler_) {
            scheduler_->stop();
        }
    }

    std::vector<std::pair<std::string, uint64_t>> fired() {
        std::lock_guard<std::mutex> lock(mutex_);
        return fired_;
    }

    bool wait_for_fired(size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (fired().size() >= count) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return fired().size() >= count;
    }

    std::unique_ptr<DeferredPurgeScheduler> scheduler_;
    std::mutex mutex_;
    std::vector<std::pair<std::string, uint64_t>> fired_;
};

TEST_F(PurgeSchedulerTest, FiresAfterGracePeriod) {
    create_scheduler(std::chrono::milliseconds(50));
    EXPECT_EQ(scheduler_->get_grace_period(), std::chrono::milliseconds(50));
    auto scheduled_at = std::chrono::steady_clock::now();
    scheduler_->schedule("r1", 7);
    EXPECT_TRUE(scheduler_->has_pending("r1"));

    ASSERT_TRUE(wait_for_fired(1));
    EXPECT_GE(std::chrono::steady_clock::now() - scheduled_at, std::chrono::milliseconds(50));
    auto events = fired();
    EXPECT_EQ(events[0].first, "r1");
    EXPECT_EQ(events[0].second, 7u);
    EXPECT_FALSE(scheduler_->has_pending("r1"));
}

TEST_F(PurgeSchedulerTest, CancelPreventsFiring) {
    create_scheduler(std::chrono::milliseconds(100));
    scheduler_->schedule("r1", 1);
    EXPECT_TRUE(scheduler_->cancel("r1"));
    EXPECT_FALSE(scheduler_->cancel("r1"));

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    EXPECT_TRUE(fired().empty());
}

TEST_F(PurgeSchedulerTest, RescheduleReplacesPendingEntry) {
    create_scheduler(std::chrono::milliseconds(80));
    scheduler_->schedule("r1", 1);
    scheduler_->schedule("r1", 2);
    EXPECT_EQ(scheduler_->get_pending_count(), 1);

    ASSERT_TRUE(wait_for_fired(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    auto events = fired();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].second, 2u);
}

TEST_F(PurgeSchedulerTest, LateOlderEpochDoesNotReplaceNewer) {
    create_scheduler(std::chrono::milliseconds(50));
    scheduler_->schedule("r1", 9);
    // Empty-room notification from an earlier disconnect arriving late
    scheduler_->schedule("r1", 4);
    EXPECT_EQ(scheduler_->get_pending_count(), 1);

    ASSERT_TRUE(wait_for_fired(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    auto events = fired();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].first, "r1");
    EXPECT_EQ(events[0].second, 9u);
}

TEST_F(PurgeSchedulerTest, IndependentRooms) {
    create_scheduler(std::chrono::milliseconds(30));
    scheduler_->schedule("r1", 1);
    scheduler_->schedule("r2", 2);
    scheduler_->schedule("r3", 3);
    EXPECT_TRUE(scheduler_->cancel("r2"));

    ASSERT_TRUE(wait_for_fired(2));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto events = fired();
    ASSERT_EQ(events.size(), 2);
    for (const auto& event : events) {
        EXPECT_NE(event.first, "r2");
    }
}

TEST_F(PurgeSchedulerTest, HandlerExceptionDoesNotStopWorker) {
    std::atomic<int> calls(0);
    scheduler_.reset(new DeferredPurgeScheduler(std::chrono::milliseconds(10),
        [&calls](const std::string& room_id, uint64_t) {
            calls++;
            if (room_id == "bad") {
                throw std::runtime_error("storage down");
            }
        }));
    ASSERT_TRUE(scheduler_->start());

    scheduler_->schedule("bad", 1);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (calls.load() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    scheduler_->schedule("good", 2);
    while (calls.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(PurgeSchedulerTest, StopDropsPendingPurges) {
    create_scheduler(std::chrono::seconds(30));
    scheduler_->schedule("r1", 1);
    scheduler_->stop();
    EXPECT_FALSE(scheduler_->is_running());
    EXPECT_EQ(scheduler_->get_pending_count(), 0);
    EXPECT_TRUE(fired().empty());

    // Restartable
    ASSERT_TRUE(scheduler_->start());
    EXPECT_TRUE(scheduler_->is_running());
}
