#pragma once

/**
 * @file reaper.h
 * @brief Periodic expiry sweep and empty-room purge
 */

#include "blob_store.h"
#include "record_store.h"
#include "threadmanager.h"
#include "transfer_service.h"
#include "types.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace cloudless {

struct ReaperSettings {
    std::chrono::seconds sweep_interval;
    std::chrono::seconds completed_retention;   // How long COMPLETED transfers keep their bytes

    ReaperSettings()
        : sweep_interval(3600),
          completed_retention(24 * 3600) {}
};

struct SweepReport {
    size_t transfers_expired = 0;
    size_t expire_failures = 0;
    size_t completed_released = 0;
    size_t release_failures = 0;
    size_t rooms_deactivated = 0;
    size_t orphans_deleted = 0;
    size_t orphan_failures = 0;
    bool aborted = false;                       // Stopped early by shutdown
};

struct PurgeReport {
    size_t transfers_deleted = 0;
    size_t storage_failures = 0;
    size_t messages_deleted = 0;
    size_t members_deleted = 0;
    bool room_deactivated = false;
};

using SweepCallback = std::function<void(const SweepReport&)>;

/**
 * ExpiryReaper runs sweep() on a fixed interval in a managed thread and offers
 * purge_room() for the grace-period path. Every step is "delete if exists / set
 * if not already terminal", so overlapping or repeated runs are harmless.
 * Storage is always deleted before the record that points at it changes.
 */
class ExpiryReaper : public ThreadManager {
public:
    ExpiryReaper(RecordStore& store, BlobStore& blobs, TransferLockTable& locks,
                 const ReaperSettings& settings = ReaperSettings());
    ~ExpiryReaper();

    /**
     * Start the periodic sweep; the first sweep runs immediately
     */
    bool start();

    /**
     * Cancel the pending tick and wait for an in-flight sweep to finish its current item
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * One full pass:
     *  1. non-terminal transfers past expires_at: delete storage, then EXPIRED
     *  2. COMPLETED transfers past the retention window: delete storage, clear storage_path
     *  3. active rooms past expires_at: deactivate
     *  4. blob containers with no transfer row: delete
     */
    SweepReport sweep(Timestamp now = Clock::now());

    /**
     * Cascade-delete every transfer (storage first), message and member of a room,
     * then deactivate it. Storage delete failures do not keep rows alive: leftover
     * containers are reclaimed by the orphan step of a later sweep.
     */
    PurgeReport purge_room(const std::string& room_id);

    void set_sweep_callback(SweepCallback callback);

    uint64_t get_sweep_count() const { return sweep_count_.load(); }
    const ReaperSettings& get_settings() const { return settings_; }

private:
    RecordStore& store_;
    BlobStore& blobs_;
    TransferLockTable& locks_;
    ReaperSettings settings_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> sweep_count_;

    SweepCallback sweep_callback_;
    std::mutex callback_mutex_;

    void sweep_loop();

    void expire_transfers(Timestamp now, SweepReport& report);
    void release_completed_storage(Timestamp now, SweepReport& report);
    void deactivate_expired_rooms(Timestamp now, SweepReport& report);
    void delete_orphaned_containers(SweepReport& report);
};

} // namespace cloudless
