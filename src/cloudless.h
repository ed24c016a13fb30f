#pragma once

/**
 * @file cloudless.h
 * @brief The relay daemon: owns and wires every component
 */

#include "auth.h"
#include "blob_store.h"
#include "config.h"
#include "presence_registry.h"
#include "purge_scheduler.h"
#include "realtime_server.h"
#include "reaper.h"
#include "record_store.h"
#include "room_service.h"
#include "signal_router.h"
#include "transfer_service.h"
#include <atomic>
#include <memory>
#include <string>

namespace cloudless {

/**
 * CloudlessServer composes the relay core.
 *
 * The last disconnect from a room arms a deferred purge; a reconnect within the
 * grace period cancels it. When the timer fires the purge runs only if the room
 * is still empty and no connection came and went since (room epoch unchanged).
 * Records are snapshotted after every reaper sweep and on stop.
 */
class CloudlessServer {
public:
    explicit CloudlessServer(const ServerConfig& config);
    ~CloudlessServer();

    /**
     * Load the record snapshot, start the reaper, purge scheduler and realtime listener
     * @return false if any of them failed; already started parts are stopped again
     */
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    /**
     * Realtime listener port (after start)
     */
    int get_port() const { return realtime_.get_port(); }

    const ServerConfig& get_config() const { return config_; }

    MemoryRecordStore& get_store() { return store_; }
    BlobStore& get_blob_store() { return blobs_; }
    StaticTokenVerifier& get_auth() { return auth_; }
    PresenceRegistry& get_presence() { return presence_; }
    TransferService& get_transfer_service() { return transfers_; }
    RoomService& get_room_service() { return rooms_; }
    ExpiryReaper& get_reaper() { return reaper_; }
    DeferredPurgeScheduler& get_purge_scheduler() { return scheduler_; }
    SignalRouter& get_router() { return router_; }

    bool save_state();

private:
    ServerConfig config_;
    std::atomic<bool> running_;

    MemoryRecordStore store_;
    FileBlobStore blobs_;
    StaticTokenVerifier auth_;
    TransferLockTable locks_;
    PresenceRegistry presence_;
    TransferService transfers_;
    ExpiryReaper reaper_;
    RoomService rooms_;
    SignalRouter router_;
    DeferredPurgeScheduler scheduler_;
    RealtimeServer realtime_;

    void handle_room_empty(const std::string& room_id, uint64_t epoch);
    void handle_room_active(const std::string& room_id);
    void handle_purge_due(const std::string& room_id, uint64_t epoch);
};

} // namespace cloudless
