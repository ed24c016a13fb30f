#pragma once

/**
 * @file presence_registry.h
 * @brief Room -> member -> live transport registry with fan-out and unicast
 *
 * Each room has its own slot with its own mutex, so registrations in different
 * rooms never contend. The room index lock is only held long enough to find or
 * create a slot. Sends happen outside the slot lock on a snapshot of the
 * recipients; a failed send is handled as an implicit disconnect.
 */

#include "record_store.h"
#include "transport.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudless {

/**
 * Called when a disconnect leaves a room with no live transports.
 * @param room_id Room that became empty
 * @param epoch Room epoch observed at that moment
 */
using RoomEmptyCallback = std::function<void(const std::string& room_id, uint64_t epoch)>;

/**
 * Called when a connect brings a room from zero to one live transport.
 */
using RoomActiveCallback = std::function<void(const std::string& room_id)>;

class PresenceRegistry {
public:
    explicit PresenceRegistry(RecordStore& store);
    ~PresenceRegistry();

    /**
     * Register `transport` as the live connection of (room, user), replacing any
     * previous one without closing it. Marks the member online and announces
     * user_joined to every other connection in the room.
     * @return false if the member row no longer exists (room purged meanwhile)
     */
    bool connect(const std::string& room_id, const std::string& user_id, const TransportPtr& transport);

    /**
     * Remove the registration of (room, user) if `transport` is still the one
     * registered. A superseded transport is ignored: no offline mark, no user_left.
     * @return true if a registration was removed
     */
    bool disconnect(const std::string& room_id, const std::string& user_id, const Transport* transport);

    /**
     * Deliver `message` to every connection in the room except `exclude_user_id`.
     * @return Number of successful deliveries
     */
    int broadcast_to_room(const std::string& room_id, const nlohmann::json& message,
                          const std::string& exclude_user_id = "");

    /**
     * Deliver `message` to one member if connected; silently does nothing otherwise.
     */
    void send_to_user(const std::string& room_id, const std::string& user_id, const nlohmann::json& message);

    /**
     * Snapshot of connected user ids, in connection order
     */
    std::vector<std::string> get_online_users(const std::string& room_id);

    bool is_user_online(const std::string& room_id, const std::string& user_id);
    size_t get_connection_count(const std::string& room_id);
    size_t get_room_count();

    /**
     * Current epoch of a room; every connect advances it. 0 if the room has no slot.
     */
    uint64_t get_room_epoch(const std::string& room_id);

    /**
     * Run `action` under the room lock if the room still has no connections and
     * its epoch still equals `epoch`, then retire the room slot. Connects that
     * arrive meanwhile wait for the lock and land in a fresh slot.
     * @return true if the action ran
     */
    bool run_if_room_idle(const std::string& room_id, uint64_t epoch, const std::function<void()>& action);

    /**
     * Close every registered transport (server shutdown)
     */
    void close_all_connections(int code, const std::string& reason);

    void set_room_empty_callback(RoomEmptyCallback callback);
    void set_room_active_callback(RoomActiveCallback callback);

private:
    struct Connection {
        std::string user_id;
        TransportPtr transport;
        uint64_t sequence;                  // Registration order, for stable listings
    };

    struct RoomSlot {
        std::mutex mutex;
        std::unordered_map<std::string, Connection> connections;
        uint64_t epoch = 0;
        bool retired = false;
    };

    using SlotPtr = std::shared_ptr<RoomSlot>;

    RecordStore& store_;

    std::unordered_map<std::string, SlotPtr> rooms_;
    std::mutex rooms_mutex_;

    // Epochs and sequences are process-wide so a retired slot's values never repeat
    std::atomic<uint64_t> next_epoch_;
    std::atomic<uint64_t> next_sequence_;

    RoomEmptyCallback room_empty_callback_;
    RoomActiveCallback room_active_callback_;
    std::mutex callbacks_mutex_;

    SlotPtr get_or_create_slot(const std::string& room_id);
    SlotPtr find_slot(const std::string& room_id);

    // Sends outside any slot lock; failures become disconnects
    int deliver(const std::string& room_id, const std::vector<Connection>& recipients, const std::string& payload);

    void mark_member_presence(const std::string& room_id, const std::string& user_id, bool online);
};

} // namespace cloudless
