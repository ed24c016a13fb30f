#pragma once

/**
 * @file record_store.h
 * @brief Persistence adapter for rooms, members, transfers and messages
 *
 * The core only depends on the RecordStore interface. Every update goes through a
 * mutator callback executed while the store holds its lock, which gives callers an
 * atomic read-modify-write on a single record.
 */

#include "types.h"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cloudless {

template <typename T>
using RecordMutator = std::function<bool(T&)>;

template <typename T>
using RecordPredicate = std::function<bool(const T&)>;

/**
 * Transactional CRUD contract over the four record kinds.
 *
 * update_* methods return true only when the record existed and the mutator
 * returned true; a mutator returning false leaves the stored record untouched.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Rooms
    virtual bool insert_room(const Room& room) = 0;
    virtual std::optional<Room> get_room(const std::string& room_id) = 0;
    virtual std::optional<Room> find_room_by_code(const std::string& code) = 0;
    virtual std::vector<Room> find_rooms(const RecordPredicate<Room>& predicate) = 0;
    virtual bool update_room(const std::string& room_id, const RecordMutator<Room>& mutator) = 0;

    // Members
    virtual void upsert_member(const Member& member) = 0;
    virtual std::optional<Member> get_member(const std::string& room_id, const std::string& user_id) = 0;
    virtual std::vector<Member> list_members(const std::string& room_id) = 0;
    virtual bool update_member(const std::string& room_id, const std::string& user_id,
                               const RecordMutator<Member>& mutator) = 0;
    virtual bool delete_member(const std::string& room_id, const std::string& user_id) = 0;
    virtual size_t delete_members_for_room(const std::string& room_id) = 0;

    // Transfers
    virtual bool insert_transfer(const Transfer& transfer) = 0;
    virtual std::optional<Transfer> get_transfer(const std::string& transfer_id) = 0;
    virtual std::vector<Transfer> list_transfers_for_room(const std::string& room_id) = 0;
    virtual std::vector<Transfer> find_transfers(const RecordPredicate<Transfer>& predicate) = 0;
    virtual bool update_transfer(const std::string& transfer_id, const RecordMutator<Transfer>& mutator) = 0;
    virtual bool delete_transfer(const std::string& transfer_id) = 0;
    virtual std::vector<std::string> transfer_ids() = 0;

    // Messages
    virtual bool insert_message(const Message& message) = 0;
    virtual std::vector<Message> list_messages_for_room(const std::string& room_id) = 0;
    virtual size_t delete_messages_for_room(const std::string& room_id) = 0;
};

/**
 * In-process RecordStore guarded by one mutex, with JSON snapshot persistence.
 */
class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;
    ~MemoryRecordStore() override = default;

    bool insert_room(const Room& room) override;
    std::optional<Room> get_room(const std::string& room_id) override;
    std::optional<Room> find_room_by_code(const std::string& code) override;
    std::vector<Room> find_rooms(const RecordPredicate<Room>& predicate) override;
    bool update_room(const std::string& room_id, const RecordMutator<Room>& mutator) override;

    void upsert_member(const Member& member) override;
    std::optional<Member> get_member(const std::string& room_id, const std::string& user_id) override;
    std::vector<Member> list_members(const std::string& room_id) override;
    bool update_member(const std::string& room_id, const std::string& user_id,
                       const RecordMutator<Member>& mutator) override;
    bool delete_member(const std::string& room_id, const std::string& user_id) override;
    size_t delete_members_for_room(const std::string& room_id) override;

    bool insert_transfer(const Transfer& transfer) override;
    std::optional<Transfer> get_transfer(const std::string& transfer_id) override;
    std::vector<Transfer> list_transfers_for_room(const std::string& room_id) override;
    std::vector<Transfer> find_transfers(const RecordPredicate<Transfer>& predicate) override;
    bool update_transfer(const std::string& transfer_id, const RecordMutator<Transfer>& mutator) override;
    bool delete_transfer(const std::string& transfer_id) override;
    std::vector<std::string> transfer_ids() override;

    bool insert_message(const Message& message) override;
    std::vector<Message> list_messages_for_room(const std::string& room_id) override;
    size_t delete_messages_for_room(const std::string& room_id) override;

    //=========================================================================
    // Snapshot persistence
    //=========================================================================

    /**
     * Write every record to `path` as one JSON document (temp file + rename).
     * @return true on success
     */
    bool save_snapshot(const std::string& path);

    /**
     * Replace the current contents with the snapshot at `path`.
     * Members are loaded offline: presence is rebuilt by reconnects.
     * @return true if the file was loaded, false if missing or invalid
     */
    bool load_snapshot(const std::string& path);

    nlohmann::json snapshot_json() const;
    bool restore_snapshot(const nlohmann::json& snapshot);

    size_t room_count() const;
    size_t member_count() const;
    size_t transfer_count() const;
    size_t message_count() const;

private:
    using MemberKey = std::pair<std::string, std::string>;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Room> rooms_;
    std::map<MemberKey, Member> members_;
    std::unordered_map<std::string, Transfer> transfers_;
    std::vector<Message> messages_;
};

} // namespace cloudless
