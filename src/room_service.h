#pragma once

/**
 * @file room_service.h
 * @brief Room lifecycle: create, join by code, leave, deactivate, safety numbers
 */

#include "outcome.h"
#include "record_store.h"
#include "types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cloudless {

struct CreateRoomRequest {
    std::string name;                        // Optional, at most 100 characters
    std::string display_name;
    std::string public_key;                  // Base64 X25519 public key
    bool allow_relay;
    std::optional<int64_t> expires_in_hours; // nullopt: room never expires

    CreateRoomRequest() : allow_relay(true), expires_in_hours(24) {}
};

struct JoinRoomRequest {
    std::string code;                        // Case-insensitive
    std::string display_name;
    std::string public_key;
};

struct RoomResult {
    Outcome outcome;
    std::string error_message;
    Room room;
    std::vector<Member> members;

    RoomResult() : outcome(Outcome::OK) {}
    bool ok() const { return outcome == Outcome::OK; }
};

struct RoomListResult {
    Outcome outcome;
    std::string error_message;
    std::vector<Room> rooms;

    RoomListResult() : outcome(Outcome::OK) {}
    bool ok() const { return outcome == Outcome::OK; }
};

struct SafetyNumberResult {
    Outcome outcome;
    std::string error_message;
    std::string safety_number;
    std::vector<std::string> emoji_fingerprint_self;
    std::vector<std::string> emoji_fingerprint_peer;

    SafetyNumberResult() : outcome(Outcome::OK) {}
    bool ok() const { return outcome == Outcome::OK; }
};

class RoomService {
public:
    explicit RoomService(RecordStore& store);

    /**
     * Create a direct room; the creator becomes its first member.
     */
    RoomResult create_room(const std::string& user_id, const CreateRoomRequest& request);

    /**
     * Join an active room by code. Rejoining replaces the member's public key.
     */
    RoomResult join_room(const std::string& user_id, const JoinRoomRequest& request);

    /**
     * Delete the caller's member row
     */
    RoomResult leave_room(const std::string& user_id, const std::string& room_id);

    /**
     * Creator only; the room stops accepting connections, joins and uploads
     */
    RoomResult deactivate_room(const std::string& user_id, const std::string& room_id);

    RoomResult get_room(const std::string& user_id, const std::string& room_id);

    /**
     * Active, unexpired rooms the user belongs to, newest first
     */
    RoomListResult list_rooms(const std::string& user_id);

    SafetyNumberResult get_safety_number(const std::string& user_id, const std::string& room_id,
                                         const std::string& peer_user_id);

    static nlohmann::json describe_room(const Room& room, const std::vector<Member>& members);

private:
    RecordStore& store_;

    std::string allocate_room_code();
};

} // namespace cloudless
