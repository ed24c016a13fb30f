#include "room_service.h"
#include "cloudless_log_macros.h"
#include "safety_number.h"
#include <algorithm>
#include <chrono>

namespace cloudless {

RoomService::RoomService(RecordStore& store)
    : store_(store) {
}

std::string RoomService::allocate_room_code() {
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::string code = generate_room_code();
        if (!store_.find_room_by_code(code)) {
            return code;
        }
    }
    return std::string();
}

RoomResult RoomService::create_room(const std::string& user_id, const CreateRoomRequest& request) {
    RoomResult result;

    if (request.public_key.empty()) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "public_key is required";
        return result;
    }
    if (request.name.size() > 100) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "name must be at most 100 characters";
        return result;
    }
    if (request.expires_in_hours && (*request.expires_in_hours < 1 || *request.expires_in_hours > 168)) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "expires_in_hours must be in [1, 168]";
        return result;
    }

    std::string code = allocate_room_code();
    if (code.empty()) {
        LOG_ROOM_ERROR("Could not allocate a free room code");
        result.outcome = Outcome::CONFLICT;
        result.error_message = "Could not allocate a room code";
        return result;
    }

    Timestamp now = Clock::now();
    Room room;
    room.id = generate_id();
    room.code = code;
    room.name = request.name;
    room.type = RoomType::DIRECT;
    room.created_by = user_id;
    room.is_active = true;
    room.allow_relay = request.allow_relay;
    room.created_at = now;
    if (request.expires_in_hours) {
        room.expires_at = now + std::chrono::hours(*request.expires_in_hours);
    }

    if (!store_.insert_room(room)) {
        result.outcome = Outcome::CONFLICT;
        result.error_message = "Room id collision";
        return result;
    }

    Member member;
    member.room_id = room.id;
    member.user_id = user_id;
    member.display_name = request.display_name;
    member.public_key = request.public_key;
    member.joined_at = now;
    member.is_online = false;
    member.last_seen = now;
    store_.upsert_member(member);

    LOG_ROOM_INFO("Room " << room.id << " (" << room.code << ") created by " << user_id);

    result.room = room;
    result.members.push_back(member);
    return result;
}

RoomResult RoomService::join_room(const std::string& user_id, const JoinRoomRequest& request) {
    RoomResult result;

    if (request.code.size() < 6 || request.code.size() > 10 || request.public_key.empty()) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "A 6-10 character code and a public_key are required";
        return result;
    }

    auto room = store_.find_room_by_code(request.code);
    if (!room || !room->is_active) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Room not found";
        return result;
    }
    if (room->is_expired(Clock::now())) {
        result.outcome = Outcome::GONE;
        result.error_message = "Room has expired";
        return result;
    }

    Timestamp now = Clock::now();
    bool rejoined = store_.update_member(room->id, user_id, [&](Member& member) {
        member.public_key = request.public_key;
        if (!request.display_name.empty()) {
            member.display_name = request.display_name;
        }
        member.last_seen = now;
        return true;
    });

    if (!rejoined) {
        Member member;
        member.room_id = room->id;
        member.user_id = user_id;
        member.display_name = request.display_name;
        member.public_key = request.public_key;
        member.joined_at = now;
        member.is_online = false;
        member.last_seen = now;
        store_.upsert_member(member);
    }

    LOG_ROOM_INFO("User " << user_id << (rejoined ? " rejoined" : " joined") << " room " << room->id);

    result.room = *room;
    result.members = store_.list_members(room->id);
    return result;
}

RoomResult RoomService::leave_room(const std::string& user_id, const std::string& room_id) {
    RoomResult result;

    if (!store_.delete_member(room_id, user_id)) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Not a member of this room";
        return result;
    }

    LOG_ROOM_INFO("User " << user_id << " left room " << room_id);
    auto room = store_.get_room(room_id);
    if (room) {
        result.room = *room;
    }
    return result;
}

RoomResult RoomService::deactivate_room(const std::string& user_id, const std::string& room_id) {
    RoomResult result;

    auto room = store_.get_room(room_id);
    if (!room || !room->is_active) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Room not found";
        return result;
    }
    if (room->created_by != user_id) {
        result.outcome = Outcome::FORBIDDEN;
        result.error_message = "Only the room creator can delete it";
        return result;
    }

    bool updated = store_.update_room(room_id, [](Room& r) {
        if (!r.is_active) {
            return false;
        }
        r.is_active = false;
        return true;
    });
    if (!updated) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Room not found";
        return result;
    }

    LOG_ROOM_INFO("Room " << room_id << " deactivated by its creator");
    room->is_active = false;
    result.room = *room;
    return result;
}

RoomResult RoomService::get_room(const std::string& user_id, const std::string& room_id) {
    RoomResult result;

    auto room = store_.get_room(room_id);
    if (!room || !room->is_active) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Room not found";
        return result;
    }
    if (!store_.get_member(room_id, user_id)) {
        result.outcome = Outcome::FORBIDDEN;
        result.error_message = "Not a member of this room";
        return result;
    }
    if (room->is_expired(Clock::now())) {
        result.outcome = Outcome::GONE;
        result.error_message = "Room has expired";
        return result;
    }

    result.room = *room;
    result.members = store_.list_members(room_id);
    return result;
}

RoomListResult RoomService::list_rooms(const std::string& user_id) {
    RoomListResult result;
    Timestamp now = Clock::now();

    auto rooms = store_.find_rooms([now](const Room& room) {
        return room.is_active && !room.is_expired(now);
    });
    for (auto& room : rooms) {
        if (store_.get_member(room.id, user_id)) {
            result.rooms.push_back(std::move(room));
        }
    }
    std::sort(result.rooms.begin(), result.rooms.end(), [](const Room& a, const Room& b) {
        return a.created_at > b.created_at;
    });
    return result;
}

SafetyNumberResult RoomService::get_safety_number(const std::string& user_id, const std::string& room_id,
                                                  const std::string& peer_user_id) {
    SafetyNumberResult result;

    auto room = store_.get_room(room_id);
    if (!room || !room->is_active) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Room not found";
        return result;
    }

    auto self_member = store_.get_member(room_id, user_id);
    auto peer_member = store_.get_member(room_id, peer_user_id);
    if (!self_member || !peer_member) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Member not found in room";
        return result;
    }

    if (!generate_emoji_fingerprint(self_member->public_key, result.emoji_fingerprint_self) ||
        !generate_emoji_fingerprint(peer_member->public_key, result.emoji_fingerprint_peer)) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "Public key is not valid base64";
        return result;
    }

    result.safety_number = generate_safety_number(self_member->public_key, peer_member->public_key);
    if (result.safety_number.empty()) {
        result.outcome = Outcome::STORAGE_FAILURE;
        result.error_message = "Digest computation failed";
        return result;
    }
    return result;
}

nlohmann::json RoomService::describe_room(const Room& room, const std::vector<Member>& members) {
    nlohmann::json descriptor;
    descriptor["id"] = room.id;
    descriptor["code"] = room.code;
    descriptor["name"] = room.name.empty() ? nlohmann::json(nullptr) : nlohmann::json(room.name);
    descriptor["room_type"] = to_string(room.type);
    descriptor["allow_relay"] = room.allow_relay;
    descriptor["created_at"] = format_timestamp(room.created_at);
    descriptor["expires_at"] = room.expires_at ? nlohmann::json(format_timestamp(*room.expires_at))
                                               : nlohmann::json(nullptr);

    descriptor["members"] = nlohmann::json::array();
    for (const auto& member : members) {
        nlohmann::json entry;
        entry["user_id"] = member.user_id;
        entry["display_name"] = member.display_name;
        entry["public_key"] = member.public_key;
        entry["is_online"] = member.is_online;
        entry["joined_at"] = format_timestamp(member.joined_at);
        descriptor["members"].push_back(entry);
    }
    return descriptor;
}

} // namespace cloudless
