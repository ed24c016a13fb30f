#include "record_store.h"
#include "cloudless_log_macros.h"
#include "fs.h"
#include <algorithm>
#include <cctype>

namespace cloudless {

//=============================================================================
// Rooms
//=============================================================================

bool MemoryRecordStore::insert_room(const Room& room) {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.emplace(room.id, room).second;
}

std::optional<Room> MemoryRecordStore::get_room(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Room> MemoryRecordStore::find_room_by_code(const std::string& code) {
    std::string wanted = code;
    std::transform(wanted.begin(), wanted.end(), wanted.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : rooms_) {
        if (entry.second.code == wanted) {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::vector<Room> MemoryRecordStore::find_rooms(const RecordPredicate<Room>& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Room> result;
    for (const auto& entry : rooms_) {
        if (predicate(entry.second)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

bool MemoryRecordStore::update_room(const std::string& room_id, const RecordMutator<Room>& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return false;
    }
    Room updated = it->second;
    if (!mutator(updated)) {
        return false;
    }
    it->second = std::move(updated);
    return true;
}

//=============================================================================
// Members
//=============================================================================

void MemoryRecordStore::upsert_member(const Member& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    members_[MemberKey(member.room_id, member.user_id)] = member;
}

std::optional<Member> MemoryRecordStore::get_member(const std::string& room_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(MemberKey(room_id, user_id));
    if (it == members_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Member> MemoryRecordStore::list_members(const std::string& room_id) {
    std::vector<Member> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = members_.lower_bound(MemberKey(room_id, std::string()));
             it != members_.end() && it->first.first == room_id; ++it) {
            result.push_back(it->second);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const Member& a, const Member& b) {
        return a.joined_at < b.joined_at;
    });
    return result;
}

bool MemoryRecordStore::update_member(const std::string& room_id, const std::string& user_id,
                                      const RecordMutator<Member>& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(MemberKey(room_id, user_id));
    if (it == members_.end()) {
        return false;
    }
    Member updated = it->second;
    if (!mutator(updated)) {
        return false;
    }
    it->second = std::move(updated);
    return true;
}

bool MemoryRecordStore::delete_member(const std::string& room_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.erase(MemberKey(room_id, user_id)) > 0;
}

size_t MemoryRecordStore::delete_members_for_room(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    auto it = members_.lower_bound(MemberKey(room_id, std::string()));
    while (it != members_.end() && it->first.first == room_id) {
        it = members_.erase(it);
        ++removed;
    }
    return removed;
}

//=============================================================================
// Transfers
//=============================================================================

bool MemoryRecordStore::insert_transfer(const Transfer& transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.emplace(transfer.id, transfer).second;
}

std::optional<Transfer> MemoryRecordStore::get_transfer(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Transfer> MemoryRecordStore::list_transfers_for_room(const std::string& room_id) {
    std::vector<Transfer> result = find_transfers([&room_id](const Transfer& t) {
        return t.room_id == room_id;
    });
    // Newest first
    std::sort(result.begin(), result.end(), [](const Transfer& a, const Transfer& b) {
        return a.created_at > b.created_at;
    });
    return result;
}

std::vector<Transfer> MemoryRecordStore::find_transfers(const RecordPredicate<Transfer>& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transfer> result;
    for (const auto& entry : transfers_) {
        if (predicate(entry.second)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

bool MemoryRecordStore::update_transfer(const std::string& transfer_id, const RecordMutator<Transfer>& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return false;
    }
    Transfer updated = it->second;
    if (!mutator(updated)) {
        return false;
    }
    it->second = std::move(updated);
    return true;
}

bool MemoryRecordStore::delete_transfer(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.erase(transfer_id) > 0;
}

std::vector<std::string> MemoryRecordStore::transfer_ids() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(transfers_.size());
    for (const auto& entry : transfers_) {
        ids.push_back(entry.first);
    }
    return ids;
}

//=============================================================================
// Messages
//=============================================================================

bool MemoryRecordStore::insert_message(const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : messages_) {
        if (existing.id == message.id) {
            return false;
        }
    }
    messages_.push_back(message);
    return true;
}

std::vector<Message> MemoryRecordStore::list_messages_for_room(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> result;
    for (const auto& message : messages_) {
        if (message.room_id == room_id) {
            result.push_back(message);
        }
    }
    return result;
}

size_t MemoryRecordStore::delete_messages_for_room(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = messages_.size();
    messages_.erase(std::remove_if(messages_.begin(), messages_.end(),
                                   [&room_id](const Message& m) { return m.room_id == room_id; }),
                    messages_.end());
    return before - messages_.size();
}

//=============================================================================
// Snapshot persistence
//=============================================================================

nlohmann::json MemoryRecordStore::snapshot_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json snapshot;
    snapshot["rooms"] = nlohmann::json::array();
    for (const auto& entry : rooms_) {
        snapshot["rooms"].push_back(entry.second);
    }
    snapshot["members"] = nlohmann::json::array();
    for (const auto& entry : members_) {
        snapshot["members"].push_back(entry.second);
    }
    snapshot["transfers"] = nlohmann::json::array();
    for (const auto& entry : transfers_) {
        snapshot["transfers"].push_back(entry.second);
    }
    snapshot["messages"] = messages_;
    snapshot["saved_at"] = format_timestamp(Clock::now());
    return snapshot;
}

bool MemoryRecordStore::restore_snapshot(const nlohmann::json& snapshot) {
    std::unordered_map<std::string, Room> rooms;
    std::map<MemberKey, Member> members;
    std::unordered_map<std::string, Transfer> transfers;
    std::vector<Message> messages;

    try {
        for (const auto& item : snapshot.value("rooms", nlohmann::json::array())) {
            Room room = item.get<Room>();
            rooms.emplace(room.id, std::move(room));
        }
        for (const auto& item : snapshot.value("members", nlohmann::json::array())) {
            Member member = item.get<Member>();
            member.is_online = false;
            members[MemberKey(member.room_id, member.user_id)] = std::move(member);
        }
        for (const auto& item : snapshot.value("transfers", nlohmann::json::array())) {
            Transfer transfer = item.get<Transfer>();
            transfers.emplace(transfer.id, std::move(transfer));
        }
        for (const auto& item : snapshot.value("messages", nlohmann::json::array())) {
            messages.push_back(item.get<Message>());
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_STORE_ERROR("Invalid record snapshot: " << e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_STORE_ERROR("Invalid record snapshot: " << e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    rooms_ = std::move(rooms);
    members_ = std::move(members);
    transfers_ = std::move(transfers);
    messages_ = std::move(messages);
    return true;
}

bool MemoryRecordStore::save_snapshot(const std::string& path) {
    std::string data;
    try {
        data = snapshot_json().dump(4);
    } catch (const nlohmann::json::exception& e) {
        LOG_STORE_ERROR("Failed to serialize record snapshot: " << e.what());
        return false;
    }

    if (!write_file_atomic(path, std::vector<uint8_t>(data.begin(), data.end()))) {
        LOG_STORE_ERROR("Failed to write record snapshot to " << path);
        return false;
    }

    LOG_STORE_DEBUG("Record snapshot saved to " << path);
    return true;
}

bool MemoryRecordStore::load_snapshot(const std::string& path) {
    if (!file_exists(path)) {
        LOG_STORE_INFO("No record snapshot at " << path << ", starting empty");
        return false;
    }

    std::string data = read_file_text(path);
    if (data.empty()) {
        LOG_STORE_ERROR("Record snapshot " << path << " is empty");
        return false;
    }

    nlohmann::json snapshot;
    try {
        snapshot = nlohmann::json::parse(data);
    } catch (const nlohmann::json::exception& e) {
        LOG_STORE_ERROR("Failed to parse record snapshot " << path << ": " << e.what());
        return false;
    }

    if (!restore_snapshot(snapshot)) {
        return false;
    }

    LOG_STORE_INFO("Loaded record snapshot from " << path << " (" << room_count() << " rooms, "
                   << transfer_count() << " transfers, " << message_count() << " messages)");
    return true;
}

size_t MemoryRecordStore::room_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

size_t MemoryRecordStore::member_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.size();
}

size_t MemoryRecordStore::transfer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

size_t MemoryRecordStore::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

} // namespace cloudless
