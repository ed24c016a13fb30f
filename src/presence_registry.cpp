#include "presence_registry.h"
#include "cloudless_log_macros.h"
#include <algorithm>

namespace cloudless {

PresenceRegistry::PresenceRegistry(RecordStore& store)
    : store_(store), next_epoch_(0), next_sequence_(0) {
}

PresenceRegistry::~PresenceRegistry() = default;

void PresenceRegistry::set_room_empty_callback(RoomEmptyCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    room_empty_callback_ = std::move(callback);
}

void PresenceRegistry::set_room_active_callback(RoomActiveCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    room_active_callback_ = std::move(callback);
}

PresenceRegistry::SlotPtr PresenceRegistry::get_or_create_slot(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto it = rooms_.find(room_id);
    if (it != rooms_.end()) {
        return it->second;
    }
    SlotPtr slot = std::make_shared<RoomSlot>();
    rooms_[room_id] = slot;
    return slot;
}

PresenceRegistry::SlotPtr PresenceRegistry::find_slot(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return nullptr;
    }
    return it->second;
}

void PresenceRegistry::mark_member_presence(const std::string& room_id, const std::string& user_id, bool online) {
    Timestamp now = Clock::now();
    bool updated = store_.update_member(room_id, user_id, [online, now](Member& member) {
        member.is_online = online;
        member.last_seen = now;
        return true;
    });
    if (!updated) {
        LOG_PRESENCE_DEBUG("No member row for " << user_id << " in room " << room_id << " to mark "
                           << (online ? "online" : "offline"));
    }
}

bool PresenceRegistry::connect(const std::string& room_id, const std::string& user_id, const TransportPtr& transport) {
    if (!transport) {
        return false;
    }

    std::vector<Connection> recipients;
    nlohmann::json joined;
    bool room_was_empty = false;

    for (;;) {
        SlotPtr slot = get_or_create_slot(room_id);
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->retired) {
            // Purged while we waited for the lock; the index already holds a new slot
            continue;
        }

        // The member row is gone if the room was purged after admission
        auto member = store_.get_member(room_id, user_id);
        if (!member) {
            LOG_PRESENCE_WARN("Rejecting connect of " << user_id << " to " << room_id << ": not a member");
            return false;
        }

        room_was_empty = slot->connections.empty();
        auto existing = slot->connections.find(user_id);
        if (existing != slot->connections.end()) {
            room_was_empty = false;
            if (existing->second.transport != transport) {
                LOG_PRESENCE_INFO("Connection of " << user_id << " in room " << room_id << " superseded by "
                                  << transport->describe());
            }
        }

        Connection connection;
        connection.user_id = user_id;
        connection.transport = transport;
        connection.sequence = ++next_sequence_;
        slot->connections[user_id] = connection;
        slot->epoch = ++next_epoch_;

        mark_member_presence(room_id, user_id, true);

        for (const auto& entry : slot->connections) {
            if (entry.first != user_id) {
                recipients.push_back(entry.second);
            }
        }

        joined["type"] = "user_joined";
        joined["user_id"] = user_id;
        joined["public_key"] = member->public_key;
        joined["display_name"] = member->display_name;
        joined["timestamp"] = format_timestamp(Clock::now());

        LOG_PRESENCE_INFO("User " << user_id << " connected to room " << room_id
                          << " (" << slot->connections.size() << " online, epoch " << slot->epoch << ")");
        break;
    }

    if (room_was_empty) {
        RoomActiveCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callback = room_active_callback_;
        }
        if (callback) {
            callback(room_id);
        }
    }

    deliver(room_id, recipients, joined.dump());
    return true;
}

bool PresenceRegistry::disconnect(const std::string& room_id, const std::string& user_id, const Transport* transport) {
    SlotPtr slot = find_slot(room_id);
    if (!slot) {
        return false;
    }

    std::vector<Connection> recipients;
    nlohmann::json left;
    bool now_empty = false;
    uint64_t epoch = 0;

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto it = slot->connections.find(user_id);
        if (it == slot->connections.end() || it->second.transport.get() != transport) {
            LOG_PRESENCE_DEBUG("Ignoring disconnect of stale transport for " << user_id << " in room " << room_id);
            return false;
        }
        slot->connections.erase(it);

        mark_member_presence(room_id, user_id, false);

        auto member = store_.get_member(room_id, user_id);
        left["type"] = "user_left";
        left["user_id"] = user_id;
        left["display_name"] = member ? member->display_name : std::string();
        left["timestamp"] = format_timestamp(Clock::now());

        for (const auto& entry : slot->connections) {
            recipients.push_back(entry.second);
        }
        now_empty = slot->connections.empty();
        epoch = slot->epoch;

        LOG_PRESENCE_INFO("User " << user_id << " disconnected from room " << room_id
                          << " (" << slot->connections.size() << " online)");
    }

    deliver(room_id, recipients, left.dump());

    if (now_empty) {
        RoomEmptyCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callback = room_empty_callback_;
        }
        if (callback) {
            callback(room_id, epoch);
        }
    }
    return true;
}

int PresenceRegistry::deliver(const std::string& room_id, const std::vector<Connection>& recipients,
                              const std::string& payload) {
    int sent_count = 0;
    std::vector<Connection> failed;

    for (const auto& recipient : recipients) {
        if (recipient.transport->send_text(payload)) {
            sent_count++;
        } else {
            failed.push_back(recipient);
        }
    }

    for (const auto& recipient : failed) {
        LOG_PRESENCE_WARN("Send to " << recipient.user_id << " in room " << room_id
                          << " failed, treating as disconnect");
        if (disconnect(room_id, recipient.user_id, recipient.transport.get())) {
            recipient.transport->close(CLOSE_NORMAL, "Send failed");
        }
    }

    return sent_count;
}

int PresenceRegistry::broadcast_to_room(const std::string& room_id, const nlohmann::json& message,
                                        const std::string& exclude_user_id) {
    SlotPtr slot = find_slot(room_id);
    if (!slot) {
        return 0;
    }

    std::vector<Connection> recipients;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (const auto& entry : slot->connections) {
            if (entry.first != exclude_user_id) {
                recipients.push_back(entry.second);
            }
        }
    }

    if (recipients.empty()) {
        return 0;
    }

    int sent = deliver(room_id, recipients, message.dump());
    LOG_PRESENCE_DEBUG("Broadcast " << message.value("type", "?") << " to " << sent << "/"
                       << recipients.size() << " connections in room " << room_id);
    return sent;
}

void PresenceRegistry::send_to_user(const std::string& room_id, const std::string& user_id,
                                    const nlohmann::json& message) {
    SlotPtr slot = find_slot(room_id);
    if (!slot) {
        return;
    }

    std::vector<Connection> recipients;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto it = slot->connections.find(user_id);
        if (it == slot->connections.end()) {
            return;
        }
        recipients.push_back(it->second);
    }

    deliver(room_id, recipients, message.dump());
}

std::vector<std::string> PresenceRegistry::get_online_users(const std::string& room_id) {
    std::vector<Connection> connections;
    SlotPtr slot = find_slot(room_id);
    if (slot) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (const auto& entry : slot->connections) {
            connections.push_back(entry.second);
        }
    }

    std::sort(connections.begin(), connections.end(), [](const Connection& a, const Connection& b) {
        return a.sequence < b.sequence;
    });

    std::vector<std::string> users;
    users.reserve(connections.size());
    for (const auto& connection : connections) {
        users.push_back(connection.user_id);
    }
    return users;
}

bool PresenceRegistry::is_user_online(const std::string& room_id, const std::string& user_id) {
    SlotPtr slot = find_slot(room_id);
    if (!slot) {
        return false;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->connections.find(user_id) != slot->connections.end();
}

size_t PresenceRegistry::get_connection_count(const std::string& room_id) {
    SlotPtr slot = find_slot(room_id);
    if (!slot) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->connections.size();
}

size_t PresenceRegistry::get_room_count() {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    return rooms_.size();
}

uint64_t PresenceRegistry::get_room_epoch(const std::string& room_id) {
    SlotPtr slot = find_slot(room_id);
    if (!slot) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->epoch;
}

bool PresenceRegistry::run_if_room_idle(const std::string& room_id, uint64_t epoch,
                                        const std::function<void()>& action) {
    SlotPtr slot = find_slot(room_id);
    if (!slot) {
        return false;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->retired) {
        return false;
    }
    if (!slot->connections.empty()) {
        LOG_PRESENCE_DEBUG("Room " << room_id << " reoccupied (" << slot->connections.size()
                           << " online), skipping idle action");
        return false;
    }
    if (slot->epoch != epoch) {
        LOG_PRESENCE_DEBUG("Room " << room_id << " epoch moved from " << epoch << " to " << slot->epoch
                           << ", skipping idle action");
        return false;
    }

    action();

    slot->retired = true;
    {
        std::lock_guard<std::mutex> index_lock(rooms_mutex_);
        auto it = rooms_.find(room_id);
        if (it != rooms_.end() && it->second == slot) {
            rooms_.erase(it);
        }
    }
    return true;
}

void PresenceRegistry::close_all_connections(int code, const std::string& reason) {
    std::vector<SlotPtr> slots;
    {
        std::lock_guard<std::mutex> lock(rooms_mutex_);
        for (const auto& entry : rooms_) {
            slots.push_back(entry.second);
        }
    }

    std::vector<TransportPtr> transports;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (const auto& entry : slot->connections) {
            transports.push_back(entry.second.transport);
        }
    }

    for (const auto& transport : transports) {
        transport->close(code, reason);
    }
    LOG_PRESENCE_INFO("Closed " << transports.size() << " connections");
}

} // namespace cloudless
