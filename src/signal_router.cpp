#include "signal_router.h"
#include "cloudless_log_macros.h"

namespace cloudless {

namespace {

// Present, a string, and non-empty
bool get_required_string(const nlohmann::json& frame, const char* key, std::string& out) {
    auto it = frame.find(key);
    if (it == frame.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return !out.empty();
}

bool has_payload(const nlohmann::json& frame, const char* key) {
    auto it = frame.find(key);
    if (it == frame.end() || it->is_null()) {
        return false;
    }
    if (it->is_string()) {
        return !it->get_ref<const std::string&>().empty();
    }
    return !it->empty();
}

nlohmann::json passthrough(const nlohmann::json& frame, const char* key) {
    auto it = frame.find(key);
    if (it == frame.end()) {
        return nullptr;
    }
    return *it;
}

} // namespace

FrameType classify_frame(const nlohmann::json& frame) {
    if (!frame.is_object()) {
        return FrameType::UNKNOWN;
    }
    auto it = frame.find("type");
    if (it == frame.end() || !it->is_string()) {
        return FrameType::UNKNOWN;
    }

    const std::string& type = it->get_ref<const std::string&>();
    if (type == "chat") return FrameType::CHAT;
    if (type == "signal") return FrameType::SIGNAL;
    if (type == "typing") return FrameType::TYPING;
    if (type == "transfer_update") return FrameType::TRANSFER_UPDATE;
    if (type == "ping") return FrameType::PING;
    return FrameType::UNKNOWN;
}

const char* frame_type_to_string(FrameType type) {
    switch (type) {
        case FrameType::CHAT:            return "chat";
        case FrameType::SIGNAL:          return "signal";
        case FrameType::TYPING:          return "typing";
        case FrameType::TRANSFER_UPDATE: return "transfer_update";
        case FrameType::PING:            return "ping";
        case FrameType::UNKNOWN:         return "unknown";
    }
    return "unknown";
}

SignalRouter::SignalRouter(RecordStore& store, PresenceRegistry& presence, AuthVerifier& auth)
    : store_(store), presence_(presence), auth_(auth), frames_handled_(0), frames_dropped_(0) {
}

Admission SignalRouter::admit(const std::string& credential, const std::string& room_id) {
    Admission admission;

    std::string user_id;
    if (!auth_.verify(credential, user_id)) {
        admission.close_code = CLOSE_INVALID_TOKEN;
        admission.reason = "Invalid token";
        return admission;
    }

    auto room = store_.get_room(room_id);
    if (!room || !room->is_active) {
        admission.close_code = CLOSE_ROOM_UNAVAILABLE;
        admission.reason = "Room not found";
        return admission;
    }
    if (room->is_expired(Clock::now())) {
        admission.close_code = CLOSE_ROOM_UNAVAILABLE;
        admission.reason = "Room has expired";
        return admission;
    }

    auto member = store_.get_member(room_id, user_id);
    if (!member) {
        admission.close_code = CLOSE_NOT_MEMBER;
        admission.reason = "Not a member";
        return admission;
    }

    admission.accepted = true;
    admission.user_id = user_id;
    admission.display_name = member->display_name;
    return admission;
}

void SignalRouter::serve(const TransportPtr& transport, const std::string& credential, const std::string& room_id) {
    Admission admission = admit(credential, room_id);
    if (!admission.accepted) {
        LOG_ROUTER_INFO("Rejected connection from " << transport->describe() << " to room " << room_id
                        << ": " << admission.reason << " (" << admission.close_code << ")");
        transport->close(admission.close_code, admission.reason);
        return;
    }

    if (!presence_.connect(room_id, admission.user_id, transport)) {
        transport->close(CLOSE_NOT_MEMBER, "Not a member");
        return;
    }

    nlohmann::json online;
    online["type"] = "online_users";
    online["users"] = presence_.get_online_users(room_id);
    if (!transport->send_text(online.dump())) {
        LOG_ROUTER_WARN("Failed to send online_users to " << admission.user_id);
    }

    std::string text;
    // A closed transport may still hold queued frames; they are dropped
    while (transport->receive_text(text) && !transport->is_closed()) {
        handle_frame(room_id, admission, *transport, text);
    }

    LOG_ROUTER_DEBUG("Receive loop for " << admission.user_id << " in room " << room_id << " ended");
    presence_.disconnect(room_id, admission.user_id, transport.get());
}

bool SignalRouter::handle_frame(const std::string& room_id, const Admission& admission, Transport& transport,
                                const std::string& text) {
    nlohmann::json frame = nlohmann::json::parse(text, nullptr, false);
    if (frame.is_discarded()) {
        LOG_ROUTER_DEBUG("Dropping non-JSON frame from " << admission.user_id);
        frames_dropped_++;
        return false;
    }

    FrameType type = classify_frame(frame);
    bool handled = false;
    try {
        switch (type) {
            case FrameType::CHAT:
                handled = handle_chat(room_id, admission, frame);
                break;
            case FrameType::SIGNAL:
                handled = handle_signal(room_id, admission, frame);
                break;
            case FrameType::TYPING:
                handled = handle_typing(room_id, admission, frame);
                break;
            case FrameType::TRANSFER_UPDATE:
                handled = handle_transfer_update(room_id, admission, frame);
                break;
            case FrameType::PING:
                handled = handle_ping(transport);
                break;
            case FrameType::UNKNOWN:
                break;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ROUTER_DEBUG("Dropping malformed " << frame_type_to_string(type) << " frame from "
                         << admission.user_id << ": " << e.what());
        handled = false;
    }

    if (handled) {
        frames_handled_++;
    } else {
        frames_dropped_++;
        LOG_ROUTER_DEBUG("Dropped " << frame_type_to_string(type) << " frame from " << admission.user_id);
    }
    return handled;
}

bool SignalRouter::handle_chat(const std::string& room_id, const Admission& admission, const nlohmann::json& frame) {
    std::string encrypted_content;
    std::string nonce;
    if (!get_required_string(frame, "encrypted_content", encrypted_content) ||
        !get_required_string(frame, "nonce", nonce)) {
        return false;
    }

    Message message;
    message.id = generate_id();
    message.room_id = room_id;
    message.sender_id = admission.user_id;
    message.encrypted_content = encrypted_content;
    message.nonce = nonce;
    message.created_at = Clock::now();
    message.delivered = false;

    if (!store_.insert_message(message)) {
        LOG_ROUTER_ERROR("Failed to persist chat message from " << admission.user_id << " in room " << room_id);
        return false;
    }

    nlohmann::json event;
    event["type"] = "chat";
    event["message_id"] = message.id;
    event["sender_id"] = admission.user_id;
    event["sender_name"] = admission.display_name;
    event["encrypted_content"] = encrypted_content;
    event["nonce"] = nonce;
    event["timestamp"] = format_timestamp(message.created_at);

    presence_.broadcast_to_room(room_id, event, admission.user_id);
    return true;
}

bool SignalRouter::handle_signal(const std::string& room_id, const Admission& admission, const nlohmann::json& frame) {
    std::string target_user;
    std::string signal_type;
    if (!get_required_string(frame, "target_user", target_user) ||
        !get_required_string(frame, "signal_type", signal_type) ||
        !has_payload(frame, "signal_data")) {
        return false;
    }

    nlohmann::json event;
    event["type"] = "signal";
    event["from_user"] = admission.user_id;
    event["signal_type"] = signal_type;
    event["signal_data"] = frame.at("signal_data");

    presence_.send_to_user(room_id, target_user, event);
    LOG_ROUTER_DEBUG("Relayed " << signal_type << " from " << admission.user_id << " to " << target_user);
    return true;
}

bool SignalRouter::handle_typing(const std::string& room_id, const Admission& admission, const nlohmann::json& frame) {
    nlohmann::json event;
    event["type"] = "typing";
    event["user_id"] = admission.user_id;
    event["user_name"] = admission.display_name;
    event["is_typing"] = frame.value("is_typing", false);

    presence_.broadcast_to_room(room_id, event, admission.user_id);
    return true;
}

bool SignalRouter::handle_transfer_update(const std::string& room_id, const Admission& admission,
                                          const nlohmann::json& frame) {
    nlohmann::json event;
    event["type"] = "transfer_update";
    event["transfer_id"] = passthrough(frame, "transfer_id");
    event["user_id"] = admission.user_id;
    event["status"] = passthrough(frame, "status");
    event["progress"] = passthrough(frame, "progress");
    event["timestamp"] = format_timestamp(Clock::now());

    presence_.broadcast_to_room(room_id, event);
    return true;
}

bool SignalRouter::handle_ping(Transport& transport) {
    nlohmann::json pong;
    pong["type"] = "pong";
    if (!transport.send_text(pong.dump())) {
        LOG_ROUTER_DEBUG("Failed to answer ping on " << transport.describe());
        return false;
    }
    return true;
}

} // namespace cloudless
