#pragma once

/**
 * @file signal_router.h
 * @brief Per-connection admission and realtime frame dispatch
 */

#include "auth.h"
#include "presence_registry.h"
#include "record_store.h"
#include "transport.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <string>

namespace cloudless {

/**
 * Inbound frame kinds, selected by the frame's "type" tag
 */
enum class FrameType {
    CHAT,               // Encrypted chat message, persisted then broadcast
    SIGNAL,             // WebRTC offer/answer/ICE, forwarded to one member
    TYPING,             // Typing hint, broadcast to others
    TRANSFER_UPDATE,    // Informational progress, broadcast to everyone
    PING,               // Liveness probe, answered with pong
    UNKNOWN
};

FrameType classify_frame(const nlohmann::json& frame);
const char* frame_type_to_string(FrameType type);

struct Admission {
    bool accepted;
    int close_code;
    std::string reason;
    std::string user_id;
    std::string display_name;

    Admission() : accepted(false), close_code(CLOSE_NORMAL) {}
};

class SignalRouter {
public:
    SignalRouter(RecordStore& store, PresenceRegistry& presence, AuthVerifier& auth);

    /**
     * Serve one realtime connection until its transport closes.
     *
     * Rejected connections are closed with 4001 (bad credential), 4004 (room
     * missing, inactive or expired) or 4003 (not a member). Accepted ones are
     * registered, sent online_users once, and then fed frame by frame to
     * handle_frame. The registration is released exactly once on exit.
     */
    void serve(const TransportPtr& transport, const std::string& credential, const std::string& room_id);

    /**
     * Credential, room and membership checks, in that order
     */
    Admission admit(const std::string& credential, const std::string& room_id);

    /**
     * Dispatch one inbound text frame from an admitted connection.
     * Malformed or unknown frames are dropped.
     * @return true if the frame was acted upon
     */
    bool handle_frame(const std::string& room_id, const Admission& admission, Transport& transport,
                      const std::string& text);

    uint64_t get_frames_handled() const { return frames_handled_.load(); }
    uint64_t get_frames_dropped() const { return frames_dropped_.load(); }

private:
    RecordStore& store_;
    PresenceRegistry& presence_;
    AuthVerifier& auth_;

    std::atomic<uint64_t> frames_handled_;
    std::atomic<uint64_t> frames_dropped_;

    bool handle_chat(const std::string& room_id, const Admission& admission, const nlohmann::json& frame);
    bool handle_signal(const std::string& room_id, const Admission& admission, const nlohmann::json& frame);
    bool handle_typing(const std::string& room_id, const Admission& admission, const nlohmann::json& frame);
    bool handle_transfer_update(const std::string& room_id, const Admission& admission, const nlohmann::json& frame);
    bool handle_ping(Transport& transport);
};

} // namespace cloudless
