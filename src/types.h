#pragma once

#include "chunk_bitfield.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace cloudless {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * Room kind
 */
enum class RoomType {
    DIRECT,         // One-to-one exchange
    GROUP           // Multiple participants
};

/**
 * Transfer lifecycle. COMPLETED, EXPIRED and CANCELLED are terminal.
 */
enum class TransferStatus {
    PENDING,        // Created, no chunk received yet
    UPLOADING,      // At least one chunk received
    READY,          // Every chunk received, downloadable
    COMPLETED,      // Download limit reached
    EXPIRED,        // Reaped after expires_at
    CANCELLED       // Cancelled by the sender
};

/**
 * How the encrypted bytes travel
 */
enum class TransferMode {
    P2P,            // Direct WebRTC data channel, bytes never reach the server
    RELAY           // Server stores and forwards encrypted chunks
};

struct Room {
    std::string id;
    std::string code;                       // Human-readable join code
    std::string name;
    RoomType type;
    std::string created_by;
    bool is_active;
    bool allow_relay;
    Timestamp created_at;
    std::optional<Timestamp> expires_at;

    Room() : type(RoomType::DIRECT), is_active(true), allow_relay(true) {}

    bool is_expired(Timestamp now = Clock::now()) const {
        return expires_at.has_value() && now > *expires_at;
    }
};

struct Member {
    std::string room_id;
    std::string user_id;
    std::string display_name;
    std::string public_key;                 // Base64 X25519 public key, replaced on rejoin
    Timestamp joined_at;
    bool is_online;
    std::optional<Timestamp> last_seen;

    Member() : is_online(false) {}
};

struct Transfer {
    std::string id;
    std::string room_id;
    std::string sender_id;
    std::string encrypted_filename;
    std::optional<std::string> encrypted_mimetype;
    uint64_t file_size;
    TransferMode mode;
    TransferStatus status;
    std::string nonce;
    uint32_t total_chunks;
    uint32_t uploaded_chunks;
    uint32_t download_count;
    uint32_t max_downloads;
    Timestamp created_at;
    std::optional<Timestamp> completed_at;
    std::optional<Timestamp> expires_at;
    std::string storage_path;               // Relay container location, empty once released
    ChunkBitfield received_chunks;

    Transfer()
        : file_size(0), mode(TransferMode::RELAY), status(TransferStatus::PENDING),
          total_chunks(0), uploaded_chunks(0), download_count(0), max_downloads(1) {}

    bool is_terminal() const {
        return status == TransferStatus::COMPLETED ||
               status == TransferStatus::EXPIRED ||
               status == TransferStatus::CANCELLED;
    }

    bool is_expired(Timestamp now = Clock::now()) const {
        if (status == TransferStatus::EXPIRED) return true;
        return expires_at.has_value() && now > *expires_at;
    }

    bool can_download(Timestamp now = Clock::now()) const {
        return status == TransferStatus::READY && !is_expired(now) && download_count < max_downloads;
    }
};

struct Message {
    std::string id;
    std::string room_id;
    std::string sender_id;
    std::string encrypted_content;
    std::string nonce;
    Timestamp created_at;
    bool delivered;

    Message() : delivered(false) {}
};

// Enum <-> wire strings
const char* to_string(RoomType type);
const char* to_string(TransferStatus status);
const char* to_string(TransferMode mode);
bool parse_room_type(const std::string& text, RoomType& out);
bool parse_transfer_status(const std::string& text, TransferStatus& out);
bool parse_transfer_mode(const std::string& text, TransferMode& out);

/**
 * ISO-8601 UTC with microseconds, e.g. 2026-03-01T12:00:00.000000+00:00
 */
std::string format_timestamp(Timestamp ts);
bool parse_timestamp(const std::string& text, Timestamp& out);

/**
 * URL-safe random identifier (base64url of `num_bytes` random bytes, no padding)
 */
std::string generate_id(size_t num_bytes = 16);

/**
 * Six characters from an alphabet without 0/O/1/I
 */
std::string generate_room_code();

/**
 * Ceiling division of file size by chunk size
 */
uint32_t calculate_total_chunks(uint64_t file_size, uint32_t chunk_size);

// JSON persistence (nlohmann ADL hooks)
void to_json(nlohmann::json& j, const Room& room);
void from_json(const nlohmann::json& j, Room& room);
void to_json(nlohmann::json& j, const Member& member);
void from_json(const nlohmann::json& j, Member& member);
void to_json(nlohmann::json& j, const Transfer& transfer);
void from_json(const nlohmann::json& j, Transfer& transfer);
void to_json(nlohmann::json& j, const Message& message);
void from_json(const nlohmann::json& j, Message& message);

} // namespace cloudless
