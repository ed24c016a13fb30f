#include "types.h"
#include <random>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <ctime>
#include <cctype>

namespace cloudless {

//=============================================================================
// Enum conversions
//=============================================================================

const char* to_string(RoomType type) {
    switch (type) {
        case RoomType::DIRECT: return "direct";
        case RoomType::GROUP:  return "group";
    }
    return "direct";
}

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING:   return "pending";
        case TransferStatus::UPLOADING: return "uploading";
        case TransferStatus::READY:     return "ready";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::EXPIRED:   return "expired";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "pending";
}

const char* to_string(TransferMode mode) {
    switch (mode) {
        case TransferMode::P2P:   return "p2p";
        case TransferMode::RELAY: return "relay";
    }
    return "relay";
}

bool parse_room_type(const std::string& text, RoomType& out) {
    if (text == "direct") { out = RoomType::DIRECT; return true; }
    if (text == "group")  { out = RoomType::GROUP;  return true; }
    return false;
}

bool parse_transfer_status(const std::string& text, TransferStatus& out) {
    static const TransferStatus all[] = {
        TransferStatus::PENDING, TransferStatus::UPLOADING, TransferStatus::READY,
        TransferStatus::COMPLETED, TransferStatus::EXPIRED, TransferStatus::CANCELLED
    };
    for (TransferStatus status : all) {
        if (text == to_string(status)) {
            out = status;
            return true;
        }
    }
    return false;
}

bool parse_transfer_mode(const std::string& text, TransferMode& out) {
    if (text == "p2p")   { out = TransferMode::P2P;   return true; }
    if (text == "relay") { out = TransferMode::RELAY; return true; }
    return false;
}

//=============================================================================
// Timestamps
//=============================================================================

std::string format_timestamp(Timestamp ts) {
    auto since_epoch = ts.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds).count();
    if (micros < 0) {
        seconds -= std::chrono::seconds(1);
        micros += 1000000;
    }

    std::time_t time = static_cast<std::time_t>(seconds.count());
    std::tm utc_tm;
    gmtime_r(&time, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(6) << micros << "+00:00";
    return oss.str();
}

bool parse_timestamp(const std::string& text, Timestamp& out) {
    std::tm utc_tm = {};
    std::istringstream iss(text);
    iss >> std::get_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return false;
    }

    int64_t micros = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string fraction;
        while (std::isdigit(iss.peek())) {
            fraction.push_back(static_cast<char>(iss.get()));
        }
        fraction = fraction.substr(0, 6);
        while (fraction.size() < 6) {
            fraction.push_back('0');
        }
        micros = std::stoll(fraction);
    }

    std::time_t seconds = timegm(&utc_tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(seconds) + std::chrono::microseconds(micros)));
    return true;
}

//=============================================================================
// Identifiers
//=============================================================================

std::string generate_id(size_t num_bytes) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 255);

    std::vector<uint8_t> bytes(num_bytes);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dis(gen));
    }

    std::string result;
    result.reserve((num_bytes * 4 + 2) / 3);
    size_t i = 0;
    for (; i + 2 < num_bytes; i += 3) {
        uint32_t v = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        result.push_back(alphabet[(v >> 18) & 0x3F]);
        result.push_back(alphabet[(v >> 12) & 0x3F]);
        result.push_back(alphabet[(v >> 6) & 0x3F]);
        result.push_back(alphabet[v & 0x3F]);
    }
    if (num_bytes - i == 1) {
        uint32_t v = bytes[i] << 16;
        result.push_back(alphabet[(v >> 18) & 0x3F]);
        result.push_back(alphabet[(v >> 12) & 0x3F]);
    } else if (num_bytes - i == 2) {
        uint32_t v = (bytes[i] << 16) | (bytes[i + 1] << 8);
        result.push_back(alphabet[(v >> 18) & 0x3F]);
        result.push_back(alphabet[(v >> 12) & 0x3F]);
        result.push_back(alphabet[(v >> 6) & 0x3F]);
    }
    return result;
}

std::string generate_room_code() {
    static const std::string alphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<size_t> dis(0, alphabet.size() - 1);

    std::string code;
    for (int i = 0; i < 6; ++i) {
        code.push_back(alphabet[dis(gen)]);
    }
    return code;
}

uint32_t calculate_total_chunks(uint64_t file_size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

//=============================================================================
// JSON persistence
//=============================================================================

namespace {

nlohmann::json optional_timestamp_to_json(const std::optional<Timestamp>& ts) {
    if (!ts) return nullptr;
    return format_timestamp(*ts);
}

Timestamp timestamp_from_json(const nlohmann::json& j, const char* key) {
    Timestamp ts;
    if (!parse_timestamp(j.at(key).get<std::string>(), ts)) {
        throw std::invalid_argument(std::string("invalid timestamp in field ") + key);
    }
    return ts;
}

std::optional<Timestamp> optional_timestamp_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return timestamp_from_json(j, key);
}

} // namespace

void to_json(nlohmann::json& j, const Room& room) {
    j = nlohmann::json{
        {"id", room.id},
        {"code", room.code},
        {"name", room.name},
        {"room_type", to_string(room.type)},
        {"created_by", room.created_by},
        {"is_active", room.is_active},
        {"allow_relay", room.allow_relay},
        {"created_at", format_timestamp(room.created_at)},
        {"expires_at", optional_timestamp_to_json(room.expires_at)}
    };
}

void from_json(const nlohmann::json& j, Room& room) {
    room.id = j.at("id").get<std::string>();
    room.code = j.at("code").get<std::string>();
    room.name = j.value("name", "");
    if (!parse_room_type(j.at("room_type").get<std::string>(), room.type)) {
        throw std::invalid_argument("invalid room_type");
    }
    room.created_by = j.at("created_by").get<std::string>();
    room.is_active = j.at("is_active").get<bool>();
    room.allow_relay = j.value("allow_relay", true);
    room.created_at = timestamp_from_json(j, "created_at");
    room.expires_at = optional_timestamp_from_json(j, "expires_at");
}

void to_json(nlohmann::json& j, const Member& member) {
    j = nlohmann::json{
        {"room_id", member.room_id},
        {"user_id", member.user_id},
        {"display_name", member.display_name},
        {"public_key", member.public_key},
        {"joined_at", format_timestamp(member.joined_at)},
        {"is_online", member.is_online},
        {"last_seen", optional_timestamp_to_json(member.last_seen)}
    };
}

void from_json(const nlohmann::json& j, Member& member) {
    member.room_id = j.at("room_id").get<std::string>();
    member.user_id = j.at("user_id").get<std::string>();
    member.display_name = j.value("display_name", "");
    member.public_key = j.at("public_key").get<std::string>();
    member.joined_at = timestamp_from_json(j, "joined_at");
    member.is_online = j.value("is_online", false);
    member.last_seen = optional_timestamp_from_json(j, "last_seen");
}

void to_json(nlohmann::json& j, const Transfer& transfer) {
    j = nlohmann::json{
        {"id", transfer.id},
        {"room_id", transfer.room_id},
        {"sender_id", transfer.sender_id},
        {"encrypted_filename", transfer.encrypted_filename},
        {"encrypted_mimetype", transfer.encrypted_mimetype ? nlohmann::json(*transfer.encrypted_mimetype) : nlohmann::json(nullptr)},
        {"file_size", transfer.file_size},
        {"mode", to_string(transfer.mode)},
        {"status", to_string(transfer.status)},
        {"nonce", transfer.nonce},
        {"total_chunks", transfer.total_chunks},
        {"uploaded_chunks", transfer.uploaded_chunks},
        {"download_count", transfer.download_count},
        {"max_downloads", transfer.max_downloads},
        {"created_at", format_timestamp(transfer.created_at)},
        {"completed_at", optional_timestamp_to_json(transfer.completed_at)},
        {"expires_at", optional_timestamp_to_json(transfer.expires_at)},
        {"storage_path", transfer.storage_path},
        {"received_chunks", transfer.received_chunks.to_hex()}
    };
}

void from_json(const nlohmann::json& j, Transfer& transfer) {
    transfer.id = j.at("id").get<std::string>();
    transfer.room_id = j.at("room_id").get<std::string>();
    transfer.sender_id = j.at("sender_id").get<std::string>();
    transfer.encrypted_filename = j.at("encrypted_filename").get<std::string>();
    if (j.contains("encrypted_mimetype") && !j.at("encrypted_mimetype").is_null()) {
        transfer.encrypted_mimetype = j.at("encrypted_mimetype").get<std::string>();
    } else {
        transfer.encrypted_mimetype.reset();
    }
    transfer.file_size = j.at("file_size").get<uint64_t>();
    if (!parse_transfer_mode(j.at("mode").get<std::string>(), transfer.mode)) {
        throw std::invalid_argument("invalid transfer mode");
    }
    if (!parse_transfer_status(j.at("status").get<std::string>(), transfer.status)) {
        throw std::invalid_argument("invalid transfer status");
    }
    transfer.nonce = j.at("nonce").get<std::string>();
    transfer.total_chunks = j.at("total_chunks").get<uint32_t>();
    transfer.uploaded_chunks = j.at("uploaded_chunks").get<uint32_t>();
    transfer.download_count = j.at("download_count").get<uint32_t>();
    transfer.max_downloads = j.at("max_downloads").get<uint32_t>();
    transfer.created_at = timestamp_from_json(j, "created_at");
    transfer.completed_at = optional_timestamp_from_json(j, "completed_at");
    transfer.expires_at = optional_timestamp_from_json(j, "expires_at");
    transfer.storage_path = j.value("storage_path", "");
    if (!ChunkBitfield::from_hex(j.value("received_chunks", ""), transfer.total_chunks, transfer.received_chunks)) {
        throw std::invalid_argument("invalid received_chunks bitfield");
    }
}

void to_json(nlohmann::json& j, const Message& message) {
    j = nlohmann::json{
        {"id", message.id},
        {"room_id", message.room_id},
        {"sender_id", message.sender_id},
        {"encrypted_content", message.encrypted_content},
        {"nonce", message.nonce},
        {"created_at", format_timestamp(message.created_at)},
        {"delivered", message.delivered}
    };
}

void from_json(const nlohmann::json& j, Message& message) {
    message.id = j.at("id").get<std::string>();
    message.room_id = j.at("room_id").get<std::string>();
    message.sender_id = j.at("sender_id").get<std::string>();
    message.encrypted_content = j.at("encrypted_content").get<std::string>();
    message.nonce = j.at("nonce").get<std::string>();
    message.created_at = timestamp_from_json(j, "created_at");
    message.delivered = j.value("delivered", false);
}

} // namespace cloudless
