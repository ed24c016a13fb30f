#include "transfer_service.h"
#include "cloudless_log_macros.h"
#include <chrono>
#include <functional>

namespace cloudless {

//=============================================================================
// TransferLockTable
//=============================================================================

TransferLockTable::TransferLockTable(size_t stripe_count)
    : stripes_(stripe_count == 0 ? 1 : stripe_count) {
}

std::mutex& TransferLockTable::lock_for(const std::string& transfer_id) {
    size_t index = std::hash<std::string>()(transfer_id) % stripes_.size();
    return stripes_[index];
}

//=============================================================================
// TransferService
//=============================================================================

TransferService::TransferService(RecordStore& store, BlobStore& blobs, PresenceRegistry& presence,
                                 TransferLockTable& locks, const TransferSettings& settings)
    : store_(store), blobs_(blobs), presence_(presence), locks_(locks), settings_(settings) {
}

std::string TransferService::lookup_display_name(const std::string& room_id, const std::string& user_id) {
    auto member = store_.get_member(room_id, user_id);
    if (!member || member->display_name.empty()) {
        return "Unknown";
    }
    return member->display_name;
}

Outcome TransferService::check_room_access(const std::string& room_id, const std::string& user_id,
                                           std::optional<Room>& room, std::string& error_message) {
    room = store_.get_room(room_id);
    if (!room || !room->is_active) {
        error_message = "Room not found";
        return Outcome::NOT_FOUND;
    }
    if (room->is_expired(Clock::now())) {
        error_message = "Room has expired";
        return Outcome::GONE;
    }
    if (!store_.get_member(room_id, user_id)) {
        error_message = "Not a member of this room";
        return Outcome::FORBIDDEN;
    }
    return Outcome::OK;
}

TransferResult TransferService::initialize_transfer(const std::string& user_id, const TransferRequest& request) {
    TransferResult result;

    std::optional<Room> room;
    result.outcome = check_room_access(request.room_id, user_id, room, result.error_message);
    if (!result.ok()) {
        return result;
    }

    TransferMode mode;
    if (!parse_transfer_mode(request.mode, mode)) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "Invalid transfer mode: " + request.mode;
        return result;
    }
    if (mode == TransferMode::RELAY && !room->allow_relay) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "Relay transfers not allowed in this room";
        return result;
    }
    if (request.file_size <= 0 || static_cast<uint64_t>(request.file_size) > settings_.max_file_size) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "file_size must be in (0, " + std::to_string(settings_.max_file_size) + "]";
        return result;
    }
    if (request.expires_in_hours && (*request.expires_in_hours < 1 || *request.expires_in_hours > 168)) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "expires_in_hours must be in [1, 168]";
        return result;
    }
    if (request.max_downloads < 1 || request.max_downloads > 9999) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "max_downloads must be in [1, 9999]";
        return result;
    }
    if (request.encrypted_filename.empty() || request.nonce.empty()) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "encrypted_filename and nonce are required";
        return result;
    }

    Timestamp now = Clock::now();
    Transfer transfer;
    transfer.id = generate_id();
    transfer.room_id = request.room_id;
    transfer.sender_id = user_id;
    transfer.encrypted_filename = request.encrypted_filename;
    transfer.encrypted_mimetype = request.encrypted_mimetype;
    transfer.file_size = static_cast<uint64_t>(request.file_size);
    transfer.mode = mode;
    transfer.status = TransferStatus::PENDING;
    transfer.nonce = request.nonce;
    transfer.total_chunks = calculate_total_chunks(transfer.file_size, settings_.chunk_size);
    transfer.uploaded_chunks = 0;
    transfer.download_count = 0;
    transfer.max_downloads = static_cast<uint32_t>(request.max_downloads);
    transfer.created_at = now;
    if (request.expires_in_hours) {
        transfer.expires_at = now + std::chrono::hours(*request.expires_in_hours);
    }
    transfer.received_chunks = ChunkBitfield(transfer.total_chunks);

    if (!store_.insert_transfer(transfer)) {
        result.outcome = Outcome::CONFLICT;
        result.error_message = "Transfer id collision";
        return result;
    }

    if (mode == TransferMode::RELAY) {
        std::string location;
        if (!blobs_.create_container(transfer.id, location)) {
            LOG_TRANSFER_ERROR("Failed to create storage for transfer " << transfer.id);
            if (!store_.delete_transfer(transfer.id)) {
                LOG_TRANSFER_WARN("Transfer " << transfer.id << " vanished before rollback");
            }
            result.outcome = Outcome::STORAGE_FAILURE;
            result.error_message = "Failed to create transfer storage";
            return result;
        }
        transfer.storage_path = location;
        bool recorded = store_.update_transfer(transfer.id, [&location](Transfer& t) {
            t.storage_path = location;
            return true;
        });
        if (!recorded) {
            // Room purged between insert and container creation; the orphan scan reclaims it
            result.outcome = Outcome::NOT_FOUND;
            result.error_message = "Room not found";
            return result;
        }
    }

    LOG_TRANSFER_INFO("Initialized " << to_string(mode) << " transfer " << transfer.id << " in room "
                      << transfer.room_id << " (" << transfer.file_size << " bytes, "
                      << transfer.total_chunks << " chunks)");

    result.transfer = transfer;
    result.sender_name = lookup_display_name(transfer.room_id, user_id);
    return result;
}

ChunkUploadResult TransferService::upload_chunk(const std::string& user_id, const std::string& transfer_id,
                                                int64_t chunk_index, const std::vector<uint8_t>& data) {
    ChunkUploadResult result;
    result.transfer_id = transfer_id;

    auto transfer = store_.get_transfer(transfer_id);
    if (!transfer) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Transfer not found";
        return result;
    }
    result.total_chunks = transfer->total_chunks;
    result.uploaded_chunks = transfer->uploaded_chunks;
    result.status = transfer->status;

    if (transfer->sender_id != user_id) {
        result.outcome = Outcome::FORBIDDEN;
        result.error_message = "Only the sender can upload chunks";
        return result;
    }
    if (transfer->status != TransferStatus::PENDING && transfer->status != TransferStatus::UPLOADING) {
        result.outcome = Outcome::CONFLICT;
        result.error_message = std::string("Cannot upload to transfer in state: ") + to_string(transfer->status);
        return result;
    }
    if (chunk_index < 0 || chunk_index >= static_cast<int64_t>(transfer->total_chunks)) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "Invalid chunk index: " + std::to_string(chunk_index);
        return result;
    }
    if (transfer->mode != TransferMode::RELAY) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "Chunk upload only supported for relay transfers";
        return result;
    }
    if (data.empty() || data.size() > settings_.chunk_size) {
        result.outcome = Outcome::BAD_REQUEST;
        result.error_message = "Chunk size must be in [1, " + std::to_string(settings_.chunk_size) + "] bytes";
        return result;
    }
    auto room = store_.get_room(transfer->room_id);
    if (!room || !room->is_active) {
        result.outcome = Outcome::CONFLICT;
        result.error_message = "Room is no longer active";
        return result;
    }

    uint32_t index = static_cast<uint32_t>(chunk_index);
    result.chunk_index = index;
    bool became_ready = false;
    Transfer updated;

    {
        std::lock_guard<std::mutex> lock(locks_.lock_for(transfer_id));

        // State may have moved while we validated (cancel, expiry, purge)
        auto current = store_.get_transfer(transfer_id);
        if (!current) {
            result.outcome = Outcome::NOT_FOUND;
            result.error_message = "Transfer not found";
            return result;
        }
        if (current->status != TransferStatus::PENDING && current->status != TransferStatus::UPLOADING) {
            result.outcome = Outcome::CONFLICT;
            result.error_message = std::string("Cannot upload to transfer in state: ") + to_string(current->status);
            result.status = current->status;
            return result;
        }

        if (!blobs_.write_chunk(transfer_id, index, data)) {
            result.outcome = Outcome::STORAGE_FAILURE;
            result.error_message = "Failed to store chunk " + std::to_string(index);
            result.status = current->status;
            result.uploaded_chunks = current->uploaded_chunks;
            return result;
        }

        bool duplicate = false;
        bool committed = store_.update_transfer(transfer_id, [&](Transfer& t) {
            if (t.received_chunks.size() != t.total_chunks) {
                t.received_chunks = ChunkBitfield(t.total_chunks);
            }
            duplicate = !t.received_chunks.set_bit(index);
            t.uploaded_chunks = static_cast<uint32_t>(t.received_chunks.count());
            if (t.status == TransferStatus::PENDING) {
                t.status = TransferStatus::UPLOADING;
            }
            if (t.received_chunks.all_set()) {
                t.status = TransferStatus::READY;
                became_ready = true;
            }
            updated = t;
            return true;
        });
        if (!committed) {
            result.outcome = Outcome::NOT_FOUND;
            result.error_message = "Transfer not found";
            return result;
        }
        result.duplicate = duplicate;
    }

    result.uploaded_chunks = updated.uploaded_chunks;
    result.total_chunks = updated.total_chunks;
    result.status = updated.status;

    if (result.duplicate) {
        LOG_TRANSFER_DEBUG("Chunk " << index << " of " << transfer_id << " re-uploaded, not counted again");
    } else {
        LOG_TRANSFER_DEBUG("Chunk " << index << " of " << transfer_id << " stored ("
                           << updated.uploaded_chunks << "/" << updated.total_chunks << ")");
    }

    if (became_ready) {
        LOG_TRANSFER_INFO("Transfer " << transfer_id << " is ready (" << updated.total_chunks << " chunks)");
        announce_ready(updated);
    }
    return result;
}

void TransferService::announce_ready(const Transfer& transfer) {
    nlohmann::json event;
    event["type"] = "new_transfer";
    event["transfer_id"] = transfer.id;
    event["sender_id"] = transfer.sender_id;
    event["sender_name"] = lookup_display_name(transfer.room_id, transfer.sender_id);
    event["encrypted_filename"] = transfer.encrypted_filename;
    event["file_size"] = transfer.file_size;
    event["status"] = to_string(transfer.status);
    event["timestamp"] = format_timestamp(Clock::now());

    int delivered = presence_.broadcast_to_room(transfer.room_id, event);
    LOG_TRANSFER_DEBUG("Announced transfer " << transfer.id << " to " << delivered << " connections");
}

DownloadResult TransferService::download(const std::string& user_id, const std::string& transfer_id) {
    DownloadResult result;

    auto transfer = store_.get_transfer(transfer_id);
    if (!transfer) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Transfer not found";
        return result;
    }
    if (!store_.get_member(transfer->room_id, user_id)) {
        result.outcome = Outcome::FORBIDDEN;
        result.error_message = "Not a member of this room";
        return result;
    }

    std::lock_guard<std::mutex> lock(locks_.lock_for(transfer_id));

    auto current = store_.get_transfer(transfer_id);
    if (!current) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Transfer not found";
        return result;
    }
    result.status = current->status;
    result.download_count = current->download_count;

    Timestamp now = Clock::now();
    if (!current->can_download(now)) {
        if (current->is_expired(now)) {
            result.outcome = Outcome::GONE;
            result.error_message = "Transfer has expired";
        } else if (current->download_count >= current->max_downloads) {
            result.outcome = Outcome::GONE;
            result.error_message = "Maximum downloads reached";
        } else {
            result.outcome = Outcome::NOT_READY;
            result.error_message = std::string("Transfer not ready: ") + to_string(current->status);
        }
        return result;
    }

    std::vector<uint8_t> data;
    data.reserve(static_cast<size_t>(current->file_size));
    std::vector<uint8_t> chunk;
    for (uint32_t i = 0; i < current->total_chunks; ++i) {
        if (!blobs_.read_chunk(transfer_id, i, chunk)) {
            result.outcome = Outcome::STORAGE_FAILURE;
            result.error_message = "Failed to read chunk " + std::to_string(i);
            return result;
        }
        data.insert(data.end(), chunk.begin(), chunk.end());
    }

    Transfer updated;
    bool committed = store_.update_transfer(transfer_id, [&](Transfer& t) {
        t.download_count++;
        if (t.download_count >= t.max_downloads) {
            t.status = TransferStatus::COMPLETED;
            t.completed_at = now;
        }
        updated = t;
        return true;
    });
    if (!committed) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Transfer not found";
        return result;
    }

    LOG_TRANSFER_INFO("Transfer " << transfer_id << " downloaded by " << user_id << " ("
                      << updated.download_count << "/" << updated.max_downloads << ")");
    if (updated.status == TransferStatus::COMPLETED) {
        LOG_TRANSFER_INFO("Transfer " << transfer_id << " completed");
    }

    result.data = std::move(data);
    result.nonce = updated.nonce;
    result.download_count = updated.download_count;
    result.status = updated.status;
    return result;
}

TransferResult TransferService::cancel_transfer(const std::string& user_id, const std::string& transfer_id) {
    TransferResult result;

    auto transfer = store_.get_transfer(transfer_id);
    if (!transfer) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Transfer not found";
        return result;
    }
    if (transfer->sender_id != user_id) {
        result.outcome = Outcome::FORBIDDEN;
        result.error_message = "Only the sender can cancel a transfer";
        return result;
    }

    std::lock_guard<std::mutex> lock(locks_.lock_for(transfer_id));

    auto current = store_.get_transfer(transfer_id);
    if (!current) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Transfer not found";
        return result;
    }
    if (current->is_terminal()) {
        result.outcome = Outcome::CONFLICT;
        result.error_message = std::string("Transfer already ") + to_string(current->status);
        result.transfer = *current;
        return result;
    }

    if (current->mode == TransferMode::RELAY && !blobs_.delete_container(transfer_id)) {
        result.outcome = Outcome::STORAGE_FAILURE;
        result.error_message = "Failed to delete transfer storage";
        result.transfer = *current;
        return result;
    }

    Transfer updated;
    bool committed = store_.update_transfer(transfer_id, [&updated](Transfer& t) {
        t.status = TransferStatus::CANCELLED;
        t.storage_path.clear();
        updated = t;
        return true;
    });
    if (!committed) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Transfer not found";
        return result;
    }

    LOG_TRANSFER_INFO("Transfer " << transfer_id << " cancelled by sender");
    result.transfer = updated;
    result.sender_name = lookup_display_name(updated.room_id, updated.sender_id);
    return result;
}

TransferResult TransferService::get_transfer(const std::string& user_id, const std::string& transfer_id) {
    TransferResult result;

    auto transfer = store_.get_transfer(transfer_id);
    if (!transfer) {
        result.outcome = Outcome::NOT_FOUND;
        result.error_message = "Transfer not found";
        return result;
    }
    if (!store_.get_member(transfer->room_id, user_id)) {
        result.outcome = Outcome::FORBIDDEN;
        result.error_message = "Not a member of this room";
        return result;
    }

    result.transfer = *transfer;
    result.sender_name = lookup_display_name(transfer->room_id, transfer->sender_id);
    return result;
}

TransferListResult TransferService::list_room_transfers(const std::string& user_id, const std::string& room_id) {
    TransferListResult result;

    std::optional<Room> room;
    result.outcome = check_room_access(room_id, user_id, room, result.error_message);
    if (!result.ok()) {
        return result;
    }

    result.transfers = store_.list_transfers_for_room(room_id);
    return result;
}

nlohmann::json TransferService::describe_transfer(const Transfer& transfer, const std::string& sender_name) {
    nlohmann::json descriptor;
    descriptor["id"] = transfer.id;
    descriptor["room_id"] = transfer.room_id;
    descriptor["sender_id"] = transfer.sender_id;
    descriptor["sender_name"] = sender_name;
    descriptor["encrypted_filename"] = transfer.encrypted_filename;
    if (transfer.encrypted_mimetype) {
        descriptor["encrypted_mimetype"] = *transfer.encrypted_mimetype;
    } else {
        descriptor["encrypted_mimetype"] = nullptr;
    }
    descriptor["file_size"] = transfer.file_size;
    descriptor["mode"] = to_string(transfer.mode);
    descriptor["status"] = to_string(transfer.status);
    descriptor["nonce"] = transfer.nonce;
    descriptor["total_chunks"] = transfer.total_chunks;
    descriptor["uploaded_chunks"] = transfer.uploaded_chunks;
    descriptor["created_at"] = format_timestamp(transfer.created_at);
    if (transfer.expires_at) {
        descriptor["expires_at"] = format_timestamp(*transfer.expires_at);
    } else {
        descriptor["expires_at"] = nullptr;
    }
    descriptor["download_count"] = transfer.download_count;
    descriptor["max_downloads"] = transfer.max_downloads;
    return descriptor;
}

nlohmann::json TransferService::describe_chunk_upload(const ChunkUploadResult& result) {
    nlohmann::json descriptor;
    descriptor["transfer_id"] = result.transfer_id;
    descriptor["chunk_index"] = result.chunk_index;
    descriptor["uploaded_chunks"] = result.uploaded_chunks;
    descriptor["total_chunks"] = result.total_chunks;
    descriptor["status"] = to_string(result.status);
    return descriptor;
}

} // namespace cloudless
