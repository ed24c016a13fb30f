#pragma once

/**
 * @file transfer_service.h
 * @brief Chunked relay transfer state machine
 *
 * PENDING -> UPLOADING -> READY -> COMPLETED, with CANCELLED reachable from any
 * non-terminal state by the sender and EXPIRED applied only by the reaper.
 * Every state change of one transfer happens under that transfer's entry in a
 * TransferLockTable shared with the reaper.
 */

#include "blob_store.h"
#include "outcome.h"
#include "presence_registry.h"
#include "record_store.h"
#include "types.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cloudless {

/**
 * Striped mutexes keyed by transfer id. Two transfers may share a stripe;
 * one transfer always maps to the same stripe.
 */
class TransferLockTable {
public:
    explicit TransferLockTable(size_t stripe_count = 64);

    std::mutex& lock_for(const std::string& transfer_id);

    size_t get_stripe_count() const { return stripes_.size(); }

private:
    std::vector<std::mutex> stripes_;
};

struct TransferSettings {
    uint32_t chunk_size;
    uint64_t max_file_size;

    TransferSettings()
        : chunk_size(64 * 1024),
          max_file_size(1024ULL * 1024 * 1024) {}
};

/**
 * Parameters of a new transfer as sent by the client
 */
struct TransferRequest {
    std::string room_id;
    std::string encrypted_filename;
    std::optional<std::string> encrypted_mimetype;
    int64_t file_size;
    std::string nonce;
    std::string mode;                       // "relay" or "p2p"
    std::optional<int64_t> expires_in_hours; // nullopt: never expires
    int64_t max_downloads;

    TransferRequest()
        : file_size(0), mode("relay"), expires_in_hours(24), max_downloads(9999) {}
};

struct TransferResult {
    Outcome outcome;
    std::string error_message;
    Transfer transfer;
    std::string sender_name;

    TransferResult() : outcome(Outcome::OK) {}
    bool ok() const { return outcome == Outcome::OK; }
};

struct TransferListResult {
    Outcome outcome;
    std::string error_message;
    std::vector<Transfer> transfers;

    TransferListResult() : outcome(Outcome::OK) {}
    bool ok() const { return outcome == Outcome::OK; }
};

struct ChunkUploadResult {
    Outcome outcome;
    std::string error_message;
    std::string transfer_id;
    uint32_t chunk_index;
    uint32_t uploaded_chunks;
    uint32_t total_chunks;
    TransferStatus status;
    bool duplicate;                         // Index had already been received

    ChunkUploadResult()
        : outcome(Outcome::OK), chunk_index(0), uploaded_chunks(0), total_chunks(0),
          status(TransferStatus::PENDING), duplicate(false) {}
    bool ok() const { return outcome == Outcome::OK; }
};

struct DownloadResult {
    Outcome outcome;
    std::string error_message;
    std::vector<uint8_t> data;              // Concatenated ciphertext, chunk order
    std::string nonce;
    uint32_t download_count;
    TransferStatus status;

    DownloadResult() : outcome(Outcome::OK), download_count(0), status(TransferStatus::READY) {}
    bool ok() const { return outcome == Outcome::OK; }
};

class TransferService {
public:
    TransferService(RecordStore& store, BlobStore& blobs, PresenceRegistry& presence,
                    TransferLockTable& locks, const TransferSettings& settings = TransferSettings());

    /**
     * Create a transfer in PENDING. For relay transfers the record is inserted
     * before the storage container is created, so the orphan scan never sees a
     * container without its row.
     * @param user_id Authenticated caller, becomes the sender
     */
    TransferResult initialize_transfer(const std::string& user_id, const TransferRequest& request);

    /**
     * Store one chunk and advance the state machine.
     *
     * Re-uploading an index overwrites its bytes but is counted once. The upload
     * that receives the last missing index moves the transfer to READY and
     * announces new_transfer to the room.
     * @param chunk_index Index in [0, total_chunks)
     * @param data Chunk bytes, non-empty and at most the configured chunk size
     */
    ChunkUploadResult upload_chunk(const std::string& user_id, const std::string& transfer_id,
                                   int64_t chunk_index, const std::vector<uint8_t>& data);

    /**
     * Return every chunk concatenated plus the nonce, then count the download.
     * Reaching max_downloads completes the transfer.
     */
    DownloadResult download(const std::string& user_id, const std::string& transfer_id);

    /**
     * Sender-only. Relay storage is deleted before the status becomes CANCELLED;
     * if the delete fails the transfer is left as it was.
     */
    TransferResult cancel_transfer(const std::string& user_id, const std::string& transfer_id);

    TransferResult get_transfer(const std::string& user_id, const std::string& transfer_id);

    /**
     * Transfers of a room, newest first. Caller must be a member of an active room.
     */
    TransferListResult list_room_transfers(const std::string& user_id, const std::string& room_id);

    /**
     * Client-facing descriptor of a transfer
     */
    static nlohmann::json describe_transfer(const Transfer& transfer, const std::string& sender_name);
    static nlohmann::json describe_chunk_upload(const ChunkUploadResult& result);

    const TransferSettings& get_settings() const { return settings_; }

private:
    RecordStore& store_;
    BlobStore& blobs_;
    PresenceRegistry& presence_;
    TransferLockTable& locks_;
    TransferSettings settings_;

    std::string lookup_display_name(const std::string& room_id, const std::string& user_id);

    /**
     * Room must exist, be active, not be expired, and count `user_id` as a member
     */
    Outcome check_room_access(const std::string& room_id, const std::string& user_id,
                              std::optional<Room>& room, std::string& error_message);

    void announce_ready(const Transfer& transfer);
};

} // namespace cloudless
