#pragma once

/**
 * @file blob_store.h
 * @brief Opaque chunk storage addressed by (transfer id, chunk index)
 */

#include <cstdint>
#include <string>
#include <vector>

namespace cloudless {

/**
 * Storage for encrypted relay chunks. One container per transfer; the
 * container name is the transfer id.
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    /**
     * Create the container for a transfer (no-op if it exists).
     * @param transfer_id Container name
     * @param location Receives the storage location recorded on the transfer
     * @return true on success
     */
    virtual bool create_container(const std::string& transfer_id, std::string& location) = 0;

    /**
     * Write (or overwrite) one chunk. The container is created if missing.
     */
    virtual bool write_chunk(const std::string& transfer_id, uint32_t chunk_index,
                             const std::vector<uint8_t>& data) = 0;

    virtual bool read_chunk(const std::string& transfer_id, uint32_t chunk_index,
                            std::vector<uint8_t>& data) = 0;

    /**
     * Delete a container and every chunk in it.
     * @return true if the container no longer exists (deleting a missing one succeeds)
     */
    virtual bool delete_container(const std::string& transfer_id) = 0;

    virtual bool container_exists(const std::string& transfer_id) = 0;

    /**
     * Names of every top-level container, used by the orphan scan.
     */
    virtual bool list_containers(std::vector<std::string>& names) = 0;
};

/**
 * BlobStore on the local filesystem: <root>/<transfer_id>/chunk_NNNNNN.
 * Chunk writes go through a temp file and a rename so a reader never sees
 * a partially written chunk.
 */
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(const std::string& root_directory);

    bool create_container(const std::string& transfer_id, std::string& location) override;
    bool write_chunk(const std::string& transfer_id, uint32_t chunk_index,
                     const std::vector<uint8_t>& data) override;
    bool read_chunk(const std::string& transfer_id, uint32_t chunk_index,
                    std::vector<uint8_t>& data) override;
    bool delete_container(const std::string& transfer_id) override;
    bool container_exists(const std::string& transfer_id) override;
    bool list_containers(std::vector<std::string>& names) override;

    const std::string& get_root_directory() const { return root_directory_; }

    std::string get_container_path(const std::string& transfer_id) const;
    std::string get_chunk_path(const std::string& transfer_id, uint32_t chunk_index) const;

private:
    std::string root_directory_;

    static bool is_valid_container_name(const std::string& name);
};

} // namespace cloudless
