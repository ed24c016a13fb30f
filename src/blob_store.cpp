#include "blob_store.h"
#include "cloudless_log_macros.h"
#include "fs.h"
#include <cstdio>

namespace cloudless {

FileBlobStore::FileBlobStore(const std::string& root_directory)
    : root_directory_(root_directory) {
    if (!directory_exists(root_directory_) && !create_directories(root_directory_)) {
        LOG_STORE_ERROR("Failed to create blob root directory: " << root_directory_);
    }
}

bool FileBlobStore::is_valid_container_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    for (char c : name) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::string FileBlobStore::get_container_path(const std::string& transfer_id) const {
    return combine_paths(root_directory_, transfer_id);
}

std::string FileBlobStore::get_chunk_path(const std::string& transfer_id, uint32_t chunk_index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%06u", chunk_index);
    return combine_paths(get_container_path(transfer_id), name);
}

bool FileBlobStore::create_container(const std::string& transfer_id, std::string& location) {
    if (!is_valid_container_name(transfer_id)) {
        LOG_STORE_ERROR("Refusing to create container with invalid name: " << transfer_id);
        return false;
    }

    std::string path = get_container_path(transfer_id);
    if (!directory_exists(path) && !create_directories(path)) {
        LOG_STORE_ERROR("Failed to create container directory: " << path);
        return false;
    }

    location = path;
    return true;
}

bool FileBlobStore::write_chunk(const std::string& transfer_id, uint32_t chunk_index,
                                const std::vector<uint8_t>& data) {
    if (!is_valid_container_name(transfer_id)) {
        return false;
    }

    std::string container = get_container_path(transfer_id);
    if (!directory_exists(container) && !create_directories(container)) {
        LOG_STORE_ERROR("Failed to create container directory: " << container);
        return false;
    }

    std::string chunk_path = get_chunk_path(transfer_id, chunk_index);
    if (!write_file_atomic(chunk_path, data)) {
        LOG_STORE_ERROR("Failed to write chunk " << chunk_index << " of " << transfer_id);
        return false;
    }

    LOG_STORE_DEBUG("Wrote chunk " << chunk_index << " of " << transfer_id << " (" << data.size() << " bytes)");
    return true;
}

bool FileBlobStore::read_chunk(const std::string& transfer_id, uint32_t chunk_index,
                               std::vector<uint8_t>& data) {
    if (!is_valid_container_name(transfer_id)) {
        return false;
    }

    std::string chunk_path = get_chunk_path(transfer_id, chunk_index);
    if (!read_file_binary(chunk_path, data)) {
        LOG_STORE_ERROR("Failed to read chunk " << chunk_index << " of " << transfer_id);
        return false;
    }
    return true;
}

bool FileBlobStore::delete_container(const std::string& transfer_id) {
    if (!is_valid_container_name(transfer_id)) {
        LOG_STORE_WARN("Refusing to delete container with invalid name: " << transfer_id);
        return false;
    }

    std::string path = get_container_path(transfer_id);
    if (!delete_tree(path)) {
        LOG_STORE_ERROR("Failed to delete container: " << path);
        return false;
    }
    return true;
}

bool FileBlobStore::container_exists(const std::string& transfer_id) {
    return is_valid_container_name(transfer_id) && directory_exists(get_container_path(transfer_id));
}

bool FileBlobStore::list_containers(std::vector<std::string>& names) {
    names.clear();
    std::vector<DirectoryEntry> entries;
    if (!list_directory(root_directory_, entries)) {
        LOG_STORE_ERROR("Failed to list blob root directory: " << root_directory_);
        return false;
    }

    for (const auto& entry : entries) {
        if (entry.is_directory) {
            names.push_back(entry.name);
        }
    }
    return true;
}

} // namespace cloudless
