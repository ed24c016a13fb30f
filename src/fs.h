#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace cloudless {

// Existence checks
bool file_exists(const std::string& path);
bool directory_exists(const std::string& path);

// Directory operations
bool create_directories(const std::string& path); // Creates parent directories if needed
bool delete_tree(const std::string& path);        // Recursive; true if path no longer exists

// File operations
bool create_file(const std::string& path, const std::string& content);
bool write_file_binary(const std::string& path, const std::vector<uint8_t>& data);
bool write_file_atomic(const std::string& path, const std::vector<uint8_t>& data); // temp file + rename
bool read_file_binary(const std::string& path, std::vector<uint8_t>& out);
std::string read_file_text(const std::string& path);
bool delete_file(const std::string& path);
bool rename_file(const std::string& old_path, const std::string& new_path);
int64_t get_file_size(const std::string& path);

// Directory listing
struct DirectoryEntry {
    std::string name;
    std::string path;
    bool is_directory;
    uint64_t size;
};
bool list_directory(const std::string& path, std::vector<DirectoryEntry>& entries);

// Path utilities
std::string combine_paths(const std::string& base, const std::string& relative);

} // namespace cloudless
