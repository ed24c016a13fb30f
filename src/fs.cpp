#include "fs.h"
#include "logger.h"
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

namespace cloudless {

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool directory_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

static bool create_single_directory(const std::string& path) {
    if (directory_exists(path)) {
        return true;
    }
    if (mkdir(path.c_str(), 0755) == 0 || errno == EEXIST) {
        return true;
    }
    LOG_ERROR("FS", "Failed to create directory: " << path << " (" << strerror(errno) << ")");
    return false;
}

bool create_directories(const std::string& path) {
    if (path.empty()) return false;
    if (directory_exists(path)) return true;

    std::string partial;
    partial.reserve(path.size());
    for (size_t i = 0; i < path.size(); ++i) {
        partial.push_back(path[i]);
        if (path[i] == '/' && i > 0) {
            if (!create_single_directory(partial)) {
                return false;
            }
        }
    }
    return create_single_directory(path);
}

bool delete_tree(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        // Already gone
        return errno == ENOENT;
    }

    if (!S_ISDIR(st.st_mode)) {
        if (unlink(path.c_str()) != 0 && errno != ENOENT) {
            LOG_ERROR("FS", "Failed to delete file: " << path << " (" << strerror(errno) << ")");
            return false;
        }
        return true;
    }

    std::vector<DirectoryEntry> entries;
    if (!list_directory(path, entries)) {
        return false;
    }
    bool ok = true;
    for (const auto& entry : entries) {
        if (!delete_tree(entry.path)) {
            ok = false;
        }
    }
    if (!ok) {
        return false;
    }
    if (rmdir(path.c_str()) != 0 && errno != ENOENT) {
        LOG_ERROR("FS", "Failed to remove directory: " << path << " (" << strerror(errno) << ")");
        return false;
    }
    return true;
}

bool create_file(const std::string& path, const std::string& content) {
    std::vector<uint8_t> data(content.begin(), content.end());
    return write_file_binary(path, data);
}

bool write_file_binary(const std::string& path, const std::vector<uint8_t>& data) {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        LOG_ERROR("FS", "Failed to create binary file: " << path);
        return false;
    }

    size_t written = data.empty() ? 0 : fwrite(data.data(), 1, data.size(), file);
    bool flushed = fflush(file) == 0;
    fclose(file);

    if (written != data.size() || !flushed) {
        LOG_ERROR("FS", "Failed to write complete binary data to file: " << path);
        return false;
    }
    return true;
}

bool write_file_atomic(const std::string& path, const std::vector<uint8_t>& data) {
    std::string temp_path = path + ".part";
    if (!write_file_binary(temp_path, data)) {
        delete_file(temp_path);
        return false;
    }
    if (!rename_file(temp_path, path)) {
        delete_file(temp_path);
        return false;
    }
    return true;
}

bool read_file_binary(const std::string& path, std::vector<uint8_t>& out) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_ERROR("FS", "Failed to open binary file for reading: " << path);
        return false;
    }

    fseek(file, 0, SEEK_END);
    long file_size = ftell(file);
    fseek(file, 0, SEEK_SET);

    if (file_size < 0) {
        LOG_ERROR("FS", "Failed to get binary file size: " << path);
        fclose(file);
        return false;
    }

    out.resize(static_cast<size_t>(file_size));
    size_t bytes_read = file_size > 0 ? fread(out.data(), 1, out.size(), file) : 0;
    fclose(file);

    if (bytes_read != out.size()) {
        LOG_ERROR("FS", "Short read from file: " << path);
        return false;
    }
    return true;
}

std::string read_file_text(const std::string& path) {
    std::vector<uint8_t> data;
    if (!read_file_binary(path, data)) {
        return "";
    }
    return std::string(data.begin(), data.end());
}

bool delete_file(const std::string& path) {
    if (unlink(path.c_str()) == 0) {
        return true;
    }
    return errno == ENOENT;
}

bool rename_file(const std::string& old_path, const std::string& new_path) {
    if (rename(old_path.c_str(), new_path.c_str()) != 0) {
        LOG_ERROR("FS", "Failed to rename " << old_path << " to " << new_path << " (" << strerror(errno) << ")");
        return false;
    }
    return true;
}

int64_t get_file_size(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return static_cast<int64_t>(st.st_size);
    }
    return -1;
}

bool list_directory(const std::string& path, std::vector<DirectoryEntry>& entries) {
    entries.clear();

    DIR* dir = opendir(path.c_str());
    if (!dir) {
        LOG_ERROR("FS", "Failed to open directory: " << path);
        return false;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }

        DirectoryEntry dir_entry;
        dir_entry.name = entry->d_name;
        dir_entry.path = combine_paths(path, dir_entry.name);

        struct stat st;
        if (lstat(dir_entry.path.c_str(), &st) == 0) {
            dir_entry.is_directory = S_ISDIR(st.st_mode);
            dir_entry.size = dir_entry.is_directory ? 0 : static_cast<uint64_t>(st.st_size);
        } else {
            dir_entry.is_directory = false;
            dir_entry.size = 0;
        }
        entries.push_back(dir_entry);
    }

    closedir(dir);
    return true;
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;
    if (base.back() == '/') {
        return base + relative;
    }
    return base + "/" + relative;
}

} // namespace cloudless
