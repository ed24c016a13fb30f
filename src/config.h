#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace cloudless {

/**
 * Daemon settings. Every key is optional in the config file; absent keys keep
 * the defaults below.
 */
struct ServerConfig {
    int listen_port;
    std::string upload_dir;
    std::string state_file;                 // Record store snapshot; empty disables persistence
    uint32_t chunk_size;
    int64_t max_file_size_mb;
    int64_t file_expiry_hours;              // Retention of COMPLETED transfer storage
    int64_t cleanup_interval_seconds;
    int64_t room_grace_period_seconds;
    int send_timeout_ms;
    std::string log_level;
    std::string log_file;
    std::unordered_map<std::string, std::string> tokens;   // token -> user id

    ServerConfig()
        : listen_port(8765),
          upload_dir("./uploads"),
          state_file("./cloudless_state.json"),
          chunk_size(65536),
          max_file_size_mb(1024),
          file_expiry_hours(24),
          cleanup_interval_seconds(3600),
          room_grace_period_seconds(60),
          send_timeout_ms(5000),
          log_level("info") {}
};

void to_json(nlohmann::json& j, const ServerConfig& config);

/**
 * Parse a config document over the defaults.
 * @throws nlohmann::json::exception on wrongly typed values
 * @throws std::invalid_argument on out-of-range values
 */
void from_json(const nlohmann::json& j, ServerConfig& config);

/**
 * Load a config file. A missing file leaves `config` at its defaults and succeeds.
 * @return false if the file exists but is not a valid config
 */
bool load_server_config(const std::string& path, ServerConfig& config);

bool save_server_config(const std::string& path, const ServerConfig& config);

} // namespace cloudless
