#include "config.h"
#include "cloudless_log_macros.h"
#include "fs.h"
#include "logger.h"
#include <stdexcept>

namespace cloudless {

void to_json(nlohmann::json& j, const ServerConfig& config) {
    j = nlohmann::json::object();
    j["listen_port"] = config.listen_port;
    j["upload_dir"] = config.upload_dir;
    j["state_file"] = config.state_file;
    j["chunk_size"] = config.chunk_size;
    j["max_file_size_mb"] = config.max_file_size_mb;
    j["file_expiry_hours"] = config.file_expiry_hours;
    j["cleanup_interval_seconds"] = config.cleanup_interval_seconds;
    j["room_grace_period_seconds"] = config.room_grace_period_seconds;
    j["send_timeout_ms"] = config.send_timeout_ms;
    j["log_level"] = config.log_level;
    j["log_file"] = config.log_file;
    j["tokens"] = config.tokens;
}

void from_json(const nlohmann::json& j, ServerConfig& config) {
    if (!j.is_object()) {
        throw std::invalid_argument("config root must be an object");
    }

    config.listen_port = j.value("listen_port", config.listen_port);
    config.upload_dir = j.value("upload_dir", config.upload_dir);
    config.state_file = j.value("state_file", config.state_file);
    config.chunk_size = j.value("chunk_size", config.chunk_size);
    config.max_file_size_mb = j.value("max_file_size_mb", config.max_file_size_mb);
    config.file_expiry_hours = j.value("file_expiry_hours", config.file_expiry_hours);
    config.cleanup_interval_seconds = j.value("cleanup_interval_seconds", config.cleanup_interval_seconds);
    config.room_grace_period_seconds = j.value("room_grace_period_seconds", config.room_grace_period_seconds);
    config.send_timeout_ms = j.value("send_timeout_ms", config.send_timeout_ms);
    config.log_level = j.value("log_level", config.log_level);
    config.log_file = j.value("log_file", config.log_file);
    if (j.contains("tokens")) {
        config.tokens = j.at("tokens").get<std::unordered_map<std::string, std::string>>();
    }

    if (config.listen_port < 0 || config.listen_port > 65535) {
        throw std::invalid_argument("listen_port must be in [0, 65535]");
    }
    if (config.chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (config.max_file_size_mb <= 0) {
        throw std::invalid_argument("max_file_size_mb must be positive");
    }
    if (config.cleanup_interval_seconds <= 0) {
        throw std::invalid_argument("cleanup_interval_seconds must be positive");
    }
    if (config.room_grace_period_seconds < 0 || config.file_expiry_hours < 0) {
        throw std::invalid_argument("grace period and retention must not be negative");
    }
    LogLevel level;
    if (!parse_log_level(config.log_level, level)) {
        throw std::invalid_argument("unknown log_level '" + config.log_level + "'");
    }
}

bool load_server_config(const std::string& path, ServerConfig& config) {
    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No configuration at " << path << ", using defaults");
        return true;
    }

    std::string config_data = read_file_text(path);
    if (config_data.empty()) {
        LOG_CONFIG_ERROR("Configuration file " << path << " is empty");
        return false;
    }

    try {
        nlohmann::json document = nlohmann::json::parse(config_data);
        ServerConfig loaded;
        from_json(document, loaded);
        config = loaded;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file " << path << ": " << e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        LOG_CONFIG_ERROR("Invalid configuration in " << path << ": " << e.what());
        return false;
    }

    LOG_CONFIG_INFO("Loaded configuration from " << path << " (" << config.tokens.size() << " tokens)");
    return true;
}

bool save_server_config(const std::string& path, const ServerConfig& config) {
    nlohmann::json document = config;
    std::string data = document.dump(4);
    if (!write_file_atomic(path, std::vector<uint8_t>(data.begin(), data.end()))) {
        LOG_CONFIG_ERROR("Failed to write configuration to " << path);
        return false;
    }
    return true;
}

} // namespace cloudless
