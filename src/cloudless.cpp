#include "cloudless.h"
#include "cloudless_log_macros.h"
#include "fs.h"

namespace cloudless {

namespace {

TransferSettings make_transfer_settings(const ServerConfig& config) {
    TransferSettings settings;
    settings.chunk_size = config.chunk_size;
    settings.max_file_size = static_cast<uint64_t>(config.max_file_size_mb) * 1024 * 1024;
    return settings;
}

ReaperSettings make_reaper_settings(const ServerConfig& config) {
    ReaperSettings settings;
    settings.sweep_interval = std::chrono::seconds(config.cleanup_interval_seconds);
    settings.completed_retention = std::chrono::hours(config.file_expiry_hours);
    return settings;
}

} // namespace

CloudlessServer::CloudlessServer(const ServerConfig& config)
    : config_(config),
      running_(false),
      blobs_(config.upload_dir),
      auth_(config.tokens),
      presence_(store_),
      transfers_(store_, blobs_, presence_, locks_, make_transfer_settings(config)),
      reaper_(store_, blobs_, locks_, make_reaper_settings(config)),
      rooms_(store_),
      router_(store_, presence_, auth_),
      scheduler_(std::chrono::seconds(config.room_grace_period_seconds),
                 [this](const std::string& room_id, uint64_t epoch) { handle_purge_due(room_id, epoch); }),
      realtime_(router_, config.listen_port, config.send_timeout_ms) {

    presence_.set_room_empty_callback([this](const std::string& room_id, uint64_t epoch) {
        handle_room_empty(room_id, epoch);
    });
    presence_.set_room_active_callback([this](const std::string& room_id) {
        handle_room_active(room_id);
    });
    reaper_.set_sweep_callback([this](const SweepReport& report) {
        if (!report.aborted) {
            save_state();
        }
    });
}

CloudlessServer::~CloudlessServer() {
    stop();
}

bool CloudlessServer::start() {
    if (running_.load()) {
        LOG_SERVER_WARN("Server is already running");
        return false;
    }

    LOG_SERVER_INFO("Starting cloudless relay (uploads in " << config_.upload_dir << ")");

    if (!create_directories(config_.upload_dir)) {
        LOG_SERVER_ERROR("Cannot create upload directory " << config_.upload_dir);
        return false;
    }

    if (!config_.state_file.empty() && file_exists(config_.state_file)) {
        if (!store_.load_snapshot(config_.state_file)) {
            LOG_SERVER_ERROR("Refusing to start over an unreadable state file " << config_.state_file);
            return false;
        }
    }

    if (!scheduler_.start()) {
        LOG_SERVER_ERROR("Failed to start the purge scheduler");
        return false;
    }
    if (!reaper_.start()) {
        LOG_SERVER_ERROR("Failed to start the expiry reaper");
        scheduler_.stop();
        return false;
    }
    if (!realtime_.start()) {
        LOG_SERVER_ERROR("Failed to start the realtime listener");
        reaper_.stop();
        scheduler_.stop();
        return false;
    }

    running_.store(true);
    LOG_SERVER_INFO("Cloudless relay running on port " << realtime_.get_port());
    return true;
}

void CloudlessServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_SERVER_INFO("Stopping cloudless relay");

    realtime_.stop();
    presence_.close_all_connections(CLOSE_NORMAL, "Server shutting down");
    scheduler_.stop();
    reaper_.stop();

    if (!save_state()) {
        LOG_SERVER_WARN("Final state snapshot was not written");
    }
    LOG_SERVER_INFO("Cloudless relay stopped");
}

bool CloudlessServer::save_state() {
    if (config_.state_file.empty()) {
        return true;
    }
    return store_.save_snapshot(config_.state_file);
}

void CloudlessServer::handle_room_empty(const std::string& room_id, uint64_t epoch) {
    LOG_SERVER_DEBUG("Room " << room_id << " empty at epoch " << epoch << ", arming purge");
    scheduler_.schedule(room_id, epoch);
}

void CloudlessServer::handle_room_active(const std::string& room_id) {
    if (scheduler_.cancel(room_id)) {
        LOG_SERVER_DEBUG("Room " << room_id << " reconnected within the grace period");
    }
}

void CloudlessServer::handle_purge_due(const std::string& room_id, uint64_t epoch) {
    bool ran = presence_.run_if_room_idle(room_id, epoch, [this, &room_id]() {
        reaper_.purge_room(room_id);
    });
    if (!ran) {
        LOG_SERVER_DEBUG("Skipped purge of room " << room_id << ": activity since epoch " << epoch);
    }
}

} // namespace cloudless
