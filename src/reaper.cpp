#include "reaper.h"
#include "cloudless_log_macros.h"
#include <unordered_set>

namespace cloudless {

ExpiryReaper::ExpiryReaper(RecordStore& store, BlobStore& blobs, TransferLockTable& locks,
                           const ReaperSettings& settings)
    : store_(store), blobs_(blobs), locks_(locks), settings_(settings),
      running_(false), sweep_count_(0) {
}

ExpiryReaper::~ExpiryReaper() {
    stop();
}

bool ExpiryReaper::start() {
    if (running_.exchange(true)) {
        LOG_REAPER_WARN("Reaper is already running");
        return true;
    }
    reset_shutdown();
    add_managed_thread(std::thread(&ExpiryReaper::sweep_loop, this), "expiry-reaper");
    LOG_REAPER_INFO("Expiry reaper started (interval " << settings_.sweep_interval.count() << "s, retention "
                    << settings_.completed_retention.count() << "s)");
    return true;
}

void ExpiryReaper::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_REAPER_INFO("Stopping expiry reaper");
    shutdown_all_threads();
    join_all_active_threads();
    LOG_REAPER_INFO("Expiry reaper stopped");
}

void ExpiryReaper::set_sweep_callback(SweepCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    sweep_callback_ = std::move(callback);
}

void ExpiryReaper::sweep_loop() {
    LOG_REAPER_DEBUG("Sweep loop started");

    while (!is_shutdown_requested()) {
        SweepReport report = sweep(Clock::now());

        SweepCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = sweep_callback_;
        }
        if (callback) {
            callback(report);
        }

        if (!wait_for_shutdown_or(settings_.sweep_interval)) {
            break;
        }
    }

    LOG_REAPER_DEBUG("Sweep loop exiting");
}

SweepReport ExpiryReaper::sweep(Timestamp now) {
    SweepReport report;

    // Each step is isolated: one failing step must not skip the rest
    try {
        expire_transfers(now, report);
    } catch (const std::exception& e) {
        LOG_REAPER_ERROR("Transfer expiry step failed: " << e.what());
    }
    try {
        release_completed_storage(now, report);
    } catch (const std::exception& e) {
        LOG_REAPER_ERROR("Completed storage release step failed: " << e.what());
    }
    try {
        deactivate_expired_rooms(now, report);
    } catch (const std::exception& e) {
        LOG_REAPER_ERROR("Room expiry step failed: " << e.what());
    }
    try {
        delete_orphaned_containers(report);
    } catch (const std::exception& e) {
        LOG_REAPER_ERROR("Orphan scan step failed: " << e.what());
    }

    report.aborted = is_shutdown_requested();
    sweep_count_++;

    if (report.transfers_expired || report.completed_released || report.rooms_deactivated ||
        report.orphans_deleted || report.expire_failures || report.release_failures || report.orphan_failures) {
        LOG_REAPER_INFO("Sweep: " << report.transfers_expired << " transfers expired, "
                        << report.completed_released << " completed released, "
                        << report.rooms_deactivated << " rooms deactivated, "
                        << report.orphans_deleted << " orphans deleted ("
                        << report.expire_failures + report.release_failures + report.orphan_failures
                        << " failures)");
    } else {
        LOG_REAPER_DEBUG("Sweep found nothing to reap");
    }
    return report;
}

void ExpiryReaper::expire_transfers(Timestamp now, SweepReport& report) {
    auto candidates = store_.find_transfers([now](const Transfer& t) {
        return !t.is_terminal() && t.expires_at.has_value() && *t.expires_at < now;
    });

    for (const auto& candidate : candidates) {
        if (is_shutdown_requested()) {
            return;
        }

        std::lock_guard<std::mutex> lock(locks_.lock_for(candidate.id));

        auto current = store_.get_transfer(candidate.id);
        if (!current || current->is_terminal() || !current->expires_at || !(*current->expires_at < now)) {
            continue;
        }

        if (current->mode == TransferMode::RELAY && !blobs_.delete_container(current->id)) {
            // Left non-terminal so the next sweep retries the delete
            LOG_REAPER_WARN("Could not delete storage of expired transfer " << current->id << ", will retry");
            report.expire_failures++;
            continue;
        }

        bool updated = store_.update_transfer(current->id, [](Transfer& t) {
            if (t.is_terminal()) {
                return false;
            }
            t.status = TransferStatus::EXPIRED;
            t.storage_path.clear();
            return true;
        });
        if (updated) {
            report.transfers_expired++;
            LOG_REAPER_DEBUG("Transfer " << current->id << " expired");
        }
    }
}

void ExpiryReaper::release_completed_storage(Timestamp now, SweepReport& report) {
    Timestamp threshold = now - settings_.completed_retention;
    auto candidates = store_.find_transfers([threshold](const Transfer& t) {
        return t.status == TransferStatus::COMPLETED && t.completed_at.has_value() &&
               *t.completed_at < threshold && !t.storage_path.empty();
    });

    for (const auto& candidate : candidates) {
        if (is_shutdown_requested()) {
            return;
        }

        std::lock_guard<std::mutex> lock(locks_.lock_for(candidate.id));

        if (!blobs_.delete_container(candidate.id)) {
            LOG_REAPER_WARN("Could not release storage of completed transfer " << candidate.id << ", will retry");
            report.release_failures++;
            continue;
        }

        bool updated = store_.update_transfer(candidate.id, [](Transfer& t) {
            if (t.storage_path.empty()) {
                return false;
            }
            t.storage_path.clear();
            return true;
        });
        if (updated) {
            report.completed_released++;
            LOG_REAPER_DEBUG("Released storage of completed transfer " << candidate.id);
        }
    }
}

void ExpiryReaper::deactivate_expired_rooms(Timestamp now, SweepReport& report) {
    auto candidates = store_.find_rooms([now](const Room& room) {
        return room.is_active && room.expires_at.has_value() && *room.expires_at < now;
    });

    for (const auto& room : candidates) {
        if (is_shutdown_requested()) {
            return;
        }
        bool updated = store_.update_room(room.id, [](Room& r) {
            if (!r.is_active) {
                return false;
            }
            r.is_active = false;
            return true;
        });
        if (updated) {
            report.rooms_deactivated++;
            LOG_REAPER_INFO("Room " << room.id << " expired and was deactivated");
        }
    }
}

void ExpiryReaper::delete_orphaned_containers(SweepReport& report) {
    std::vector<std::string> containers;
    if (!blobs_.list_containers(containers)) {
        report.orphan_failures++;
        return;
    }
    if (containers.empty()) {
        return;
    }

    // Rows are inserted before their containers are created, so listing
    // containers first means every live container's row is already visible
    std::vector<std::string> ids = store_.transfer_ids();
    std::unordered_set<std::string> known(ids.begin(), ids.end());

    for (const auto& name : containers) {
        if (is_shutdown_requested()) {
            return;
        }
        if (known.count(name)) {
            continue;
        }
        if (blobs_.delete_container(name)) {
            report.orphans_deleted++;
            LOG_REAPER_INFO("Deleted orphaned container " << name);
        } else {
            report.orphan_failures++;
        }
    }
}

PurgeReport ExpiryReaper::purge_room(const std::string& room_id) {
    PurgeReport report;
    LOG_REAPER_INFO("Purging room " << room_id);

    auto transfers = store_.list_transfers_for_room(room_id);
    for (const auto& transfer : transfers) {
        std::lock_guard<std::mutex> lock(locks_.lock_for(transfer.id));

        if (transfer.mode == TransferMode::RELAY && !blobs_.delete_container(transfer.id)) {
            LOG_REAPER_WARN("Could not delete storage of transfer " << transfer.id
                            << " during purge, leaving it to the orphan scan");
            report.storage_failures++;
        }
        if (store_.delete_transfer(transfer.id)) {
            report.transfers_deleted++;
        }
    }

    report.messages_deleted = store_.delete_messages_for_room(room_id);
    report.members_deleted = store_.delete_members_for_room(room_id);
    report.room_deactivated = store_.update_room(room_id, [](Room& room) {
        if (!room.is_active) {
            return false;
        }
        room.is_active = false;
        return true;
    });

    LOG_REAPER_INFO("Purged room " << room_id << ": " << report.transfers_deleted << " transfers, "
                    << report.messages_deleted << " messages, " << report.members_deleted << " members"
                    << (report.storage_failures ? " (storage failures: " + std::to_string(report.storage_failures) + ")" : ""));
    return report;
}

} // namespace cloudless
