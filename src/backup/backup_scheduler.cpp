#include "backup/backup_scheduler.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

BackupScheduler::BackupScheduler(RelationshipStore& store, BackupExecutor& executor,
                                 const RestoreExecutor& restore,
                                 std::chrono::seconds checkInterval)
    : store_(store)
    , executor_(executor)
    , restore_(restore)
    , checkInterval_(checkInterval) {
}

BackupScheduler::~BackupScheduler() {
    stop();
}

void BackupScheduler::start() {
    if (running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = false;
    }
    running_ = true;
    schedulerThread_ = std::thread(&BackupScheduler::schedulerLoop, this);
    Logger::info("Backup scheduler started");
}

void BackupScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    wakeup_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
    if (running_) {
        running_ = false;
        Logger::info("Backup scheduler stopped");
    }
}

std::vector<std::string> BackupScheduler::dueProviders(int64_t now) const {
    std::vector<std::string> due;
    for (const auto& provider : store_.getProviders()) {
        if (provider.status != RelationshipStatus::Active) {
            continue;
        }
        if (!provider.nextScheduledBackup || *provider.nextScheduledBackup <= now) {
            due.push_back(provider.providerCallsign);
        }
    }
    return due;
}

std::string BackupScheduler::runDueBackups() {
    if (executor_.isRunning()) {
        return "";
    }
    if (restore_.isRunning()) {
        Logger::debug("Restore in progress, scheduled backups deferred");
        return "";
    }

    // One backup at a time; the rest are picked up on the next pass
    for (const auto& callsign : dueProviders(utils::nowSeconds())) {
        BackupStatus status = executor_.startBackup(callsign);
        if (status.state == TransferState::InProgress &&
            status.errorCode == BackupErrorCode::None) {
            Logger::info("Scheduled backup to " + callsign + " started");
            return callsign;
        }
        if (status.errorCode == BackupErrorCode::AlreadyInProgress) {
            return "";
        }
        Logger::warning("Scheduled backup to " + callsign + " did not start: " + status.error);
    }
    return "";
}

void BackupScheduler::schedulerLoop() {
    while (true) {
        runDueBackups();

        std::unique_lock<std::mutex> lock(mutex_);
        if (wakeup_.wait_for(lock, checkInterval_, [this] { return stopRequested_; })) {
            return;
        }
    }
}
