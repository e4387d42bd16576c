#pragma once

#include "backup/backup_executor.hpp"
#include "restore/restore_executor.hpp"
#include "storage/relationship_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Periodically starts a backup to every active provider whose
// nextScheduledBackup has passed (or that has never been backed up to).
// Nothing starts while a restore is writing into the data directory.
class BackupScheduler {
public:
    BackupScheduler(RelationshipStore& store, BackupExecutor& executor,
                    const RestoreExecutor& restore,
                    std::chrono::seconds checkInterval = std::chrono::hours(1));
    ~BackupScheduler();

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Providers due at |now|
    std::vector<std::string> dueProviders(int64_t now) const;

    // Starts the first due backup; returns the provider callsign or "" if none
    std::string runDueBackups();

private:
    void schedulerLoop();

    RelationshipStore& store_;
    BackupExecutor& executor_;
    const RestoreExecutor& restore_;
    std::chrono::seconds checkInterval_;

    std::thread schedulerThread_;
    std::mutex mutex_;
    std::condition_variable wakeup_;
    std::atomic<bool> running_{false};
    bool stopRequested_{false};
};
