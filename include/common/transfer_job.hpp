#pragma once

#include "common/backup_error.hpp"
#include "common/parallel_task_manager.hpp"
#include "common/status_channel.hpp"
#include "common/transfer_status.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

// Shared state machine for backup and restore runs: single-flight start,
// status publishing and exception-to-status conversion at the task boundary.
class TransferJob {
public:
    TransferJob(ParallelTaskManager& taskManager, const std::string& name,
                BackupErrorCode defaultErrorCode);
    virtual ~TransferJob() = default;

    TransferJob(const TransferJob&) = delete;
    TransferJob& operator=(const TransferJob&) = delete;

    TransferStatus getStatus() const;
    // True from a successful start until the final status has been published
    bool isRunning() const;
    StatusChannel<TransferStatus>& statusChannel() { return channel_; }

    // False if the run is still going when the timeout passes
    bool waitForCompletion(std::chrono::milliseconds timeout) const;

protected:
    // Check-and-set into InProgress. On false, |current| is the running status
    // tagged AlreadyInProgress and nothing was changed.
    bool tryBegin(const TransferStatus& initial, TransferStatus& current);

    // Publishes a failed status for a run that never started
    TransferStatus reject(const std::string& peerCallsign, BackupErrorCode code,
                          const std::string& message);

    // Runs |work| on the task manager; BackupError and std::exception fail the run
    void launch(std::function<void()> work, TaskPriority priority = TaskPriority::NORMAL);

    void updateStatus(const std::function<void(TransferStatus&)>& mutate);
    void setFailed(BackupErrorCode code, const std::string& message);
    void setComplete();

private:
    bool busyLocked() const { return status_.isRunning() || !settled_; }
    void settle();

    ParallelTaskManager& taskManager_;
    std::string name_;
    BackupErrorCode defaultErrorCode_;

    mutable std::mutex mutex_;
    mutable std::condition_variable finished_;
    TransferStatus status_;
    bool settled_{true};
    StatusChannel<TransferStatus> channel_;
};
