#include "common/transfer_job.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

TransferJob::TransferJob(ParallelTaskManager& taskManager, const std::string& name,
                         BackupErrorCode defaultErrorCode)
    : taskManager_(taskManager)
    , name_(name)
    , defaultErrorCode_(defaultErrorCode) {
}

TransferStatus TransferJob::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool TransferJob::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busyLocked();
}

bool TransferJob::waitForCompletion(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_.wait_for(lock, timeout, [this] { return !busyLocked(); });
}

bool TransferJob::tryBegin(const TransferStatus& initial, TransferStatus& current) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (busyLocked()) {
            current = status_;
            current.errorCode = BackupErrorCode::AlreadyInProgress;
            current.error = "A " + name_ + " is already in progress";
            return false;
        }
        status_ = initial;
        status_.state = TransferState::InProgress;
        status_.startedAt = utils::nowSeconds();
        status_.error.clear();
        status_.errorCode = BackupErrorCode::None;
        status_.recomputeProgress();
        settled_ = false;
        current = status_;
    }
    channel_.publish(current);
    return true;
}

TransferStatus TransferJob::reject(const std::string& peerCallsign, BackupErrorCode code,
                                   const std::string& message) {
    TransferStatus failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (busyLocked()) {
            failed = status_;
            failed.errorCode = code;
            failed.error = message;
            return failed;
        }
        status_ = TransferStatus{};
        status_.peerCallsign = peerCallsign;
        status_.state = TransferState::Failed;
        status_.errorCode = code;
        status_.error = message;
        status_.startedAt = utils::nowSeconds();
        failed = status_;
    }
    Logger::error(name_ + " rejected: " + message);
    channel_.publish(failed);
    finished_.notify_all();
    return failed;
}

void TransferJob::launch(std::function<void()> work, TaskPriority priority) {
    try {
        taskManager_.addTask([this, work]() {
            try {
                work();
            } catch (const BackupError& e) {
                setFailed(e.code(), e.what());
            } catch (const std::exception& e) {
                setFailed(defaultErrorCode_, e.what());
            }
        }, priority);
    } catch (const std::exception& e) {
        setFailed(defaultErrorCode_, std::string("Failed to schedule ") + name_ + ": " + e.what());
    }
}

void TransferJob::updateStatus(const std::function<void(TransferStatus&)>& mutate) {
    TransferStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int previous = status_.progressPercent;
        mutate(status_);
        status_.recomputeProgress();
        if (status_.progressPercent < previous) {
            status_.progressPercent = previous;
        }
        snapshot = status_;
    }
    channel_.publish(snapshot);
}

void TransferJob::setFailed(BackupErrorCode code, const std::string& message) {
    TransferStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.state = TransferState::Failed;
        status_.errorCode = code;
        status_.error = message;
        snapshot = status_;
    }
    Logger::error(name_ + " failed: " + message);
    channel_.publish(snapshot);
    settle();
}

void TransferJob::setComplete() {
    TransferStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.state = TransferState::Complete;
        status_.recomputeProgress();
        snapshot = status_;
    }
    Logger::info(name_ + " of snapshot " + snapshot.snapshotId + " with " +
                 snapshot.peerCallsign + " complete");
    channel_.publish(snapshot);
    settle();
}

void TransferJob::settle() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settled_ = true;
    }
    finished_.notify_all();
}
