#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <vector>

// Multi-subscriber status handle. publish() delivers the new value to every
// subscriber registered at that moment; late subscribers only see later
// publishes but can read latest() at any time.
template<typename T>
class StatusChannel {
public:
    using Callback = std::function<void(const T&)>;
    using SubscriptionId = size_t;

    StatusChannel() = default;
    explicit StatusChannel(const T& initial) : latest_(initial) {}

    SubscriptionId subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = nextId_++;
        subscribers_.emplace(id, std::move(callback));
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.erase(id);
    }

    void publish(const T& value) {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            latest_ = value;
            callbacks.reserve(subscribers_.size());
            for (const auto& entry : subscribers_) {
                callbacks.push_back(entry.second);
            }
        }
        // Subscribers may call back into the owner, so never under the lock
        for (const auto& callback : callbacks) {
            callback(value);
        }
    }

    T latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

private:
    mutable std::mutex mutex_;
    T latest_{};
    std::map<SubscriptionId, Callback> subscribers_;
    SubscriptionId nextId_{1};
};
