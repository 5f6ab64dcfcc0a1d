#pragma once

#include "cnclink/system_constants.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

/**
 * Multi-subscriber fan-out channel.
 *
 * Each subscriber owns a bounded buffer. Publishing never blocks: when a
 * subscriber's buffer is full its oldest item is dropped and its lag counter
 * grows. Dropping a Subscription unsubscribes it.
 */
template <typename T>
class BroadcastChannel {
    struct SubscriberState {
        std::mutex mutex;
        std::condition_variable available;
        std::deque<T> items;
        size_t capacity = 0;
        uint64_t lagged = 0;
        bool closed = false;
    };

public:
    class Subscription {
    public:
        Subscription() = default;

        /**
         * Wait for the next item
         * @return false on timeout, or when the channel is closed and drained
         */
        bool receive(T& item, std::chrono::milliseconds timeout) {
            if (!state_) return false;
            std::unique_lock<std::mutex> lock(state_->mutex);
            state_->available.wait_for(lock, timeout, [this] {
                return !state_->items.empty() || state_->closed;
            });
            if (state_->items.empty()) {
                return false;
            }
            item = std::move(state_->items.front());
            state_->items.pop_front();
            return true;
        }

        bool tryReceive(T& item) {
            if (!state_) return false;
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->items.empty()) {
                return false;
            }
            item = std::move(state_->items.front());
            state_->items.pop_front();
            return true;
        }

        size_t pending() const {
            if (!state_) return 0;
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->items.size();
        }

        // Items this subscriber lost to overflow
        uint64_t lagged() const {
            if (!state_) return 0;
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->lagged;
        }

        bool isClosed() const {
            if (!state_) return true;
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->closed;
        }

        bool isValid() const { return state_ != nullptr; }

    private:
        friend class BroadcastChannel<T>;
        explicit Subscription(std::shared_ptr<SubscriberState> state) : state_(std::move(state)) {}

        std::shared_ptr<SubscriberState> state_;
    };

    explicit BroadcastChannel(size_t capacity = SystemConstants::Channels::SUBSCRIBER_CAPACITY)
        : capacity_(capacity > 0 ? capacity : 1) {
    }

    ~BroadcastChannel() {
        close();
    }

    BroadcastChannel(const BroadcastChannel&) = delete;
    BroadcastChannel& operator=(const BroadcastChannel&) = delete;

    Subscription subscribe() {
        auto state = std::make_shared<SubscriberState>();
        state->capacity = capacity_;

        std::lock_guard<std::mutex> lock(mutex_);
        state->closed = closed_;
        subscribers_.push_back(state);
        return Subscription(state);
    }

    void publish(const T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }

        // Subscriptions that went away are pruned here
        subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
            [](const std::weak_ptr<SubscriberState>& weak) { return weak.expired(); }),
            subscribers_.end());

        for (auto& weak : subscribers_) {
            auto state = weak.lock();
            if (!state) continue;
            {
                std::lock_guard<std::mutex> subscriberLock(state->mutex);
                if (state->items.size() >= state->capacity) {
                    state->items.pop_front();
                    ++state->lagged;
                }
                state->items.push_back(item);
            }
            state->available.notify_all();
        }
    }

    /**
     * Stop delivery; blocked receivers wake and drain what is left
     */
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        for (auto& weak : subscribers_) {
            auto state = weak.lock();
            if (!state) continue;
            {
                std::lock_guard<std::mutex> subscriberLock(state->mutex);
                state->closed = true;
            }
            state->available.notify_all();
        }
        subscribers_.clear();
    }

    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& weak : subscribers_) {
            if (!weak.expired()) ++count;
        }
        return count;
    }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<SubscriberState>> subscribers_;
    bool closed_ = false;
};
