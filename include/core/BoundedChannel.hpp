#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

#include "common/Cancellation.hpp"
#include "common/FrameTypes.hpp"

namespace core {

/**
 * @brief Fixed-capacity single-producer/single-consumer FIFO.
 *
 * A full channel is reported through full() so the session can react to it
 * before the producer starts blocking. The terminal item (the termination
 * marker) goes through push_final(), which has one reserved slot beyond the
 * capacity and therefore never blocks; nothing can be pushed after it.
 */
template <typename T>
class BoundedChannel {
public:
    enum class PushStatus {
        Pushed,
        Cancelled,  // stop requested while waiting for space
        Closed,     // push_final() already delivered the last item
        Abandoned   // consumer is gone
    };

    explicit BoundedChannel(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedChannel capacity must be at least 1");
        }
    }

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /**
     * @brief Blocking push. Waits while the channel is full.
     * @param token checked while waiting; cancellation gives up the push
     */
    PushStatus push(T item, const common::CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            if (abandoned_) return PushStatus::Abandoned;
            if (closed_) return PushStatus::Closed;
            if (items_.size() < capacity_) break;
            if (token.is_cancellation_requested()) return PushStatus::Cancelled;
            not_full_.wait_for(lock, kCancelCheckInterval);
        }
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return PushStatus::Pushed;
    }

    /**
     * @brief Deliver the last item of the stream. Never blocks.
     */
    PushStatus push_final(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (abandoned_) return PushStatus::Abandoned;
            if (closed_) return PushStatus::Closed;
            items_.push_back(std::move(item));
            closed_ = true;
        }
        not_empty_.notify_one();
        return PushStatus::Pushed;
    }

    /**
     * @brief Pop the oldest item, waiting at most 'timeout'.
     * @return std::nullopt when nothing arrived in time
     */
    std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() { return !items_.empty(); })) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Called by a consumer that stops early. Pending items are
     * dropped and later pushes fail instead of blocking.
     */
    void abandon() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            abandoned_ = true;
            items_.clear();
        }
        not_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size() >= capacity_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool abandoned() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return abandoned_;
    }

private:
    static constexpr std::chrono::milliseconds kCancelCheckInterval{10};

    const size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;
    bool abandoned_ = false;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

// One per frame sink; carries frames and, last, the termination marker
using FrameChannel = BoundedChannel<common::FrameItem>;

} // namespace core
