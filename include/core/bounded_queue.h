#pragma once

/**
 * @file bounded_queue.h
 * @brief Ordered, bounded, closable FIFO for handing work between threads
 *
 * Used for:
 * - Capture thread -> transport sender (outbound frames)
 * - Receive thread -> playback worker (decoded audio, reset commands)
 */

#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstddef>

namespace duplex_voice {

/**
 * @brief Multi-producer multi-consumer FIFO with a fixed capacity
 *
 * Items come out in the order they went in. After close() producers are
 * refused and consumers drain what is left, then see end-of-stream.
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
        , closed_(false) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    size_t capacity() const { return capacity_; }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief Append without waiting
     * @return False if the queue is full or closed (item not taken)
     */
    bool try_push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Append, waiting for space
     * @return False if the queue was closed before space became available
     */
    bool push(T item) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Remove the front item, waiting until one arrives or the queue closes
     * @return False at end-of-stream (closed and empty)
     */
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take_front(out, lock);
    }

    /**
     * @brief Remove the front item, waiting at most `timeout`
     * @return False on timeout or end-of-stream
     */
    template<typename Rep, typename Period>
    bool pop_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return take_front(out, lock);
    }

    /// Discard queued items; the queue stays open
    /// @return Number of items discarded
    size_t clear() {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped = items_.size();
            items_.clear();
        }
        not_full_.notify_all();
        return dropped;
    }

    /// Refuse further pushes and wake every waiter
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    bool take_front(T& out, std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    size_t capacity_;
    bool closed_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

} // namespace duplex_voice
