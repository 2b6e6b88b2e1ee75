/**
 * @file inbox_queue.hpp
 * @brief Bounded FIFO behind EventInbox
 *
 * WHAT IT DOES:
 * Holds at most `capacity` entries. A push into a full queue evicts the
 * oldest entry and counts it as dropped, so a consumer that stops polling
 * costs a fixed amount of memory and always sees the newest events.
 *
 * EXAMPLE:
 * InboxQueue<LogBatchReceivedEvent> queue(256);
 * queue.push(batch);                                   // bus thread
 * auto next = queue.pop_for(std::chrono::seconds(1));  // consumer thread
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace qadt::events {

template<typename T>
class InboxQueue {
public:
    explicit InboxQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    InboxQueue(const InboxQueue&) = delete;
    InboxQueue& operator=(const InboxQueue&) = delete;

    /**
     * @brief Append, evicting the oldest entry when full
     *
     * RETURNS: false if an entry was evicted or the queue is closed
     */
    bool push(T item) {
        bool evicted = false;
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            if (entries_.size() >= capacity_) {
                entries_.pop_front();
                ++dropped_;
                evicted = true;
            }
            entries_.push_back(std::move(item));
        }
        ready_.notify_one();
        return !evicted;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    // Waits up to `timeout`; returns early with nullopt once closed and empty
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this]() { return !entries_.empty() || closed_; });
        return take_front();
    }

    // Stop accepting entries and wake every waiting consumer. Queued entries stay poppable.
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    std::size_t dropped() const {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::optional<T> take_front() {
        if (entries_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(entries_.front()));
        entries_.pop_front();
        return item;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> entries_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace qadt::events
