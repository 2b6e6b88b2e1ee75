#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qadt::session {

/**
 * @brief Bounded multi-producer/single-consumer lock-free queue of log lines
 *
 * Node-based (Vyukov) queue: producers swap themselves in at the head with
 * one atomic exchange, the single consumer walks from the tail. try_push
 * never blocks; once capacity lines are queued it returns false and the
 * line is counted as dropped.
 *
 * THREAD SAFETY:
 * - try_push: any number of threads
 * - try_pop / drain: one thread at a time
 */
class LogDeliveryQueue {
public:
    explicit LogDeliveryQueue(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity),
          head_(new Node),
          tail_(head_.load(std::memory_order_relaxed)) {}

    ~LogDeliveryQueue() {
        Node* node = tail_;
        while (node != nullptr) {
            Node* next = node->next.load(std::memory_order_relaxed);
            delete node;
            node = next;
        }
    }

    LogDeliveryQueue(const LogDeliveryQueue&) = delete;
    LogDeliveryQueue& operator=(const LogDeliveryQueue&) = delete;

    bool try_push(std::string line) {
        if (size_.fetch_add(1, std::memory_order_acq_rel) >= capacity_) {
            size_.fetch_sub(1, std::memory_order_acq_rel);
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        Node* node = new Node;
        node->value = std::move(line);
        Node* previous = head_.exchange(node, std::memory_order_acq_rel);
        previous->next.store(node, std::memory_order_release);
        return true;
    }

    /**
     * @brief Pop the oldest line
     *
     * May report empty while a producer is between its exchange and its
     * link store; that line shows up on the next call.
     */
    std::optional<std::string> try_pop() {
        Node* tail = tail_;
        Node* next = tail->next.load(std::memory_order_acquire);
        if (next == nullptr) {
            return std::nullopt;
        }
        std::string value = std::move(next->value);
        tail_ = next;
        delete tail;
        size_.fetch_sub(1, std::memory_order_acq_rel);
        return value;
    }

    // Up to max_lines lines, oldest first
    std::vector<std::string> drain(std::size_t max_lines) {
        std::vector<std::string> lines;
        while (lines.size() < max_lines) {
            auto line = try_pop();
            if (!line) {
                break;
            }
            lines.push_back(std::move(*line));
        }
        return lines;
    }

    [[nodiscard]] std::size_t size() const noexcept { return size_.load(std::memory_order_acquire); }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::string value;
    };

    const std::size_t capacity_;
    std::atomic<Node*> head_;  ///< Most recently pushed node
    Node* tail_;               ///< Consumer-owned stub; its successor is the oldest line
    std::atomic<std::size_t> size_{0};
    std::atomic<std::size_t> dropped_{0};
};

} // namespace qadt::session
