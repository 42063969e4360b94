#pragma once

/// @file mpsc_queue.hpp
/// @brief Lock-free multi-producer single-consumer queue for weft_structures
///
/// MpscQueue is an unbounded intrusive queue in the style of Vyukov's MPSC
/// node queue. Any number of threads may push; exactly one thread pops.
/// Used for worker results flowing back to the run loop.

#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <optional>

namespace weft_structures {

/// Lock-free unbounded MPSC queue
/// @tparam T Stored value type (must be movable)
template<typename T>
class MpscQueue {
private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;

        Node() = default;
        explicit Node(T val) : value(std::move(val)) {}
    };

    // Producers swap themselves in at head_, the consumer reads from tail_.
    alignas(64) std::atomic<Node*> head_;
    alignas(64) Node* tail_;
    alignas(64) std::atomic<std::size_t> size_{0};

public:
    using value_type = T;
    using size_type = std::size_t;

    // =========================================================================
    // Constructors / Destructor
    // =========================================================================

    MpscQueue() {
        Node* stub = new Node();
        head_.store(stub, std::memory_order_relaxed);
        tail_ = stub;
    }

    ~MpscQueue() {
        while (pop().has_value()) {}
        delete tail_;
    }

    MpscQueue(const MpscQueue&) = delete;
    MpscQueue& operator=(const MpscQueue&) = delete;
    MpscQueue(MpscQueue&&) = delete;
    MpscQueue& operator=(MpscQueue&&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    /// Push value to back of queue. Safe from any thread.
    void push(T value) {
        Node* node = new Node(std::move(value));
        size_.fetch_add(1, std::memory_order_relaxed);
        Node* prev = head_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);
    }

    /// Pop value from front of queue. Consumer thread only.
    /// @return Value if available, nullopt if empty or a push is mid-link
    [[nodiscard]] std::optional<T> pop() {
        Node* tail = tail_;
        Node* next = tail->next.load(std::memory_order_acquire);
        if (next == nullptr) {
            return std::nullopt;
        }
        std::optional<T> value = std::move(next->value);
        next->value.reset();
        tail_ = next;
        delete tail;
        size_.fetch_sub(1, std::memory_order_relaxed);
        return value;
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    /// Check if queue is empty
    /// @note Snapshot only; a concurrent push may be counted before it is linked
    [[nodiscard]] bool empty() const noexcept {
        return size_.load(std::memory_order_acquire) == 0;
    }

    /// Get approximate size
    [[nodiscard]] size_type size() const noexcept {
        return size_.load(std::memory_order_acquire);
    }

    // =========================================================================
    // Bulk Operations
    // =========================================================================

    void push_range(std::initializer_list<T> values) {
        for (const auto& v : values) {
            push(v);
        }
    }
};

} // namespace weft_structures
