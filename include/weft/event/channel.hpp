#pragma once

/// @file channel.hpp
/// @brief Typed multi-producer single-consumer channel for weft_event
///
/// EventChannel carries values from any number of producer threads to the
/// run-loop thread. Producers hold a Sender; the channel itself is read only
/// by its owner.

#include "fwd.hpp"
#include <weft/core/error.hpp>
#include <weft/structures/mpsc_queue.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weft_event {

/// Lock-free typed channel, single reader
/// @tparam E Value type
template<typename E>
class EventChannel {
public:
    using value_type = E;
    using size_type = std::size_t;

    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // =========================================================================
    // Send / Receive
    // =========================================================================

    /// Send a value. Safe from any thread.
    void send(E value) {
        m_queue.push(std::move(value));
    }

    /// Receive a value. Reader thread only.
    /// @return Value if available, nullopt if empty
    [[nodiscard]] std::optional<E> receive() {
        return m_queue.pop();
    }

    /// Drain all values currently linked into the queue
    [[nodiscard]] std::vector<E> drain() {
        std::vector<E> values;
        while (auto value = m_queue.pop()) {
            values.push_back(std::move(*value));
        }
        return values;
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    [[nodiscard]] bool empty() const noexcept {
        return m_queue.empty();
    }

    /// Pending value count (approximate)
    [[nodiscard]] size_type size() const noexcept {
        return m_queue.size();
    }

private:
    weft_structures::MpscQueue<E> m_queue;
};

// =============================================================================
// Sender
// =============================================================================

/// Producer handle for a shared EventChannel.
///
/// Holds the channel weakly: once the reading side is gone, send() reports
/// the disconnect instead of queueing into nothing.
template<typename E>
class Sender {
public:
    Sender() = default;
    explicit Sender(const std::shared_ptr<EventChannel<E>>& channel, std::string name = "channel")
        : m_channel(channel)
        , m_name(std::move(name))
    {
    }

    /// Send a value
    /// @return Error if the receiving side has been dropped
    weft_core::Result<void> send(E value) const {
        if (auto channel = m_channel.lock()) {
            channel->send(std::move(value));
            return weft_core::Ok();
        }
        return weft_core::Err(weft_core::Error(weft_core::PollError::disconnected(m_name)));
    }

    /// Check if the receiving side still exists
    [[nodiscard]] bool is_connected() const noexcept {
        return !m_channel.expired();
    }

private:
    std::weak_ptr<EventChannel<E>> m_channel;
    std::string m_name;
};

} // namespace weft_event
