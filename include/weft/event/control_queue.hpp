#pragma once

/// @file control_queue.hpp
/// @brief FIFO of pending control outcomes for one run-loop tick

#include "control.hpp"

#include <deque>
#include <optional>

namespace weft_event {

/// Queue of results waiting to be processed by the run loop.
///
/// Handlers push follow-up outcomes (or errors) here; the run loop drains
/// the queue completely before it reads the next event source. Single
/// threaded: only the run-loop thread touches it.
template<typename Event>
class ControlQueue {
public:
    using value_type = weft_core::Result<Control<Event>>;
    using size_type = std::size_t;

    ControlQueue() = default;

    ControlQueue(const ControlQueue&) = delete;
    ControlQueue& operator=(const ControlQueue&) = delete;
    ControlQueue(ControlQueue&&) = default;
    ControlQueue& operator=(ControlQueue&&) = default;

    /// Append a result
    void push(value_type r) {
        m_items.push_back(std::move(r));
    }

    /// Append a control
    void push(Control<Event> c) {
        m_items.push_back(value_type(std::move(c)));
    }

    /// Append an error
    void push_err(weft_core::Error e) {
        m_items.push_back(value_type(std::move(e)));
    }

    /// Remove and return the oldest entry
    [[nodiscard]] std::optional<value_type> take() {
        if (m_items.empty()) {
            return std::nullopt;
        }
        std::optional<value_type> front(std::move(m_items.front()));
        m_items.pop_front();
        return front;
    }

    /// Process every entry in FIFO order.
    ///
    /// Entries pushed by `on_control` while draining are processed in the same
    /// pass. Errors are set aside and handed to `on_error` only once the queue
    /// is empty; whatever `on_error` returns is queued and drained in turn.
    /// @return Number of entries processed (errors included)
    template<typename OnControl, typename OnError>
    size_type drain(OnControl&& on_control, OnError&& on_error) {
        size_type count = 0;
        std::deque<weft_core::Error> deferred;

        while (true) {
            while (auto item = take()) {
                ++count;
                if (item->is_err()) {
                    deferred.push_back(std::move(*item).error());
                    continue;
                }
                on_control(std::move(*item).value());
            }
            if (deferred.empty()) {
                break;
            }
            while (!deferred.empty()) {
                weft_core::Error e = std::move(deferred.front());
                deferred.pop_front();
                push(on_error(std::move(e)));
            }
        }

        return count;
    }

    [[nodiscard]] bool empty() const noexcept { return m_items.empty(); }
    [[nodiscard]] size_type size() const noexcept { return m_items.size(); }

    void clear() { m_items.clear(); }

private:
    std::deque<value_type> m_items;
};

} // namespace weft_event
