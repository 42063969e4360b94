#pragma once

/// @file window_control.hpp
/// @brief Outcome of a window event handler

#include "fwd.hpp"
#include <weft/core/error.hpp>
#include <weft/event/control.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <utility>

namespace weft_window {

/// Discriminant of WindowControl, in lattice order
enum class WindowFlow : unsigned char {
    Continue = 0,
    Unchanged = 1,
    Changed = 2,
    Event = 3,
    Close = 4,
};

[[nodiscard]] constexpr const char* window_flow_name(WindowFlow f) noexcept {
    switch (f) {
        case WindowFlow::Continue: return "Continue";
        case WindowFlow::Unchanged: return "Unchanged";
        case WindowFlow::Changed: return "Changed";
        case WindowFlow::Event: return "Event";
        case WindowFlow::Close: return "Close";
    }
    return "Unknown";
}

/// Five-level window outcome: Continue < Unchanged < Changed < Event < Close.
///
/// Close removes the window that returned it and still carries an event for
/// the application. Comparison looks at the discriminant only.
template<typename Event>
class WindowControl {
public:
    WindowControl() = default;

    WindowControl(weft_event::Outcome o) : m_flow(static_cast<WindowFlow>(o)) {}

    [[nodiscard]] static WindowControl continue_() { return WindowControl(WindowFlow::Continue); }
    [[nodiscard]] static WindowControl unchanged() { return WindowControl(WindowFlow::Unchanged); }
    [[nodiscard]] static WindowControl changed() { return WindowControl(WindowFlow::Changed); }

    [[nodiscard]] static WindowControl event(Event e) {
        WindowControl c(WindowFlow::Event);
        c.m_event.emplace(std::move(e));
        return c;
    }

    [[nodiscard]] static WindowControl close(Event e) {
        WindowControl c(WindowFlow::Close);
        c.m_event.emplace(std::move(e));
        return c;
    }

    [[nodiscard]] WindowFlow flow() const noexcept { return m_flow; }

    [[nodiscard]] bool is_continue() const noexcept { return m_flow == WindowFlow::Continue; }
    [[nodiscard]] bool is_close() const noexcept { return m_flow == WindowFlow::Close; }
    [[nodiscard]] bool is_consumed() const noexcept { return m_flow != WindowFlow::Continue; }

    /// Payload of Event or Close
    /// @throws weft_core::Panic for the other outcomes
    [[nodiscard]] const Event& payload() const {
        if (!m_event) {
            throw weft_core::Panic("WindowControl has no event payload");
        }
        return *m_event;
    }

    /// Widen into the run-loop lattice; Close becomes Event(payload)
    [[nodiscard]] weft_event::Control<Event> into_control() && {
        switch (m_flow) {
            case WindowFlow::Unchanged: return weft_event::Control<Event>::unchanged();
            case WindowFlow::Changed: return weft_event::Control<Event>::changed();
            case WindowFlow::Event:
            case WindowFlow::Close:
                return weft_event::Control<Event>::event(std::move(*m_event));
            default: return weft_event::Control<Event>::continue_();
        }
    }

    friend bool operator==(const WindowControl& a, const WindowControl& b) noexcept {
        return a.m_flow == b.m_flow;
    }

    friend std::strong_ordering operator<=>(const WindowControl& a, const WindowControl& b) noexcept {
        return a.m_flow <=> b.m_flow;
    }

private:
    explicit WindowControl(WindowFlow f) : m_flow(f) {}

    WindowFlow m_flow = WindowFlow::Continue;
    std::optional<Event> m_event;
};

/// Greater of two window outcomes; on a tie the second wins
template<typename Event>
[[nodiscard]] WindowControl<Event> merge(WindowControl<Event> a, WindowControl<Event> b) {
    return a > b ? std::move(a) : std::move(b);
}

} // namespace weft_window
