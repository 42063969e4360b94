#pragma once

/// @file control.hpp
/// @brief Outcome lattice for event handling
///
/// Every handler in a weft application answers with one of a small,
/// totally ordered set of outcomes. Combining two answers keeps the
/// greater one, so a handler chain can be folded with merge().
///
/// Outcome:  Continue < Unchanged < Changed
/// Control:  Continue < Unchanged < Changed < Event(payload) < Quit

#include "fwd.hpp"
#include <weft/core/error.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <utility>

namespace weft_event {

// =============================================================================
// Outcome
// =============================================================================

/// Three-level widget outcome
enum class Outcome : std::uint8_t {
    /// Event not recognised; try the next handler
    Continue = 0,
    /// Event used, nothing to repaint
    Unchanged = 1,
    /// Event used, repaint required
    Changed = 2,
};

/// Greater of two outcomes
[[nodiscard]] constexpr Outcome merge(Outcome a, Outcome b) noexcept {
    return a > b ? a : b;
}

/// Anything but Continue stops the handler chain
[[nodiscard]] constexpr bool is_consumed(Outcome o) noexcept {
    return o != Outcome::Continue;
}

/// true -> Changed, false -> Unchanged
[[nodiscard]] constexpr Outcome outcome_from(bool changed) noexcept {
    return changed ? Outcome::Changed : Outcome::Unchanged;
}

[[nodiscard]] constexpr const char* outcome_name(Outcome o) noexcept {
    switch (o) {
        case Outcome::Continue: return "Continue";
        case Outcome::Unchanged: return "Unchanged";
        case Outcome::Changed: return "Changed";
    }
    return "Unknown";
}

// =============================================================================
// Flow
// =============================================================================

/// Discriminant of a Control
enum class Flow : std::uint8_t {
    Continue = 0,
    Unchanged = 1,
    Changed = 2,
    Event = 3,
    Quit = 4,
};

[[nodiscard]] constexpr const char* flow_name(Flow f) noexcept {
    switch (f) {
        case Flow::Continue: return "Continue";
        case Flow::Unchanged: return "Unchanged";
        case Flow::Changed: return "Changed";
        case Flow::Event: return "Event";
        case Flow::Quit: return "Quit";
    }
    return "Unknown";
}

// =============================================================================
// Control<Event>
// =============================================================================

/// Five-level application outcome.
///
/// Equality and ordering look at the discriminant only:
/// Control::event(a) == Control::event(b) for any payloads.
template<typename Event>
class Control {
public:
    using event_type = Event;

    /// Continue
    Control() = default;

    /// Lossless embedding of a widget outcome
    Control(Outcome o) : m_flow(static_cast<Flow>(o)) {}

    // =========================================================================
    // Factories
    // =========================================================================

    [[nodiscard]] static Control continue_() { return Control(Flow::Continue); }
    [[nodiscard]] static Control unchanged() { return Control(Flow::Unchanged); }
    [[nodiscard]] static Control changed() { return Control(Flow::Changed); }
    [[nodiscard]] static Control quit() { return Control(Flow::Quit); }

    [[nodiscard]] static Control event(Event e) {
        Control c(Flow::Event);
        c.m_event.emplace(std::move(e));
        return c;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] Flow flow() const noexcept { return m_flow; }

    [[nodiscard]] bool is_continue() const noexcept { return m_flow == Flow::Continue; }
    [[nodiscard]] bool is_unchanged() const noexcept { return m_flow == Flow::Unchanged; }
    [[nodiscard]] bool is_changed() const noexcept { return m_flow == Flow::Changed; }
    [[nodiscard]] bool is_event() const noexcept { return m_flow == Flow::Event; }
    [[nodiscard]] bool is_quit() const noexcept { return m_flow == Flow::Quit; }

    /// Anything but Continue
    [[nodiscard]] bool is_consumed() const noexcept { return m_flow != Flow::Continue; }

    /// Payload of an Event outcome
    /// @throws weft_core::Panic if this is not an Event
    [[nodiscard]] const Event& payload() const {
        if (!m_event) {
            throw weft_core::Panic("Control has no event payload");
        }
        return *m_event;
    }

    [[nodiscard]] Event& payload() {
        if (!m_event) {
            throw weft_core::Panic("Control has no event payload");
        }
        return *m_event;
    }

    /// Move the payload out, leaving the flow untouched
    [[nodiscard]] std::optional<Event> take_payload() {
        return std::exchange(m_event, std::nullopt);
    }

    /// Lossy narrowing: Event and Quit collapse to Continue
    [[nodiscard]] Outcome to_outcome() const noexcept {
        switch (m_flow) {
            case Flow::Unchanged: return Outcome::Unchanged;
            case Flow::Changed: return Outcome::Changed;
            default: return Outcome::Continue;
        }
    }

    /// Convert the payload type, keeping the flow
    template<typename F>
    [[nodiscard]] auto map_event(F&& func) && -> Control<decltype(func(std::declval<Event>()))> {
        using U = decltype(func(std::declval<Event>()));
        if (m_flow == Flow::Event) {
            return Control<U>::event(func(std::move(*m_event)));
        }
        switch (m_flow) {
            case Flow::Unchanged: return Control<U>::unchanged();
            case Flow::Changed: return Control<U>::changed();
            case Flow::Quit: return Control<U>::quit();
            default: return Control<U>::continue_();
        }
    }

    // =========================================================================
    // Comparison (discriminant only)
    // =========================================================================

    friend bool operator==(const Control& a, const Control& b) noexcept {
        return a.m_flow == b.m_flow;
    }

    friend std::strong_ordering operator<=>(const Control& a, const Control& b) noexcept {
        return a.m_flow <=> b.m_flow;
    }

private:
    explicit Control(Flow f) : m_flow(f) {}

    Flow m_flow = Flow::Continue;
    std::optional<Event> m_event;
};

/// Greater of two controls; on a tie the second wins
template<typename Event>
[[nodiscard]] Control<Event> merge(Control<Event> a, Control<Event> b) {
    return a > b ? std::move(a) : std::move(b);
}

template<typename Event>
[[nodiscard]] bool is_consumed(const Control<Event>& c) noexcept {
    return c.is_consumed();
}

[[nodiscard]] inline bool is_consumed(bool handled) noexcept {
    return handled;
}

} // namespace weft_event

// =============================================================================
// Handler chaining
// =============================================================================

/// Return from the enclosing handler if `expr` consumed the event.
#define WEFT_FLOW(expr)                                        \
    do {                                                       \
        auto _weft_flow = (expr);                              \
        if (::weft_event::is_consumed(_weft_flow)) {           \
            return _weft_flow;                                 \
        }                                                      \
    } while (0)

/// Like WEFT_FLOW for a Result-returning expression; errors propagate.
#define WEFT_TRY_FLOW(expr)                                    \
    do {                                                       \
        auto _weft_flow = (expr);                              \
        if (_weft_flow.is_err()) {                             \
            return std::move(_weft_flow).error();              \
        }                                                      \
        if (::weft_event::is_consumed(_weft_flow.value())) {   \
            return std::move(_weft_flow).value();              \
        }                                                      \
    } while (0)
