#pragma once

/// @file timer.hpp
/// @brief Wall-clock timer registry for weft_kernel

#include "fwd.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace weft_kernel {

using TimerClock = std::chrono::steady_clock;

// =============================================================================
// Timer types
// =============================================================================

/// Identifies a registered timer. Never reused within one registry.
struct TimerHandle {
    std::uint64_t value = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }

    constexpr bool operator==(const TimerHandle&) const = default;
};

/// Description of a timer to register
struct TimerDef {
    /// Time between firings, and the delay before the first one
    TimerClock::duration interval{};
    /// Number of firings; none means fire once
    std::optional<std::uint32_t> repeat;
    /// Only trigger a repaint instead of delivering an application event
    bool repaint = false;
    /// First deadline, overriding now + interval
    std::optional<TimerClock::time_point> next;

    /// Fire once after `delay`
    [[nodiscard]] static TimerDef once(TimerClock::duration delay) {
        return TimerDef{delay, std::nullopt, false, std::nullopt};
    }

    /// Fire `count` times, `interval` apart
    [[nodiscard]] static TimerDef repeating(TimerClock::duration interval, std::uint32_t count) {
        return TimerDef{interval, count, false, std::nullopt};
    }

    /// Fire once at a given instant
    [[nodiscard]] static TimerDef at(TimerClock::time_point when) {
        return TimerDef{TimerClock::duration::zero(), std::nullopt, false, when};
    }

    TimerDef& with_repaint(bool value = true) {
        repaint = value;
        return *this;
    }

    TimerDef& starting_at(TimerClock::time_point when) {
        next = when;
        return *this;
    }
};

/// Payload of one firing
struct TimeOut {
    TimerHandle handle;
    /// Zero-based firing number
    std::uint32_t counter = 0;

    constexpr bool operator==(const TimeOut&) const = default;
};

/// What an elapsed timer produces
struct TimerEvent {
    enum class Kind : std::uint8_t {
        Repaint,
        Application,
    };

    Kind kind = Kind::Application;
    TimeOut timeout;

    [[nodiscard]] bool is_repaint() const noexcept { return kind == Kind::Repaint; }

    constexpr bool operator==(const TimerEvent&) const = default;
};

// =============================================================================
// Timers
// =============================================================================

/// Registry of pending timers.
///
/// Owned by the run-loop thread; not synchronised.
class Timers {
public:
    using NowFn = std::function<TimerClock::time_point()>;

    Timers();

    /// Use a custom clock (tests)
    explicit Timers(NowFn now);

    Timers(const Timers&) = delete;
    Timers& operator=(const Timers&) = delete;

    /// Register a timer
    [[nodiscard]] TimerHandle add(const TimerDef& def);

    /// Remove a timer
    /// @return false if it had already fired for the last time or was removed
    bool remove(TimerHandle handle);

    /// Remove `old` if given and still registered, then add `def`
    [[nodiscard]] TimerHandle replace(std::optional<TimerHandle> old, const TimerDef& def);

    /// Time until the earliest deadline (zero if already due), none if idle
    [[nodiscard]] std::optional<TimerClock::duration> sleep_time() const;

    /// Earliest deadline has passed
    [[nodiscard]] bool poll() const;

    /// Pop exactly one elapsed timer, earliest first, and reschedule it
    /// if it repeats.
    [[nodiscard]] std::optional<TimerEvent> read();

    [[nodiscard]] bool contains(TimerHandle handle) const;
    [[nodiscard]] std::size_t len() const noexcept { return m_timers.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_timers.empty(); }

private:
    struct Entry {
        TimerHandle handle;
        bool repaint = false;
        std::uint32_t count = 0;
        std::optional<std::uint32_t> repeat;
        TimerClock::time_point next;
        TimerClock::duration interval{};
    };

    void insert(Entry entry);

    NowFn m_now;
    std::uint64_t m_last_tag = 0;
    /// Sorted by deadline, latest first; the back is due next
    std::vector<Entry> m_timers;
};

} // namespace weft_kernel
