#pragma once

/// @file poll_sources.hpp
/// @brief The built-in event sources
///
/// | Source       | Produces                                             |
/// |--------------|------------------------------------------------------|
/// | PollTimers   | Changed for repaint timers, Event(TimerEvent) else   |
/// | PollTasks    | whatever worker jobs return                          |
/// | PollAsync    | whatever async tasks return or send                  |
/// | PollInput    | Event(InputEvent) pushed by a terminal backend       |
/// | PollRendered | Event(RenderedEvent) after each frame                |
/// | PollQuit     | Event(QuitEvent) before the loop exits               |
///
/// Event must be constructible from the payload of every source it is used
/// with.

#include "fwd.hpp"
#include "app_context.hpp"
#include "async_tasks.hpp"
#include "poll_source.hpp"
#include "timer.hpp"
#include "worker_pool.hpp"
#include <weft/event/channel.hpp>
#include <weft/event/input.hpp>

#include <memory>
#include <type_traits>

namespace weft_kernel {

/// Delivered after every successful render when PollRendered is configured
struct RenderedEvent {
    constexpr bool operator==(const RenderedEvent&) const = default;
};

/// Delivered to the event hook before the loop quits when PollQuit is
/// configured. Returning anything but Quit cancels the quit.
struct QuitEvent {
    constexpr bool operator==(const QuitEvent&) const = default;
};

// =============================================================================
// PollTimers
// =============================================================================

template<typename Event>
class PollTimers final : public IPollSource<Event> {
public:
    PollTimers() : m_timers(std::make_shared<Timers>()) {}
    explicit PollTimers(std::shared_ptr<Timers> timers) : m_timers(std::move(timers)) {}

    [[nodiscard]] weft_core::Result<bool> poll() override {
        return m_timers->poll();
    }

    [[nodiscard]] weft_core::Result<weft_event::Control<Event>> read() override {
        auto event = m_timers->read();
        if (!event) {
            return weft_event::Control<Event>::continue_();
        }
        if (event->is_repaint()) {
            return weft_event::Control<Event>::changed();
        }
        static_assert(std::is_constructible_v<Event, TimerEvent>,
            "PollTimers requires Event to be constructible from TimerEvent");
        return weft_event::Control<Event>::event(Event(*event));
    }

    /// Every elapsed timer fires in the same tick
    [[nodiscard]] bool drain_until_idle() const noexcept override { return true; }

    void attach(AppContext<Event>& ctx) override { ctx.attach_timers(m_timers); }

    [[nodiscard]] const char* name() const noexcept override { return "timers"; }

    [[nodiscard]] const std::shared_ptr<Timers>& timers() const noexcept { return m_timers; }

private:
    std::shared_ptr<Timers> m_timers;
};

// =============================================================================
// PollTasks
// =============================================================================

template<typename Event>
class PollTasks final : public IPollSource<Event> {
public:
    explicit PollTasks(std::size_t worker_count = 1)
        : m_pool(std::make_shared<WorkerPool<Event>>(worker_count))
    {
    }

    [[nodiscard]] weft_core::Result<bool> poll() override {
        return m_pool->has_results();
    }

    [[nodiscard]] weft_core::Result<weft_event::Control<Event>> read() override {
        if (auto r = m_pool->try_recv()) {
            return std::move(*r);
        }
        return weft_event::Control<Event>::continue_();
    }

    void attach(AppContext<Event>& ctx) override { ctx.attach_tasks(m_pool); }

    [[nodiscard]] const char* name() const noexcept override { return "tasks"; }

    [[nodiscard]] const std::shared_ptr<WorkerPool<Event>>& pool() const noexcept { return m_pool; }

private:
    std::shared_ptr<WorkerPool<Event>> m_pool;
};

// =============================================================================
// PollAsync
// =============================================================================

template<typename Event>
class PollAsync final : public IPollSource<Event> {
public:
    PollAsync() : m_tasks(std::make_shared<AsyncTasks<Event>>()) {}

    [[nodiscard]] weft_core::Result<bool> poll() override {
        return m_tasks->poll();
    }

    [[nodiscard]] weft_core::Result<weft_event::Control<Event>> read() override {
        if (auto r = m_tasks->try_recv()) {
            return std::move(*r);
        }
        return weft_event::Control<Event>::continue_();
    }

    void attach(AppContext<Event>& ctx) override { ctx.attach_async(m_tasks); }

    [[nodiscard]] const char* name() const noexcept override { return "async"; }

    [[nodiscard]] const std::shared_ptr<AsyncTasks<Event>>& tasks() const noexcept { return m_tasks; }

private:
    std::shared_ptr<AsyncTasks<Event>> m_tasks;
};

// =============================================================================
// PollInput
// =============================================================================

/// Input decoded by a terminal backend, possibly on its own reader thread
template<typename Event>
class PollInput final : public IPollSource<Event> {
public:
    PollInput() : m_channel(std::make_shared<weft_event::EventChannel<weft_event::InputEvent>>()) {}

    /// Queue input from any thread
    void push(weft_event::InputEvent event) {
        m_channel->send(std::move(event));
    }

    /// Sender for a backend reader thread
    [[nodiscard]] weft_event::Sender<weft_event::InputEvent> sender() const {
        return weft_event::Sender<weft_event::InputEvent>(m_channel, "input");
    }

    [[nodiscard]] weft_core::Result<bool> poll() override {
        return !m_channel->empty();
    }

    [[nodiscard]] weft_core::Result<weft_event::Control<Event>> read() override {
        static_assert(std::is_constructible_v<Event, weft_event::InputEvent>,
            "PollInput requires Event to be constructible from InputEvent");
        if (auto input = m_channel->receive()) {
            return weft_event::Control<Event>::event(Event(std::move(*input)));
        }
        return weft_event::Control<Event>::continue_();
    }

    [[nodiscard]] const char* name() const noexcept override { return "input"; }

private:
    std::shared_ptr<weft_event::EventChannel<weft_event::InputEvent>> m_channel;
};

// =============================================================================
// PollRendered / PollQuit
// =============================================================================

/// Never ready by polling; the run loop reads it after each render.
template<typename Event>
class PollRendered final : public IPollSource<Event> {
public:
    [[nodiscard]] weft_core::Result<bool> poll() override { return false; }

    [[nodiscard]] weft_core::Result<weft_event::Control<Event>> read() override {
        static_assert(std::is_constructible_v<Event, RenderedEvent>,
            "PollRendered requires Event to be constructible from RenderedEvent");
        return weft_event::Control<Event>::event(Event(RenderedEvent{}));
    }

    [[nodiscard]] SourceRole role() const noexcept override { return SourceRole::Rendered; }

    [[nodiscard]] const char* name() const noexcept override { return "rendered"; }
};

/// Never ready by polling; the run loop reads it when a Quit arrives.
template<typename Event>
class PollQuit final : public IPollSource<Event> {
public:
    [[nodiscard]] weft_core::Result<bool> poll() override { return false; }

    [[nodiscard]] weft_core::Result<weft_event::Control<Event>> read() override {
        static_assert(std::is_constructible_v<Event, QuitEvent>,
            "PollQuit requires Event to be constructible from QuitEvent");
        return weft_event::Control<Event>::event(Event(QuitEvent{}));
    }

    [[nodiscard]] SourceRole role() const noexcept override { return SourceRole::Quit; }

    [[nodiscard]] const char* name() const noexcept override { return "quit"; }
};

} // namespace weft_kernel
