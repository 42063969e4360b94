#pragma once

/// @file app_context.hpp
/// @brief Facilities the run loop offers to application handlers

#include "fwd.hpp"
#include "async_tasks.hpp"
#include "focus.hpp"
#include "tasks.hpp"
#include "terminal.hpp"
#include "timer.hpp"
#include "worker_pool.hpp"
#include <weft/core/error.hpp>
#include <weft/event/control.hpp>
#include <weft/event/control_queue.hpp>
#include <weft/event/input.hpp>
#include <weft/ui/types.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace weft_kernel {

/// Application context.
///
/// Passed explicitly to every init, render, event and error hook. An
/// application can derive its global state from this class to carry its own
/// fields alongside. The run loop attaches timers, workers, async tasks and
/// the terminal before init() runs; calling into a facility that was never
/// configured throws weft_core::Panic.
template<typename Event>
class AppContext {
public:
    using ResultType = weft_core::Result<weft_event::Control<Event>>;
    using Tokens = std::pair<Cancellation, Liveness>;

    AppContext() = default;
    virtual ~AppContext() = default;

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    // =========================================================================
    // Queue
    // =========================================================================

    /// Queue an application event
    void queue_event(Event event) {
        m_queue.push(weft_event::Control<Event>::event(std::move(event)));
    }

    /// Queue an additional outcome
    void queue(weft_event::Control<Event> ctrl) {
        m_queue.push(std::move(ctrl));
    }

    /// Queue an error for the error hook
    void queue_err(weft_core::Error err) {
        m_queue.push_err(std::move(err));
    }

    // =========================================================================
    // Timers
    // =========================================================================

    [[nodiscard]] TimerHandle add_timer(const TimerDef& def) {
        return timers().add(def);
    }

    void remove_timer(TimerHandle handle) {
        timers().remove(handle);
    }

    /// Remove `old` if it still exists, then add `def`
    [[nodiscard]] TimerHandle replace_timer(std::optional<TimerHandle> old, const TimerDef& def) {
        return timers().replace(old, def);
    }

    // =========================================================================
    // Worker pool
    // =========================================================================

    /// Run a job on the worker pool
    weft_core::Result<Tokens> spawn(typename WorkerPool<Event>::SimpleJob job) {
        return tasks().spawn(std::move(job));
    }

    /// Run a job that checks for cancellation and can send extra results
    weft_core::Result<Tokens> spawn_ext(typename WorkerPool<Event>::Job job) {
        return tasks().spawn_ext(std::move(job));
    }

    // =========================================================================
    // Async tasks
    // =========================================================================

    Liveness spawn_async(typename AsyncTasks<Event>::Task task) {
        return async_tasks().spawn(std::move(task));
    }

    Tokens spawn_async_ext(typename AsyncTasks<Event>::ExtTask task) {
        return async_tasks().spawn_ext(std::move(task));
    }

    // =========================================================================
    // Focus
    // =========================================================================

    void set_focus(Focus focus) { m_focus = std::move(focus); }

    /// Take the focus back out of the context
    [[nodiscard]] std::optional<Focus> take_focus() {
        return std::exchange(m_focus, std::nullopt);
    }

    void clear_focus() { m_focus.reset(); }

    [[nodiscard]] bool has_focus() const noexcept { return m_focus.has_value(); }

    /// @throws weft_core::Panic if no focus is set
    [[nodiscard]] const Focus& focus() const {
        if (!m_focus) {
            throw weft_core::Panic("focus");
        }
        return *m_focus;
    }

    /// @throws weft_core::Panic if no focus is set
    [[nodiscard]] Focus& focus_mut() {
        if (!m_focus) {
            throw weft_core::Panic("focus");
        }
        return *m_focus;
    }

    /// Let the focus handle an input event; a consumed outcome is queued
    /// @throws weft_core::Panic if no focus is set
    weft_event::Outcome handle_focus(const Event& event) {
        Focus& f = focus_mut();
        const weft_event::InputEvent* input = weft_event::as_input(event);
        if (!input) {
            return weft_event::Outcome::Continue;
        }
        auto r = f.handle(*input);
        if (weft_event::is_consumed(r)) {
            queue(r);
        }
        return r;
    }

    // =========================================================================
    // Terminal
    // =========================================================================

    /// @throws weft_core::Panic if no terminal is attached
    [[nodiscard]] ITerminal& terminal() {
        if (!m_terminal) {
            throw weft_core::Panic("terminal");
        }
        return *m_terminal;
    }

    /// Clear the terminal and redraw everything before the next frame
    void clear_terminal() { m_clear_terminal = true; }

    /// Insert lines above an inline viewport before the next frame
    void insert_before(std::uint16_t height, ITerminal::InsertFn draw) {
        m_insert_before = InsertBefore{height, std::move(draw)};
    }

    /// Place the cursor after this render; nothing hides it.
    /// Only meaningful during render.
    void set_screen_cursor(std::optional<weft_ui::Position> cursor) {
        if (cursor) {
            m_cursor = cursor;
        }
    }

    /// Set the terminal window title before the next frame
    void set_window_title(std::string title) { m_window_title = std::move(title); }

    // =========================================================================
    // Statistics
    // =========================================================================

    /// Frames rendered so far
    [[nodiscard]] std::uint64_t count() const noexcept { return m_count; }

    /// Duration of the last render hook
    [[nodiscard]] std::chrono::microseconds last_render() const noexcept { return m_last_render; }

    /// Duration of the last event hook
    [[nodiscard]] std::chrono::microseconds last_event() const noexcept { return m_last_event; }

    // =========================================================================
    // Wiring (set by the run loop)
    // =========================================================================

    void attach_timers(std::shared_ptr<Timers> timers) { m_timers = std::move(timers); }
    void attach_tasks(std::shared_ptr<WorkerPool<Event>> tasks) { m_tasks = std::move(tasks); }
    void attach_async(std::shared_ptr<AsyncTasks<Event>> tasks) { m_async = std::move(tasks); }
    void attach_terminal(std::shared_ptr<ITerminal> terminal) { m_terminal = std::move(terminal); }

    [[nodiscard]] bool has_timers() const noexcept { return m_timers != nullptr; }
    [[nodiscard]] bool has_tasks() const noexcept { return m_tasks != nullptr; }
    [[nodiscard]] bool has_async() const noexcept { return m_async != nullptr; }

    /// Pending outcomes for this tick
    [[nodiscard]] weft_event::ControlQueue<Event>& control_queue() noexcept { return m_queue; }

private:
    template<typename E, typename S, typename G>
    friend class RunLoop;

    struct InsertBefore {
        std::uint16_t height = 0;
        ITerminal::InsertFn draw;
    };

    Timers& timers() {
        if (!m_timers) {
            throw weft_core::Panic("No timers configured. Add PollTimers to the RunConfig.");
        }
        return *m_timers;
    }

    WorkerPool<Event>& tasks() {
        if (!m_tasks) {
            throw weft_core::Panic("No worker pool configured. Add PollTasks to the RunConfig.");
        }
        return *m_tasks;
    }

    AsyncTasks<Event>& async_tasks() {
        if (!m_async) {
            throw weft_core::Panic("No async runtime configured. Add PollAsync to the RunConfig.");
        }
        return *m_async;
    }

    std::optional<Focus> m_focus;
    std::uint64_t m_count = 0;
    std::optional<weft_ui::Position> m_cursor;
    std::shared_ptr<ITerminal> m_terminal;
    std::optional<std::string> m_window_title;
    bool m_clear_terminal = false;
    InsertBefore m_insert_before;
    std::chrono::microseconds m_last_render{0};
    std::chrono::microseconds m_last_event{0};

    std::shared_ptr<Timers> m_timers;
    std::shared_ptr<WorkerPool<Event>> m_tasks;
    std::shared_ptr<AsyncTasks<Event>> m_async;
    weft_event::ControlQueue<Event> m_queue;
};

} // namespace weft_kernel
