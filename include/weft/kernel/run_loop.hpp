#pragma once

/// @file run_loop.hpp
/// @brief The event loop: poll sources, dispatch, render

#include "fwd.hpp"
#include "app_context.hpp"
#include "poll_source.hpp"
#include "run_config.hpp"
#include "run_stats.hpp"
#include <weft/core/error.hpp>
#include <weft/core/log.hpp>
#include <weft/event/control.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace weft_kernel {

/// Result of one tick
struct TickOutcome {
    /// Something was read, handled or rendered
    bool active = false;
    /// Quit was confirmed
    bool quit = false;
};

/// Application hooks called by the run loop
template<typename Event, typename State, typename Global>
struct AppHooks {
    using Control = weft_event::Control<Event>;

    std::function<weft_core::Result<void>(State&, Global&)> init;
    std::function<weft_core::Result<void>(weft_ui::Rect, weft_ui::Buffer&, State&, Global&)> render;
    std::function<weft_core::Result<Control>(const Event&, State&, Global&)> event;
    std::function<weft_core::Result<Control>(weft_core::Error, State&, Global&)> error;
};

/// The run loop.
///
/// Each tick polls every source in configuration order and remembers the
/// ready ones. Ready sources are then read one after the other; after every
/// read the control queue is drained completely, so follow-up events are
/// handled before the next source is looked at. Errors reach the error hook
/// only once nothing else is queued. When anything asked for a repaint the
/// frame is rendered once, after all sources had their turn.
///
/// A Quit is confirmed by the event hook if a PollQuit source is configured;
/// any other answer cancels it. Once confirmed the remaining sources are
/// skipped, the queue is drained and nothing more is rendered.
template<typename Event, typename State, typename Global = AppContext<Event>>
class RunLoop {
    static_assert(std::is_base_of_v<AppContext<Event>, Global>,
                  "Global must derive from AppContext<Event>");

public:
    using Control = weft_event::Control<Event>;
    using ResultType = weft_core::Result<Control>;
    using Hooks = AppHooks<Event, State, Global>;

    RunLoop(Hooks hooks, Global& global, State& state, RunConfig<Event> config)
        : m_hooks(std::move(hooks))
        , m_global(global)
        , m_state(state)
        , m_terminal(config.terminal())
        , m_term_init(config.term_init())
        , m_timing(config.timing())
        , m_sources(std::move(config.sources()))
        , m_poll_sleep(m_timing.fast_sleep)
    {
        if (!m_terminal) {
            throw weft_core::Panic("RunConfig has no terminal");
        }
        m_global.attach_terminal(m_terminal);
        for (auto& source : m_sources) {
            source->attach(m_global);
            switch (source->role()) {
                case SourceRole::Rendered: m_rendered = source.get(); break;
                case SourceRole::Quit: m_quit_source = source.get(); break;
                case SourceRole::Plain: break;
            }
        }
    }

    RunLoop(const RunLoop&) = delete;
    RunLoop& operator=(const RunLoop&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Initialize the terminal, run until quit and restore the terminal.
    ///
    /// The terminal is restored even if a handler throws; the exception is
    /// passed on afterwards.
    weft_core::Result<void> run() {
        WEFT_LOG_SCOPE("RunLoop::run");
        if (!m_term_init.manual) {
            auto r = m_terminal->init(m_term_init);
            if (!r) {
                return r;
            }
        }

        weft_core::Result<void> result = weft_core::Ok();
        try {
            result = run_inner();
        } catch (...) {
            // shutdown failure is already logged; the handler's exception wins
            (void)restore_terminal();
            throw;
        }

        auto restored = restore_terminal();
        if (result && !restored) {
            return restored;
        }
        return result;
    }

    /// Run the init hook and render the first frame
    weft_core::Result<void> start() {
        if (m_started) {
            return weft_core::Err(weft_core::Error(weft_core::ErrorCode::InvalidState,
                                                   "run loop already started"));
        }
        m_started = true;
        weft_core::kernel_logger()->info("Run loop starting with {} sources", m_sources.size());

        if (m_hooks.init) {
            auto r = m_hooks.init(m_state, m_global);
            if (!r) {
                return r;
            }
        }
        render_frame();
        return weft_core::Ok();
    }

    /// One pass over all event sources
    TickOutcome tick() {
        ++m_stats.ticks;
        bool active = false;

        std::vector<IPollSource<Event>*> ready;
        for (auto& source : m_sources) {
            if (source->role() != SourceRole::Plain) {
                continue;
            }
            ++m_stats.polls;
            auto polled = source->poll();
            if (!polled) {
                queue_source_error(std::move(polled).error(), *source);
                active = true;
            } else if (polled.value()) {
                ready.push_back(source.get());
            }
        }
        drain();
        weft_core::kernel_logger()->trace("tick {}: {} of {} sources ready",
                                          m_stats.ticks, ready.size(), m_sources.size());

        for (IPollSource<Event>* source : ready) {
            if (m_quit) {
                break;
            }
            active = true;
            read_source(*source);
        }

        if (m_changed && !m_quit) {
            render_frame();
        }

        active = active || m_changed;
        return TickOutcome{active, m_quit};
    }

    /// Time to sleep after an idle tick
    [[nodiscard]] std::chrono::microseconds next_sleep() const {
        auto t = m_poll_sleep;
        if (m_global.has_timers()) {
            if (auto timer_sleep = timers_sleep_time()) {
                t = std::min(t, *timer_sleep);
            }
        }
        return t;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool quit_requested() const noexcept { return m_quit; }
    [[nodiscard]] bool repaint_pending() const noexcept { return m_changed; }
    [[nodiscard]] const RunStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] std::size_t source_count() const noexcept { return m_sources.size(); }

private:
    using clock = std::chrono::steady_clock;

    weft_core::Result<void> run_inner() {
        auto started = start();
        if (!started) {
            return started;
        }

        while (!m_quit) {
            TickOutcome t = tick();
            if (t.quit) {
                break;
            }
            if (t.active) {
                m_poll_sleep = m_timing.fast_sleep;
            } else {
                std::this_thread::sleep_for(next_sleep());
                if (m_poll_sleep < m_timing.idle_sleep) {
                    m_poll_sleep = std::min(m_poll_sleep + m_timing.backoff, m_timing.idle_sleep);
                }
            }
        }

        weft_core::kernel_logger()->info("Run loop finished after {} ticks, {} renders",
                                          m_stats.ticks, m_stats.renders);
        return weft_core::Ok();
    }

    weft_core::Result<void> restore_terminal() {
        if (m_term_init.manual) {
            return weft_core::Ok();
        }
        auto r = m_terminal->shutdown();
        if (!r) {
            weft_core::kernel_logger()->error("Terminal shutdown failed: {}", r.error().message());
        }
        return r;
    }

    std::optional<std::chrono::microseconds> timers_sleep_time() const {
        if (auto t = m_global.m_timers->sleep_time()) {
            return std::chrono::duration_cast<std::chrono::microseconds>(*t);
        }
        return std::nullopt;
    }

    void read_source(IPollSource<Event>& source) {
        while (true) {
            ++m_stats.reads;
            auto read = source.read();
            const bool failed = read.is_err();
            m_global.control_queue().push(std::move(read));
            drain();

            // a failed read ends this source's turn
            if (failed || m_quit || !source.drain_until_idle()) {
                return;
            }
            ++m_stats.polls;
            auto again = source.poll();
            if (!again) {
                queue_source_error(std::move(again).error(), source);
                drain();
                return;
            }
            if (!again.value()) {
                return;
            }
        }
    }

    void queue_source_error(weft_core::Error err, const IPollSource<Event>& source) {
        err.with_context("source", source.name());
        weft_core::kernel_logger()->warn("Source '{}' failed: {}", source.name(), err.message());
        m_global.control_queue().push_err(std::move(err));
    }

    // =========================================================================
    // Queue processing
    // =========================================================================

    void drain() {
        m_global.control_queue().drain(
            [this](Control ctrl) { handle_control(std::move(ctrl)); },
            [this](weft_core::Error err) { return handle_error(std::move(err)); });
    }

    void handle_control(Control ctrl) {
        switch (ctrl.flow()) {
            case weft_event::Flow::Continue:
            case weft_event::Flow::Unchanged:
                break;
            case weft_event::Flow::Changed:
                m_changed = true;
                break;
            case weft_event::Flow::Event: {
                auto payload = ctrl.take_payload();
                if (payload) {
                    m_global.control_queue().push(call_event(*payload));
                }
                break;
            }
            case weft_event::Flow::Quit:
                handle_quit();
                break;
        }
    }

    void handle_quit() {
        if (m_quit) {
            return;
        }
        if (!m_quit_source) {
            m_quit = true;
            return;
        }

        auto quit_event = m_quit_source->read();
        if (!quit_event) {
            m_global.control_queue().push(std::move(quit_event));
            m_quit = true;
            return;
        }
        auto payload = std::move(quit_event).value().take_payload();
        if (!payload) {
            m_quit = true;
            return;
        }

        auto answer = call_event(*payload);
        if (answer && answer.value().is_quit()) {
            m_quit = true;
            return;
        }
        ++m_stats.quit_vetoes;
        weft_core::kernel_logger()->debug("Quit cancelled by the event handler");
        m_global.control_queue().push(std::move(answer));
    }

    ResultType call_event(const Event& event) {
        if (!m_hooks.event) {
            return Control::continue_();
        }
        auto t0 = clock::now();
        auto r = m_hooks.event(event, m_state, m_global);
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - t0);
        m_global.m_last_event = elapsed;
        m_stats.record_event(elapsed);
        return r;
    }

    ResultType handle_error(weft_core::Error err) {
        ++m_stats.errors;
        weft_core::debug::record_error(err);
        weft_core::kernel_logger()->debug("Dispatching error: {}", weft_core::build_error_chain(err));
        if (!m_hooks.error) {
            weft_core::kernel_logger()->error("Unhandled error: {}", weft_core::build_error_chain(err));
            return Control::continue_();
        }
        auto r = m_hooks.error(std::move(err), m_state, m_global);
        if (!r) {
            // Errors from the error hook are not fed back into it.
            weft_core::kernel_logger()->error("Error hook failed: {}",
                                              weft_core::build_error_chain(r.error()));
            return Control::continue_();
        }
        return r;
    }

    // =========================================================================
    // Rendering
    // =========================================================================

    void render_frame() {
        m_changed = false;
        auto& queue = m_global.control_queue();

        if (m_global.m_clear_terminal) {
            m_global.m_clear_terminal = false;
            auto r = m_terminal->clear();
            if (!r) {
                queue.push_err(std::move(r).error());
            }
        }

        if (m_global.m_insert_before.height > 0) {
            auto insert = std::exchange(m_global.m_insert_before, {});
            auto r = m_terminal->insert_before(insert.height, std::move(insert.draw));
            if (!r) {
                queue.push_err(std::move(r).error());
            }
        }

        if (m_global.m_window_title) {
            auto title = std::move(*m_global.m_window_title);
            m_global.m_window_title.reset();
            auto r = m_terminal->set_title(title);
            if (!r) {
                queue.push_err(std::move(r).error());
            }
        }

        auto rendered = m_terminal->render([this](Frame& frame) -> weft_core::Result<void> {
            auto t0 = clock::now();
            weft_core::Result<void> r = weft_core::Ok();
            if (m_hooks.render) {
                r = m_hooks.render(frame.area(), frame.buffer(), m_state, m_global);
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - t0);
            m_global.m_last_render = elapsed;
            m_stats.record_render(elapsed);

            if (m_global.m_cursor) {
                frame.set_cursor_position(*m_global.m_cursor);
                m_global.m_cursor.reset();
            }
            m_global.m_count = frame.count() + 1;
            return r;
        });

        if (rendered) {
            if (m_rendered) {
                queue.push(m_rendered->read());
            }
        } else {
            queue.push_err(std::move(rendered).error());
        }
        drain();
    }

    Hooks m_hooks;
    Global& m_global;
    State& m_state;
    std::shared_ptr<ITerminal> m_terminal;
    TermInit m_term_init;
    LoopTiming m_timing;
    std::vector<std::unique_ptr<IPollSource<Event>>> m_sources;
    IPollSource<Event>* m_rendered = nullptr;
    IPollSource<Event>* m_quit_source = nullptr;

    std::chrono::microseconds m_poll_sleep;
    bool m_started = false;
    bool m_changed = false;
    bool m_quit = false;
    RunStats m_stats;
};

/// Run an application to completion.
///
/// @code
/// AppContext<AppEvent> global;
/// AppState state;
/// auto r = run_tui<AppEvent>(hooks, global, state,
///     RunConfig<AppEvent>(terminal).poll(PollTimers<AppEvent>()));
/// @endcode
template<typename Event, typename State, typename Global>
weft_core::Result<void> run_tui(AppHooks<Event, State, Global> hooks, Global& global, State& state,
                                RunConfig<Event> config) {
    RunLoop<Event, State, Global> loop(std::move(hooks), global, state, std::move(config));
    return loop.run();
}

} // namespace weft_kernel
