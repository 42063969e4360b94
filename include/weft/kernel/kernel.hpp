#pragma once

/// @file kernel.hpp
/// @brief Main include file for weft_kernel
///
/// The kernel multiplexes event sources into one ordered stream of handler
/// calls and renders at most once per tick.
///
/// - IPollSource and the stock sources (timers, worker pool, async tasks,
///   input, rendered, quit)
/// - AppContext: facilities offered to the application hooks
/// - RunConfig / RunLoop / run_tui(): wiring and the loop itself
/// - ITerminal / BufferTerminal: render target
/// - Focus: keyboard focus among FocusFlags
///
/// Example usage:
/// @code
/// using AppEvent = std::variant<InputEvent, TimerEvent, QuitEvent>;
///
/// auto terminal = std::make_shared<BufferTerminal>();
/// auto config = RunConfig<AppEvent>(terminal)
///     .poll(PollTimers<AppEvent>())
///     .poll(PollQuit<AppEvent>());
///
/// AppHooks<AppEvent, App, AppContext<AppEvent>> hooks;
/// hooks.render = render_app;
/// hooks.event = handle_app;
/// hooks.error = report_error;
/// auto r = run_tui(hooks, global, app, std::move(config));
/// @endcode

#include "fwd.hpp"
#include "tasks.hpp"
#include "timer.hpp"
#include "worker_pool.hpp"
#include "async_tasks.hpp"
#include "terminal.hpp"
#include "focus.hpp"
#include "app_context.hpp"
#include "poll_source.hpp"
#include "poll_sources.hpp"
#include "run_config.hpp"
#include "run_stats.hpp"
#include "run_loop.hpp"
