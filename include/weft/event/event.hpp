#pragma once

/// @file event.hpp
/// @brief Main include header for weft_event
///
/// weft_event defines how handlers answer events and how those answers
/// travel:
/// - Outcome / Control: the ordered outcome lattice and merge()
/// - ControlQueue: follow-up outcomes queued during one tick
/// - EventChannel / Sender: lock-free MPSC channel for worker results
/// - InputEvent: decoded terminal input, as_input() and mouse_trap()
///
/// ```cpp
/// Control<AppEvent> handle(const AppEvent& e, App& app) {
///     WEFT_FLOW(app.menu.handle(e));       // menu first
///     WEFT_FLOW(app.editor.handle(e));     // then the editor
///     return Control<AppEvent>::continue_();
/// }
/// ```

#include "fwd.hpp"
#include "control.hpp"
#include "control_queue.hpp"
#include "channel.hpp"
#include "input.hpp"
