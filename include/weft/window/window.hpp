#pragma once

/// @file window.hpp
/// @brief Main include file for weft_window
///
/// Windows are modal or overlay parts of the UI, each with its own state
/// type. The stack routes events top first, renders bottom first and keeps
/// exactly one window flagged as top.
///
/// Example usage:
/// @code
/// WindowStack<AppEvent, AppGlobal> windows;
/// windows.show<Dialog>(render_dialog, handle_dialog, std::make_unique<Dialog>(), global);
/// auto r = windows.handle(event, global);
/// @endcode

#include "fwd.hpp"
#include "window_control.hpp"
#include "window_state.hpp"
#include "window_stack.hpp"
