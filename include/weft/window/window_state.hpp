#pragma once

/// @file window_state.hpp
/// @brief Base class of window states kept in a WindowStack

#include "fwd.hpp"
#include <weft/ui/types.hpp>

namespace weft_window {

/// Window state interface.
///
/// The stack tells every window whether it is on top after each reordering
/// and asks for its area to route mouse events.
template<typename Context>
class IWindow {
public:
    virtual ~IWindow() = default;

    /// Called after every show, close and reorder
    virtual void set_top(bool top, Context& ctx) = 0;

    /// Screen area of the window as of the last render
    [[nodiscard]] virtual weft_ui::Rect area() const = 0;
};

} // namespace weft_window
