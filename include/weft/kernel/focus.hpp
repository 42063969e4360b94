#pragma once

/// @file focus.hpp
/// @brief Keyboard focus over a flat list of widgets

#include "fwd.hpp"
#include <weft/event/control.hpp>
#include <weft/event/input.hpp>
#include <weft/ui/types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weft_kernel {

// =============================================================================
// FocusFlag
// =============================================================================

/// Shared focus state of one widget.
///
/// Copies refer to the same flag; the widget keeps one and the Focus keeps
/// another.
class FocusFlag {
public:
    explicit FocusFlag(std::string name = {});

    [[nodiscard]] const std::string& name() const { return m_state->name; }

    [[nodiscard]] bool is_focused() const { return m_state->focused; }

    /// Focus arrived with the last change
    [[nodiscard]] bool gained() const { return m_state->gained; }

    /// Focus left with the last change
    [[nodiscard]] bool lost() const { return m_state->lost; }

    /// Screen area used for mouse focus, set during render
    void set_area(weft_ui::Rect area) { m_state->area = area; }
    [[nodiscard]] weft_ui::Rect area() const { return m_state->area; }

    bool operator==(const FocusFlag& other) const { return m_state == other.m_state; }

private:
    friend class Focus;

    struct State {
        std::string name;
        bool focused = false;
        bool gained = false;
        bool lost = false;
        weft_ui::Rect area;
    };

    std::shared_ptr<State> m_state;
};

// =============================================================================
// Focus
// =============================================================================

/// Focus cycle over widgets in navigation order.
///
/// Built by the application each render (or once), installed into the
/// AppContext, and consulted for Tab/BackTab and mouse focus.
class Focus {
public:
    Focus() = default;
    explicit Focus(std::vector<FocusFlag> flags);

    /// Append a widget in navigation order
    Focus& add(FocusFlag flag);

    /// Focus the first widget
    void first();

    /// Move to the next widget, wrapping around
    /// @return false if there is nothing to focus
    bool next();

    /// Move to the previous widget, wrapping around
    bool prev();

    /// Focus a specific widget
    /// @return false if it is not part of this focus cycle
    bool focus(const FocusFlag& flag);

    /// Focus the widget whose area contains the position
    bool focus_at(std::uint16_t column, std::uint16_t row);

    /// Currently focused widget
    [[nodiscard]] std::optional<FocusFlag> focused() const;

    /// Clear gained/lost markers
    void reset_lost_gained();

    /// Tab/BackTab navigation and left-click focus
    [[nodiscard]] weft_event::Outcome handle(const weft_event::InputEvent& event);

    [[nodiscard]] std::size_t len() const noexcept { return m_flags.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_flags.empty(); }

private:
    [[nodiscard]] std::optional<std::size_t> focused_index() const;
    void change_to(std::size_t index);

    std::vector<FocusFlag> m_flags;
};

} // namespace weft_kernel
