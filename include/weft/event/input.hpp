#pragma once

/// @file input.hpp
/// @brief Terminal input events for weft_event
///
/// The terminal backend decodes raw input into InputEvent. Application
/// event types that carry input make it reachable through as_input() so
/// that generic code (window stacks, focus, mouse capture) can inspect it.

#include "fwd.hpp"
#include "control.hpp"
#include <weft/ui/types.hpp>

#include <concepts>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace weft_event {

// =============================================================================
// Keyboard
// =============================================================================

/// Key codes
enum class Key : std::uint16_t {
    Char = 0,   // see KeyEvent::ch
    Enter,
    Tab,
    BackTab,
    Backspace,
    Delete,
    Insert,
    Escape,
    Left,
    Right,
    Up,
    Down,
    Home,
    End,
    PageUp,
    PageDown,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
};

/// Key modifier flags
enum class KeyMod : std::uint8_t {
    None = 0,
    Shift = 1 << 0,
    Control = 1 << 1,
    Alt = 1 << 2,
};

[[nodiscard]] constexpr KeyMod operator|(KeyMod a, KeyMod b) noexcept {
    return static_cast<KeyMod>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

[[nodiscard]] constexpr bool has_mod(KeyMod set, KeyMod flag) noexcept {
    return (static_cast<std::uint8_t>(set) & static_cast<std::uint8_t>(flag)) != 0;
}

enum class KeyAction : std::uint8_t {
    Press,
    Repeat,
    Release,
};

struct KeyEvent {
    Key key = Key::Char;
    char32_t ch = 0;
    KeyMod mods = KeyMod::None;
    KeyAction action = KeyAction::Press;

    [[nodiscard]] static constexpr KeyEvent press(Key k, KeyMod m = KeyMod::None) {
        return KeyEvent{k, 0, m, KeyAction::Press};
    }

    [[nodiscard]] static constexpr KeyEvent press_char(char32_t c, KeyMod m = KeyMod::None) {
        return KeyEvent{Key::Char, c, m, KeyAction::Press};
    }

    /// Pressed character key with exactly these modifiers
    [[nodiscard]] constexpr bool is_char(char32_t c, KeyMod m = KeyMod::None) const noexcept {
        return action == KeyAction::Press && key == Key::Char && ch == c && mods == m;
    }

    /// Pressed special key with exactly these modifiers
    [[nodiscard]] constexpr bool is_key(Key k, KeyMod m = KeyMod::None) const noexcept {
        return action == KeyAction::Press && key == k && mods == m;
    }

    constexpr bool operator==(const KeyEvent&) const = default;
};

// =============================================================================
// Mouse
// =============================================================================

enum class MouseButton : std::uint8_t {
    Left,
    Right,
    Middle,
};

enum class MouseKind : std::uint8_t {
    Down,
    Up,
    Drag,
    Moved,
    ScrollDown,
    ScrollUp,
    ScrollLeft,
    ScrollRight,
};

struct MouseEvent {
    MouseKind kind = MouseKind::Moved;
    MouseButton button = MouseButton::Left;
    std::uint16_t column = 0;
    std::uint16_t row = 0;
    KeyMod mods = KeyMod::None;

    [[nodiscard]] static constexpr MouseEvent down(MouseButton b, std::uint16_t col, std::uint16_t r) {
        return MouseEvent{MouseKind::Down, b, col, r, KeyMod::None};
    }

    [[nodiscard]] static constexpr MouseEvent up(MouseButton b, std::uint16_t col, std::uint16_t r) {
        return MouseEvent{MouseKind::Up, b, col, r, KeyMod::None};
    }

    [[nodiscard]] static constexpr MouseEvent moved(std::uint16_t col, std::uint16_t r) {
        return MouseEvent{MouseKind::Moved, MouseButton::Left, col, r, KeyMod::None};
    }

    [[nodiscard]] static constexpr MouseEvent scroll_down(std::uint16_t col, std::uint16_t r) {
        return MouseEvent{MouseKind::ScrollDown, MouseButton::Left, col, r, KeyMod::None};
    }

    [[nodiscard]] constexpr weft_ui::Position position() const noexcept {
        return weft_ui::Position{column, row};
    }

    constexpr bool operator==(const MouseEvent&) const = default;
};

// =============================================================================
// Other terminal events
// =============================================================================

struct ResizeEvent {
    std::uint16_t width = 0;
    std::uint16_t height = 0;

    constexpr bool operator==(const ResizeEvent&) const = default;
};

struct PasteEvent {
    std::string text;

    bool operator==(const PasteEvent&) const = default;
};

/// Terminal window gained or lost focus
struct FocusChange {
    bool gained = true;

    constexpr bool operator==(const FocusChange&) const = default;
};

/// Any decoded terminal input
using InputEvent = std::variant<KeyEvent, MouseEvent, ResizeEvent, PasteEvent, FocusChange>;

// =============================================================================
// Access from application event types
// =============================================================================

namespace detail {

template<typename T>
struct variant_holds_input : std::false_type {};

template<typename... Ts>
struct variant_holds_input<std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<Ts, InputEvent> || ...)> {};

} // namespace detail

/// Input carried by an application event, or nullptr.
///
/// Works for InputEvent itself, for std::variant types with an InputEvent
/// alternative, and for types with a member `const InputEvent* input() const`.
template<typename Event>
[[nodiscard]] const InputEvent* as_input(const Event& event) {
    if constexpr (std::is_same_v<Event, InputEvent>) {
        return &event;
    } else if constexpr (detail::variant_holds_input<Event>::value) {
        return std::get_if<InputEvent>(&event);
    } else if constexpr (requires { { event.input() } -> std::convertible_to<const InputEvent*>; }) {
        return event.input();
    } else {
        return nullptr;
    }
}

/// Mouse part of an input event, or nullptr
[[nodiscard]] inline const MouseEvent* as_mouse(const InputEvent& event) {
    return std::get_if<MouseEvent>(&event);
}

/// Key part of an input event, or nullptr
[[nodiscard]] inline const KeyEvent* as_key(const InputEvent& event) {
    return std::get_if<KeyEvent>(&event);
}

/// Left button pressed inside the area
[[nodiscard]] inline bool is_left_down_in(const InputEvent& event, const weft_ui::Rect& area) {
    const MouseEvent* m = as_mouse(event);
    return m && m->kind == MouseKind::Down && m->button == MouseButton::Left
        && area.contains(m->position());
}

/// Swallow mouse clicks, scrolls and moves that hit the area.
///
/// Returns Unchanged for a mouse down, up, move or scroll inside `area`,
/// Continue otherwise. Drags pass through.
[[nodiscard]] inline Outcome mouse_trap(const InputEvent& event, const weft_ui::Rect& area) {
    const MouseEvent* m = as_mouse(event);
    if (!m || m->kind == MouseKind::Drag) {
        return Outcome::Continue;
    }
    return area.contains(m->position()) ? Outcome::Unchanged : Outcome::Continue;
}

} // namespace weft_event
