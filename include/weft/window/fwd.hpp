#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for weft_window

namespace weft_window {

enum class WindowFlow : unsigned char;

template<typename Event>
class WindowControl;

template<typename Context>
class IWindow;

template<typename Event, typename Context>
class WindowStack;

template<typename S>
class WindowRef;

template<typename S>
class WindowMut;

} // namespace weft_window
