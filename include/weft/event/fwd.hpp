#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for weft_event

#include <cstdint>

namespace weft_event {

// Outcomes
enum class Outcome : std::uint8_t;
enum class Flow : std::uint8_t;

template<typename Event>
class Control;

template<typename Event>
class ControlQueue;

// Channels
template<typename E>
class EventChannel;

template<typename E>
class Sender;

// Input
struct KeyEvent;
struct MouseEvent;
struct ResizeEvent;
struct PasteEvent;
struct FocusChange;

} // namespace weft_event
