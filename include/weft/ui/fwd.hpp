#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for weft_ui

namespace weft_ui {

struct Position;
struct Size;
struct Rect;
struct Cell;
class Buffer;

} // namespace weft_ui
