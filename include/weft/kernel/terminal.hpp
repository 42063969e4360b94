#pragma once

/// @file terminal.hpp
/// @brief Render-target seam between the run loop and a terminal backend

#include "fwd.hpp"
#include <weft/core/error.hpp>
#include <weft/ui/types.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace weft_kernel {

// =============================================================================
// TermInit
// =============================================================================

/// Terminal init/shutdown flags
struct TermInit {
    /// Skip init/shutdown entirely; the application does it
    bool manual = false;
    bool alternate_screen = true;
    bool mouse_capture = true;
    bool bracketed_paste = true;
    bool cursor_blinking = true;
    /// Clear the used area at shutdown
    bool clear_area = false;
};

// =============================================================================
// Frame
// =============================================================================

/// One render pass: the drawing area, its buffer and the cursor request
class Frame {
public:
    Frame(weft_ui::Buffer& buffer, std::uint64_t count)
        : m_buffer(buffer)
        , m_count(count)
    {
    }

    [[nodiscard]] weft_ui::Rect area() const { return m_buffer.area(); }
    [[nodiscard]] weft_ui::Buffer& buffer() { return m_buffer; }

    /// Show the cursor at this position after the frame is flushed
    void set_cursor_position(weft_ui::Position pos) { m_cursor = pos; }
    [[nodiscard]] const std::optional<weft_ui::Position>& cursor_position() const { return m_cursor; }

    /// Number of frames rendered before this one
    [[nodiscard]] std::uint64_t count() const noexcept { return m_count; }

private:
    weft_ui::Buffer& m_buffer;
    std::uint64_t m_count;
    std::optional<weft_ui::Position> m_cursor;
};

// =============================================================================
// ITerminal
// =============================================================================

/// Terminal backend interface.
///
/// Raw mode, escape sequences and input decoding live behind this; the
/// kernel only needs to draw frames and manage the screen.
class ITerminal {
public:
    using DrawFn = std::function<weft_core::Result<void>(Frame&)>;
    using InsertFn = std::function<void(weft_ui::Buffer&)>;

    virtual ~ITerminal() = default;

    /// Enter raw mode and apply the init flags
    [[nodiscard]] virtual weft_core::Result<void> init(const TermInit& flags) = 0;

    /// Restore the terminal
    [[nodiscard]] virtual weft_core::Result<void> shutdown() = 0;

    [[nodiscard]] virtual weft_core::Result<weft_ui::Size> size() const = 0;

    /// Clear the screen and force a full redraw on the next render
    [[nodiscard]] virtual weft_core::Result<void> clear() = 0;

    [[nodiscard]] virtual weft_core::Result<void> set_title(const std::string& title) = 0;

    /// Insert `height` lines above an inline viewport, drawn by `draw`
    [[nodiscard]] virtual weft_core::Result<void> insert_before(std::uint16_t height, InsertFn draw) = 0;

    /// Draw one frame. Errors from `draw` are returned unchanged.
    [[nodiscard]] virtual weft_core::Result<void> render(const DrawFn& draw) = 0;
};

// =============================================================================
// BufferTerminal
// =============================================================================

/// In-memory terminal for tests and headless runs.
///
/// Keeps the last rendered buffer, the lines inserted above the viewport and
/// counters for every backend call.
class BufferTerminal : public ITerminal {
public:
    explicit BufferTerminal(weft_ui::Size size = weft_ui::Size{80, 24});

    [[nodiscard]] weft_core::Result<void> init(const TermInit& flags) override;
    [[nodiscard]] weft_core::Result<void> shutdown() override;
    [[nodiscard]] weft_core::Result<weft_ui::Size> size() const override;
    [[nodiscard]] weft_core::Result<void> clear() override;
    [[nodiscard]] weft_core::Result<void> set_title(const std::string& title) override;
    [[nodiscard]] weft_core::Result<void> insert_before(std::uint16_t height, InsertFn draw) override;
    [[nodiscard]] weft_core::Result<void> render(const DrawFn& draw) override;

    /// Change the screen size; the next frame uses it
    void resize(weft_ui::Size size);

    /// Make the next render fail with an I/O error
    void fail_next_render(std::string reason);

    [[nodiscard]] const weft_ui::Buffer& screen() const noexcept { return m_screen; }
    [[nodiscard]] const std::vector<std::string>& inserted_lines() const noexcept { return m_inserted; }
    [[nodiscard]] const std::optional<weft_ui::Position>& cursor() const noexcept { return m_cursor; }
    [[nodiscard]] const std::string& title() const noexcept { return m_title; }
    [[nodiscard]] const TermInit& init_flags() const noexcept { return m_flags; }

    [[nodiscard]] bool is_active() const noexcept { return m_active; }
    [[nodiscard]] std::uint64_t frame_count() const noexcept { return m_frames; }
    [[nodiscard]] std::uint32_t clear_count() const noexcept { return m_clears; }
    [[nodiscard]] std::uint32_t init_count() const noexcept { return m_inits; }
    [[nodiscard]] std::uint32_t shutdown_count() const noexcept { return m_shutdowns; }

private:
    weft_ui::Size m_size;
    weft_ui::Buffer m_screen;
    std::vector<std::string> m_inserted;
    std::optional<weft_ui::Position> m_cursor;
    std::optional<std::string> m_fail_render;
    std::string m_title;
    TermInit m_flags;
    bool m_active = false;
    std::uint64_t m_frames = 0;
    std::uint32_t m_clears = 0;
    std::uint32_t m_inits = 0;
    std::uint32_t m_shutdowns = 0;
};

} // namespace weft_kernel
