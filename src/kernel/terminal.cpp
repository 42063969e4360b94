/// @file terminal.cpp
/// @brief BufferTerminal implementation

#include <weft/kernel/terminal.hpp>
#include <weft/core/log.hpp>

namespace weft_kernel {

BufferTerminal::BufferTerminal(weft_ui::Size size)
    : m_size(size)
    , m_screen(weft_ui::Rect{weft_ui::Position{0, 0}, size})
{
}

weft_core::Result<void> BufferTerminal::init(const TermInit& flags) {
    m_flags = flags;
    m_active = true;
    ++m_inits;
    weft_core::kernel_logger()->debug("buffer terminal init ({}x{})", m_size.width, m_size.height);
    return weft_core::Ok();
}

weft_core::Result<void> BufferTerminal::shutdown() {
    if (m_flags.clear_area) {
        m_screen.reset();
    }
    m_active = false;
    ++m_shutdowns;
    return weft_core::Ok();
}

weft_core::Result<weft_ui::Size> BufferTerminal::size() const {
    return m_size;
}

weft_core::Result<void> BufferTerminal::clear() {
    m_screen.reset();
    ++m_clears;
    return weft_core::Ok();
}

weft_core::Result<void> BufferTerminal::set_title(const std::string& title) {
    m_title = title;
    return weft_core::Ok();
}

weft_core::Result<void> BufferTerminal::insert_before(std::uint16_t height, InsertFn draw) {
    weft_ui::Buffer lines(weft_ui::Rect{0, 0, m_size.width, height});
    if (draw) {
        draw(lines);
    }
    for (auto& line : lines.lines()) {
        m_inserted.push_back(std::move(line));
    }
    return weft_core::Ok();
}

weft_core::Result<void> BufferTerminal::render(const DrawFn& draw) {
    if (m_fail_render) {
        auto reason = std::move(*m_fail_render);
        m_fail_render.reset();
        return weft_core::Err(weft_core::Error(weft_core::PollError::io(reason)));
    }

    weft_ui::Rect area{weft_ui::Position{0, 0}, m_size};
    if (m_screen.area() != area) {
        m_screen.resize(area);
    } else {
        m_screen.reset();
    }

    Frame frame(m_screen, m_frames);
    auto r = draw(frame);
    if (r.is_err()) {
        return r;
    }

    m_cursor = frame.cursor_position();
    ++m_frames;
    return weft_core::Ok();
}

void BufferTerminal::resize(weft_ui::Size size) {
    m_size = size;
}

void BufferTerminal::fail_next_render(std::string reason) {
    m_fail_render = std::move(reason);
}

} // namespace weft_kernel
