/// @file buffer.cpp
/// @brief Buffer implementation for weft_ui

#include <weft/ui/types.hpp>

#include <algorithm>

namespace weft_ui {

Buffer::Buffer(Rect area)
    : m_area(area)
    , m_cells(area.area())
{
}

Buffer Buffer::filled(Rect area, std::string_view symbol) {
    Buffer buf(area);
    buf.fill(area, symbol);
    return buf;
}

void Buffer::resize(Rect area) {
    m_area = area;
    m_cells.assign(area.area(), Cell{});
}

void Buffer::reset() {
    std::fill(m_cells.begin(), m_cells.end(), Cell{});
}

std::size_t Buffer::index_of(Position pos) const {
    return static_cast<std::size_t>(pos.y - m_area.y) * m_area.width + (pos.x - m_area.x);
}

Cell* Buffer::cell(Position pos) {
    if (!m_area.contains(pos)) {
        return nullptr;
    }
    return &m_cells[index_of(pos)];
}

const Cell* Buffer::cell(Position pos) const {
    if (!m_area.contains(pos)) {
        return nullptr;
    }
    return &m_cells[index_of(pos)];
}

namespace {

/// Byte length of the UTF-8 sequence starting with `lead`; stray bytes count as one
std::size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

} // anonymous namespace

std::size_t Buffer::set_string(std::uint16_t x, std::uint16_t y, std::string_view text) {
    std::size_t written = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto column = static_cast<std::uint32_t>(x) + written;
        if (column >= m_area.right()) {
            break;
        }
        Cell* c = cell(Position{static_cast<std::uint16_t>(column), y});
        if (!c) {
            break;
        }
        std::size_t len = std::min(utf8_length(static_cast<unsigned char>(text[pos])), text.size() - pos);
        c->symbol.assign(text.substr(pos, len));
        pos += len;
        ++written;
    }
    return written;
}

void Buffer::fill(Rect area, std::string_view symbol) {
    Rect clipped = m_area.intersection(area);
    for (std::uint32_t row = clipped.top(); row < clipped.bottom(); ++row) {
        for (std::uint32_t col = clipped.left(); col < clipped.right(); ++col) {
            cell(Position{static_cast<std::uint16_t>(col), static_cast<std::uint16_t>(row)})
                ->symbol.assign(symbol);
        }
    }
}

std::string Buffer::line(std::uint16_t row) const {
    std::string out;
    if (row < m_area.top() || row >= m_area.bottom()) {
        return out;
    }
    for (std::uint32_t col = m_area.left(); col < m_area.right(); ++col) {
        out += cell(Position{static_cast<std::uint16_t>(col), row})->symbol;
    }
    return out;
}

std::vector<std::string> Buffer::lines() const {
    std::vector<std::string> out;
    out.reserve(m_area.height);
    for (std::uint32_t row = m_area.top(); row < m_area.bottom(); ++row) {
        out.push_back(line(static_cast<std::uint16_t>(row)));
    }
    return out;
}

} // namespace weft_ui
