/// @file focus.cpp
/// @brief Focus implementation

#include <weft/kernel/focus.hpp>
#include <weft/core/log.hpp>

namespace weft_kernel {

FocusFlag::FocusFlag(std::string name)
    : m_state(std::make_shared<State>())
{
    m_state->name = std::move(name);
}

Focus::Focus(std::vector<FocusFlag> flags)
    : m_flags(std::move(flags))
{
}

Focus& Focus::add(FocusFlag flag) {
    m_flags.push_back(std::move(flag));
    return *this;
}

std::optional<std::size_t> Focus::focused_index() const {
    for (std::size_t i = 0; i < m_flags.size(); ++i) {
        if (m_flags[i].is_focused()) {
            return i;
        }
    }
    return std::nullopt;
}

void Focus::change_to(std::size_t index) {
    reset_lost_gained();
    for (std::size_t i = 0; i < m_flags.size(); ++i) {
        auto& state = *m_flags[i].m_state;
        if (i == index) {
            state.gained = !state.focused;
            state.focused = true;
        } else if (state.focused) {
            state.focused = false;
            state.lost = true;
        }
    }
    weft_core::kernel_logger()->trace("focus -> {}", m_flags[index].name());
}

void Focus::first() {
    if (!m_flags.empty()) {
        change_to(0);
    }
}

bool Focus::next() {
    if (m_flags.empty()) {
        return false;
    }
    auto current = focused_index();
    change_to(current ? (*current + 1) % m_flags.size() : 0);
    return true;
}

bool Focus::prev() {
    if (m_flags.empty()) {
        return false;
    }
    auto current = focused_index();
    if (!current) {
        change_to(0);
    } else {
        change_to(*current == 0 ? m_flags.size() - 1 : *current - 1);
    }
    return true;
}

bool Focus::focus(const FocusFlag& flag) {
    for (std::size_t i = 0; i < m_flags.size(); ++i) {
        if (m_flags[i] == flag) {
            change_to(i);
            return true;
        }
    }
    return false;
}

bool Focus::focus_at(std::uint16_t column, std::uint16_t row) {
    for (std::size_t i = 0; i < m_flags.size(); ++i) {
        if (m_flags[i].area().contains(column, row)) {
            change_to(i);
            return true;
        }
    }
    return false;
}

std::optional<FocusFlag> Focus::focused() const {
    if (auto i = focused_index()) {
        return m_flags[*i];
    }
    return std::nullopt;
}

void Focus::reset_lost_gained() {
    for (auto& flag : m_flags) {
        flag.m_state->gained = false;
        flag.m_state->lost = false;
    }
}

weft_event::Outcome Focus::handle(const weft_event::InputEvent& event) {
    using weft_event::Key;
    using weft_event::KeyMod;
    using weft_event::Outcome;

    if (const auto* key = weft_event::as_key(event)) {
        if (key->is_key(Key::Tab)) {
            return next() ? Outcome::Changed : Outcome::Continue;
        }
        if (key->is_key(Key::BackTab) || key->is_key(Key::BackTab, KeyMod::Shift)
            || key->is_key(Key::Tab, KeyMod::Shift)) {
            return prev() ? Outcome::Changed : Outcome::Continue;
        }
    }

    if (const auto* mouse = weft_event::as_mouse(event)) {
        if (mouse->kind == weft_event::MouseKind::Down && mouse->button == weft_event::MouseButton::Left) {
            if (focus_at(mouse->column, mouse->row)) {
                return Outcome::Changed;
            }
        }
    }

    reset_lost_gained();
    return Outcome::Continue;
}

} // namespace weft_kernel
