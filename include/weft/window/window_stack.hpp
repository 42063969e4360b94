#pragma once

/// @file window_stack.hpp
/// @brief Z-ordered stack of type-erased windows

#include "fwd.hpp"
#include "window_state.hpp"
#include "window_control.hpp"
#include <weft/core/error.hpp>
#include <weft/core/log.hpp>
#include <weft/event/input.hpp>
#include <weft/ui/types.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace weft_window {

namespace detail {

/// Borrow bookkeeping of one slot
struct SlotBase {
    /// Taken out for its own render or event call
    bool checked_out = false;
    /// >0 shared guards, -1 one exclusive guard
    int borrows = 0;

    virtual ~SlotBase() = default;
};

template<typename Context>
struct Slot final : SlotBase {
    std::unique_ptr<IWindow<Context>> state;
};

} // namespace detail

// =============================================================================
// Borrow guards
// =============================================================================

/// Shared borrow of a window state; released on destruction
template<typename S>
class WindowRef {
public:
    WindowRef(std::shared_ptr<detail::SlotBase> slot, const S* state)
        : m_slot(std::move(slot)), m_state(state) {}

    ~WindowRef() { release(); }

    WindowRef(const WindowRef&) = delete;
    WindowRef& operator=(const WindowRef&) = delete;

    WindowRef(WindowRef&& other) noexcept
        : m_slot(std::move(other.m_slot)), m_state(std::exchange(other.m_state, nullptr)) {}

    WindowRef& operator=(WindowRef&& other) noexcept {
        if (this != &other) {
            release();
            m_slot = std::move(other.m_slot);
            m_state = std::exchange(other.m_state, nullptr);
        }
        return *this;
    }

    [[nodiscard]] const S& operator*() const { return *m_state; }
    [[nodiscard]] const S* operator->() const { return m_state; }
    [[nodiscard]] const S* get() const { return m_state; }

private:
    void release() {
        if (m_slot && m_slot->borrows > 0) {
            --m_slot->borrows;
        }
        m_slot.reset();
    }

    std::shared_ptr<detail::SlotBase> m_slot;
    const S* m_state;
};

/// Exclusive borrow of a window state; released on destruction
template<typename S>
class WindowMut {
public:
    WindowMut(std::shared_ptr<detail::SlotBase> slot, S* state)
        : m_slot(std::move(slot)), m_state(state) {}

    ~WindowMut() { release(); }

    WindowMut(const WindowMut&) = delete;
    WindowMut& operator=(const WindowMut&) = delete;

    WindowMut(WindowMut&& other) noexcept
        : m_slot(std::move(other.m_slot)), m_state(std::exchange(other.m_state, nullptr)) {}

    WindowMut& operator=(WindowMut&& other) noexcept {
        if (this != &other) {
            release();
            m_slot = std::move(other.m_slot);
            m_state = std::exchange(other.m_state, nullptr);
        }
        return *this;
    }

    [[nodiscard]] S& operator*() const { return *m_state; }
    [[nodiscard]] S* operator->() const { return m_state; }
    [[nodiscard]] S* get() const { return m_state; }

private:
    void release() {
        if (m_slot && m_slot->borrows < 0) {
            m_slot->borrows = 0;
        }
        m_slot.reset();
    }

    std::shared_ptr<detail::SlotBase> m_slot;
    S* m_state;
};

// =============================================================================
// WindowStack
// =============================================================================

/// Stack of modal and overlay windows.
///
/// Each entry is a type tag, an owned state, a render closure and an event
/// closure, kept in four parallel vectors; the vector position is the z-order
/// with the last entry on top. Copies of a WindowStack share the same
/// entries, so a handler can show further windows through its own copy.
///
/// A state is checked out while its own render or event closure runs.
/// Closing or reordering while anything is checked out throws
/// weft_core::Panic("state is gone"); so does checking out a state that has
/// a live borrow guard.
template<typename Event, typename Context>
class WindowStack {
public:
    using Control = WindowControl<Event>;
    using ResultType = weft_core::Result<Control>;

    template<typename S>
    using RenderFor = std::function<weft_core::Result<void>(weft_ui::Rect, weft_ui::Buffer&, S&, Context&)>;

    template<typename S>
    using EventFor = std::function<ResultType(const Event&, S&, Context&)>;

    WindowStack() : m_core(std::make_shared<Core>()) {}

    // =========================================================================
    // Show / close / reorder
    // =========================================================================

    /// Put a new window on top
    template<typename S>
    void show(std::type_identity_t<RenderFor<S>> render,
              std::type_identity_t<EventFor<S>> event,
              std::unique_ptr<S> state,
              Context& ctx) {
        static_assert(std::is_base_of_v<IWindow<Context>, S>,
                      "window state must derive from IWindow<Context>");
        if (!state) {
            throw weft_core::Panic("WindowStack::show without a state");
        }

        Core& core = *m_core;
        auto slot = std::make_shared<detail::Slot<Context>>();
        slot->state = std::move(state);

        core.types.emplace_back(typeid(S));
        core.slots.push_back(std::move(slot));
        core.renders.push_back(
            [render = std::move(render)](weft_ui::Rect area, weft_ui::Buffer& buf,
                                         IWindow<Context>& w, Context& c) {
                return render(area, buf, static_cast<S&>(w), c);
            });
        core.events.push_back(
            [event = std::move(event)](const Event& e, IWindow<Context>& w, Context& c) {
                return event(e, static_cast<S&>(w), c);
            });

        weft_core::window_logger()->trace("show window {} ({})", core.slots.size() - 1, typeid(S).name());
        set_top(ctx);
    }

    /// Remove window n
    /// @throws weft_core::Panic if any window is checked out or n is borrowed
    void close(std::size_t n, Context& ctx) {
        ensure_none_checked_out();
        check_index(n);
        Core& core = *m_core;
        if (core.slots[n]->borrows != 0) {
            throw weft_core::Panic(weft_core::WindowError::borrowed(n).message);
        }

        core.types.erase(core.types.begin() + static_cast<std::ptrdiff_t>(n));
        core.slots.erase(core.slots.begin() + static_cast<std::ptrdiff_t>(n));
        core.renders.erase(core.renders.begin() + static_cast<std::ptrdiff_t>(n));
        core.events.erase(core.events.begin() + static_cast<std::ptrdiff_t>(n));

        weft_core::window_logger()->trace("close window {}", n);
        set_top(ctx);
    }

    /// Move window n to the top
    void to_front(std::size_t n, Context& ctx) {
        ensure_none_checked_out();
        check_index(n);
        move_entry(n, len() - 1);
        set_top(ctx);
    }

    /// Move window n to the bottom
    void to_back(std::size_t n, Context& ctx) {
        ensure_none_checked_out();
        check_index(n);
        move_entry(n, 0);
        set_top(ctx);
    }

    // =========================================================================
    // Render / handle
    // =========================================================================

    /// Render all windows, bottom first
    weft_core::Result<void> render(weft_ui::Rect area, weft_ui::Buffer& buf, Context& ctx) {
        for (std::size_t i = 0; i < len(); ++i) {
            auto slot = m_core->slots[i];
            auto fn = m_core->renders[i];
            CheckOut guard(*slot, i);
            auto r = fn(area, buf, *slot->state, ctx);
            if (!r) {
                return r;
            }
        }
        return weft_core::Ok();
    }

    /// Offer an event to the windows, top first.
    ///
    /// A left click inside a window brings it to front. Mouse events inside
    /// a window that ignores them are still consumed.
    ResultType handle(const Event& event, Context& ctx) {
        const weft_event::InputEvent* input = weft_event::as_input(event);

        for (std::size_t i = len(); i-- > 0;) {
            if (i >= len()) {
                continue;
            }
            auto slot = m_core->slots[i];
            auto fn = m_core->events[i];
            const weft_ui::Rect area = slot->state->area();
            const bool promote = input && weft_event::is_left_down_in(*input, area);

            ResultType r = Control::continue_();
            {
                CheckOut guard(*slot, i);
                r = fn(event, *slot->state, ctx);
            }

            // promotion happens whatever the handler answered, errors included
            Control promoted = Control::continue_();
            std::size_t idx = i;
            if (promote) {
                idx = position_of(*slot);
                to_front(idx, ctx);
                idx = len() - 1;
                promoted = Control::changed();
            }

            if (!r) {
                return r;
            }
            Control res = std::move(r).value();

            switch (res.flow()) {
                case WindowFlow::Close:
                    close(idx, ctx);
                    return merge(std::move(promoted), std::move(res));
                case WindowFlow::Event:
                case WindowFlow::Changed:
                case WindowFlow::Unchanged:
                    return merge(std::move(promoted), std::move(res));
                case WindowFlow::Continue:
                    if (input && weft_event::mouse_trap(*input, area) == weft_event::Outcome::Unchanged) {
                        return merge(std::move(promoted), Control::unchanged());
                    }
                    if (promoted.is_consumed()) {
                        return promoted;
                    }
                    break;
            }
        }
        return Control::continue_();
    }

    // =========================================================================
    // State access
    // =========================================================================

    /// Shared borrow of window n as S
    /// @throws weft_core::Panic on a bad index, wrong type or conflicting borrow
    template<typename S>
    [[nodiscard]] WindowRef<S> get(std::size_t n) const {
        auto r = try_get<S>(n);
        if (!r) {
            throw weft_core::Panic(r.error().message());
        }
        return std::move(r).value();
    }

    /// Exclusive borrow of window n as S
    /// @throws weft_core::Panic on a bad index, wrong type or conflicting borrow
    template<typename S>
    [[nodiscard]] WindowMut<S> get_mut(std::size_t n) const {
        auto r = try_get_mut<S>(n);
        if (!r) {
            throw weft_core::Panic(r.error().message());
        }
        return std::move(r).value();
    }

    template<typename S>
    [[nodiscard]] weft_core::Result<WindowRef<S>> try_get(std::size_t n) const {
        auto slot = checked_slot<S>(n);
        if (!slot) {
            return weft_core::Err<WindowRef<S>>(std::move(slot).error());
        }
        auto& s = slot.value();
        if (s->borrows < 0) {
            return weft_core::Err<WindowRef<S>>(weft_core::WindowError::borrowed(n));
        }
        ++s->borrows;
        const S* state = static_cast<const S*>(s->state.get());
        return WindowRef<S>(std::static_pointer_cast<detail::SlotBase>(s), state);
    }

    template<typename S>
    [[nodiscard]] weft_core::Result<WindowMut<S>> try_get_mut(std::size_t n) const {
        auto slot = checked_slot<S>(n);
        if (!slot) {
            return weft_core::Err<WindowMut<S>>(std::move(slot).error());
        }
        auto& s = slot.value();
        if (s->borrows != 0) {
            return weft_core::Err<WindowMut<S>>(weft_core::WindowError::borrowed(n));
        }
        s->borrows = -1;
        S* state = static_cast<S*>(s->state.get());
        return WindowMut<S>(std::static_pointer_cast<detail::SlotBase>(s), state);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Is window n of type S
    template<typename S>
    [[nodiscard]] bool state_is(std::size_t n) const {
        return n < len() && m_core->types[n] == std::type_index(typeid(S));
    }

    /// Topmost window of type S
    template<typename S>
    [[nodiscard]] std::optional<std::size_t> top() const {
        for (std::size_t i = len(); i-- > 0;) {
            if (state_is<S>(i)) {
                return i;
            }
        }
        return std::nullopt;
    }

    /// All windows of type S, topmost first
    template<typename S>
    [[nodiscard]] std::vector<std::size_t> find() const {
        std::vector<std::size_t> found;
        for (std::size_t i = len(); i-- > 0;) {
            if (state_is<S>(i)) {
                found.push_back(i);
            }
        }
        return found;
    }

    [[nodiscard]] std::size_t len() const noexcept { return m_core->slots.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_core->slots.empty(); }

private:
    using ErasedRender = std::function<weft_core::Result<void>(
        weft_ui::Rect, weft_ui::Buffer&, IWindow<Context>&, Context&)>;
    using ErasedEvent = std::function<ResultType(const Event&, IWindow<Context>&, Context&)>;
    using SlotPtr = std::shared_ptr<detail::Slot<Context>>;

    struct Core {
        std::vector<std::type_index> types;
        std::vector<SlotPtr> slots;
        std::vector<ErasedRender> renders;
        std::vector<ErasedEvent> events;
    };

    /// Marks a slot checked out for the lifetime of the guard
    class CheckOut {
    public:
        CheckOut(detail::SlotBase& slot, std::size_t n) : m_slot(slot) {
            if (slot.checked_out) {
                throw weft_core::Panic(weft_core::WindowError::state_gone(n).message);
            }
            if (slot.borrows != 0) {
                throw weft_core::Panic(weft_core::WindowError::borrowed(n).message);
            }
            slot.checked_out = true;
        }

        ~CheckOut() { m_slot.checked_out = false; }

        CheckOut(const CheckOut&) = delete;
        CheckOut& operator=(const CheckOut&) = delete;

    private:
        detail::SlotBase& m_slot;
    };

    template<typename S>
    weft_core::Result<SlotPtr> checked_slot(std::size_t n) const {
        if (n >= len()) {
            return weft_core::Err<SlotPtr>(weft_core::WindowError::out_of_bounds(n, len()));
        }
        if (m_core->types[n] != std::type_index(typeid(S))) {
            return weft_core::Err<SlotPtr>(weft_core::WindowError::type_mismatch(n, typeid(S).name()));
        }
        const SlotPtr& slot = m_core->slots[n];
        if (slot->checked_out) {
            return weft_core::Err<SlotPtr>(weft_core::WindowError::state_gone(n));
        }
        return slot;
    }

    void check_index(std::size_t n) const {
        if (n >= len()) {
            throw weft_core::Panic(weft_core::WindowError::out_of_bounds(n, len()).message);
        }
    }

    void ensure_none_checked_out() const {
        for (std::size_t i = 0; i < len(); ++i) {
            if (m_core->slots[i]->checked_out) {
                throw weft_core::Panic(weft_core::WindowError::state_gone(i).message);
            }
        }
    }

    std::size_t position_of(const detail::SlotBase& slot) const {
        for (std::size_t i = 0; i < len(); ++i) {
            if (m_core->slots[i].get() == &slot) {
                return i;
            }
        }
        throw weft_core::Panic("state is gone");
    }

    void move_entry(std::size_t from, std::size_t to) {
        if (from == to) {
            return;
        }
        Core& core = *m_core;
        move_in(core.types, from, to);
        move_in(core.slots, from, to);
        move_in(core.renders, from, to);
        move_in(core.events, from, to);
    }

    template<typename T>
    static void move_in(std::vector<T>& v, std::size_t from, std::size_t to) {
        T item = std::move(v[from]);
        v.erase(v.begin() + static_cast<std::ptrdiff_t>(from));
        v.insert(v.begin() + static_cast<std::ptrdiff_t>(to), std::move(item));
    }

    /// Exactly the last window is top
    void set_top(Context& ctx) {
        const std::size_t n = len();
        for (std::size_t i = 0; i < n; ++i) {
            auto slot = m_core->slots[i];
            slot->state->set_top(i + 1 == n, ctx);
        }
    }

    std::shared_ptr<Core> m_core;
};

} // namespace weft_window
