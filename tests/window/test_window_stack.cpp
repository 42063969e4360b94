/// @file test_window_stack.cpp
/// @brief Tests for WindowStack ordering, routing and borrow checks

#include <catch2/catch_test_macros.hpp>
#include <weft/window/window.hpp>

#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace weft_window;
using namespace weft_event;
using weft_ui::Rect;

namespace {

struct Note {
    std::string text;
};

using Event = std::variant<InputEvent, Note>;

struct Desk;
using Stack = WindowStack<Event, Desk>;
using WCtl = WindowControl<Event>;

struct Desk {
    Stack* windows = nullptr;
    std::vector<std::string> log;
};

enum class Reply {
    Ignore,
    Consume,
    Emit,
    Close,
    ReadSelf,
    CloseSelf,
    ShowAnother,
    Fail,
};

struct Dialog final : IWindow<Desk> {
    std::string name;
    Rect rect;
    Reply reply = Reply::Ignore;
    bool top = false;
    int events = 0;

    Dialog(std::string n, Rect r, Reply rep = Reply::Ignore) : name(std::move(n)), rect(r), reply(rep) {}

    void set_top(bool t, Desk&) override { top = t; }
    [[nodiscard]] Rect area() const override { return rect; }
};

struct Tooltip final : IWindow<Desk> {
    void set_top(bool, Desk&) override {}
    [[nodiscard]] Rect area() const override { return Rect{}; }
};

weft_core::Result<void> render_dialog(Rect, weft_ui::Buffer& buf, Dialog& d, Desk& desk) {
    desk.log.push_back("render " + d.name);
    buf.set_string(d.rect.x, d.rect.y, d.name);
    return weft_core::Ok();
}

weft_core::Result<WCtl> dialog_event(const Event&, Dialog& d, Desk& desk) {
    ++d.events;
    desk.log.push_back("event " + d.name);
    switch (d.reply) {
        case Reply::Ignore:
            return WCtl::continue_();
        case Reply::Consume:
            return WCtl::changed();
        case Reply::Emit:
            return WCtl::event(Note{d.name});
        case Reply::Close:
            return WCtl::close(Note{"closed " + d.name});
        case Reply::ReadSelf: {
            auto self = desk.windows->top<Dialog>();
            auto guard = desk.windows->get<Dialog>(*self);
            return WCtl::unchanged();
        }
        case Reply::CloseSelf:
            desk.windows->close(desk.windows->len() - 1, desk);
            return WCtl::unchanged();
        case Reply::ShowAnother: {
            Stack copy = *desk.windows;
            copy.show<Dialog>(render_dialog, dialog_event,
                              std::make_unique<Dialog>("popup", Rect{0, 0, 1, 1}), desk);
            return WCtl::changed();
        }
        case Reply::Fail:
            return weft_core::Error("boom");
    }
    return WCtl::continue_();
}

void show(Stack& stack, Desk& desk, std::string name, Rect rect, Reply reply = Reply::Ignore) {
    stack.show<Dialog>(render_dialog, dialog_event, std::make_unique<Dialog>(std::move(name), rect, reply), desk);
}

std::vector<std::string> names(const Stack& stack) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < stack.len(); ++i) {
        out.push_back(stack.get<Dialog>(i)->name);
    }
    return out;
}

std::size_t top_count(const Stack& stack) {
    std::size_t n = 0;
    for (std::size_t i = 0; i < stack.len(); ++i) {
        if (stack.get<Dialog>(i)->top) {
            ++n;
        }
    }
    return n;
}

Event click(std::uint16_t col, std::uint16_t row) {
    return InputEvent{MouseEvent::down(MouseButton::Left, col, row)};
}

Event key(char32_t c) {
    return InputEvent{KeyEvent::press_char(c)};
}

} // anonymous namespace

// =============================================================================
// WindowControl
// =============================================================================

TEST_CASE("WindowControl: lattice order", "[window][control]") {
    REQUIRE(WCtl::continue_() < WCtl::unchanged());
    REQUIRE(WCtl::unchanged() < WCtl::changed());
    REQUIRE(WCtl::changed() < WCtl::event(Note{"a"}));
    REQUIRE(WCtl::event(Note{"a"}) < WCtl::close(Note{"b"}));
    REQUIRE(WCtl::event(Note{"a"}) == WCtl::event(Note{"b"}));

    WCtl from_outcome = Outcome::Changed;
    REQUIRE(from_outcome.flow() == WindowFlow::Changed);
    REQUIRE(std::string(window_flow_name(WindowFlow::Close)) == "Close");
}

TEST_CASE("WindowControl: merge and payload", "[window][control]") {
    SECTION("greater wins") {
        auto m = merge(WCtl::close(Note{"x"}), WCtl::changed());
        REQUIRE(m.is_close());
        REQUIRE(std::get<Note>(m.payload()).text == "x");
    }

    SECTION("tie keeps the second") {
        auto m = merge(WCtl::event(Note{"first"}), WCtl::event(Note{"second"}));
        REQUIRE(std::get<Note>(m.payload()).text == "second");
    }

    SECTION("no payload") {
        REQUIRE_THROWS_AS(WCtl::changed().payload(), weft_core::Panic);
    }

    SECTION("close widens to an event") {
        auto ctl = WCtl::close(Note{"bye"}).into_control();
        REQUIRE(ctl.is_event());
        REQUIRE(std::get<Note>(ctl.payload()).text == "bye");

        REQUIRE(WCtl::continue_().into_control().is_continue());
        REQUIRE(WCtl::changed().into_control() == Control<Event>::changed());
    }
}

// =============================================================================
// Ordering
// =============================================================================

TEST_CASE("WindowStack: exactly one window is top", "[window][stack]") {
    Stack stack;
    Desk desk;
    desk.windows = &stack;

    REQUIRE(stack.empty());
    show(stack, desk, "a", Rect{0, 0, 5, 5});
    show(stack, desk, "b", Rect{5, 0, 5, 5});
    show(stack, desk, "c", Rect{10, 0, 5, 5});

    REQUIRE(names(stack) == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(top_count(stack) == 1);
    REQUIRE(stack.get<Dialog>(2)->top);

    SECTION("to_front") {
        stack.to_front(0, desk);
        REQUIRE(names(stack) == std::vector<std::string>{"b", "c", "a"});
        REQUIRE(stack.get<Dialog>(2)->top);
        REQUIRE(top_count(stack) == 1);
    }

    SECTION("to_back") {
        stack.to_back(2, desk);
        REQUIRE(names(stack) == std::vector<std::string>{"c", "a", "b"});
        REQUIRE(stack.get<Dialog>(2)->name == "b");
        REQUIRE(top_count(stack) == 1);
    }

    SECTION("close") {
        stack.close(2, desk);
        REQUIRE(names(stack) == std::vector<std::string>{"a", "b"});
        REQUIRE(stack.get<Dialog>(1)->top);
        REQUIRE(top_count(stack) == 1);

        stack.close(0, desk);
        stack.close(0, desk);
        REQUIRE(stack.empty());
    }

    SECTION("bad index") {
        REQUIRE_THROWS_AS(stack.close(3, desk), weft_core::Panic);
        REQUIRE_THROWS_AS(stack.to_front(7, desk), weft_core::Panic);
    }
}

TEST_CASE("WindowStack: render bottom first", "[window][stack]") {
    Stack stack;
    Desk desk;
    show(stack, desk, "low", Rect{0, 0, 8, 2});
    show(stack, desk, "up", Rect{0, 0, 8, 2});

    weft_ui::Buffer buf(Rect{0, 0, 8, 2});
    REQUIRE(stack.render(buf.area(), buf, desk).is_ok());

    REQUIRE(desk.log == std::vector<std::string>{"render low", "render up"});
    REQUIRE(buf.line(0).rfind("upw", 0) == 0);
}

// =============================================================================
// Event routing
// =============================================================================

TEST_CASE("WindowStack: keys go top first", "[window][stack]") {
    Stack stack;
    Desk desk;
    desk.windows = &stack;
    show(stack, desk, "a", Rect{0, 0, 5, 5}, Reply::Consume);
    show(stack, desk, "b", Rect{10, 0, 5, 5});

    SECTION("lower window consumes") {
        auto r = stack.handle(key('x'), desk);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().flow() == WindowFlow::Changed);
        REQUIRE(desk.log == std::vector<std::string>{"event b", "event a"});
    }

    SECTION("top window consumes") {
        stack.get_mut<Dialog>(1)->reply = Reply::Emit;
        auto r = stack.handle(key('x'), desk);
        REQUIRE(r.value().flow() == WindowFlow::Event);
        REQUIRE(std::get<Note>(r.value().payload()).text == "b");
        REQUIRE(desk.log == std::vector<std::string>{"event b"});
    }

    SECTION("nobody consumes") {
        stack.get_mut<Dialog>(0)->reply = Reply::Ignore;
        auto r = stack.handle(key('x'), desk);
        REQUIRE(r.value().is_continue());
    }
}

TEST_CASE("WindowStack: click brings a window to front", "[window][stack]") {
    Stack stack;
    Desk desk;
    desk.windows = &stack;
    show(stack, desk, "a", Rect{0, 0, 10, 5});
    show(stack, desk, "b", Rect{20, 0, 10, 5});

    auto r = stack.handle(click(2, 2), desk);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() >= WCtl::changed());
    REQUIRE(names(stack) == std::vector<std::string>{"b", "a"});
    REQUIRE(stack.get<Dialog>(1)->top);
    REQUIRE_FALSE(stack.get<Dialog>(0)->top);

    SECTION("click on the top window does not reorder") {
        auto again = stack.handle(click(3, 3), desk);
        REQUIRE(again.value() >= WCtl::changed());
        REQUIRE(names(stack) == std::vector<std::string>{"b", "a"});
    }
}

TEST_CASE("WindowStack: click promotes even when the handler fails", "[window][stack]") {
    Stack stack;
    Desk desk;
    show(stack, desk, "a", Rect{0, 0, 10, 5}, Reply::Fail);
    show(stack, desk, "b", Rect{20, 0, 10, 5});

    auto r = stack.handle(click(1, 1), desk);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message() == "boom");
    REQUIRE(names(stack) == std::vector<std::string>{"b", "a"});
    REQUIRE(stack.get<Dialog>(1)->top);
    REQUIRE(top_count(stack) == 1);
}

TEST_CASE("WindowStack: mouse inside a window is consumed", "[window][stack]") {
    Stack stack;
    Desk desk;
    show(stack, desk, "a", Rect{0, 0, 10, 5});

    Event inside = InputEvent{MouseEvent::moved(4, 4)};
    Event outside = InputEvent{MouseEvent::moved(40, 4)};

    REQUIRE(stack.handle(inside, desk).value().flow() == WindowFlow::Unchanged);
    REQUIRE(stack.handle(outside, desk).value().flow() == WindowFlow::Continue);

    SECTION("mouse down that is not a left click") {
        Event right = InputEvent{MouseEvent::down(MouseButton::Right, 4, 4)};
        auto r = stack.handle(right, desk);
        REQUIRE(r.value().flow() == WindowFlow::Unchanged);
        REQUIRE(stack.get<Dialog>(0)->events == 3);
    }

    SECTION("non-input events pass through") {
        REQUIRE(stack.handle(Event{Note{"hi"}}, desk).value().is_continue());
    }
}

TEST_CASE("WindowStack: close outcome removes the window", "[window][stack]") {
    Stack stack;
    Desk desk;
    show(stack, desk, "a", Rect{0, 0, 10, 5});
    show(stack, desk, "b", Rect{20, 0, 10, 5}, Reply::Close);

    auto r = stack.handle(key('q'), desk);
    REQUIRE(r.value().is_close());
    REQUIRE(std::get<Note>(r.value().payload()).text == "closed b");
    REQUIRE(names(stack) == std::vector<std::string>{"a"});
    REQUIRE(stack.get<Dialog>(0)->top);
}

TEST_CASE("WindowStack: closing a promoted window", "[window][stack]") {
    Stack stack;
    Desk desk;
    show(stack, desk, "a", Rect{0, 0, 10, 5}, Reply::Close);
    show(stack, desk, "b", Rect{20, 0, 10, 5});

    auto r = stack.handle(click(1, 1), desk);
    REQUIRE(r.value().is_close());
    REQUIRE(names(stack) == std::vector<std::string>{"b"});
}

// =============================================================================
// State access
// =============================================================================

TEST_CASE("WindowStack: typed access", "[window][stack]") {
    Stack stack;
    Desk desk;
    show(stack, desk, "a", Rect{0, 0, 10, 5});
    stack.show<Tooltip>(
        [](Rect, weft_ui::Buffer&, Tooltip&, Desk&) -> weft_core::Result<void> { return weft_core::Ok(); },
        [](const Event&, Tooltip&, Desk&) -> weft_core::Result<WCtl> { return WCtl::continue_(); },
        std::make_unique<Tooltip>(), desk);
    show(stack, desk, "c", Rect{0, 0, 10, 5});

    REQUIRE(stack.state_is<Tooltip>(1));
    REQUIRE_FALSE(stack.state_is<Dialog>(1));
    REQUIRE_FALSE(stack.state_is<Dialog>(9));
    REQUIRE(stack.top<Dialog>() == std::optional<std::size_t>{2});
    REQUIRE(stack.top<Tooltip>() == std::optional<std::size_t>{1});
    REQUIRE(stack.find<Dialog>() == std::vector<std::size_t>{2, 0});

    SECTION("wrong type") {
        auto r = stack.try_get<Dialog>(1);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == weft_core::ErrorCode::TypeMismatch);
        REQUIRE_THROWS_AS(stack.get<Tooltip>(0), weft_core::Panic);
    }

    SECTION("out of bounds") {
        auto r = stack.try_get_mut<Dialog>(3);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == weft_core::ErrorCode::OutOfBounds);
    }

    SECTION("mutation is visible") {
        stack.get_mut<Dialog>(0)->name = "renamed";
        REQUIRE(stack.get<Dialog>(0)->name == "renamed");
    }
}

TEST_CASE("WindowStack: borrows", "[window][stack]") {
    Stack stack;
    Desk desk;
    show(stack, desk, "a", Rect{0, 0, 10, 5});
    show(stack, desk, "b", Rect{0, 0, 10, 5});

    SECTION("live guard blocks closing its window only") {
        auto guard = stack.get<Dialog>(0);
        REQUIRE_THROWS_AS(stack.close(0, desk), weft_core::Panic);

        stack.close(1, desk);
        REQUIRE(stack.len() == 1);
        REQUIRE(guard->name == "a");
    }

    SECTION("shared guards exclude a mutable one") {
        auto g1 = stack.get<Dialog>(1);
        auto g2 = stack.get<Dialog>(1);
        auto m = stack.try_get_mut<Dialog>(1);
        REQUIRE(m.is_err());
        REQUIRE(m.error().code() == weft_core::ErrorCode::Reentrancy);
    }

    SECTION("released guards free the window") {
        {
            auto m = stack.get_mut<Dialog>(1);
            REQUIRE(stack.try_get<Dialog>(1).is_err());
        }
        REQUIRE(stack.try_get<Dialog>(1).is_ok());
        stack.close(1, desk);
        REQUIRE(stack.len() == 1);
    }

    SECTION("guarded window cannot be entered") {
        auto guard = stack.get<Dialog>(1);
        REQUIRE_THROWS_AS(stack.handle(key('x'), desk), weft_core::Panic);
    }
}

TEST_CASE("WindowStack: handlers cannot reach their own state", "[window][stack]") {
    Stack stack;
    Desk desk;
    desk.windows = &stack;

    SECTION("reading itself") {
        show(stack, desk, "a", Rect{0, 0, 10, 5}, Reply::ReadSelf);
        REQUIRE_THROWS_AS(stack.handle(key('x'), desk), weft_core::Panic);
        REQUIRE(stack.try_get<Dialog>(0).is_ok());
    }

    SECTION("closing while checked out") {
        show(stack, desk, "a", Rect{0, 0, 10, 5}, Reply::CloseSelf);
        REQUIRE_THROWS_AS(stack.handle(key('x'), desk), weft_core::Panic);
        REQUIRE(stack.len() == 1);
    }

    SECTION("showing from a handler is allowed") {
        show(stack, desk, "a", Rect{0, 0, 10, 5}, Reply::ShowAnother);
        auto r = stack.handle(key('x'), desk);
        REQUIRE(r.value().flow() == WindowFlow::Changed);
        REQUIRE(names(stack) == std::vector<std::string>{"a", "popup"});
        REQUIRE(stack.get<Dialog>(1)->top);
    }
}
