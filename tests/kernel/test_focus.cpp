/// @file test_focus.cpp
/// @brief Tests for FocusFlag and Focus

#include <catch2/catch_test_macros.hpp>
#include <weft/kernel/focus.hpp>

using namespace weft_kernel;
using namespace weft_event;

TEST_CASE("Focus: next and prev wrap around", "[kernel][focus]") {
    FocusFlag a("a"), b("b"), c("c");
    Focus focus({a, b, c});

    REQUIRE_FALSE(focus.focused().has_value());

    focus.first();
    REQUIRE(a.is_focused());
    REQUIRE(a.gained());

    REQUIRE(focus.next());
    REQUIRE(b.is_focused());
    REQUIRE(b.gained());
    REQUIRE(a.lost());
    REQUIRE_FALSE(a.is_focused());

    focus.next();
    focus.next();
    REQUIRE(a.is_focused());

    REQUIRE(focus.prev());
    REQUIRE(c.is_focused());
    REQUIRE(focus.focused()->name() == "c");
}

TEST_CASE("Focus: empty cycle", "[kernel][focus]") {
    Focus focus;
    REQUIRE_FALSE(focus.next());
    REQUIRE_FALSE(focus.prev());
    REQUIRE(focus.handle(InputEvent(KeyEvent::press(Key::Tab))) == Outcome::Continue);
}

TEST_CASE("Focus: focus a flag", "[kernel][focus]") {
    FocusFlag a("a"), b("b");
    FocusFlag stranger("x");
    Focus focus;
    focus.add(a).add(b);

    REQUIRE(focus.focus(b));
    REQUIRE(b.is_focused());
    REQUIRE_FALSE(focus.focus(stranger));
    REQUIRE(b.is_focused());
}

TEST_CASE("Focus: keyboard and mouse handling", "[kernel][focus]") {
    FocusFlag a("a"), b("b");
    a.set_area(weft_ui::Rect(0, 0, 10, 1));
    b.set_area(weft_ui::Rect(0, 2, 10, 1));
    Focus focus({a, b});
    focus.first();

    SECTION("Tab moves forward") {
        REQUIRE(focus.handle(InputEvent(KeyEvent::press(Key::Tab))) == Outcome::Changed);
        REQUIRE(b.is_focused());
    }

    SECTION("BackTab and Shift-Tab move back") {
        REQUIRE(focus.handle(InputEvent(KeyEvent::press(Key::BackTab))) == Outcome::Changed);
        REQUIRE(b.is_focused());
        REQUIRE(focus.handle(InputEvent(KeyEvent::press(Key::Tab, KeyMod::Shift))) == Outcome::Changed);
        REQUIRE(a.is_focused());
    }

    SECTION("left click focuses by area") {
        REQUIRE(focus.handle(InputEvent(MouseEvent::down(MouseButton::Left, 3, 2))) == Outcome::Changed);
        REQUIRE(b.is_focused());
    }

    SECTION("other events clear gained and lost") {
        REQUIRE(a.gained());
        REQUIRE(focus.handle(InputEvent(KeyEvent::press_char('x'))) == Outcome::Continue);
        REQUIRE_FALSE(a.gained());
        REQUIRE(a.is_focused());
    }
}
