/// @file test_app_context.cpp
/// @brief Tests for AppContext facilities

#include <catch2/catch_test_macros.hpp>
#include <weft/kernel/app_context.hpp>

#include <chrono>
#include <memory>
#include <variant>

using namespace weft_kernel;
using namespace weft_event;
using namespace std::chrono_literals;

namespace {

struct Ping {};

using Event = std::variant<InputEvent, TimerEvent, Ping>;
using Ctx = AppContext<Event>;

} // anonymous namespace

TEST_CASE("AppContext: queue", "[kernel][context]") {
    Ctx ctx;

    ctx.queue_event(Ping{});
    ctx.queue(Control<Event>::changed());
    ctx.queue_err(weft_core::Error("oops"));

    auto& q = ctx.control_queue();
    REQUIRE(q.size() == 3);
    REQUIRE(q.take()->value().is_event());
    REQUIRE(q.take()->value().is_changed());
    REQUIRE(q.take()->is_err());
}

TEST_CASE("AppContext: unconfigured facilities panic", "[kernel][context]") {
    Ctx ctx;

    REQUIRE_THROWS_AS(ctx.add_timer(TimerDef::once(1ms)), weft_core::Panic);
    REQUIRE_THROWS_AS(ctx.spawn([]() -> Ctx::ResultType { return Control<Event>::changed(); }),
                      weft_core::Panic);
    REQUIRE_THROWS_AS(ctx.spawn_async([]() -> Ctx::ResultType { return Control<Event>::changed(); }),
                      weft_core::Panic);
    REQUIRE_THROWS_AS(ctx.terminal(), weft_core::Panic);
    REQUIRE_THROWS_AS(ctx.focus(), weft_core::Panic);

    try {
        (void)ctx.add_timer(TimerDef::once(1ms));
    } catch (const weft_core::Panic& p) {
        REQUIRE(std::string(p.what()).find("PollTimers") != std::string::npos);
    }
}

TEST_CASE("AppContext: attached timers", "[kernel][context]") {
    Ctx ctx;
    auto timers = std::make_shared<Timers>();
    ctx.attach_timers(timers);
    REQUIRE(ctx.has_timers());

    auto h = ctx.add_timer(TimerDef::once(1h));
    REQUIRE(timers->contains(h));

    auto h2 = ctx.replace_timer(h, TimerDef::once(2h));
    REQUIRE_FALSE(timers->contains(h));
    REQUIRE(timers->contains(h2));

    ctx.remove_timer(h2);
    REQUIRE(timers->empty());
}

TEST_CASE("AppContext: focus", "[kernel][context]") {
    Ctx ctx;
    FocusFlag a("a"), b("b");
    Focus focus({a, b});
    focus.first();
    ctx.set_focus(std::move(focus));
    REQUIRE(ctx.has_focus());

    SECTION("handle_focus queues consumed outcomes") {
        Event tab = InputEvent(KeyEvent::press(Key::Tab));
        REQUIRE(ctx.handle_focus(tab) == Outcome::Changed);
        REQUIRE(b.is_focused());
        REQUIRE(ctx.control_queue().size() == 1);
        REQUIRE(ctx.control_queue().take()->value().is_changed());
    }

    SECTION("non-input events are ignored") {
        REQUIRE(ctx.handle_focus(Event(Ping{})) == Outcome::Continue);
        REQUIRE(ctx.control_queue().empty());
    }

    SECTION("take and clear") {
        auto taken = ctx.take_focus();
        REQUIRE(taken.has_value());
        REQUIRE_FALSE(ctx.has_focus());
        ctx.set_focus(std::move(*taken));
        ctx.clear_focus();
        REQUIRE_THROWS_AS(ctx.focus_mut(), weft_core::Panic);
    }
}

TEST_CASE("AppContext: terminal access", "[kernel][context]") {
    Ctx ctx;
    auto terminal = std::make_shared<BufferTerminal>(weft_ui::Size{20, 5});
    ctx.attach_terminal(terminal);

    REQUIRE(ctx.terminal().size().value() == weft_ui::Size{20, 5});
    REQUIRE(ctx.count() == 0);
    REQUIRE(ctx.last_render() == std::chrono::microseconds(0));
}
