/// @file test_timer.cpp
/// @brief Tests for the timer registry and PollTimers

#include <catch2/catch_test_macros.hpp>
#include <weft/kernel/poll_sources.hpp>
#include <weft/kernel/timer.hpp>

#include <chrono>
#include <memory>
#include <variant>
#include <vector>

using namespace weft_kernel;
using namespace std::chrono_literals;

namespace {

/// Manually advanced clock shared with a Timers registry
struct FakeClock {
    TimerClock::time_point now{};

    Timers::NowFn fn() {
        return [this]() { return now; };
    }
};

} // anonymous namespace

TEST_CASE("Timers: handles are unique", "[kernel][timer]") {
    FakeClock clock;
    Timers timers(clock.fn());

    auto a = timers.add(TimerDef::once(10ms));
    auto b = timers.add(TimerDef::once(10ms));

    REQUIRE(a.is_valid());
    REQUIRE(a.value == 1);
    REQUIRE_FALSE(a == b);
    REQUIRE(timers.len() == 2);
}

TEST_CASE("Timers: one-shot fires once at the deadline", "[kernel][timer]") {
    FakeClock clock;
    Timers timers(clock.fn());
    auto h = timers.add(TimerDef::once(100ms));

    REQUIRE_FALSE(timers.poll());
    REQUIRE(timers.sleep_time() == TimerClock::duration(100ms));

    clock.now += 99ms;
    REQUIRE_FALSE(timers.poll());
    REQUIRE_FALSE(timers.read().has_value());

    clock.now += 1ms;
    REQUIRE(timers.poll());
    auto ev = timers.read();
    REQUIRE(ev.has_value());
    REQUIRE(ev->timeout.handle == h);
    REQUIRE(ev->timeout.counter == 0);
    REQUIRE_FALSE(ev->is_repaint());

    clock.now += 1s;
    REQUIRE_FALSE(timers.poll());
    REQUIRE(timers.empty());
    REQUIRE_FALSE(timers.sleep_time().has_value());
}

TEST_CASE("Timers: repeating timer fires count times", "[kernel][timer]") {
    FakeClock clock;
    Timers timers(clock.fn());
    timers.add(TimerDef::repeating(50ms, 3));

    std::vector<std::uint32_t> counters;
    std::vector<TimerClock::time_point> fired_at;
    for (int step = 0; step < 20; ++step) {
        clock.now += 10ms;
        while (auto ev = timers.read()) {
            counters.push_back(ev->timeout.counter);
            fired_at.push_back(clock.now);
        }
    }

    REQUIRE(counters == std::vector<std::uint32_t>{0, 1, 2});
    REQUIRE(fired_at[0] - TimerClock::time_point{} >= 50ms);
    REQUIRE(fired_at[1] - fired_at[0] >= 50ms);
    REQUIRE(fired_at[2] - fired_at[1] >= 50ms);
    REQUIRE(timers.empty());
}

TEST_CASE("Timers: repeat count of one fires once", "[kernel][timer]") {
    FakeClock clock;
    Timers timers(clock.fn());
    auto h = timers.add(TimerDef::repeating(30ms, 1));

    clock.now += 29ms;
    REQUIRE_FALSE(timers.read().has_value());

    clock.now += 1ms;
    auto ev = timers.read();
    REQUIRE(ev.has_value());
    REQUIRE(ev->timeout.handle == h);
    REQUIRE(ev->timeout.counter == 0);
    REQUIRE(timers.empty());

    clock.now += 1s;
    REQUIRE_FALSE(timers.poll());
    REQUIRE_FALSE(timers.read().has_value());
}

TEST_CASE("Timers: earliest first, ties in registration order", "[kernel][timer]") {
    FakeClock clock;
    Timers timers(clock.fn());

    auto late = timers.add(TimerDef::once(30ms));
    auto first = timers.add(TimerDef::once(10ms));
    auto second = timers.add(TimerDef::once(10ms));

    clock.now += 1s;
    REQUIRE(timers.read()->timeout.handle == first);
    REQUIRE(timers.read()->timeout.handle == second);
    REQUIRE(timers.read()->timeout.handle == late);
    REQUIRE_FALSE(timers.read().has_value());
}

TEST_CASE("Timers: remove and replace", "[kernel][timer]") {
    FakeClock clock;
    Timers timers(clock.fn());

    auto h = timers.add(TimerDef::once(10ms));
    REQUIRE(timers.contains(h));
    REQUIRE(timers.remove(h));
    REQUIRE_FALSE(timers.remove(h));
    REQUIRE_FALSE(timers.contains(h));

    SECTION("replace tolerates a gone handle") {
        auto r = timers.replace(h, TimerDef::once(5ms));
        REQUIRE(timers.contains(r));
        REQUIRE(timers.len() == 1);
    }

    SECTION("replace removes a live handle") {
        auto live = timers.add(TimerDef::once(5ms));
        auto r = timers.replace(live, TimerDef::once(5ms));
        REQUIRE_FALSE(timers.contains(live));
        REQUIRE(timers.contains(r));
        REQUIRE(timers.len() == 1);
    }

    SECTION("replace without an old handle") {
        auto r = timers.replace(std::nullopt, TimerDef::once(5ms));
        REQUIRE(timers.contains(r));
    }
}

TEST_CASE("Timers: explicit start instant", "[kernel][timer]") {
    FakeClock clock;
    Timers timers(clock.fn());

    timers.add(TimerDef::repeating(100ms, 2).starting_at(clock.now + 5ms));
    timers.add(TimerDef::at(clock.now + 20ms));

    clock.now += 5ms;
    REQUIRE(timers.read()->timeout.counter == 0);
    REQUIRE_FALSE(timers.poll());

    clock.now += 15ms;
    REQUIRE(timers.read().has_value());

    clock.now += 100ms;
    auto ev = timers.read();
    REQUIRE(ev->timeout.counter == 1);
    REQUIRE(timers.empty());
}

TEST_CASE("PollTimers: repaint and application timers", "[kernel][timer]") {
    using Event = std::variant<TimerEvent>;

    FakeClock clock;
    auto timers = std::make_shared<Timers>(clock.fn());
    PollTimers<Event> source(timers);

    timers->add(TimerDef::once(10ms).with_repaint());
    timers->add(TimerDef::once(20ms));

    REQUIRE(source.drain_until_idle());
    REQUIRE_FALSE(source.poll().value());

    clock.now += 20ms;
    REQUIRE(source.poll().value());

    auto repaint = source.read();
    REQUIRE(repaint.value().is_changed());

    auto app = source.read();
    REQUIRE(app.value().is_event());
    REQUIRE(std::get<TimerEvent>(app.value().payload()).kind == TimerEvent::Kind::Application);

    REQUIRE_FALSE(source.poll().value());
    REQUIRE(source.read().value().is_continue());
}
