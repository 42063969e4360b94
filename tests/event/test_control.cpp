/// @file test_control.cpp
/// @brief Tests for Outcome, Control and handler chaining

#include <catch2/catch_test_macros.hpp>
#include <weft/event/event.hpp>
#include <string>
#include <vector>

using namespace weft_event;

using Ctl = Control<std::string>;

TEST_CASE("Outcome: order and merge", "[event][control]") {
    REQUIRE(Outcome::Continue < Outcome::Unchanged);
    REQUIRE(Outcome::Unchanged < Outcome::Changed);

    REQUIRE(merge(Outcome::Continue, Outcome::Changed) == Outcome::Changed);
    REQUIRE(merge(Outcome::Unchanged, Outcome::Continue) == Outcome::Unchanged);
    REQUIRE_FALSE(is_consumed(Outcome::Continue));
    REQUIRE(is_consumed(Outcome::Unchanged));
    REQUIRE(outcome_from(true) == Outcome::Changed);
    REQUIRE(outcome_from(false) == Outcome::Unchanged);
}

TEST_CASE("Control: lattice order", "[event][control]") {
    std::vector<Ctl> ascending = {
        Ctl::continue_(), Ctl::unchanged(), Ctl::changed(), Ctl::event("x"), Ctl::quit()};

    for (std::size_t i = 0; i + 1 < ascending.size(); ++i) {
        REQUIRE(ascending[i] < ascending[i + 1]);
    }
    REQUIRE(Ctl() == Ctl::continue_());
}

TEST_CASE("Control: events compare by discriminant", "[event][control]") {
    REQUIRE(Ctl::event("a") == Ctl::event("b"));
    REQUIRE_FALSE(Ctl::event("a") < Ctl::event("b"));
}

TEST_CASE("Control: merge", "[event][control]") {
    SECTION("greater wins") {
        REQUIRE(merge(Ctl::changed(), Ctl::unchanged()).is_changed());
        REQUIRE(merge(Ctl::unchanged(), Ctl::quit()).is_quit());
    }

    SECTION("commutative and associative up to discriminant") {
        std::vector<Ctl> all = {
            Ctl::continue_(), Ctl::unchanged(), Ctl::changed(), Ctl::event("e"), Ctl::quit()};
        for (const auto& a : all) {
            for (const auto& b : all) {
                REQUIRE(merge(a, b) == merge(b, a));
                for (const auto& c : all) {
                    REQUIRE(merge(merge(a, b), c) == merge(a, merge(b, c)));
                }
            }
        }
    }

    SECTION("tie returns the second argument") {
        auto m = merge(Ctl::event("first"), Ctl::event("second"));
        REQUIRE(m.payload() == "second");
    }
}

TEST_CASE("Control: Outcome embedding", "[event][control]") {
    Ctl c = Outcome::Changed;
    REQUIRE(c.is_changed());
    REQUIRE(c.to_outcome() == Outcome::Changed);

    REQUIRE(Ctl::event("e").to_outcome() == Outcome::Continue);
    REQUIRE(Ctl::quit().to_outcome() == Outcome::Continue);
}

TEST_CASE("Control: payload access", "[event][control]") {
    SECTION("event payload") {
        Ctl c = Ctl::event("hello");
        REQUIRE(c.payload() == "hello");
        auto taken = c.take_payload();
        REQUIRE(taken.has_value());
        REQUIRE(*taken == "hello");
        REQUIRE(c.is_event());
    }

    SECTION("no payload throws") {
        REQUIRE_THROWS_AS(Ctl::changed().payload(), weft_core::Panic);
    }

    SECTION("map_event") {
        auto mapped = Ctl::event("abc").map_event([](std::string s) { return s.size(); });
        REQUIRE(mapped.payload() == 3);
        auto quit = Ctl::quit().map_event([](std::string s) { return s.size(); });
        REQUIRE(quit.is_quit());
    }
}

namespace {

Outcome first_handler(int key) {
    return key == 1 ? Outcome::Changed : Outcome::Continue;
}

Outcome second_handler(int key) {
    return key == 2 ? Outcome::Unchanged : Outcome::Continue;
}

Outcome chain(int key, int& reached) {
    WEFT_FLOW(first_handler(key));
    reached = 2;
    WEFT_FLOW(second_handler(key));
    reached = 3;
    return Outcome::Continue;
}

weft_core::Result<Outcome> fallible(int key) {
    if (key < 0) {
        return weft_core::Error("negative key");
    }
    return first_handler(key);
}

weft_core::Result<Outcome> try_chain(int key) {
    WEFT_TRY_FLOW(fallible(key));
    return Outcome::Unchanged;
}

} // anonymous namespace

TEST_CASE("Control: handler chaining", "[event][control]") {
    int reached = 1;
    REQUIRE(chain(1, reached) == Outcome::Changed);
    REQUIRE(reached == 1);

    REQUIRE(chain(2, reached) == Outcome::Unchanged);
    REQUIRE(reached == 2);

    REQUIRE(chain(9, reached) == Outcome::Continue);
    REQUIRE(reached == 3);

    REQUIRE(try_chain(1).value() == Outcome::Changed);
    REQUIRE(try_chain(5).value() == Outcome::Unchanged);
    REQUIRE(try_chain(-1).is_err());
}
