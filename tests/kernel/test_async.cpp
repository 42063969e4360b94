/// @file test_async.cpp
/// @brief Tests for AsyncTasks and PollAsync

#include <catch2/catch_test_macros.hpp>
#include <weft/kernel/async_tasks.hpp>
#include <weft/kernel/poll_sources.hpp>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace weft_kernel;
using namespace std::chrono_literals;

namespace {

using Tasks = AsyncTasks<int>;
using Ctl = weft_event::Control<int>;

std::vector<Tasks::ResultType> collect(Tasks& tasks, std::size_t expected) {
    std::vector<Tasks::ResultType> out;
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (out.size() < expected && std::chrono::steady_clock::now() < deadline) {
        if (tasks.poll()) {
            if (auto r = tasks.try_recv()) {
                out.push_back(std::move(*r));
            }
        } else {
            std::this_thread::sleep_for(1ms);
        }
    }
    return out;
}

} // anonymous namespace

TEST_CASE("AsyncTasks: result of a task", "[kernel][async]") {
    Tasks tasks;
    Liveness l = tasks.spawn([]() -> Tasks::ResultType { return Ctl::event(3); });

    auto results = collect(tasks, 1);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].value().payload() == 3);
    REQUIRE(l.is_finished());
    REQUIRE(tasks.pending() == 0);
}

TEST_CASE("AsyncTasks: sent values come before the final result", "[kernel][async]") {
    Tasks tasks;
    tasks.spawn_ext([](const Cancellation&, const Tasks::ResultSender& send) -> Tasks::ResultType {
        auto sent = send.send(Ctl::event(1));
        if (sent.is_err()) {
            return sent.error();
        }
        return Ctl::event(2);
    });

    auto results = collect(tasks, 2);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].value().payload() == 1);
    REQUIRE(results[1].value().payload() == 2);
}

TEST_CASE("AsyncTasks: exceptions become errors", "[kernel][async]") {
    Tasks tasks;
    tasks.spawn([]() -> Tasks::ResultType { throw std::runtime_error("async failure"); });

    auto results = collect(tasks, 1);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].is_err());
    REQUIRE(results[0].error().code() == weft_core::ErrorCode::TaskPanicked);
}

TEST_CASE("AsyncTasks: cancellation token", "[kernel][async]") {
    Tasks tasks;
    auto [cancel, liveness] = tasks.spawn_ext(
        [](const Cancellation& c, const Tasks::ResultSender&) -> Tasks::ResultType {
            while (!c.is_canceled()) {
                std::this_thread::sleep_for(1ms);
            }
            return Ctl::unchanged();
        });

    cancel.cancel();
    auto results = collect(tasks, 1);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].value().is_unchanged());
    REQUIRE(liveness.is_finished());
}

TEST_CASE("PollAsync: reads through the source", "[kernel][async]") {
    PollAsync<int> source;
    source.tasks()->spawn([]() -> Tasks::ResultType { return Ctl::changed(); });

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!source.poll().value() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(source.poll().value());
    REQUIRE(source.read().value().is_changed());
    REQUIRE_FALSE(source.poll().value());
}
