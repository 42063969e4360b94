#pragma once

/// @file async_tasks.hpp
/// @brief Future-based background tasks with the worker-pool contract

#include "fwd.hpp"
#include "tasks.hpp"
#include <weft/core/error.hpp>
#include <weft/core/log.hpp>
#include <weft/event/channel.hpp>
#include <weft/event/control.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <optional>
#include <utility>

namespace weft_kernel {

/// Tasks launched with std::async.
///
/// Each task resolves to one Result<Control>; ext tasks can also push
/// intermediate results through a sender. Completed futures and sent values
/// are read back by the run loop through PollAsync. Abort is cooperative,
/// via the Cancellation token.
template<typename Event>
class AsyncTasks {
public:
    using ResultType = weft_core::Result<weft_event::Control<Event>>;
    using ResultChannel = weft_event::EventChannel<ResultType>;
    using ResultSender = weft_event::Sender<ResultType>;
    using Task = std::function<ResultType()>;
    using ExtTask = std::function<ResultType(const Cancellation&, const ResultSender&)>;
    using Tokens = std::pair<Cancellation, Liveness>;

    AsyncTasks()
        : m_sent(std::make_shared<ResultChannel>())
    {
    }

    /// Waits for every outstanding task
    ~AsyncTasks() {
        for (auto& pending : m_pending) {
            if (pending.future.valid()) {
                pending.future.wait();
            }
        }
    }

    AsyncTasks(const AsyncTasks&) = delete;
    AsyncTasks& operator=(const AsyncTasks&) = delete;

    /// Launch a task
    Liveness spawn(Task task) {
        return spawn_ext([task = std::move(task)](const Cancellation&, const ResultSender&) {
            return task();
        }).second;
    }

    /// Launch a task with a cancel token and a sender for extra results
    Tokens spawn_ext(ExtTask task) {
        Cancellation cancel;
        Liveness liveness;
        ResultSender sender(m_sent, "async results");

        auto future = std::async(std::launch::async,
            [task = std::move(task), cancel, liveness, sender]() -> ResultType {
                liveness.born();
                ResultType r = run_task(task, cancel, sender);
                liveness.dead();
                return r;
            });
        m_pending.push_back(Pending{std::move(future), liveness});

        return Tokens{cancel, liveness};
    }

    /// A sent value or a finished task is waiting
    [[nodiscard]] bool poll() const {
        if (!m_sent->empty()) {
            return true;
        }
        for (const auto& pending : m_pending) {
            if (pending.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                return true;
            }
        }
        return false;
    }

    /// Take one sent value, else the result of one finished task
    [[nodiscard]] std::optional<ResultType> try_recv() {
        if (auto sent = m_sent->receive()) {
            return sent;
        }
        for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
            if (it->future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                continue;
            }
            auto future = std::move(it->future);
            m_pending.erase(it);
            try {
                return future.get();
            } catch (const std::exception& e) {
                return ResultType(weft_core::Error(weft_core::TaskError::panicked(e.what())));
            }
        }
        return std::nullopt;
    }

    /// Tasks not yet collected
    [[nodiscard]] std::size_t pending() const noexcept { return m_pending.size(); }

private:
    struct Pending {
        std::future<ResultType> future;
        Liveness liveness;
    };

    static ResultType run_task(const ExtTask& task, const Cancellation& cancel, const ResultSender& sender) {
        try {
            return task(cancel, sender);
        } catch (const std::exception& e) {
            weft_core::worker_logger()->error("async task threw: {}", e.what());
            return weft_core::Error(weft_core::TaskError::panicked(e.what()));
        } catch (...) {
            weft_core::worker_logger()->error("async task threw a non-std exception");
            return weft_core::Error(weft_core::TaskError::panicked("unknown exception"));
        }
    }

    std::shared_ptr<ResultChannel> m_sent;
    std::list<Pending> m_pending;
};

} // namespace weft_kernel
