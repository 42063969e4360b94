#pragma once

/// @file worker_pool.hpp
/// @brief Fixed-size OS-thread pool whose results feed the run loop

#include "fwd.hpp"
#include "tasks.hpp"
#include <weft/core/error.hpp>
#include <weft/core/log.hpp>
#include <weft/event/channel.hpp>
#include <weft/event/control.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace weft_kernel {

/// Background job runner.
///
/// Jobs run on a fixed set of worker threads. Every job produces exactly one
/// Result<Control> on the results channel when it terminates; a job that
/// throws is reported as a TaskError there and the worker carries on.
/// Jobs can push extra intermediate results through the sender they get.
template<typename Event>
class WorkerPool {
public:
    using ResultType = weft_core::Result<weft_event::Control<Event>>;
    using ResultChannel = weft_event::EventChannel<ResultType>;
    using ResultSender = weft_event::Sender<ResultType>;
    using Job = std::function<ResultType(const Cancellation&, const ResultSender&)>;
    using SimpleJob = std::function<ResultType()>;
    using Tokens = std::pair<Cancellation, Liveness>;

    explicit WorkerPool(std::size_t worker_count)
        : m_results(std::make_shared<ResultChannel>())
    {
        m_threads.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i) {
            m_threads.emplace_back([this, i]() { worker_main(i); });
        }
        weft_core::worker_logger()->info("worker pool started with {} threads", worker_count);
    }

    ~WorkerPool() {
        shutdown();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // =========================================================================
    // Spawning
    // =========================================================================

    /// Queue a job that gets a cancel token and a sender for extra results
    [[nodiscard]] weft_core::Result<Tokens> spawn_ext(Job job) {
        if (m_threads.empty()) {
            return weft_core::Err<Tokens>(weft_core::Error(weft_core::TaskError::no_workers()));
        }

        Cancellation cancel;
        Liveness liveness;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_shutdown) {
                return weft_core::Err<Tokens>(weft_core::Error(weft_core::TaskError::shut_down()));
            }
            m_jobs.push_back(QueuedJob{cancel, liveness, std::move(job)});
        }
        m_cv.notify_one();

        return Tokens{cancel, liveness};
    }

    /// Queue a plain job.
    ///
    /// Jobs are stored as std::function and must be copyable. Move-only
    /// inputs go in a std::shared_ptr captured by the job, and the job moves
    /// them out when it runs.
    [[nodiscard]] weft_core::Result<Tokens> spawn(SimpleJob job) {
        return spawn_ext([job = std::move(job)](const Cancellation&, const ResultSender&) {
            return job();
        });
    }

    // =========================================================================
    // Results
    // =========================================================================

    /// Results waiting to be read
    [[nodiscard]] bool has_results() const noexcept {
        return !m_results->empty();
    }

    /// Take one result. Run-loop thread only.
    [[nodiscard]] std::optional<ResultType> try_recv() {
        return m_results->receive();
    }

    /// Sender for the results channel
    [[nodiscard]] ResultSender sender() const {
        return ResultSender(m_results, "worker results");
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    [[nodiscard]] std::size_t worker_count() const noexcept { return m_threads.size(); }

    /// Jobs not yet picked up by a worker
    [[nodiscard]] std::size_t pending_jobs() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_jobs.size();
    }

    /// Stop accepting jobs, let the queue run dry and join the workers
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_shutdown) {
                return;
            }
            m_shutdown = true;
        }
        m_cv.notify_all();
        for (auto& t : m_threads) {
            if (t.joinable()) {
                t.join();
            }
        }
        weft_core::worker_logger()->info("worker pool stopped");
    }

private:
    struct QueuedJob {
        Cancellation cancel;
        Liveness liveness;
        Job job;
    };

    void worker_main(std::size_t index) {
        auto log = weft_core::worker_logger();
        log->debug("worker {} running", index);

        while (true) {
            QueuedJob queued;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this]() { return m_shutdown || !m_jobs.empty(); });
                if (m_jobs.empty()) {
                    break;
                }
                queued = std::move(m_jobs.front());
                m_jobs.pop_front();
            }

            queued.liveness.born();
            ResultType result = run_job(queued, index);
            m_results->send(std::move(result));
            queued.liveness.dead();
        }

        log->debug("worker {} exiting", index);
    }

    ResultType run_job(QueuedJob& queued, std::size_t index) {
        ResultSender results = sender();
        try {
            ResultType r = queued.job(queued.cancel, results);
            if (r.is_err()) {
                weft_core::debug::record_error(r.error());
            }
            return r;
        } catch (const std::exception& e) {
            weft_core::worker_logger()->error("job on worker {} threw: {}", index, e.what());
            weft_core::Error err(weft_core::TaskError::panicked(e.what()));
            weft_core::debug::record_error(err);
            return err;
        } catch (...) {
            weft_core::worker_logger()->error("job on worker {} threw a non-std exception", index);
            weft_core::Error err(weft_core::TaskError::panicked("unknown exception"));
            weft_core::debug::record_error(err);
            return err;
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<QueuedJob> m_jobs;
    bool m_shutdown = false;
    std::vector<std::thread> m_threads;
    std::shared_ptr<ResultChannel> m_results;
};

} // namespace weft_kernel
