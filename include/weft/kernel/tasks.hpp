#pragma once

/// @file tasks.hpp
/// @brief Cancellation and liveness tokens shared with background jobs

#include "fwd.hpp"

#include <atomic>
#include <memory>

namespace weft_kernel {

// =============================================================================
// Cancellation
// =============================================================================

/// Shared cancel flag.
///
/// Set by the application, checked (never waited on) by the job.
class Cancellation {
public:
    Cancellation() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    /// Ask the job to stop
    void cancel() const noexcept {
        m_flag->store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_canceled() const noexcept {
        return m_flag->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

// =============================================================================
// Liveness
// =============================================================================

/// Tracks a job from queued through running to finished.
///
/// born() is set when a worker picks the job up, dead() exactly once when it
/// terminates, whether it returned a value, an error, or threw.
class Liveness {
public:
    Liveness() : m_state(std::make_shared<std::atomic<std::uint8_t>>(k_queued)) {}

    void born() const noexcept {
        m_state->store(k_running, std::memory_order_release);
    }

    void dead() const noexcept {
        m_state->store(k_finished, std::memory_order_release);
    }

    /// Picked up by a worker, not yet finished
    [[nodiscard]] bool is_alive() const noexcept {
        return m_state->load(std::memory_order_acquire) == k_running;
    }

    /// Finished in any way
    [[nodiscard]] bool is_finished() const noexcept {
        return m_state->load(std::memory_order_acquire) == k_finished;
    }

    /// Still waiting in the job queue
    [[nodiscard]] bool is_queued() const noexcept {
        return m_state->load(std::memory_order_acquire) == k_queued;
    }

private:
    static constexpr std::uint8_t k_queued = 0;
    static constexpr std::uint8_t k_running = 1;
    static constexpr std::uint8_t k_finished = 2;

    std::shared_ptr<std::atomic<std::uint8_t>> m_state;
};

} // namespace weft_kernel
