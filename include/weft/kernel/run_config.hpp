#pragma once

/// @file run_config.hpp
/// @brief Terminal, event sources and loop timing for one run

#include "fwd.hpp"
#include "poll_source.hpp"
#include "terminal.hpp"
#include <weft/core/settings.hpp>

#include <chrono>
#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace weft_kernel {

/// Sleep regime of the run loop while idle
struct LoopTiming {
    /// Longest sleep between idle ticks
    std::chrono::microseconds idle_sleep{250'000};
    /// Added to the sleep after each idle tick
    std::chrono::microseconds backoff{10'000};
    /// Sleep right after activity
    std::chrono::microseconds fast_sleep{100};
};

/// Everything the run loop needs besides the application hooks.
///
/// @code
/// auto cfg = RunConfig<AppEvent>(terminal)
///     .poll(PollTimers<AppEvent>())
///     .poll(PollTasks<AppEvent>(2))
///     .poll(input);
/// @endcode
template<typename Event>
class RunConfig {
public:
    using SourcePtr = std::unique_ptr<IPollSource<Event>>;

    explicit RunConfig(std::shared_ptr<ITerminal> terminal)
        : m_terminal(std::move(terminal))
    {
    }

    /// Terminal flags and loop timing taken from loaded settings
    [[nodiscard]] static RunConfig from_settings(std::shared_ptr<ITerminal> terminal,
                                                 const weft_core::KernelSettings& settings) {
        RunConfig cfg(std::move(terminal));
        cfg.m_term_init.manual = settings.manual_terminal;
        cfg.m_term_init.alternate_screen = settings.alternate_screen;
        cfg.m_term_init.mouse_capture = settings.mouse_capture;
        cfg.m_term_init.bracketed_paste = settings.bracketed_paste;
        cfg.m_timing.idle_sleep = settings.idle_sleep;
        cfg.m_timing.backoff = settings.backoff;
        cfg.m_timing.fast_sleep = settings.fast_sleep;
        return cfg;
    }

    RunConfig(RunConfig&&) = default;
    RunConfig& operator=(RunConfig&&) = default;

    // =========================================================================
    // Builder
    // =========================================================================

    /// Add an event source; sources are polled in the order they are added
    RunConfig& poll(SourcePtr source) & {
        m_sources.push_back(std::move(source));
        return *this;
    }

    RunConfig&& poll(SourcePtr source) && {
        m_sources.push_back(std::move(source));
        return std::move(*this);
    }

    template<typename S>
        requires std::derived_from<std::decay_t<S>, IPollSource<Event>>
    RunConfig& poll(S&& source) & {
        return poll(SourcePtr(std::make_unique<std::decay_t<S>>(std::forward<S>(source))));
    }

    template<typename S>
        requires std::derived_from<std::decay_t<S>, IPollSource<Event>>
    RunConfig&& poll(S&& source) && {
        m_sources.push_back(std::make_unique<std::decay_t<S>>(std::forward<S>(source)));
        return std::move(*this);
    }

    RunConfig& term_init(const TermInit& flags) & {
        m_term_init = flags;
        return *this;
    }

    RunConfig&& term_init(const TermInit& flags) && {
        m_term_init = flags;
        return std::move(*this);
    }

    RunConfig& timing(const LoopTiming& timing) & {
        m_timing = timing;
        return *this;
    }

    RunConfig&& timing(const LoopTiming& timing) && {
        m_timing = timing;
        return std::move(*this);
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const std::shared_ptr<ITerminal>& terminal() const noexcept { return m_terminal; }
    [[nodiscard]] const TermInit& term_init() const noexcept { return m_term_init; }
    [[nodiscard]] const LoopTiming& timing() const noexcept { return m_timing; }
    [[nodiscard]] std::vector<SourcePtr>& sources() noexcept { return m_sources; }

private:
    std::shared_ptr<ITerminal> m_terminal;
    std::vector<SourcePtr> m_sources;
    TermInit m_term_init;
    LoopTiming m_timing;
};

} // namespace weft_kernel
