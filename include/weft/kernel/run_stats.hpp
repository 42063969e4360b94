#pragma once

/// @file run_stats.hpp
/// @brief Counters collected by the run loop

#include "fwd.hpp"
#include <weft/core/error.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace weft_kernel {

/// Counters of one run
struct RunStats {
    std::uint64_t ticks = 0;
    std::uint64_t polls = 0;
    std::uint64_t reads = 0;
    std::uint64_t events = 0;
    std::uint64_t renders = 0;
    std::uint64_t errors = 0;
    std::uint64_t quit_vetoes = 0;
    std::chrono::microseconds render_time{0};
    std::chrono::microseconds event_time{0};
    std::chrono::microseconds max_render{0};
    std::chrono::microseconds max_event{0};

    void record_render(std::chrono::microseconds d) {
        ++renders;
        render_time += d;
        if (d > max_render) max_render = d;
    }

    void record_event(std::chrono::microseconds d) {
        ++events;
        event_time += d;
        if (d > max_event) max_event = d;
    }

    /// Pretty printed JSON
    [[nodiscard]] std::string to_json_string(int indent = 2) const;

    /// Write the JSON form to a file
    [[nodiscard]] weft_core::Result<void> save(const std::string& path) const;
};

} // namespace weft_kernel
