/// @file error.cpp
/// @brief Error formatting and statistics for weft_core
///
/// Error and Result are header-only templates. This file provides the
/// out-of-line formatting used by the run loop when it logs a failure, and
/// the per-code error counters surfaced in run statistics.

#include <weft/core/error.hpp>
#include <array>
#include <atomic>
#include <sstream>
#include <vector>

namespace weft_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_poll_error(const PollError& err) {
    std::ostringstream oss;
    oss << "[PollError] " << err.message;
    if (!err.source.empty()) {
        oss << " (source: " << err.source << ")";
    }
    return oss.str();
}

std::string format_task_error(const TaskError& err) {
    return "[TaskError] " + err.message;
}

std::string format_window_error(const WindowError& err) {
    std::ostringstream oss;
    oss << "[WindowError] " << err.message << " (window: " << err.index << ")";
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.path.empty()) {
        oss << " (path: " << err.path << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, PollError>) {
            oss << detail::format_poll_error(err);
        } else if constexpr (std::is_same_v<T, TaskError>) {
            oss << detail::format_task_error(err);
        } else if constexpr (std::is_same_v<T, WindowError>) {
            oss << detail::format_window_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::size_t, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

namespace {

constexpr std::size_t k_code_count = static_cast<std::size_t>(ErrorCode::NotSupported) + 1;

struct ErrorStats {
    std::atomic<std::uint64_t> total{0};
    std::array<std::atomic<std::uint64_t>, k_code_count> by_code{};
};

ErrorStats& stats() {
    static ErrorStats s;
    return s;
}

} // anonymous namespace

void record_error(const Error& error) {
    auto& s = stats();
    s.total.fetch_add(1, std::memory_order_relaxed);
    auto idx = static_cast<std::size_t>(error.code());
    if (idx < k_code_count) {
        s.by_code[idx].fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return stats().total.load(std::memory_order_relaxed);
}

std::uint64_t error_count(ErrorCode code) {
    auto idx = static_cast<std::size_t>(code);
    if (idx >= k_code_count) {
        return 0;
    }
    return stats().by_code[idx].load(std::memory_order_relaxed);
}

void reset_error_stats() {
    auto& s = stats();
    s.total.store(0, std::memory_order_relaxed);
    for (auto& c : s.by_code) {
        c.store(0, std::memory_order_relaxed);
    }
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << total_error_count() << "\n";
    for (std::size_t i = 0; i < k_code_count; ++i) {
        auto n = stats().by_code[i].load(std::memory_order_relaxed);
        if (n > 0) {
            oss << "  " << error_code_name(static_cast<ErrorCode>(i)) << ": " << n << "\n";
        }
    }
    return oss.str();
}

} // namespace debug

} // namespace weft_core
