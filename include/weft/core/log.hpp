#pragma once

/// @file log.hpp
/// @brief Logging utilities for weft
///
/// The terminal owns stdout while an application runs, so console output
/// goes to stderr and file output to a rotating log per named logger.

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define WEFT_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define WEFT_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define WEFT_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define WEFT_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define WEFT_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define WEFT_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace weft_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Run loop, poll sources and timers
std::shared_ptr<spdlog::logger> kernel_logger();

/// Worker pool and async runtime
std::shared_ptr<spdlog::logger> worker_logger();

/// Window stack
std::shared_ptr<spdlog::logger> window_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "weft_kernel");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define WEFT_LOG_SCOPE(name) ::weft_core::LogScope _log_scope_##__LINE__(name)
#define WEFT_LOG_FUNC() ::weft_core::LogScope _log_scope_func(__FUNCTION__)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace weft_core
