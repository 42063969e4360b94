#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for weft_core module

#include <cstdint>

namespace weft_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;
class Panic;

template<typename T, typename E = Error>
class Result;

struct PollError;
struct TaskError;
struct WindowError;
struct ConfigError;

// =============================================================================
// Logging / Settings
// =============================================================================

struct LogConfig;
class LogScope;
struct KernelSettings;

} // namespace weft_core
