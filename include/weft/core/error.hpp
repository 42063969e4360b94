#pragma once

/// @file error.hpp
/// @brief Error handling types for weft_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace weft_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    Disconnected,
    TaskFailed,
    TaskPanicked,
    Reentrancy,
    TypeMismatch,
    OutOfBounds,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::Disconnected: return "Disconnected";
        case ErrorCode::TaskFailed: return "TaskFailed";
        case ErrorCode::TaskPanicked: return "TaskPanicked";
        case ErrorCode::Reentrancy: return "Reentrancy";
        case ErrorCode::TypeMismatch: return "TypeMismatch";
        case ErrorCode::OutOfBounds: return "OutOfBounds";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Panic
// =============================================================================

/// Thrown for programming errors that must never be silently continued:
/// reentrant window-stack mutation, access to an unconfigured facility,
/// a missing focus object.
class Panic : public std::logic_error {
public:
    explicit Panic(const std::string& what) : std::logic_error(what) {}
    explicit Panic(const char* what) : std::logic_error(what) {}
};

// =============================================================================
// Error Kinds
// =============================================================================

/// Event-source errors (a poll source failed to poll or read)
struct PollError {
    enum class Kind : std::uint8_t {
        PollFailed,     // poll() failed
        ReadFailed,     // read() failed
        Disconnected,   // Source channel closed
        Io,             // Terminal or input device error
    };

    Kind kind;
    std::string message;
    std::string source;

    [[nodiscard]] static PollError poll_failed(const std::string& src, const std::string& reason) {
        return PollError{Kind::PollFailed, "Poll failed on '" + src + "': " + reason, src};
    }

    [[nodiscard]] static PollError read_failed(const std::string& src, const std::string& reason) {
        return PollError{Kind::ReadFailed, "Read failed on '" + src + "': " + reason, src};
    }

    [[nodiscard]] static PollError disconnected(const std::string& src) {
        return PollError{Kind::Disconnected, "Source disconnected: " + src, src};
    }

    [[nodiscard]] static PollError io(const std::string& reason) {
        return PollError{Kind::Io, "I/O error: " + reason, "terminal"};
    }
};

/// Background job errors
struct TaskError {
    enum class Kind : std::uint8_t {
        NoWorkers,      // Pool has no worker threads
        ShutDown,       // Pool no longer accepts jobs
        Failed,         // Job returned an error
        Panicked,       // Job threw
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static TaskError no_workers() {
        return TaskError{Kind::NoWorkers, "Worker pool has no threads"};
    }

    [[nodiscard]] static TaskError shut_down() {
        return TaskError{Kind::ShutDown, "Worker pool is shut down"};
    }

    [[nodiscard]] static TaskError failed(const std::string& reason) {
        return TaskError{Kind::Failed, "Job failed: " + reason};
    }

    [[nodiscard]] static TaskError panicked(const std::string& reason) {
        return TaskError{Kind::Panicked, "Job panicked: " + reason};
    }
};

/// Window stack errors
struct WindowError {
    enum class Kind : std::uint8_t {
        StateGone,      // Slot is checked out (reentrant access)
        Borrowed,       // Slot already borrowed incompatibly
        TypeMismatch,   // Downcast to the wrong state type
        OutOfBounds,    // Index past the end of the stack
    };

    Kind kind;
    std::string message;
    std::size_t index = 0;

    [[nodiscard]] static WindowError state_gone(std::size_t n) {
        return WindowError{Kind::StateGone, "state is gone", n};
    }

    [[nodiscard]] static WindowError borrowed(std::size_t n) {
        return WindowError{Kind::Borrowed, "window " + std::to_string(n) + " is already borrowed", n};
    }

    [[nodiscard]] static WindowError type_mismatch(std::size_t n, const std::string& expected) {
        return WindowError{Kind::TypeMismatch,
            "window " + std::to_string(n) + " is not a " + expected, n};
    }

    [[nodiscard]] static WindowError out_of_bounds(std::size_t n, std::size_t len) {
        return WindowError{Kind::OutOfBounds,
            "window index " + std::to_string(n) + " out of bounds (len " + std::to_string(len) + ")", n};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        ParseFailed,
        InvalidValue,
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static ConfigError file_not_found(const std::string& p) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + p, p};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& p, const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Failed to parse " + p + ": " + reason, p};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        PollError,
        TaskError,
        WindowError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(PollError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(TaskError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(WindowError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(PollError::Kind kind) {
        switch (kind) {
            case PollError::Kind::PollFailed: return ErrorCode::IOError;
            case PollError::Kind::ReadFailed: return ErrorCode::IOError;
            case PollError::Kind::Disconnected: return ErrorCode::Disconnected;
            case PollError::Kind::Io: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(TaskError::Kind kind) {
        switch (kind) {
            case TaskError::Kind::NoWorkers: return ErrorCode::InvalidState;
            case TaskError::Kind::ShutDown: return ErrorCode::Disconnected;
            case TaskError::Kind::Failed: return ErrorCode::TaskFailed;
            case TaskError::Kind::Panicked: return ErrorCode::TaskPanicked;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(WindowError::Kind kind) {
        switch (kind) {
            case WindowError::Kind::StateGone: return ErrorCode::Reentrancy;
            case WindowError::Kind::Borrowed: return ErrorCode::Reentrancy;
            case WindowError::Kind::TypeMismatch: return ErrorCode::TypeMismatch;
            case WindowError::Kind::OutOfBounds: return ErrorCode::OutOfBounds;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type holding either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }
    [[nodiscard]] E&& error() && { return std::move(m_error); }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Value, or Panic carrying the error message
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw Panic(m_error.message());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw Panic(m_error.message());
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }
    [[nodiscard]] E&& error() && { return std::move(m_error); }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw Panic(m_error.message());
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count for one error code
std::uint64_t error_count(ErrorCode code);

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace weft_core
