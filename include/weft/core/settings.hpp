#pragma once

/// @file settings.hpp
/// @brief Kernel settings loaded from TOML

#include "error.hpp"
#include "log.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace weft_core {

// =============================================================================
// KernelSettings
// =============================================================================

/// Runtime settings for a weft application.
///
/// Every key is optional; a missing key keeps its default.
///
/// @code
/// [log]
/// level = "debug"
/// file = true
/// directory = "logs"
///
/// [workers]
/// count = 4
///
/// [loop]
/// idle_sleep_us = 250000
/// backoff_us = 10000
/// fast_sleep_us = 100
///
/// [terminal]
/// alternate_screen = true
/// mouse_capture = true
/// bracketed_paste = true
/// manual = false
/// @endcode
struct KernelSettings {
    // [log]
    std::string log_level = "info";
    bool log_to_file = false;
    std::string log_directory = "logs";

    // [workers]
    std::uint32_t worker_count = 1;

    // [loop]
    std::chrono::microseconds idle_sleep{250'000};
    std::chrono::microseconds backoff{10'000};
    std::chrono::microseconds fast_sleep{100};

    // [terminal]
    bool alternate_screen = true;
    bool mouse_capture = true;
    bool bracketed_paste = true;
    bool manual_terminal = false;

    /// Build the logging configuration described by the [log] table
    [[nodiscard]] LogConfig log_config() const;
};

/// Load settings from a TOML file
[[nodiscard]] Result<KernelSettings> load_settings(const std::filesystem::path& path);

/// Parse settings from TOML text
[[nodiscard]] Result<KernelSettings> parse_settings(
    const std::string& content,
    const std::string& source_name = "<memory>");

} // namespace weft_core
