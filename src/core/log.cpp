/// @file log.cpp
/// @brief Logging system implementation for weft_core

#include <weft/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace weft_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Named loggers plus the configuration their sinks were built from
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    LogConfig config;
};

LoggerRegistry& registry() {
    static LoggerRegistry instance;
    return instance;
}

/// Console sink on stderr, plus a rotating file `<directory>/<name>.log`
/// when file output is enabled. Caller holds the registry mutex.
std::vector<spdlog::sink_ptr> sinks_for(const std::string& name, const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (!config.file_enabled || config.log_directory.empty()) {
        return sinks;
    }

    const std::filesystem::path dir(config.log_directory);
    try {
        std::filesystem::create_directories(dir);
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (dir / (name + ".log")).string(), config.max_file_size, config.max_files);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");
        sinks.push_back(std::move(file));
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("no log file for '{}': {}", name, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::warn("cannot create log directory '{}': {}", config.log_directory, e.what());
    }
    return sinks;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.config = config;

    // Loggers created before configuration switch to the new sinks
    for (auto& [name, logger] : reg.loggers) {
        auto sinks = sinks_for(name, reg.config);
        logger->sinks().assign(sinks.begin(), sinks.end());
        logger->set_level(config.level);
    }

    // The default logger behind the WEFT_LOG_* macros
    auto sinks = sinks_for("weft", reg.config);
    auto fallback = std::make_shared<spdlog::logger>("weft", sinks.begin(), sinks.end());
    fallback->set_level(config.level);
    spdlog::set_default_logger(std::move(fallback));
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = sinks_for(name, reg.config);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.config.level);
    reg.loggers.emplace(name, logger);
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> kernel_logger() {
    return get_logger("weft_kernel");
}

std::shared_ptr<spdlog::logger> worker_logger() {
    return get_logger("weft_worker");
}

std::shared_ptr<spdlog::logger> window_logger() {
    return get_logger("weft_window");
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config.level = level;
    spdlog::set_level(level);

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - m_start);
    m_logger->trace("<<< Exiting {} ({}us)", m_name, duration.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();

    spdlog::shutdown();
}

} // namespace weft_core
