/// @file settings.cpp
/// @brief Kernel settings parsing (settings.toml)

#include <weft/core/settings.hpp>

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace weft_core {

namespace {

/// Read a non-negative microsecond count; 0 is rejected for sleep intervals.
Result<void> read_micros(const toml::table& tbl, const char* key, std::chrono::microseconds& out) {
    auto value = tbl[key].value<std::int64_t>();
    if (!value) {
        if (tbl.contains(key)) {
            return Err(Error(ConfigError::invalid_value(std::string("loop.") + key, "expected an integer")));
        }
        return Ok();
    }
    if (*value <= 0) {
        return Err(Error(ConfigError::invalid_value(std::string("loop.") + key, "must be positive")));
    }
    out = std::chrono::microseconds(*value);
    return Ok();
}

} // anonymous namespace

LogConfig KernelSettings::log_config() const {
    LogConfig config;
    config.file_enabled = log_to_file;
    config.log_directory = log_directory;
    if (auto level = parse_log_level(log_level)) {
        config.level = *level;
    }
    return config;
}

Result<KernelSettings> load_settings(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<KernelSettings>(Error(ConfigError::file_not_found(path.string())));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<KernelSettings>(Error(ConfigError::parse_failed(path.string(), "cannot open file")));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_settings(buffer.str(), path.string());
}

Result<KernelSettings> parse_settings(const std::string& content, const std::string& source_name) {
    KernelSettings settings;
    toml::table tbl;

    try {
        tbl = toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        return Err<KernelSettings>(Error(ConfigError::parse_failed(source_name, std::string(err.description()))));
    }

    // [log]
    if (auto log = tbl["log"].as_table()) {
        if (auto level = (*log)["level"].value<std::string>()) {
            if (!parse_log_level(*level)) {
                return Err<KernelSettings>(Error(ConfigError::invalid_value("log.level", "unknown level '" + *level + "'")));
            }
            settings.log_level = *level;
        }
        settings.log_to_file = (*log)["file"].value_or(settings.log_to_file);
        settings.log_directory = (*log)["directory"].value_or(settings.log_directory);
    }

    // [workers]
    if (auto workers = tbl["workers"].as_table()) {
        if (auto count = (*workers)["count"].value<std::int64_t>()) {
            if (*count < 0) {
                return Err<KernelSettings>(Error(ConfigError::invalid_value("workers.count", "must not be negative")));
            }
            settings.worker_count = static_cast<std::uint32_t>(*count);
        }
    }

    // [loop]
    if (auto loop = tbl["loop"].as_table()) {
        for (auto [key, field] : {
                 std::pair{"idle_sleep_us", &settings.idle_sleep},
                 std::pair{"backoff_us", &settings.backoff},
                 std::pair{"fast_sleep_us", &settings.fast_sleep}}) {
            auto r = read_micros(*loop, key, *field);
            if (!r) {
                return Err<KernelSettings>(std::move(r).error());
            }
        }
        if (settings.fast_sleep > settings.idle_sleep) {
            return Err<KernelSettings>(Error(ConfigError::invalid_value("loop.fast_sleep_us", "exceeds idle_sleep_us")));
        }
    }

    // [terminal]
    if (auto term = tbl["terminal"].as_table()) {
        settings.alternate_screen = (*term)["alternate_screen"].value_or(settings.alternate_screen);
        settings.mouse_capture = (*term)["mouse_capture"].value_or(settings.mouse_capture);
        settings.bracketed_paste = (*term)["bracketed_paste"].value_or(settings.bracketed_paste);
        settings.manual_terminal = (*term)["manual"].value_or(settings.manual_terminal);
    }

    return settings;
}

} // namespace weft_core
