// weft_core settings and logging tests

#include <catch2/catch_test_macros.hpp>
#include <weft/core/log.hpp>
#include <weft/core/settings.hpp>

#include <filesystem>
#include <fstream>

using namespace weft_core;

TEST_CASE("Settings: defaults", "[core][settings]") {
    auto r = parse_settings("");
    REQUIRE(r.is_ok());

    const KernelSettings& s = r.value();
    REQUIRE(s.log_level == "info");
    REQUIRE(s.worker_count == 1);
    REQUIRE(s.idle_sleep == std::chrono::microseconds(250'000));
    REQUIRE(s.backoff == std::chrono::microseconds(10'000));
    REQUIRE(s.fast_sleep == std::chrono::microseconds(100));
    REQUIRE(s.alternate_screen);
    REQUIRE_FALSE(s.manual_terminal);
}

TEST_CASE("Settings: full document", "[core][settings]") {
    auto r = parse_settings(R"(
[log]
level = "debug"
file = true
directory = "var/log"

[workers]
count = 4

[loop]
idle_sleep_us = 50000
backoff_us = 5000
fast_sleep_us = 200

[terminal]
alternate_screen = false
mouse_capture = false
manual = true
)");
    REQUIRE(r.is_ok());

    const KernelSettings& s = r.value();
    REQUIRE(s.log_level == "debug");
    REQUIRE(s.log_to_file);
    REQUIRE(s.log_directory == "var/log");
    REQUIRE(s.worker_count == 4);
    REQUIRE(s.idle_sleep == std::chrono::microseconds(50'000));
    REQUIRE(s.backoff == std::chrono::microseconds(5'000));
    REQUIRE(s.fast_sleep == std::chrono::microseconds(200));
    REQUIRE_FALSE(s.alternate_screen);
    REQUIRE_FALSE(s.mouse_capture);
    REQUIRE(s.bracketed_paste);
    REQUIRE(s.manual_terminal);

    LogConfig log = s.log_config();
    REQUIRE(log.file_enabled);
    REQUIRE(log.log_directory == "var/log");
    REQUIRE(log.level == spdlog::level::debug);
}

TEST_CASE("Settings: invalid values", "[core][settings]") {
    SECTION("syntax error") {
        auto r = parse_settings("[log\nlevel = ", "broken.toml");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::ParseError);
    }

    SECTION("unknown log level") {
        auto r = parse_settings("[log]\nlevel = \"loud\"\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("negative worker count") {
        auto r = parse_settings("[workers]\ncount = -2\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("zero sleep") {
        auto r = parse_settings("[loop]\nidle_sleep_us = 0\n");
        REQUIRE(r.is_err());
    }

    SECTION("fast sleep longer than idle sleep") {
        auto r = parse_settings("[loop]\nidle_sleep_us = 100\nfast_sleep_us = 1000\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().message().find("fast_sleep_us") != std::string::npos);
    }
}

TEST_CASE("Settings: load from file", "[core][settings]") {
    SECTION("missing file") {
        auto r = load_settings("does/not/exist.toml");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("existing file") {
        auto path = std::filesystem::temp_directory_path() / "weft_settings_test.toml";
        {
            std::ofstream out(path);
            out << "[workers]\ncount = 3\n";
        }
        auto r = load_settings(path);
        std::filesystem::remove(path);

        REQUIRE(r.is_ok());
        REQUIRE(r.value().worker_count == 3);
    }
}

TEST_CASE("Logging: level names", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE_FALSE(parse_log_level("chatty").has_value());
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

TEST_CASE("Logging: named loggers", "[core][log]") {
    auto a = kernel_logger();
    auto b = get_logger("weft_kernel");
    REQUIRE(a == b);
    REQUIRE(worker_logger()->name() == "weft_worker");
    REQUIRE(window_logger()->name() == "weft_window");

    set_logger_level("weft_worker", spdlog::level::err);
    REQUIRE(worker_logger()->level() == spdlog::level::err);
}

TEST_CASE("Logging: configuration follows settings", "[core][log]") {
    KernelSettings settings;
    settings.log_level = "debug";

    LogConfig config = settings.log_config();
    REQUIRE(config.level == spdlog::level::debug);
    REQUIRE_FALSE(config.file_enabled);

    configure_logging(config);
    REQUIRE(get_global_log_level() == spdlog::level::debug);
    REQUIRE(kernel_logger()->level() == spdlog::level::debug);

    set_global_log_level(spdlog::level::warn);
    REQUIRE(get_global_log_level() == spdlog::level::warn);
    REQUIRE(window_logger()->level() == spdlog::level::warn);

    {
        LogScope scope("scoped block");
    }
    flush_all_loggers();
}
