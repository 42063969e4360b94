/// @file weft_demo.cpp
/// @brief weft_demo - scripted headless session on the weft kernel
///
/// Runs a small application against an in-memory terminal and feeds it
/// input from a script thread, the way a terminal backend's reader thread
/// would:
/// - a clock timer ticking a few times
/// - a background job on the worker pool
/// - two overlapping windows brought to front by clicking
/// - a quit that waits for the job to finish
///
/// The final screen is printed to stdout; loop statistics can be saved as JSON.

#include <weft/core/core.hpp>
#include <weft/kernel/kernel.hpp>
#include <weft/window/window.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

using namespace weft_kernel;
using namespace weft_event;
using namespace std::chrono_literals;

// =============================================================================
// Application types
// =============================================================================

struct JobDone {
    std::uint64_t sum = 0;
};

struct PanelClosed {
    std::string title;
};

using DemoEvent = std::variant<InputEvent, TimerEvent, RenderedEvent, QuitEvent, JobDone, PanelClosed>;

struct DemoGlobal;
using Windows = weft_window::WindowStack<DemoEvent, DemoGlobal>;
using WControl = weft_window::WindowControl<DemoEvent>;

struct DemoGlobal : AppContext<DemoEvent> {
    Windows windows;
};

struct DemoApp {
    std::uint32_t clock = 0;
    std::optional<std::uint64_t> job_result;
    bool job_running = false;
    bool quit_pending = false;
    std::string status = "ready";
    std::vector<std::string> closed;
};

/// Boxed window with a title
struct Panel final : weft_window::IWindow<DemoGlobal> {
    std::string title;
    weft_ui::Rect rect;
    bool top = false;

    Panel(std::string t, weft_ui::Rect r) : title(std::move(t)), rect(r) {}

    void set_top(bool t, DemoGlobal&) override { top = t; }
    [[nodiscard]] weft_ui::Rect area() const override { return rect; }
};

// =============================================================================
// Windows
// =============================================================================

weft_core::Result<void> render_panel(weft_ui::Rect, weft_ui::Buffer& buf, Panel& panel, DemoGlobal&) {
    const weft_ui::Rect r = panel.rect;
    buf.fill(r, " ");
    buf.fill(weft_ui::Rect{r.x, r.y, r.width, 1}, "-");
    buf.fill(weft_ui::Rect{r.x, static_cast<std::uint16_t>(r.bottom() - 1), r.width, 1}, "-");
    const std::string label = panel.top ? "[" + panel.title + "]" : " " + panel.title + " ";
    buf.set_string(static_cast<std::uint16_t>(r.x + 2), r.y, label);
    return weft_core::Ok();
}

weft_core::Result<WControl> handle_panel(const DemoEvent& event, Panel& panel, DemoGlobal&) {
    const InputEvent* input = as_input(event);
    if (!input || !panel.top) {
        return WControl::continue_();
    }
    if (const KeyEvent* key = as_key(*input)) {
        if (key->is_char('x')) {
            return WControl::close(PanelClosed{panel.title});
        }
    }
    return WControl::continue_();
}

void open_panel(DemoGlobal& global, std::string title, weft_ui::Rect rect) {
    global.windows.show<Panel>(render_panel, handle_panel,
                               std::make_unique<Panel>(std::move(title), rect), global);
}

// =============================================================================
// Application hooks
// =============================================================================

weft_core::Result<void> demo_init(DemoApp&, DemoGlobal& global) {
    auto clock = global.add_timer(TimerDef::repeating(40ms, 5));
    WEFT_LOG_DEBUG("clock timer {}", clock.value);
    open_panel(global, "help", weft_ui::Rect{2, 3, 24, 5});
    open_panel(global, "stats", weft_ui::Rect{14, 5, 24, 5});
    return weft_core::Ok();
}

weft_core::Result<void> demo_render(weft_ui::Rect area, weft_ui::Buffer& buf, DemoApp& app, DemoGlobal& global) {
    buf.set_string(area.x, area.y, "weft demo  frame " + std::to_string(global.count())
                                       + "  clock " + std::to_string(app.clock));
    std::string job = app.job_result ? "job " + std::to_string(*app.job_result)
                    : app.job_running ? std::string("job running") : std::string("job idle");
    buf.set_string(area.x, static_cast<std::uint16_t>(area.y + 1), job);
    buf.set_string(area.x, static_cast<std::uint16_t>(area.bottom() - 1), app.status);

    if (auto r = global.windows.render(area, buf, global); !r) {
        return r;
    }
    global.set_window_title("weft demo (" + std::to_string(global.windows.len()) + " windows)");
    return weft_core::Ok();
}

weft_core::Result<Control<DemoEvent>> start_job(DemoApp& app, DemoGlobal& global) {
    if (app.job_running) {
        return Control<DemoEvent>::unchanged();
    }
    auto tokens = global.spawn_ext([](const Cancellation& cancel, const auto&) -> weft_core::Result<Control<DemoEvent>> {
        std::uint64_t sum = 0;
        for (std::uint64_t i = 1; i <= 200; ++i) {
            if (cancel.is_canceled()) {
                return Control<DemoEvent>::continue_();
            }
            sum += i * i;
            std::this_thread::sleep_for(100us);
        }
        return Control<DemoEvent>::event(JobDone{sum});
    });
    if (!tokens) {
        return tokens.error();
    }
    app.job_running = true;
    app.status = "job started";
    return Control<DemoEvent>::changed();
}

weft_core::Result<Control<DemoEvent>> demo_event(const DemoEvent& event, DemoApp& app, DemoGlobal& global) {
    auto windowed = global.windows.handle(event, global);
    if (!windowed) {
        return windowed.error();
    }
    if (windowed.value().is_consumed()) {
        return std::move(windowed).value().into_control();
    }

    if (const auto* timer = std::get_if<TimerEvent>(&event)) {
        app.clock = timer->timeout.counter + 1;
        return Control<DemoEvent>::changed();
    }

    if (const auto* done = std::get_if<JobDone>(&event)) {
        app.job_running = false;
        app.job_result = done->sum;
        app.status = "job finished";
        if (app.quit_pending) {
            return Control<DemoEvent>::quit();
        }
        return Control<DemoEvent>::changed();
    }

    if (const auto* closed = std::get_if<PanelClosed>(&event)) {
        app.closed.push_back(closed->title);
        app.status = "closed " + closed->title;
        return Control<DemoEvent>::changed();
    }

    if (std::holds_alternative<QuitEvent>(event)) {
        if (app.job_running) {
            WEFT_LOG_INFO("quit deferred until the job finishes");
            app.quit_pending = true;
            app.status = "waiting for job";
            return Control<DemoEvent>::changed();
        }
        return Control<DemoEvent>::quit();
    }

    if (std::holds_alternative<RenderedEvent>(event)) {
        return Control<DemoEvent>::continue_();
    }

    if (const auto* input = as_input(event)) {
        if (const KeyEvent* key = as_key(*input)) {
            if (key->is_char('j')) {
                return start_job(app, global);
            }
            if (key->is_char('q')) {
                return Control<DemoEvent>::quit();
            }
            app.status = "unbound key";
            return Control<DemoEvent>::changed();
        }
    }

    return Control<DemoEvent>::continue_();
}

weft_core::Result<Control<DemoEvent>> demo_error(weft_core::Error err, DemoApp& app, DemoGlobal&) {
    WEFT_LOG_ERROR("{}", weft_core::build_error_chain(err));
    app.status = "error: " + err.message();
    return Control<DemoEvent>::changed();
}

// =============================================================================
// Script
// =============================================================================

/// Feed scripted input until the loop goes away
void run_script(Sender<InputEvent> input) {
    const std::vector<InputEvent> script = {
        KeyEvent::press_char('j'),
        MouseEvent::down(MouseButton::Left, 4, 4),
        MouseEvent::moved(30, 6),
        KeyEvent::press_char('x'),
        KeyEvent::press_char('?'),
        KeyEvent::press_char('q'),
    };

    for (const auto& event : script) {
        std::this_thread::sleep_for(30ms);
        if (auto r = input.send(event); !r) {
            WEFT_LOG_DEBUG("script stopped: {}", r.error().message());
            return;
        }
    }
}

// =============================================================================
// Main
// =============================================================================

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>   Kernel settings (TOML)\n"
              << "  --stats <file>    Write run statistics as JSON\n"
              << "  --help, -h        Show this help message\n";
}

int main(int argc, char** argv) {
    std::optional<fs::path> config_path;
    std::optional<fs::path> stats_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--stats" && i + 1 < argc) {
            stats_path = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    weft_core::KernelSettings settings;
    if (config_path) {
        auto loaded = weft_core::load_settings(*config_path);
        if (!loaded) {
            std::cerr << weft_core::build_error_chain(loaded.error()) << "\n";
            return 1;
        }
        settings = std::move(loaded).value();
    }
    weft_core::configure_logging(settings.log_config());
    WEFT_LOG_INFO("weft_demo starting (workers: {})", settings.worker_count);

    auto terminal = std::make_shared<BufferTerminal>(weft_ui::Size{48, 12});
    auto input = std::make_unique<PollInput<DemoEvent>>();
    Sender<InputEvent> feed = input->sender();

    auto config = RunConfig<DemoEvent>::from_settings(terminal, settings)
        .poll(PollTimers<DemoEvent>())
        .poll(PollTasks<DemoEvent>(settings.worker_count))
        .poll(std::move(input))
        .poll(PollRendered<DemoEvent>())
        .poll(PollQuit<DemoEvent>());

    AppHooks<DemoEvent, DemoApp, DemoGlobal> hooks;
    hooks.init = demo_init;
    hooks.render = demo_render;
    hooks.event = demo_event;
    hooks.error = demo_error;

    DemoGlobal global;
    DemoApp app;

    RunStats stats;
    weft_core::Result<void> result = weft_core::Ok();
    {
        RunLoop<DemoEvent, DemoApp, DemoGlobal> loop(std::move(hooks), global, app, std::move(config));
        std::thread script(run_script, feed);
        result = loop.run();
        stats = loop.stats();
        script.join();
    }

    for (const auto& line : terminal->screen().lines()) {
        std::cout << line << "\n";
    }
    std::cout << "title: " << terminal->title() << "\n"
              << "closed windows: " << app.closed.size() << "\n";

    if (stats_path) {
        if (auto saved = stats.save(*stats_path); !saved) {
            WEFT_LOG_ERROR("{}", weft_core::build_error_chain(saved.error()));
        }
    }

    if (!result) {
        WEFT_LOG_ERROR("run failed: {}", weft_core::build_error_chain(result.error()));
        weft_core::shutdown_logging();
        return 1;
    }

    WEFT_LOG_INFO("weft_demo finished after {} ticks", stats.ticks);
    weft_core::shutdown_logging();
    return 0;
}
