/// @file run_stats.cpp
/// @brief JSON output of run statistics

#include <weft/kernel/run_stats.hpp>
#include <weft/core/log.hpp>

#include <nlohmann/json.hpp>

#include <fstream>

namespace weft_kernel {

namespace {

nlohmann::json stats_to_json(const RunStats& s) {
    nlohmann::json j;
    j["ticks"] = s.ticks;
    j["polls"] = s.polls;
    j["reads"] = s.reads;
    j["events"] = s.events;
    j["renders"] = s.renders;
    j["errors"] = s.errors;
    j["quit_vetoes"] = s.quit_vetoes;

    nlohmann::json timing;
    timing["render_total_us"] = s.render_time.count();
    timing["render_max_us"] = s.max_render.count();
    timing["event_total_us"] = s.event_time.count();
    timing["event_max_us"] = s.max_event.count();
    timing["render_avg_us"] = s.renders > 0
        ? s.render_time.count() / static_cast<std::int64_t>(s.renders) : 0;
    timing["event_avg_us"] = s.events > 0
        ? s.event_time.count() / static_cast<std::int64_t>(s.events) : 0;
    j["timing"] = std::move(timing);
    return j;
}

} // anonymous namespace

std::string RunStats::to_json_string(int indent) const {
    return stats_to_json(*this).dump(indent);
}

weft_core::Result<void> RunStats::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return weft_core::Err(weft_core::Error(weft_core::ErrorCode::IOError,
                                               "Cannot open stats file: " + path));
    }
    file << to_json_string(2);
    if (!file) {
        return weft_core::Err(weft_core::Error(weft_core::ErrorCode::IOError,
                                               "Failed to write stats file: " + path));
    }
    weft_core::kernel_logger()->debug("Run statistics written to {}", path);
    return weft_core::Ok();
}

} // namespace weft_kernel
