#include "prism/render/health.hpp"
#include "prism/core/utils.hpp"

#include <fstream>
#include <sstream>

namespace prism::render {

auto health_status_to_string(HealthStatus status) -> std::string_view {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unhealthy";
}

auto to_json(const HealthReport& report) -> nlohmann::json {
    return {
        {"status", std::string(health_status_to_string(report.status))},
        {"uptime", report.uptime_seconds},
        {"browserPool", browser::to_json(report.pool)},
        {"memoryUsage", {
            {"rssMb", report.memory.rss_mb},
            {"peakRssMb", report.memory.peak_rss_mb},
        }},
        {"timestamp", report.timestamp},
    };
}

auto derive_health_status(const browser::PoolStatistics& stats) -> HealthStatus {
    if (stats.shut_down) return HealthStatus::Unhealthy;
    if (stats.waiting > 0 && stats.available == 0) return HealthStatus::Degraded;
    return HealthStatus::Healthy;
}

auto parse_proc_status(std::istream& in) -> MemoryUsage {
    MemoryUsage usage;
    std::string line;
    while (std::getline(in, line)) {
        // Lines look like "VmRSS:     12345 kB".
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        auto key = line.substr(0, colon);
        if (key != "VmRSS" && key != "VmHWM") continue;

        std::istringstream value(line.substr(colon + 1));
        double kilobytes = 0.0;
        if (!(value >> kilobytes)) continue;

        auto megabytes = kilobytes / 1024.0;
        if (key == "VmRSS") {
            usage.rss_mb = megabytes;
        } else {
            usage.peak_rss_mb = megabytes;
        }
    }
    return usage;
}

auto read_memory_usage() -> MemoryUsage {
    std::ifstream status("/proc/self/status");
    if (!status.is_open()) return {};
    return parse_proc_status(status);
}

HealthReporter::HealthReporter(const browser::BrowserPool& pool)
    : pool_(pool), started_(std::chrono::steady_clock::now()) {}

auto HealthReporter::report() const -> HealthReport {
    HealthReport report;
    report.pool = pool_.statistics();
    report.status = derive_health_status(report.pool);
    report.uptime_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_).count();
    report.memory = read_memory_usage();
    report.timestamp = utils::timestamp_iso();
    return report;
}

} // namespace prism::render
