#pragma once

#include <chrono>
#include <istream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "prism/browser/browser_pool.hpp"

namespace prism::render {

enum class HealthStatus {
    Healthy,
    Degraded,     // saturated with callers waiting for a browser
    Unhealthy,    // pool shut down
};

auto health_status_to_string(HealthStatus status) -> std::string_view;

struct MemoryUsage {
    double rss_mb = 0.0;
    double peak_rss_mb = 0.0;
};

struct HealthReport {
    HealthStatus status = HealthStatus::Healthy;
    double uptime_seconds = 0.0;
    browser::PoolStatistics pool;
    MemoryUsage memory;
    std::string timestamp;
};

auto to_json(const HealthReport& report) -> nlohmann::json;

auto derive_health_status(const browser::PoolStatistics& stats) -> HealthStatus;

/// Reads VmRSS / VmHWM from a /proc/<pid>/status style stream.
auto parse_proc_status(std::istream& in) -> MemoryUsage;

/// Memory of the current process; zeros where /proc is unavailable.
auto read_memory_usage() -> MemoryUsage;

/// Read-only view over the pool for the health endpoint.
class HealthReporter {
public:
    explicit HealthReporter(const browser::BrowserPool& pool);

    [[nodiscard]] auto report() const -> HealthReport;

private:
    const browser::BrowserPool& pool_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace prism::render
