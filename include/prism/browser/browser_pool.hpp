#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "prism/browser/browser.hpp"
#include "prism/core/config.hpp"
#include "prism/core/error.hpp"

namespace prism::browser {

/// One pooled browser process and its bookkeeping.
struct BrowserInstance {
    std::string id;
    std::unique_ptr<BrowserProcess> process;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used_at;
    bool in_use = false;
};

/// Snapshot of pool occupancy.
struct PoolStatistics {
    size_t total = 0;
    size_t in_use = 0;
    size_t available = 0;
    size_t launching = 0;
    size_t waiting = 0;
    size_t leases_granted = 0;
    size_t leases_returned = 0;
    bool shut_down = false;
    PoolConfig config;
};

auto to_json(const PoolStatistics& stats) -> nlohmann::json;

class BrowserLease;

/// Bounded pool of browser processes.
///
/// Between min_instances and max_instances processes are kept. A released
/// instance is handed directly to the longest-waiting acquirer, so waiters
/// are served in FIFO order. Idle or aged instances above the minimum are
/// evicted by a periodic sweep; instances in use are never evicted.
///
/// All methods are safe to call from coroutines running on any thread of
/// the io_context. No lock is held across a suspension point.
class BrowserPool {
public:
    BrowserPool(boost::asio::io_context& ioc, PoolConfig config,
                std::shared_ptr<BrowserLauncher> launcher);
    ~BrowserPool();

    BrowserPool(const BrowserPool&) = delete;
    BrowserPool& operator=(const BrowserPool&) = delete;

    /// Launches instances until min_instances exist. Launch failures are
    /// logged, not fatal. Returns how many instances were started.
    auto warm_up() -> awaitable<size_t>;

    /// Acquire with the configured acquire_timeout_ms (0 waits indefinitely).
    auto acquire() -> awaitable<Result<BrowserLease>>;

    /// Acquire an instance, waiting at most `wait_limit` (zero = no limit).
    /// Fails with PoolExhausted when the limit expires, PoolShutdown after
    /// shutdown() and LaunchFailure when a needed launch fails.
    auto acquire(std::chrono::milliseconds wait_limit) -> awaitable<Result<BrowserLease>>;

    /// Evicts idle or aged instances while more than min_instances exist.
    /// Dead free instances are always removed. Returns the number removed.
    auto evict_idle() -> awaitable<size_t>;

    /// Runs evict_idle() every sweep_interval_ms until stop_eviction() or
    /// shutdown(). Stopping is final: a later run_eviction() returns at once.
    auto run_eviction() -> awaitable<void>;
    void stop_eviction();

    /// Rejects pending and future acquirers and closes every instance,
    /// leased or not. Safe to call more than once.
    auto shutdown() -> awaitable<void>;

    [[nodiscard]] auto statistics() const -> PoolStatistics;
    [[nodiscard]] auto config() const -> const PoolConfig&;

private:
    friend class BrowserLease;
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

/// Exclusive use of one browser instance. Returns the instance to the pool
/// when released or destroyed; releasing twice is a no-op. A lease keeps the
/// pool's state alive, so it may outlive the BrowserPool object; once the
/// pool is shut down, releasing only updates the lease counters.
class BrowserLease {
public:
    BrowserLease() = default;
    ~BrowserLease();

    BrowserLease(BrowserLease&& other) noexcept;
    BrowserLease& operator=(BrowserLease&& other) noexcept;
    BrowserLease(const BrowserLease&) = delete;
    BrowserLease& operator=(const BrowserLease&) = delete;

    [[nodiscard]] auto browser() const -> BrowserProcess&;
    [[nodiscard]] auto id() const -> const std::string&;
    [[nodiscard]] auto valid() const -> bool { return instance_ != nullptr; }
    explicit operator bool() const { return valid(); }

    void release();

private:
    friend class BrowserPool;
    BrowserLease(std::shared_ptr<BrowserPool::Impl> pool,
                 std::shared_ptr<BrowserInstance> instance);

    std::shared_ptr<BrowserPool::Impl> pool_;
    std::shared_ptr<BrowserInstance> instance_;
};

} // namespace prism::browser
