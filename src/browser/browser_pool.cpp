#include "prism/browser/browser_pool.hpp"
#include "prism/core/logger.hpp"
#include "prism/core/utils.hpp"

#include <boost/asio.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace prism::browser {

namespace net = boost::asio;
using Clock = std::chrono::steady_clock;

namespace {

/// What a waiting acquirer is woken with. An instance means direct handoff,
/// an error ends the wait, neither means capacity was freed and the waiter
/// should scan again.
struct WaitOutcome {
    std::shared_ptr<BrowserInstance> instance;
    std::optional<Error> error;
};

using WaiterChannel = net::experimental::concurrent_channel<void(
    boost::system::error_code, WaitOutcome)>;

struct Waiter {
    WaiterChannel channel;

    explicit Waiter(net::io_context& ioc) : channel(ioc, 1) {}

    void notify(WaitOutcome outcome) {
        channel.try_send(boost::system::error_code{}, std::move(outcome));
    }
};

// Collected under the pool mutex, delivered after it is released.
using Notifications = std::vector<std::pair<std::shared_ptr<Waiter>, WaitOutcome>>;

void deliver(Notifications& notes) {
    for (auto& [waiter, outcome] : notes) {
        waiter->notify(std::move(outcome));
    }
    notes.clear();
}

auto launch_error(const Error& error) -> Error {
    if (error.code() == ErrorCode::LaunchFailure) return error;
    return make_error(ErrorCode::LaunchFailure, "Browser launch failed", error.what());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BrowserPool::Impl
// ---------------------------------------------------------------------------

struct BrowserPool::Impl {
    net::io_context& ioc;
    PoolConfig config;
    std::shared_ptr<BrowserLauncher> launcher;

    mutable std::mutex mutex;
    std::vector<std::shared_ptr<BrowserInstance>> instances;
    std::deque<std::shared_ptr<Waiter>> waiters;
    size_t launching = 0;
    size_t leases_granted = 0;
    size_t leases_returned = 0;
    bool shut_down = false;

    // The sweep loop and its cancellation are serialized on this strand.
    net::strand<net::io_context::executor_type> sweep_strand;
    net::steady_timer sweep_timer;
    std::atomic<bool> sweep_stopping{false};

    Impl(net::io_context& ctx, PoolConfig cfg, std::shared_ptr<BrowserLauncher> l)
        : ioc(ctx),
          config(std::move(cfg)),
          launcher(std::move(l)),
          sweep_strand(net::make_strand(ctx)),
          sweep_timer(sweep_strand) {}

    /// Wakes up to `count` waiters to rescan for a freed slot. Mutex held.
    void wake_for_capacity(size_t count, Notifications& notes) {
        while (count-- > 0 && !waiters.empty()) {
            notes.emplace_back(std::move(waiters.front()), WaitOutcome{});
            waiters.pop_front();
        }
    }

    /// Hands a free instance to the oldest waiter, or marks it free. Mutex held.
    void offer(const std::shared_ptr<BrowserInstance>& inst, Notifications& notes) {
        if (waiters.empty()) {
            inst->in_use = false;
            return;
        }
        inst->in_use = true;
        inst->last_used_at = Clock::now();
        ++leases_granted;
        notes.emplace_back(std::move(waiters.front()), WaitOutcome{inst, std::nullopt});
        waiters.pop_front();
    }

    /// Records a freshly launched process. Mutex held.
    auto adopt(std::unique_ptr<BrowserProcess> process) -> std::shared_ptr<BrowserInstance> {
        auto inst = std::make_shared<BrowserInstance>();
        inst->id = utils::generate_id(12);
        inst->process = std::move(process);
        inst->created_at = Clock::now();
        inst->last_used_at = inst->created_at;
        instances.push_back(inst);
        return inst;
    }

    void expire_waiter(const std::shared_ptr<Waiter>& waiter, std::chrono::milliseconds limit) {
        bool queued = false;
        {
            std::lock_guard lock(mutex);
            auto it = std::find(waiters.begin(), waiters.end(), waiter);
            if (it != waiters.end()) {
                waiters.erase(it);
                queued = true;
            }
        }
        // A waiter already dequeued has been (or is being) signalled by someone else.
        if (queued) {
            LOG_WARN("Gave up waiting for a browser after {}ms", limit.count());
            waiter->notify(WaitOutcome{nullptr, make_error(ErrorCode::PoolExhausted,
                "Browser pool exhausted",
                "no instance freed within " + std::to_string(limit.count()) + "ms")});
        }
    }

    /// Returns a released instance to the pool after its pages were cleaned.
    void return_instance(const std::shared_ptr<BrowserInstance>& inst) {
        Notifications notes;
        std::shared_ptr<BrowserInstance> dead;
        {
            std::lock_guard lock(mutex);
            ++leases_returned;
            auto it = std::find(instances.begin(), instances.end(), inst);
            if (it == instances.end()) return;   // taken by shutdown()

            inst->last_used_at = Clock::now();
            if (!inst->process->is_alive()) {
                instances.erase(it);
                dead = inst;
                wake_for_capacity(1, notes);
            } else {
                offer(inst, notes);
            }
        }
        deliver(notes);

        if (dead) {
            LOG_WARN("Released browser {} is no longer alive, removing it", dead->id);
            net::co_spawn(ioc, close_instances({dead}, "dead"), net::detached);
        } else {
            LOG_DEBUG("Released browser instance: {}", inst->id);
        }
    }

    /// Takes back a lease. Cleanup runs as a detached task and the instance
    /// stays reserved until it finishes. After shutdown there is nothing to
    /// return the instance to, so only the counter moves.
    static void release(const std::shared_ptr<Impl>& self,
                        std::shared_ptr<BrowserInstance> instance) {
        {
            std::lock_guard lock(self->mutex);
            if (self->shut_down) {
                ++self->leases_returned;
                return;
            }
        }

        net::co_spawn(self->ioc,
            [self, instance = std::move(instance)]() -> awaitable<void> {
                // Leak prevention: pages a failed render left behind.
                if (instance->process->is_alive()) {
                    try {
                        auto closed = co_await instance->process->close_stray_pages();
                        if (!closed) {
                            LOG_WARN("Page cleanup on {} failed: {}",
                                     instance->id, closed.error().what());
                        } else if (*closed > 0) {
                            LOG_DEBUG("Closed {} leftover page(s) on {}", *closed, instance->id);
                        }
                    } catch (const std::exception& e) {
                        LOG_WARN("Page cleanup on {} threw: {}", instance->id, e.what());
                    }
                }
                self->return_instance(instance);
            },
            net::detached);
    }

    static auto launch_process(std::shared_ptr<Impl> self)
        -> awaitable<Result<std::unique_ptr<BrowserProcess>>> {
        try {
            auto process = co_await self->launcher->launch();
            if (!process) co_return make_fail(launch_error(process.error()));
            co_return std::move(*process);
        } catch (const std::exception& e) {
            co_return make_fail(make_error(ErrorCode::LaunchFailure,
                "Browser launch threw", e.what()));
        }
    }

    static auto close_instances(std::vector<std::shared_ptr<BrowserInstance>> victims,
                                std::string reason) -> awaitable<void> {
        for (auto& victim : victims) {
            try {
                co_await victim->process->close();
                LOG_INFO("Closed browser instance {} ({})", victim->id, reason);
            } catch (const std::exception& e) {
                LOG_WARN("Error closing browser instance {}: {}", victim->id, e.what());
            }
        }
    }
};

// ---------------------------------------------------------------------------
// PoolStatistics
// ---------------------------------------------------------------------------

auto to_json(const PoolStatistics& stats) -> nlohmann::json {
    return {
        {"total", stats.total},
        {"in_use", stats.in_use},
        {"available", stats.available},
        {"launching", stats.launching},
        {"waiting", stats.waiting},
        {"leases_granted", stats.leases_granted},
        {"leases_returned", stats.leases_returned},
        {"shut_down", stats.shut_down},
        {"config", stats.config},
    };
}

// ---------------------------------------------------------------------------
// BrowserLease
// ---------------------------------------------------------------------------

BrowserLease::BrowserLease(std::shared_ptr<BrowserPool::Impl> pool,
                           std::shared_ptr<BrowserInstance> instance)
    : pool_(std::move(pool)), instance_(std::move(instance)) {}

BrowserLease::~BrowserLease() {
    release();
}

BrowserLease::BrowserLease(BrowserLease&& other) noexcept
    : pool_(std::move(other.pool_)),
      instance_(std::move(other.instance_)) {}

BrowserLease& BrowserLease::operator=(BrowserLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::move(other.pool_);
        instance_ = std::move(other.instance_);
    }
    return *this;
}

auto BrowserLease::browser() const -> BrowserProcess& {
    return *instance_->process;
}

auto BrowserLease::id() const -> const std::string& {
    return instance_->id;
}

void BrowserLease::release() {
    if (!instance_ || !pool_) return;
    auto pool = std::move(pool_);
    auto instance = std::move(instance_);
    pool_.reset();
    instance_.reset();
    BrowserPool::Impl::release(pool, std::move(instance));
}

// ---------------------------------------------------------------------------
// BrowserPool
// ---------------------------------------------------------------------------

BrowserPool::BrowserPool(boost::asio::io_context& ioc, PoolConfig config,
                         std::shared_ptr<BrowserLauncher> launcher)
    : impl_(std::make_shared<Impl>(ioc, std::move(config), std::move(launcher))) {
    LOG_INFO("BrowserPool created (min={}, max={})",
             impl_->config.min_instances, impl_->config.max_instances);
}

BrowserPool::~BrowserPool() {
    if (!impl_) return;
    stop_eviction();

    Notifications notes;
    size_t remaining = 0;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->shut_down = true;
        for (auto& waiter : impl_->waiters) {
            notes.emplace_back(waiter, WaitOutcome{nullptr,
                make_error(ErrorCode::PoolShutdown, "Browser pool destroyed")});
        }
        impl_->waiters.clear();
        remaining = impl_->instances.size();
    }
    deliver(notes);

    // Remaining processes are killed by their own destructors with Impl.
    if (remaining > 0) {
        LOG_WARN("BrowserPool destroyed without shutdown(), {} instance(s) left", remaining);
    }
}

auto BrowserPool::config() const -> const PoolConfig& {
    return impl_->config;
}

auto BrowserPool::warm_up() -> awaitable<size_t> {
    auto impl = impl_;
    size_t started = 0;

    for (size_t attempt = 0; attempt < impl->config.min_instances; ++attempt) {
        {
            std::lock_guard lock(impl->mutex);
            if (impl->shut_down ||
                impl->instances.size() + impl->launching >= impl->config.min_instances) {
                break;
            }
            ++impl->launching;
        }

        auto process = co_await Impl::launch_process(impl);

        Notifications notes;
        bool pool_closed = false;
        std::shared_ptr<BrowserInstance> inst;
        {
            std::lock_guard lock(impl->mutex);
            --impl->launching;
            if (!process) {
                impl->wake_for_capacity(1, notes);
            } else if (impl->shut_down) {
                pool_closed = true;
            } else {
                inst = impl->adopt(std::move(*process));
                impl->offer(inst, notes);
            }
        }
        deliver(notes);

        if (!process) {
            LOG_ERROR("Warm-up launch failed: {}", process.error().what());
            continue;
        }
        if (pool_closed) {
            co_await (*process)->close();
            break;
        }
        ++started;
        LOG_INFO("Warmed up browser instance {}", inst->id);
    }

    co_return started;
}

auto BrowserPool::acquire() -> awaitable<Result<BrowserLease>> {
    co_return co_await acquire(std::chrono::milliseconds(impl_->config.acquire_timeout_ms));
}

auto BrowserPool::acquire(std::chrono::milliseconds wait_limit)
    -> awaitable<Result<BrowserLease>> {
    auto impl = impl_;
    auto started = Clock::now();
    bool reported_wait = false;
    // Set once this acquirer was woken to rescan; if it loses the freed slot
    // it goes back to the head of the queue.
    bool rescanning = false;

    while (true) {
        std::shared_ptr<BrowserInstance> picked;
        std::vector<std::shared_ptr<BrowserInstance>> dead;
        std::shared_ptr<Waiter> waiter;
        bool launch = false;
        bool pool_closed = false;
        size_t in_use = 0;
        {
            std::lock_guard lock(impl->mutex);
            if (impl->shut_down) {
                pool_closed = true;
            } else {
                auto& instances = impl->instances;
                for (auto it = instances.begin(); it != instances.end();) {
                    const auto& inst = *it;
                    if (inst->in_use) {
                        ++it;
                        continue;
                    }
                    if (!inst->process->is_alive()) {
                        dead.push_back(inst);
                        it = instances.erase(it);
                        continue;
                    }
                    picked = inst;
                    break;
                }

                if (picked) {
                    picked->in_use = true;
                    picked->last_used_at = Clock::now();
                    ++impl->leases_granted;
                } else if (instances.size() + impl->launching < impl->config.max_instances) {
                    ++impl->launching;
                    launch = true;
                } else {
                    waiter = std::make_shared<Waiter>(impl->ioc);
                    if (rescanning) {
                        impl->waiters.push_front(waiter);
                    } else {
                        impl->waiters.push_back(waiter);
                    }
                    in_use = instances.size();
                }
            }
        }

        if (!dead.empty()) {
            LOG_WARN("Removing {} disconnected browser instance(s)", dead.size());
            net::co_spawn(impl->ioc, Impl::close_instances(std::move(dead), "dead"), net::detached);
        }

        if (pool_closed) {
            co_return make_fail(make_error(ErrorCode::PoolShutdown, "Browser pool is shut down"));
        }

        if (picked) {
            LOG_DEBUG("Reusing browser instance: {}", picked->id);
            co_return BrowserLease(impl, std::move(picked));
        }

        if (launch) {
            auto process = co_await Impl::launch_process(impl);

            Notifications notes;
            std::shared_ptr<BrowserInstance> inst;
            size_t total = 0;
            {
                std::lock_guard lock(impl->mutex);
                --impl->launching;
                if (!process) {
                    impl->wake_for_capacity(1, notes);
                } else if (!impl->shut_down) {
                    inst = impl->adopt(std::move(*process));
                    inst->in_use = true;
                    ++impl->leases_granted;
                    total = impl->instances.size();
                }
            }
            deliver(notes);

            if (!process) {
                LOG_ERROR("Failed to launch browser: {}", process.error().what());
                co_return make_fail(process.error());
            }
            if (!inst) {
                co_await (*process)->close();
                co_return make_fail(make_error(ErrorCode::PoolShutdown,
                    "Browser pool shut down during launch"));
            }
            LOG_INFO("Launched browser instance {} ({}/{})",
                     inst->id, total, impl->config.max_instances);
            co_return BrowserLease(impl, std::move(inst));
        }

        if (!reported_wait) {
            LOG_WARN("Browser pool exhausted ({} in use), waiting for a release", in_use);
            reported_wait = true;
        }

        std::shared_ptr<net::steady_timer> timer;
        if (wait_limit.count() > 0) {
            auto left = wait_limit - std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::now() - started);
            timer = std::make_shared<net::steady_timer>(
                co_await net::this_coro::executor,
                std::max(left, std::chrono::milliseconds(0)));
            timer->async_wait(
                [impl, weak = std::weak_ptr<Waiter>(waiter), wait_limit](
                    boost::system::error_code ec) {
                    if (ec) return;
                    if (auto w = weak.lock()) {
                        impl->expire_waiter(w, wait_limit);
                    }
                });
        }

        auto outcome = co_await waiter->channel.async_receive(net::use_awaitable);
        if (timer) timer->cancel();

        if (outcome.error) {
            co_return make_fail(std::move(*outcome.error));
        }
        if (outcome.instance) {
            LOG_DEBUG("Browser instance {} handed to waiting acquirer", outcome.instance->id);
            co_return BrowserLease(impl, std::move(outcome.instance));
        }
        // A slot was freed; scan again.
        rescanning = true;
    }
}

auto BrowserPool::evict_idle() -> awaitable<size_t> {
    auto impl = impl_;
    std::vector<std::shared_ptr<BrowserInstance>> victims;
    Notifications notes;
    bool below_min = false;
    {
        std::lock_guard lock(impl->mutex);
        if (!impl->shut_down) {
            auto& instances = impl->instances;
            const auto& cfg = impl->config;
            auto now = Clock::now();
            auto idle_timeout = std::chrono::milliseconds(cfg.idle_timeout_ms);
            auto max_age = std::chrono::milliseconds(cfg.max_age_ms);

            // Dead free instances are useless whatever the minimum.
            for (auto it = instances.begin(); it != instances.end();) {
                if (!(*it)->in_use && !(*it)->process->is_alive()) {
                    victims.push_back(*it);
                    it = instances.erase(it);
                } else {
                    ++it;
                }
            }

            // Newest first; the oldest min_instances stay.
            for (size_t i = instances.size(); i-- > 0 && instances.size() > cfg.min_instances;) {
                const auto& inst = instances[i];
                if (inst->in_use) continue;
                if (now - inst->last_used_at > idle_timeout ||
                    now - inst->created_at > max_age) {
                    victims.push_back(inst);
                    instances.erase(instances.begin() + static_cast<std::ptrdiff_t>(i));
                }
            }

            impl->wake_for_capacity(victims.size(), notes);
            below_min = instances.size() + impl->launching < cfg.min_instances;
        }
    }
    deliver(notes);

    if (!victims.empty()) {
        LOG_INFO("Evicting {} browser instance(s)", victims.size());
    }
    auto count = victims.size();
    co_await Impl::close_instances(std::move(victims), "evicted");

    if (below_min) {
        co_await warm_up();
    }
    co_return count;
}

auto BrowserPool::run_eviction() -> awaitable<void> {
    auto impl = impl_;
    {
        std::lock_guard lock(impl->mutex);
        if (impl->shut_down || impl->sweep_stopping) co_return;
    }
    LOG_DEBUG("Eviction sweep started (interval={}ms)", impl->config.sweep_interval_ms);

    co_await net::co_spawn(impl->sweep_strand,
        [this, impl]() -> awaitable<void> {
            auto interval = std::chrono::milliseconds(impl->config.sweep_interval_ms);
            while (!impl->sweep_stopping) {
                impl->sweep_timer.expires_after(interval);
                auto [ec] = co_await impl->sweep_timer.async_wait(
                    net::as_tuple(net::use_awaitable));
                if (ec || impl->sweep_stopping) break;

                try {
                    auto evicted = co_await evict_idle();
                    LOG_TRACE("Eviction sweep removed {} instance(s)", evicted);
                } catch (const std::exception& e) {
                    LOG_ERROR("Eviction sweep failed: {}", e.what());
                }
            }
        },
        net::use_awaitable);

    LOG_DEBUG("Eviction sweep stopped");
}

void BrowserPool::stop_eviction() {
    auto impl = impl_;
    impl->sweep_stopping = true;
    net::post(impl->sweep_strand, [impl]() { impl->sweep_timer.cancel(); });
}

auto BrowserPool::shutdown() -> awaitable<void> {
    auto impl = impl_;
    std::vector<std::shared_ptr<BrowserInstance>> victims;
    Notifications notes;
    bool first = false;
    {
        std::lock_guard lock(impl->mutex);
        first = !impl->shut_down;
        impl->shut_down = true;
        victims.swap(impl->instances);
        for (auto& waiter : impl->waiters) {
            notes.emplace_back(waiter, WaitOutcome{nullptr,
                make_error(ErrorCode::PoolShutdown, "Browser pool is shutting down")});
        }
        impl->waiters.clear();
    }

    stop_eviction();
    deliver(notes);

    if (first) {
        LOG_INFO("Shutting down browser pool ({} instance(s))", victims.size());
    }
    co_await Impl::close_instances(std::move(victims), "shutdown");
}

auto BrowserPool::statistics() const -> PoolStatistics {
    std::lock_guard lock(impl_->mutex);
    PoolStatistics stats;
    stats.total = impl_->instances.size();
    stats.in_use = static_cast<size_t>(std::count_if(
        impl_->instances.begin(), impl_->instances.end(),
        [](const auto& inst) { return inst->in_use; }));
    stats.available = stats.total - stats.in_use;
    stats.launching = impl_->launching;
    stats.waiting = impl_->waiters.size();
    stats.leases_granted = impl_->leases_granted;
    stats.leases_returned = impl_->leases_returned;
    stats.shut_down = impl_->shut_down;
    stats.config = impl_->config;
    return stats;
}

} // namespace prism::browser
