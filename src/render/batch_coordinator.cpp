#include "prism/render/batch_coordinator.hpp"
#include "prism/core/logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <memory>

namespace prism::render {

namespace net = boost::asio;

namespace {

using ResultChannel = net::experimental::concurrent_channel<void(
    boost::system::error_code, size_t, RenderResult)>;

} // anonymous namespace

BatchCoordinator::BatchCoordinator(RenderingService& service, size_t concurrency)
    : service_(service), concurrency_(std::max<size_t>(concurrency, 1)) {}

auto BatchCoordinator::render_batch(std::vector<RenderRequest> requests)
    -> awaitable<std::vector<RenderResult>> {
    std::vector<RenderResult> results(requests.size());
    if (requests.empty()) co_return results;

    auto executor = co_await net::this_coro::executor;
    LOG_INFO("Batch of {} render(s), concurrency {}", requests.size(), concurrency_);

    for (size_t begin = 0; begin < requests.size(); begin += concurrency_) {
        auto end = std::min(begin + concurrency_, requests.size());
        auto channel = std::make_shared<ResultChannel>(executor, end - begin);

        for (size_t i = begin; i < end; ++i) {
            net::co_spawn(executor,
                [this, channel, i, request = std::move(requests[i])]() -> awaitable<void> {
                    RenderResult result;
                    try {
                        result = co_await service_.render(request);
                    } catch (const std::exception& e) {
                        result = RenderResult::failure(ErrorCode::InternalError,
                            "Batch item failed", {e.what()});
                    }
                    channel->try_send(boost::system::error_code{}, i, std::move(result));
                },
                net::detached);
        }

        // Every spawned item sends exactly once, so the chunk always drains.
        for (size_t received = begin; received < end; ++received) {
            auto [index, result] = co_await channel->async_receive(net::use_awaitable);
            results[index] = std::move(result);
        }
    }

    auto failed = std::count_if(results.begin(), results.end(),
                                [](const RenderResult& r) { return !r.success; });
    if (failed > 0) {
        LOG_WARN("Batch finished with {} of {} failed", failed, results.size());
    }
    co_return results;
}

} // namespace prism::render
