#pragma once

#include <cstddef>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "prism/render/rendering_service.hpp"
#include "prism/render/types.hpp"

namespace prism::render {

/// Fans a batch of render requests out over the pool in chunks of at most
/// `concurrency` simultaneous renders. Results keep submission order and a
/// failing item never aborts the rest.
class BatchCoordinator {
public:
    BatchCoordinator(RenderingService& service, size_t concurrency);

    auto render_batch(std::vector<RenderRequest> requests)
        -> awaitable<std::vector<RenderResult>>;

    [[nodiscard]] auto concurrency() const -> size_t { return concurrency_; }

private:
    RenderingService& service_;
    size_t concurrency_;
};

} // namespace prism::render
