#pragma once

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "prism/browser/browser.hpp"
#include "prism/core/config.hpp"

namespace prism::browser {

/// Locates a Chrome/Chromium binary: the configured path first, then
/// well-known install locations, then PATH. Empty when nothing is found.
auto find_chrome(const BrowserConfig& config) -> std::string;

/// Command-line flags for a pooled headless browser.
auto chrome_arguments(const BrowserConfig& config,
                      const std::filesystem::path& user_data_dir)
    -> std::vector<std::string>;

/// Page targets from a Target.getTargets `targetInfos` array that were
/// opened by us (`opened`) and are still alive. The browser's initial tab is
/// never in `opened`, so it survives cleanup.
auto stray_page_targets(const nlohmann::json& target_infos,
                        const std::set<std::string>& opened)
    -> std::vector<std::string>;

/// Starts local Chrome processes with a DevTools endpoint on an ephemeral
/// port and connects a CdpClient to each.
class ChromeLauncher : public BrowserLauncher {
public:
    ChromeLauncher(boost::asio::io_context& ioc, BrowserConfig config);
    ~ChromeLauncher() override;

    auto launch() -> awaitable<Result<std::unique_ptr<BrowserProcess>>> override;

    [[nodiscard]] auto config() const -> const BrowserConfig&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace prism::browser
