#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace prism::utils {

/// Random lowercase alphanumeric id, used for browser instances and profiles.
auto generate_id(std::size_t length = 16) -> std::string;

/// Current UTC time as 2026-01-31T12:00:00.000Z.
auto timestamp_iso() -> std::string;

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;

/// Standard alphabet with padding. Decoding skips bytes outside the alphabet
/// and stops at the first '='.
auto base64_encode(std::string_view data) -> std::string;
auto base64_decode(std::string_view data) -> std::string;

/// Milliseconds elapsed since `start` on the steady clock.
auto elapsed_ms(std::chrono::steady_clock::time_point start) -> int64_t;

} // namespace prism::utils
