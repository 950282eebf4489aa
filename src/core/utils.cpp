#include "prism/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace prism::utils {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r";
constexpr std::string_view kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// 0xFF marks bytes outside the alphabet.
constexpr auto base64_reverse_table() -> std::array<uint8_t, 256> {
    std::array<uint8_t, 256> table{};
    table.fill(0xFF);
    for (size_t i = 0; i < kBase64Alphabet.size(); ++i) {
        table[static_cast<uint8_t>(kBase64Alphabet[i])] = static_cast<uint8_t>(i);
    }
    return table;
}

} // anonymous namespace

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars = "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> pick(0, chars.size() - 1);

    std::string id(length, '\0');
    std::ranges::generate(id, [&]() { return chars[pick(rng)]; });
    return id;
}

auto timestamp_iso() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

auto trim(std::string_view s) -> std::string {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(kWhitespace);
    return std::string(s.substr(first, last - first + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    while (!s.empty()) {
        auto cut = s.find(delim);
        parts.emplace_back(s.substr(0, cut));
        if (cut == std::string_view::npos) break;
        s.remove_prefix(cut + 1);
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string lowered;
    lowered.reserve(s.size());
    for (unsigned char c : s) {
        lowered += static_cast<char>(std::tolower(c));
    }
    return lowered;
}

auto base64_encode(std::string_view data) -> std::string {
    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);

    for (size_t i = 0; i < data.size(); i += 3) {
        auto remaining = std::min<size_t>(3, data.size() - i);
        uint32_t group = static_cast<uint8_t>(data[i]) << 16;
        if (remaining > 1) group |= static_cast<uint8_t>(data[i + 1]) << 8;
        if (remaining > 2) group |= static_cast<uint8_t>(data[i + 2]);

        encoded += kBase64Alphabet[(group >> 18) & 0x3F];
        encoded += kBase64Alphabet[(group >> 12) & 0x3F];
        encoded += remaining > 1 ? kBase64Alphabet[(group >> 6) & 0x3F] : '=';
        encoded += remaining > 2 ? kBase64Alphabet[group & 0x3F] : '=';
    }
    return encoded;
}

auto base64_decode(std::string_view data) -> std::string {
    static constexpr auto reverse = base64_reverse_table();

    std::string decoded;
    decoded.reserve(data.size() / 4 * 3);

    uint32_t accumulator = 0;
    int bits = 0;
    for (char c : data) {
        if (c == '=') break;
        auto value = reverse[static_cast<uint8_t>(c)];
        if (value == 0xFF) continue;   // line breaks from chunked payloads
        accumulator = (accumulator << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded += static_cast<char>((accumulator >> bits) & 0xFF);
        }
    }
    return decoded;
}

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace prism::utils
