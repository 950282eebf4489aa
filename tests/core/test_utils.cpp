#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

#include "prism/core/utils.hpp"

TEST_CASE("generate_id produces expected length", "[utils]") {
    SECTION("default length") {
        auto id = prism::utils::generate_id();
        REQUIRE(id.size() == 16);
    }

    SECTION("custom length") {
        auto id = prism::utils::generate_id(32);
        REQUIRE(id.size() == 32);
    }

    SECTION("contains only lowercase alphanumeric characters") {
        auto id = prism::utils::generate_id(100);
        for (char c : id) {
            bool valid = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
            CHECK(valid);
        }
    }

    SECTION("successive calls produce different IDs") {
        auto a = prism::utils::generate_id(16);
        auto b = prism::utils::generate_id(16);
        CHECK(a != b);
    }
}

TEST_CASE("trim removes whitespace", "[utils]") {
    CHECK(prism::utils::trim("  hello  ") == "hello");
    CHECK(prism::utils::trim("\t\nhello\r\n") == "hello");
    CHECK(prism::utils::trim("") == "");
    CHECK(prism::utils::trim("   \t\n  ") == "");
    CHECK(prism::utils::trim("  hello world  ") == "hello world");
}

TEST_CASE("split divides string by delimiter", "[utils]") {
    SECTION("basic split on comma") {
        auto parts = prism::utils::split("a,b,c", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == "a");
        CHECK(parts[1] == "b");
        CHECK(parts[2] == "c");
    }

    SECTION("empty fields in the middle are kept") {
        auto parts = prism::utils::split("a,,b", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[1].empty());
    }

    SECTION("no delimiter") {
        auto parts = prism::utils::split("abc", ',');
        REQUIRE(parts.size() == 1);
        CHECK(parts[0] == "abc");
    }

    SECTION("empty input") {
        CHECK(prism::utils::split("", ',').empty());
    }
}

TEST_CASE("to_lower converts ASCII letters", "[utils]") {
    CHECK(prism::utils::to_lower("A4") == "a4");
    CHECK(prism::utils::to_lower("LeTTer") == "letter");
    CHECK(prism::utils::to_lower("123-_") == "123-_");
}

TEST_CASE("base64 encoding", "[utils]") {
    SECTION("known vectors") {
        CHECK(prism::utils::base64_encode("") == "");
        CHECK(prism::utils::base64_encode("f") == "Zg==");
        CHECK(prism::utils::base64_encode("fo") == "Zm8=");
        CHECK(prism::utils::base64_encode("foo") == "Zm9v");
        CHECK(prism::utils::base64_encode("foobar") == "Zm9vYmFy");
    }

    SECTION("binary PNG signature survives decoding") {
        std::string signature("\x89PNG\r\n\x1a\n", 8);
        auto encoded = prism::utils::base64_encode(signature);
        CHECK(encoded == "iVBORw0KGgo=");
        CHECK(prism::utils::base64_decode(encoded) == signature);
    }

    SECTION("decode ignores line breaks") {
        CHECK(prism::utils::base64_decode("Zm9v\nYmFy") == "foobar");
    }
}

TEST_CASE("timestamp helpers", "[utils]") {
    SECTION("timestamp_iso is UTC with milliseconds") {
        auto ts = prism::utils::timestamp_iso();
        REQUIRE(ts.size() == 24);
        CHECK(ts[4] == '-');
        CHECK(ts[10] == 'T');
        CHECK(ts[19] == '.');
        CHECK(ts.back() == 'Z');
    }

    SECTION("elapsed_ms measures steady time") {
        auto start = std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        CHECK(prism::utils::elapsed_ms(start) >= 20);
    }
}
