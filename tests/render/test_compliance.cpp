#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <string>

#include "prism/render/compliance.hpp"

using namespace prism::render;
using Catch::Matchers::WithinAbs;

TEST_CASE("clean markup with an action is compliant", "[render][compliance]") {
    auto result = check_compliance({"screenshot_generation", "<h1>Quarterly report</h1>"});
    CHECK(result.compliant);
    CHECK(result.score == 1.0);
    CHECK(result.violations.empty());
    CHECK(result.warnings.empty());
}

TEST_CASE("missing action lowers the score below the default threshold", "[render][compliance]") {
    auto result = check_compliance({"", "<p>hello</p>"});
    CHECK_THAT(result.score, WithinAbs(0.999, 1e-9));
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.violations.empty());
    // 0.999 still clears 0.997.
    CHECK(result.compliant);

    auto strict = check_compliance({"", "<p>hello</p>"}, 0.9995);
    CHECK_FALSE(strict.compliant);
}

TEST_CASE("script injection in the excerpt is a violation", "[render][compliance]") {
    for (const std::string markup : {
             "<div><SCRIPT>alert(1)</SCRIPT></div>",
             "<a href=\"javascript:void(0)\">x</a>",
             "<img src=x onerror = \"steal()\">",
             "<iframe src=\"https://example.com\"></iframe>",
         }) {
        auto result = check_compliance({"pdf_generation", markup});
        CHECK_FALSE(result.compliant);
        REQUIRE(result.violations.size() == 1);
        CHECK(result.violations[0] == "Potential script injection detected");
        CHECK_THAT(result.score, WithinAbs(0.9, 1e-9));
    }
}

TEST_CASE("only one injection penalty is applied", "[render][compliance]") {
    auto result = check_compliance({"screenshot_generation",
                                    "<script></script><iframe></iframe>"});
    CHECK(result.violations.size() == 1);
    CHECK_THAT(result.score, WithinAbs(0.9, 1e-9));
}

TEST_CASE("markup past the excerpt is not inspected", "[render][compliance]") {
    std::string markup(kComplianceExcerptLength, ' ');
    markup += "<script>alert(1)</script>";
    auto result = check_compliance({"screenshot_generation", markup});
    CHECK(result.compliant);
    CHECK(result.violations.empty());
}

TEST_CASE("compliance gates", "[render][compliance]") {
    SECTION("default gate applies the threshold") {
        auto gate = default_compliance_gate(0.9995);
        CHECK_FALSE(gate({"", "<p>ok</p>"}).compliant);
        CHECK(gate({"screenshot_generation", "<p>ok</p>"}).compliant);
    }

    SECTION("permissive gate admits scripts") {
        auto gate = permissive_compliance_gate();
        auto result = gate({"", "<script>1</script>"});
        CHECK(result.compliant);
        CHECK(result.score == 1.0);
    }
}
