#include "prism/render/compliance.hpp"
#include "prism/core/logger.hpp"

#include <algorithm>
#include <regex>

#include <nlohmann/json.hpp>

namespace prism::render {

namespace {

constexpr double kMissingActionPenalty = 0.001;
constexpr double kInjectionPenalty = 0.1;

auto injection_patterns() -> const std::vector<std::regex>& {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(<script)", std::regex::icase),
        std::regex(R"(javascript:)", std::regex::icase),
        std::regex(R"(on\w+\s*=)", std::regex::icase),
        std::regex(R"(<iframe)", std::regex::icase),
    };
    return patterns;
}

void log_decision(std::string_view action, const ComplianceResult& result) {
    auto entry = nlohmann::json{
        {"action", std::string(action)},
        {"compliant", result.compliant},
        {"score", result.score},
        {"violations", result.violations},
        {"warnings", result.warnings},
    }.dump();

    if (!result.compliant || !result.violations.empty()) {
        LOG_ERROR("Compliance violation: {}", entry);
    } else if (!result.warnings.empty()) {
        LOG_WARN("Compliance warning: {}", entry);
    } else {
        LOG_DEBUG("Compliance check passed: {}", entry);
    }
}

} // anonymous namespace

auto check_compliance(const ComplianceInput& input, double min_score) -> ComplianceResult {
    ComplianceResult result;
    double score = 1.0;

    if (input.action.empty()) {
        result.warnings.emplace_back("Action not specified - transparency reduced");
        score -= kMissingActionPenalty;
    }

    auto excerpt = std::string_view(input.markup).substr(
        0, std::min(input.markup.size(), kComplianceExcerptLength));
    for (const auto& pattern : injection_patterns()) {
        if (std::regex_search(excerpt.begin(), excerpt.end(), pattern)) {
            result.violations.emplace_back("Potential script injection detected");
            score -= kInjectionPenalty;
            break;
        }
    }

    result.compliant = result.violations.empty() && score >= min_score;
    result.score = std::clamp(score, 0.0, 1.0);

    log_decision(input.action.empty() ? "unspecified" : input.action, result);
    return result;
}

auto default_compliance_gate(double min_score) -> ComplianceGate {
    return [min_score](const ComplianceInput& input) {
        return check_compliance(input, min_score);
    };
}

auto permissive_compliance_gate() -> ComplianceGate {
    return [](const ComplianceInput&) { return ComplianceResult{}; };
}

} // namespace prism::render
