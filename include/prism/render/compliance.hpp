#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace prism::render {

struct ComplianceInput {
    std::string action;     // e.g. "screenshot_generation"; empty lowers the score
    std::string markup;     // only the leading excerpt is inspected
};

struct ComplianceResult {
    bool compliant = true;
    double score = 1.0;     // clamped to [0, 1]
    std::vector<std::string> violations;
    std::vector<std::string> warnings;
};

/// Number of leading markup characters inspected for script injection.
inline constexpr size_t kComplianceExcerptLength = 100;

/// Pre-render policy check. Compliant iff there are no violations and the
/// score reaches `min_score`. Logs every decision.
auto check_compliance(const ComplianceInput& input, double min_score = 0.997)
    -> ComplianceResult;

/// Replaceable precondition run before a render takes a pool lease.
using ComplianceGate = std::function<ComplianceResult(const ComplianceInput&)>;

/// check_compliance() bound to `min_score`.
auto default_compliance_gate(double min_score) -> ComplianceGate;

/// Gate that admits everything with a perfect score.
auto permissive_compliance_gate() -> ComplianceGate;

} // namespace prism::render
