#include "reasoning.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace pensioncalc {

std::string issue_kind_to_string(IssueKind kind) {
    switch (kind) {
        case IssueKind::EligibilityWarning: return "EligibilityWarning";
        case IssueKind::ComputationWarning: return "ComputationWarning";
        case IssueKind::ComputationError: return "ComputationError";
        case IssueKind::ConfigurationError: return "ConfigurationError";
        default: return "Unknown";
    }
}

Issue::Issue() : kind(IssueKind::ComputationWarning) {}

Issue::Issue(IssueKind k, const std::string& scheme, const std::string& msg)
    : kind(k), scheme_id(scheme), message(msg) {}

bool Issue::operator==(const Issue& other) const {
    return kind == other.kind && scheme_id == other.scheme_id && message == other.message;
}

std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::Wage: return "wage";
        case Stage::Eligibility: return "eligibility";
        case Stage::Dispatch: return "dispatch";
        case Stage::Aggregate: return "aggregate";
        case Stage::Tax: return "tax";
        case Stage::Wealth: return "wealth";
        default: return "unknown";
    }
}

ReasoningStep::ReasoningStep() : stage(Stage::Wage) {}

ReasoningStep::ReasoningStep(Stage s, const std::string& lbl, const std::string& fml,
                             const std::string& val, const std::string& scheme,
                             const std::string& cite)
    : stage(s), label(lbl), formula(fml), value(val), scheme_id(scheme), citation(cite) {}

void ReasoningTrace::append(const ReasoningStep& step) {
    steps_.push_back(step);
}

void ReasoningTrace::append(Stage stage, const std::string& label, const std::string& formula,
                            const std::string& value, const std::string& scheme_id,
                            const std::string& citation) {
    steps_.emplace_back(stage, label, formula, value, scheme_id, citation);
}

std::vector<ReasoningStep> ReasoningTrace::steps_for(Stage stage) const {
    std::vector<ReasoningStep> out;
    for (const auto& step : steps_) {
        if (step.stage == stage) {
            out.push_back(step);
        }
    }
    return out;
}

std::string format_amount(double amount) {
    if (!std::isfinite(amount)) {
        return std::to_string(amount);
    }
    // llround is unspecified past the long long range
    if (std::fabs(amount) >= 9.0e18) {
        return format_number(amount, 0);
    }
    const bool negative = amount < 0.0;
    const long long whole = std::llround(std::fabs(amount));
    std::string digits = std::to_string(whole);

    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }
    return negative ? "-" + grouped : grouped;
}

std::string format_number(double value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

} // namespace pensioncalc
