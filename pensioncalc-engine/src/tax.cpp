#include "tax.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace pensioncalc {

FlatRateTax::FlatRateTax() : simplified_net_rate(0.0) {}

FlatRateTax::FlatRateTax(double rate) : simplified_net_rate(rate) {}

BracketTax::BracketTax()
    : basic_allowance(0.0),
      social_contribution_rate(0.0) {}

// ============================================================================
// TaxConverter Implementation
// ============================================================================

TaxConverter::TaxConverter(const TaxStrategy& strategy, double average_wage)
    : strategy_(strategy), allowance_(0.0) {
    if (auto* flat = std::get_if<FlatRateTax>(&strategy_)) {
        const double rate = flat->simplified_net_rate;
        if (!std::isfinite(rate)) {
            throw ConfigurationError("simplified_net_rate must be a finite number");
        }
        if (rate < 0.0 || rate > 1.0) {
            const double clamped = std::clamp(rate, 0.0, 1.0);
            warnings_.emplace_back(IssueKind::ComputationWarning, "",
                "simplified_net_rate=" + format_number(rate) + " is outside [0, 1]; clamped to " +
                format_number(clamped));
            flat->simplified_net_rate = clamped;
        }
        return;
    }

    auto& brackets = std::get<BracketTax>(strategy_);
    std::sort(brackets.brackets.begin(), brackets.brackets.end(),
              [](const TaxBracket& a, const TaxBracket& b) {
                  return a.upper_threshold < b.upper_threshold;
              });
    validate_brackets(brackets);

    allowance_ = brackets.basic_allowance_aw_multiple
        ? *brackets.basic_allowance_aw_multiple * average_wage
        : brackets.basic_allowance;
    if (!std::isfinite(allowance_) || allowance_ < 0.0) {
        throw ConfigurationError("Tax basic allowance must be a non-negative amount");
    }
}

void TaxConverter::validate_brackets(const BracketTax& tax) const {
    const double sc = tax.social_contribution_rate;
    if (!(sc >= 0.0 && sc <= 1.0)) {
        throw ConfigurationError("social_contribution_rate must lie in [0, 1]");
    }

    double previous = 0.0;
    double max_rate = 0.0;
    for (const auto& bracket : tax.brackets) {
        if (!(bracket.marginal_rate >= 0.0 && bracket.marginal_rate <= 1.0)) {
            throw ConfigurationError("Tax bracket marginal rate must lie in [0, 1]");
        }
        if (!(bracket.upper_threshold > previous)) {
            throw ConfigurationError("Tax bracket thresholds must be positive and strictly increasing");
        }
        previous = bracket.upper_threshold;
        max_rate = std::max(max_rate, bracket.marginal_rate);
    }

    // A combined marginal rate above 100% would make net fall as gross rises
    if (sc + max_rate > 1.0 + 1e-12) {
        throw ConfigurationError("social_contribution_rate plus top marginal rate exceeds 1");
    }
}

double TaxConverter::income_tax(double gross) const {
    const auto* tax = std::get_if<BracketTax>(&strategy_);
    if (tax == nullptr || gross <= 0.0) {
        return 0.0;
    }

    const double taxable = std::max(0.0, gross - allowance_);
    double owed = 0.0;
    double lower = 0.0;
    for (const auto& bracket : tax->brackets) {
        if (taxable <= lower) {
            break;
        }
        const double band = std::min(taxable, bracket.upper_threshold) - lower;
        owed += band * bracket.marginal_rate;
        lower = bracket.upper_threshold;
    }
    return owed;
}

double TaxConverter::net(double gross) const {
    if (gross <= 0.0) {
        return gross;
    }
    if (const auto* flat = std::get_if<FlatRateTax>(&strategy_)) {
        return gross * (1.0 - flat->simplified_net_rate);
    }
    const auto& tax = std::get<BracketTax>(strategy_);
    const double social = gross * tax.social_contribution_rate;
    return gross - income_tax(gross) - social;
}

double TaxConverter::effective_rate(double gross) const {
    if (gross <= 0.0) {
        if (const auto* flat = std::get_if<FlatRateTax>(&strategy_)) {
            return flat->simplified_net_rate;
        }
        return std::get<BracketTax>(strategy_).social_contribution_rate;
    }
    return 1.0 - net(gross) / gross;
}

std::string TaxConverter::describe() const {
    std::ostringstream oss;
    if (const auto* flat = std::get_if<FlatRateTax>(&strategy_)) {
        oss << "gross x (1 - " << format_number(flat->simplified_net_rate) << ")";
        return oss.str();
    }
    const auto& tax = std::get<BracketTax>(strategy_);
    oss << "gross - income tax(" << tax.brackets.size() << " brackets, allowance "
        << format_amount(allowance_) << ") - " << format_number(tax.social_contribution_rate)
        << " x gross";
    return oss.str();
}

} // namespace pensioncalc
