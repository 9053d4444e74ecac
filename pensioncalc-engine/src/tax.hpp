#ifndef PENSIONCALC_TAX_HPP
#define PENSIONCALC_TAX_HPP

#include <limits>
#include <optional>
#include <variant>
#include <vector>
#include "reasoning.hpp"

namespace pensioncalc {

// Flat effective rate applied identically to benefit and wage
struct FlatRateTax {
    double simplified_net_rate;   // combined tax + contribution rate, 0-1

    FlatRateTax();
    explicit FlatRateTax(double rate);
};

struct TaxBracket {
    double upper_threshold;       // +infinity for the top bracket
    double marginal_rate;

    TaxBracket(double upper, double rate) : upper_threshold(upper), marginal_rate(rate) {}
};

// Progressive schedule: social contribution on gross, then marginal income
// tax on gross minus the basic allowance.
struct BracketTax {
    std::vector<TaxBracket> brackets;                  // ordered by upper_threshold
    double basic_allowance;                            // absolute amount
    std::optional<double> basic_allowance_aw_multiple; // takes precedence when set
    double social_contribution_rate;

    BracketTax();

    static constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();
};

// Tax strategy selected per country configuration
using TaxStrategy = std::variant<FlatRateTax, BracketTax>;

/**
 * @brief Converts gross amounts to net under one country's TaxStrategy
 *
 * Construction validates the strategy so that, for every gross >= 0,
 * net <= gross and net is non-decreasing in gross:
 *   - flat rates outside [0,1] are clamped and reported via warnings()
 *   - bracket or contribution rates outside [0,1], unordered thresholds,
 *     or a combined marginal rate above 1 throw ConfigurationError
 */
class TaxConverter {
public:
    TaxConverter(const TaxStrategy& strategy, double average_wage);

    double net(double gross) const;
    double net_benefit(double gross_benefit) const { return net(gross_benefit); }
    double net_wage(double gross_wage) const { return net(gross_wage); }

    // Income tax only (bracket strategy); 0 for flat-rate
    double income_tax(double gross) const;

    double effective_rate(double gross) const;

    bool is_flat_rate() const { return std::holds_alternative<FlatRateTax>(strategy_); }
    std::string describe() const;

    const std::vector<Issue>& warnings() const { return warnings_; }

private:
    TaxStrategy strategy_;
    double allowance_;
    std::vector<Issue> warnings_;

    void validate_brackets(const BracketTax& brackets) const;
};

} // namespace pensioncalc

#endif // PENSIONCALC_TAX_HPP
