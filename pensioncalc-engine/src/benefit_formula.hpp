#ifndef PENSIONCALC_BENEFIT_FORMULA_HPP
#define PENSIONCALC_BENEFIT_FORMULA_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "assumptions.hpp"
#include "parameters.hpp"
#include "reasoning.hpp"

namespace pensioncalc {

// ============================================================================
// Formula Parameters
// ============================================================================

// Scheme-level minimum/maximum applied to earnings-related components
struct BenefitBounds {
    std::optional<double> minimum_aw_multiple;
    std::optional<double> minimum_absolute;
    std::optional<double> maximum_aw_multiple;
    std::optional<double> maximum_absolute;

    BenefitBounds();
    explicit BenefitBounds(const BenefitRules& rules);

    bool empty() const;
};

struct DbFormula {
    double accrual_rate;
    std::optional<double> max_accrual_years;
    ReferenceWage reference_wage;
    std::optional<double> ceiling_aw_multiple;
    BenefitBounds bounds;

    DbFormula();
};

struct NdcFormula {
    double contribution_rate;            // 0 when the scheme defines none
    NotionalIndex index;
    double fixed_rate;                   // used when index == Fixed
    std::optional<double> annuity_divisor;
    BenefitBounds bounds;

    NdcFormula();
};

struct DcFormula {
    double contribution_rate;
    std::optional<double> annuity_divisor;
    BenefitBounds bounds;

    DcFormula();
};

struct PointsFormula {
    double points_per_year;
    std::optional<double> point_value;              // currency
    std::optional<double> point_value_aw_multiple;  // x AW
    BenefitBounds bounds;

    PointsFormula();
};

struct BasicFormula {
    std::optional<double> amount_aw_multiple;       // indexed to AW
    std::optional<double> amount_absolute;

    BasicFormula();
};

struct TargetedFormula {
    std::optional<double> max_benefit_aw_multiple;
    std::optional<double> max_benefit_absolute;
    double taper_rate;
    double income_threshold;

    TargetedFormula();
};

// Floor level only; the top-up is decided by the aggregator
struct MinimumFormula {
    std::optional<double> floor_aw_multiple;
    std::optional<double> floor_absolute;

    MinimumFormula();
};

// Closed set of scheme kinds; every visitor must handle all seven
using SchemeFormula = std::variant<DbFormula, NdcFormula, DcFormula, PointsFormula,
                                   BasicFormula, TargetedFormula, MinimumFormula>;

/**
 * @brief Build the typed formula of a scheme from its rules
 *
 * @param scheme Scheme configuration
 * @param contribution_override Worker-type contribution rules, merged over the scheme's
 * @throws ConfigurationError if a field the scheme's type requires is missing or invalid
 */
SchemeFormula make_formula(const SchemeComponent& scheme,
                           const std::optional<ContributionRules>& contribution_override = std::nullopt);

// ============================================================================
// Evaluation
// ============================================================================

// Inputs shared by every formula of one computation
struct FormulaContext {
    double wage;                 // individual wage, currency
    double average_wage;
    double years;                // credited years
    double life_expectancy;      // remaining years at retirement, for fallback divisors
    const GlobalAssumptions& assumptions;
    std::optional<double> dc_balance;
    std::optional<double> notional_balance;

    explicit FormulaContext(const GlobalAssumptions& asmp);
};

// Future value of one unit contributed yearly for `years` at `rate`
double accumulation_factor(double rate, double years);

// Present value of one unit paid yearly for `years` at `rate`
double annuity_certain(double rate, double years);

/**
 * @brief Evaluate one scheme's gross annual component
 *
 * Steps are appended to `trace`; clamps and fallbacks are added to `issues`.
 * Throws ComputationError for a local arithmetic failure (unusable annuity
 * divisor, zero average wage, non-finite result) and ConfigurationError for
 * a missing input; the caller scopes both to this scheme.
 */
double evaluate_formula(const SchemeFormula& formula,
                        const FormulaContext& ctx,
                        const std::string& scheme_id,
                        ReasoningTrace& trace,
                        std::vector<Issue>& issues);

} // namespace pensioncalc

#endif // PENSIONCALC_BENEFIT_FORMULA_HPP
