#ifndef PENSIONCALC_ENGINE_HPP
#define PENSIONCALC_ENGINE_HPP

#include <map>
#include <string>
#include <vector>
#include "assumptions.hpp"
#include "eligibility.hpp"
#include "parameters.hpp"
#include "profile.hpp"
#include "reasoning.hpp"
#include "tax.hpp"
#include "wealth.hpp"

namespace pensioncalc {

/**
 * @brief All indicators of one (profile, earnings multiple) computation
 *
 * Produced fresh by every call and never mutated by the engine afterwards.
 * Rates use the individual wage, levels and wealth the average wage.
 */
struct PensionResult {
    std::string country;                  // ISO3
    Sex sex;
    std::string worker_type_id;

    double earnings_multiple;
    double individual_wage;
    double average_wage;
    double net_wage;

    double gross_benefit;
    double net_benefit;
    double gross_replacement_rate;        // gross_benefit / individual_wage
    double net_replacement_rate;          // net_benefit / individual_wage
    double gross_pension_level;           // gross_benefit / average_wage
    double net_pension_level;
    double gross_pension_wealth;          // PV(gross) / average_wage
    double net_pension_wealth;

    double annuity_factor;
    WealthMethod wealth_method;
    int retirement_age;

    std::map<std::string, double> component_breakdown;
    EligibilityOutcome eligibility;
    ReasoningTrace trace;
    std::vector<Issue> warnings;

    PensionResult();

    // True when a scheme failed with a ComputationError or ConfigurationError
    bool has_errors() const;
};

/**
 * @brief Computes pension entitlements for one country
 *
 * Pipeline per call, strictly ordered:
 *   Eligibility -> Dispatch -> Aggregate -> Tax -> Wealth -> assemble
 *
 * The engine keeps const references to its inputs, which must outlive it,
 * and holds no mutable state: concurrent calls are safe.
 *
 * Only configuration inconsistencies escape as ConfigurationError (broken
 * scheme references, an invalid tax schedule, every payable scheme
 * misconfigured). Scheme-local failures become a zero component plus an
 * Issue in PensionResult::warnings.
 */
class PensionEngine {
public:
    /**
     * @param params Country rules (validated for id references here)
     * @param assumptions Economic and career assumptions
     * @param average_wage Annual average wage, currency; must be positive
     * @param life_tables Mortality data source
     * @throws ConfigurationError on broken references or an invalid tax strategy
     * @throws std::invalid_argument on a non-positive average wage
     */
    PensionEngine(const CountryParameterSet& params,
                  const GlobalAssumptions& assumptions,
                  double average_wage,
                  const LifeTableProvider& life_tables);

    // Personal calculator: the earnings multiple is derived from the profile wage
    PensionResult compute(const PersonProfile& profile) const;

    // Grid point: the profile wage is replaced by `earnings_multiple` x AW.
    // Throws std::invalid_argument unless the multiple is in EARNINGS_MULTIPLES.
    PensionResult compute(const PersonProfile& profile, double earnings_multiple) const;

    // One result per EARNINGS_MULTIPLES entry, in order
    std::vector<PensionResult> run_all_multiples(const PersonProfile& profile) const;

    // Full-career profile at the first scheme's NRA (entry_age + career_length when undefined)
    PersonProfile standard_profile(Sex sex, const std::string& worker_type_id = "private_employee") const;

    const CountryParameterSet& params() const { return params_; }
    const GlobalAssumptions& assumptions() const { return assumptions_; }
    double average_wage() const { return average_wage_; }
    const LifeTableProvider& life_tables() const { return life_tables_; }
    const TaxConverter& tax() const { return tax_; }

private:
    const CountryParameterSet& params_;
    const GlobalAssumptions& assumptions_;
    double average_wage_;
    const LifeTableProvider& life_tables_;
    TaxConverter tax_;

    PensionResult run(const PersonProfile& profile, double earnings_multiple) const;
};

} // namespace pensioncalc

#endif // PENSIONCALC_ENGINE_HPP
