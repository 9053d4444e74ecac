#ifndef PENSIONCALC_ELIGIBILITY_HPP
#define PENSIONCALC_ELIGIBILITY_HPP

#include <optional>
#include <string>
#include <vector>
#include "parameters.hpp"
#include "profile.hpp"
#include "reasoning.hpp"

namespace pensioncalc {

// Eligibility verdict for one referenced scheme
struct SchemeEligibility {
    std::string scheme_id;
    bool active;
    bool payable;
    std::string reason;
    double early_multiplier;                       // 1.0 unless claimed before NRA via ERA
    std::optional<double> normal_retirement_age;
    std::optional<double> minimum_service_years;

    SchemeEligibility();
};

struct EligibilityOutcome {
    std::string worker_type_id;
    bool worker_type_found;
    CoverageStatus coverage;
    bool eligible;                                 // at least one scheme payable

    // Referenced schemes in configured order, inactive and non-payable included
    std::vector<SchemeEligibility> schemes;

    // Headline thresholds: worker-type override, else first applicable scheme
    std::optional<double> normal_retirement_age;
    std::optional<double> early_retirement_age;
    std::optional<double> minimum_service_years;
    double years_to_nra;
    std::vector<std::string> missing;

    std::optional<ContributionRules> contribution_override;
    std::vector<Issue> issues;

    EligibilityOutcome();

    const SchemeEligibility* find(const std::string& scheme_id) const;
    bool is_payable(const std::string& scheme_id) const;
    size_t payable_count() const;
};

/**
 * @brief Decides which schemes apply to a profile and which are payable
 *
 * A referenced, active scheme is payable when the person has reached its
 * normal retirement age OR has completed its minimum service; either
 * threshold alone is sufficient, and a scheme defining neither is always
 * payable. Worker-type eligibility overrides replace scheme thresholds.
 *
 * An excluded worker type short-circuits: nothing is payable and no scheme
 * is listed. Unknown worker types fall back to every active scheme.
 */
class EligibilityResolver {
public:
    explicit EligibilityResolver(const CountryParameterSet& params);

    // Throws ConfigurationError for a broken inherit chain
    EligibilityOutcome resolve(const PersonProfile& profile, ReasoningTrace& trace) const;

private:
    const CountryParameterSet& params_;

    SchemeEligibility check_scheme(const SchemeComponent& scheme,
                                   const PersonProfile& profile,
                                   const std::optional<EligibilityOverride>& over) const;
};

} // namespace pensioncalc

#endif // PENSIONCALC_ELIGIBILITY_HPP
