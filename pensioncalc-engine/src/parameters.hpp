#ifndef PENSIONCALC_PARAMETERS_HPP
#define PENSIONCALC_PARAMETERS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "profile.hpp"
#include "tax.hpp"

namespace pensioncalc {

// ============================================================================
// Enumerations
// ============================================================================

enum class SchemeType : uint8_t {
    DB = 0,         // defined-benefit accrual
    NDC = 1,        // notional defined contribution
    DC = 2,         // funded defined contribution
    Points = 3,     // points / notional units
    Basic = 4,      // universal flat rate
    Targeted = 5,   // means-tested, tapered
    Minimum = 6     // minimum-pension guarantee, applied as a floor
};

std::string scheme_type_to_string(SchemeType type);

// Throws ConfigurationError on an unrecognised type name
SchemeType parse_scheme_type(const std::string& value);

enum class SchemeTier : uint8_t {
    Zero = 0,
    First = 1,
    Second = 2,
    Third = 3,
    Fourth = 4
};

std::string scheme_tier_to_string(SchemeTier tier);
SchemeTier parse_scheme_tier(const std::string& value);

enum class CoverageStatus : uint8_t {
    Covered = 0,
    Excluded = 1,
    Partial = 2,
    Unknown = 3
};

std::string coverage_status_to_string(CoverageStatus status);

// "mandatory" is read as covered and "voluntary" as partial
CoverageStatus parse_coverage_status(const std::string& value);

enum class ReformStatus : uint8_t {
    Current = 0,
    Legislated = 1,
    Proposed = 2,
    Closed = 3
};

std::string reform_status_to_string(ReformStatus status);
ReformStatus parse_reform_status(const std::string& value);

// Wage base of a DB formula. All three are evaluated on the resolved
// individual wage (flat real wage profile, wage valorisation).
enum class ReferenceWage : uint8_t {
    CareerAverage = 0,
    FinalSalary = 1,
    BestYears = 2
};

std::string reference_wage_to_string(ReferenceWage kind);
ReferenceWage parse_reference_wage(const std::string& value);

// Rate credited to a notional account
enum class NotionalIndex : uint8_t {
    Wages = 0,      // real wage growth + inflation
    Prices = 1,     // inflation
    Fixed = 2       // BenefitRules::notional_interest_fixed_rate
};

std::string notional_index_to_string(NotionalIndex index);
NotionalIndex parse_notional_index(const std::string& value);

// ============================================================================
// Scheme Rules
// ============================================================================

struct EligibilityRules {
    std::optional<double> normal_retirement_age_male;
    std::optional<double> normal_retirement_age_female;
    std::optional<double> early_retirement_age_male;
    std::optional<double> early_retirement_age_female;
    std::optional<double> minimum_service_years;
    double early_reduction_per_month;            // fraction of benefit lost per month before NRA

    EligibilityRules();

    std::optional<double> normal_retirement_age(Sex sex) const;
    std::optional<double> early_retirement_age(Sex sex) const;
};

struct ContributionRules {
    std::optional<double> employee_rate;
    std::optional<double> employer_rate;
    std::optional<double> total_rate;
    std::optional<double> ceiling_aw_multiple;

    ContributionRules();

    // total_rate if given, else employee + employer (missing parts count as 0)
    double combined_rate() const;
    bool has_rate() const;

    // Fields set in `over` replace the ones here
    ContributionRules merged_with(const ContributionRules& over) const;
};

struct BenefitRules {
    // DB
    std::optional<double> accrual_rate;
    std::optional<double> max_accrual_years;
    ReferenceWage reference_wage;

    // Points
    std::optional<double> point_value;              // currency per point
    std::optional<double> point_value_aw_multiple;  // x AW per point
    std::optional<double> points_per_year;

    // NDC / DC
    NotionalIndex notional_interest;
    std::optional<double> notional_interest_fixed_rate;
    std::optional<double> annuity_divisor_at_nra;

    // Basic: an AW multiple is indexed to the average wage, an absolute amount is not
    std::optional<double> flat_rate_aw_multiple;
    std::optional<double> flat_rate_absolute;

    // Targeted
    std::optional<double> taper_rate;
    std::optional<double> income_threshold;

    // Constraints (also the floor level of a minimum scheme)
    std::optional<double> minimum_benefit_aw_multiple;
    std::optional<double> minimum_benefit_absolute;
    std::optional<double> maximum_benefit_aw_multiple;
    std::optional<double> maximum_benefit_absolute;

    BenefitRules();
};

struct SchemeComponent {
    std::string id;
    std::string name;
    SchemeTier tier;
    SchemeType type;
    bool active;
    ReformStatus reform_status;
    EligibilityRules eligibility;
    ContributionRules contributions;
    BenefitRules benefits;

    // Parameter name (e.g. "accrual_rate") -> source citation
    std::map<std::string, std::string> citations;

    SchemeComponent();
    SchemeComponent(const std::string& scheme_id, SchemeType scheme_type);

    // Citation of the parameter that governs this scheme type's formula,
    // else the first cited parameter; empty when nothing is cited
    std::string primary_citation() const;
};

// ============================================================================
// Worker Types
// ============================================================================

// Worker-type level replacement of scheme eligibility thresholds
struct EligibilityOverride {
    std::optional<double> normal_retirement_age_male;
    std::optional<double> normal_retirement_age_female;
    std::optional<double> early_retirement_age_male;
    std::optional<double> early_retirement_age_female;
    std::optional<double> minimum_service_years;

    EligibilityOverride();

    std::optional<double> normal_retirement_age(Sex sex) const;
    std::optional<double> early_retirement_age(Sex sex) const;
};

struct WorkerTypeRule {
    std::string label;
    CoverageStatus coverage;
    std::vector<std::string> scheme_ids;             // empty = every active scheme
    std::optional<EligibilityOverride> eligibility_override;
    std::optional<ContributionRules> contribution_override;
    std::optional<std::string> inherit;              // parent worker-type id
    std::string notes;

    WorkerTypeRule();
};

// ============================================================================
// Country
// ============================================================================

struct CountryPayoutRules {
    std::optional<double> maximum_benefit_aw_multiple;   // country-wide cap on the total

    CountryPayoutRules();
};

struct CountryMetadata {
    std::string country_name;
    std::string iso3;
    std::string currency_code;
    int reference_year;

    CountryMetadata();
};

/**
 * @brief One country's complete pension rules
 *
 * Owned by the caller and read-only for the engine. Schemes keep their
 * configured order, which is also the order of dispatch and tracing.
 */
struct CountryParameterSet {
    CountryMetadata metadata;
    std::vector<SchemeComponent> schemes;
    std::map<std::string, WorkerTypeRule> worker_types;
    TaxStrategy tax;
    CountryPayoutRules payout;

    CountryParameterSet();

    // nullptr when no scheme has this id
    const SchemeComponent* find_scheme(const std::string& scheme_id) const;

    bool has_worker_type(const std::string& worker_type_id) const;

    /**
     * @brief Flatten the inherit chain of a worker type
     *
     * The parent is resolved first and the child's own fields override it;
     * scheme ids and overrides are replaced, not merged, when the child sets
     * them. Throws ConfigurationError for an unknown id or an inherit cycle.
     */
    WorkerTypeRule resolve_worker_type(const std::string& worker_type_id) const;

    /**
     * @brief Check id-reference integrity
     *
     * Throws ConfigurationError on duplicate scheme ids, a worker type
     * referencing a missing scheme, an unknown inherit target or a cycle.
     */
    void validate_references() const;
};

} // namespace pensioncalc

#endif // PENSIONCALC_PARAMETERS_HPP
