#include "parameters.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace pensioncalc {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::optional<double> pick(const std::optional<double>& over, const std::optional<double>& base) {
    return over ? over : base;
}

} // anonymous namespace

// ============================================================================
// Enumerations
// ============================================================================

std::string scheme_type_to_string(SchemeType type) {
    switch (type) {
        case SchemeType::DB: return "DB";
        case SchemeType::NDC: return "NDC";
        case SchemeType::DC: return "DC";
        case SchemeType::Points: return "points";
        case SchemeType::Basic: return "basic";
        case SchemeType::Targeted: return "targeted";
        case SchemeType::Minimum: return "minimum";
        default: return "unknown";
    }
}

SchemeType parse_scheme_type(const std::string& value) {
    const std::string v = to_lower(value);
    if (v == "db") return SchemeType::DB;
    if (v == "ndc") return SchemeType::NDC;
    if (v == "dc") return SchemeType::DC;
    if (v == "points") return SchemeType::Points;
    if (v == "basic") return SchemeType::Basic;
    if (v == "targeted") return SchemeType::Targeted;
    if (v == "minimum") return SchemeType::Minimum;
    throw ConfigurationError("Unsupported scheme type: " + value);
}

std::string scheme_tier_to_string(SchemeTier tier) {
    switch (tier) {
        case SchemeTier::Zero: return "zero";
        case SchemeTier::First: return "first";
        case SchemeTier::Second: return "second";
        case SchemeTier::Third: return "third";
        case SchemeTier::Fourth: return "fourth";
        default: return "unknown";
    }
}

SchemeTier parse_scheme_tier(const std::string& value) {
    const std::string v = to_lower(value);
    if (v == "zero") return SchemeTier::Zero;
    if (v == "first") return SchemeTier::First;
    if (v == "second") return SchemeTier::Second;
    if (v == "third") return SchemeTier::Third;
    if (v == "fourth") return SchemeTier::Fourth;
    throw ConfigurationError("Unknown scheme tier: " + value);
}

std::string coverage_status_to_string(CoverageStatus status) {
    switch (status) {
        case CoverageStatus::Covered: return "covered";
        case CoverageStatus::Excluded: return "excluded";
        case CoverageStatus::Partial: return "partial";
        case CoverageStatus::Unknown: return "unknown";
        default: return "unknown";
    }
}

CoverageStatus parse_coverage_status(const std::string& value) {
    const std::string v = to_lower(value);
    if (v == "covered" || v == "mandatory") return CoverageStatus::Covered;
    if (v == "excluded") return CoverageStatus::Excluded;
    if (v == "partial" || v == "voluntary") return CoverageStatus::Partial;
    if (v == "unknown") return CoverageStatus::Unknown;
    throw ConfigurationError("Unknown coverage status: " + value);
}

std::string reform_status_to_string(ReformStatus status) {
    switch (status) {
        case ReformStatus::Current: return "current";
        case ReformStatus::Legislated: return "legislated";
        case ReformStatus::Proposed: return "proposed";
        case ReformStatus::Closed: return "closed";
        default: return "unknown";
    }
}

ReformStatus parse_reform_status(const std::string& value) {
    const std::string v = to_lower(value);
    if (v == "current") return ReformStatus::Current;
    if (v == "legislated") return ReformStatus::Legislated;
    if (v == "proposed") return ReformStatus::Proposed;
    if (v == "closed") return ReformStatus::Closed;
    throw ConfigurationError("Unknown reform status: " + value);
}

std::string reference_wage_to_string(ReferenceWage kind) {
    switch (kind) {
        case ReferenceWage::CareerAverage: return "career_average";
        case ReferenceWage::FinalSalary: return "final_salary";
        case ReferenceWage::BestYears: return "best_years";
        default: return "unknown";
    }
}

ReferenceWage parse_reference_wage(const std::string& value) {
    const std::string v = to_lower(value);
    if (v.find("career") != std::string::npos) return ReferenceWage::CareerAverage;
    if (v.find("final") != std::string::npos) return ReferenceWage::FinalSalary;
    if (v.find("best") != std::string::npos) return ReferenceWage::BestYears;
    throw ConfigurationError("Unknown reference wage: " + value);
}

std::string notional_index_to_string(NotionalIndex index) {
    switch (index) {
        case NotionalIndex::Wages: return "wages";
        case NotionalIndex::Prices: return "prices";
        case NotionalIndex::Fixed: return "fixed";
        default: return "unknown";
    }
}

NotionalIndex parse_notional_index(const std::string& value) {
    const std::string v = to_lower(value);
    if (v == "wages" || v == "wage") return NotionalIndex::Wages;
    if (v == "prices" || v == "cpi") return NotionalIndex::Prices;
    if (v == "fixed") return NotionalIndex::Fixed;
    throw ConfigurationError("Unknown notional interest index: " + value);
}

// ============================================================================
// Scheme Rules
// ============================================================================

EligibilityRules::EligibilityRules() : early_reduction_per_month(0.005) {}

std::optional<double> EligibilityRules::normal_retirement_age(Sex sex) const {
    return sex == Sex::Female ? normal_retirement_age_female : normal_retirement_age_male;
}

std::optional<double> EligibilityRules::early_retirement_age(Sex sex) const {
    return sex == Sex::Female ? early_retirement_age_female : early_retirement_age_male;
}

ContributionRules::ContributionRules() = default;

double ContributionRules::combined_rate() const {
    if (total_rate) {
        return *total_rate;
    }
    return employee_rate.value_or(0.0) + employer_rate.value_or(0.0);
}

bool ContributionRules::has_rate() const {
    return total_rate.has_value() || employee_rate.has_value() || employer_rate.has_value();
}

ContributionRules ContributionRules::merged_with(const ContributionRules& over) const {
    ContributionRules merged;
    merged.employee_rate = pick(over.employee_rate, employee_rate);
    merged.employer_rate = pick(over.employer_rate, employer_rate);
    merged.total_rate = pick(over.total_rate, total_rate);
    merged.ceiling_aw_multiple = pick(over.ceiling_aw_multiple, ceiling_aw_multiple);

    // A rate split given by the override supersedes a base total
    if (!over.total_rate && (over.employee_rate || over.employer_rate)) {
        merged.total_rate.reset();
    }
    return merged;
}

BenefitRules::BenefitRules()
    : reference_wage(ReferenceWage::CareerAverage),
      notional_interest(NotionalIndex::Wages) {}

SchemeComponent::SchemeComponent()
    : tier(SchemeTier::First),
      type(SchemeType::DB),
      active(true),
      reform_status(ReformStatus::Current) {}

SchemeComponent::SchemeComponent(const std::string& scheme_id, SchemeType scheme_type)
    : id(scheme_id),
      name(scheme_id),
      tier(SchemeTier::First),
      type(scheme_type),
      active(true),
      reform_status(ReformStatus::Current) {}

std::string SchemeComponent::primary_citation() const {
    std::vector<std::string> keys;
    switch (type) {
        case SchemeType::DB: keys = {"accrual_rate", "max_accrual_years"}; break;
        case SchemeType::NDC: keys = {"annuity_divisor_at_nra", "total_rate", "notional_interest_fixed_rate"}; break;
        case SchemeType::DC: keys = {"total_rate", "employee_rate", "employer_rate"}; break;
        case SchemeType::Points: keys = {"point_value", "point_value_aw_multiple", "points_per_year"}; break;
        case SchemeType::Basic: keys = {"flat_rate_aw_multiple", "flat_rate_absolute"}; break;
        case SchemeType::Targeted: keys = {"maximum_benefit_absolute", "taper_rate", "income_threshold"}; break;
        case SchemeType::Minimum: keys = {"minimum_benefit_aw_multiple", "minimum_benefit_absolute"}; break;
    }
    for (const auto& key : keys) {
        auto it = citations.find(key);
        if (it != citations.end()) {
            return it->second;
        }
    }
    return citations.empty() ? std::string() : citations.begin()->second;
}

// ============================================================================
// Worker Types
// ============================================================================

EligibilityOverride::EligibilityOverride() = default;

std::optional<double> EligibilityOverride::normal_retirement_age(Sex sex) const {
    return sex == Sex::Female ? normal_retirement_age_female : normal_retirement_age_male;
}

std::optional<double> EligibilityOverride::early_retirement_age(Sex sex) const {
    return sex == Sex::Female ? early_retirement_age_female : early_retirement_age_male;
}

WorkerTypeRule::WorkerTypeRule() : coverage(CoverageStatus::Covered) {}

// ============================================================================
// Country
// ============================================================================

CountryPayoutRules::CountryPayoutRules() = default;

CountryMetadata::CountryMetadata() : reference_year(0) {}

CountryParameterSet::CountryParameterSet() : tax(FlatRateTax()) {}

const SchemeComponent* CountryParameterSet::find_scheme(const std::string& scheme_id) const {
    for (const auto& scheme : schemes) {
        if (scheme.id == scheme_id) {
            return &scheme;
        }
    }
    return nullptr;
}

bool CountryParameterSet::has_worker_type(const std::string& worker_type_id) const {
    return worker_types.find(worker_type_id) != worker_types.end();
}

WorkerTypeRule CountryParameterSet::resolve_worker_type(const std::string& worker_type_id) const {
    // Walk to the root of the chain, child first
    std::vector<const WorkerTypeRule*> chain;
    std::set<std::string> visited;
    std::string current = worker_type_id;
    std::string child_id;
    while (true) {
        auto it = worker_types.find(current);
        if (it == worker_types.end()) {
            if (chain.empty()) {
                throw ConfigurationError("Unknown worker type: " + worker_type_id);
            }
            throw ConfigurationError("Worker type '" + child_id +
                                     "' inherits from unknown worker type '" + current + "'");
        }
        if (!visited.insert(current).second) {
            throw ConfigurationError("Inheritance cycle through worker type '" + current + "'");
        }
        chain.push_back(&it->second);
        if (!it->second.inherit) {
            break;
        }
        child_id = current;
        current = *it->second.inherit;
    }

    // Apply root first so each child overrides its parent
    WorkerTypeRule resolved = *chain.back();
    for (auto rit = chain.rbegin() + 1; rit != chain.rend(); ++rit) {
        const WorkerTypeRule& child = **rit;
        if (!child.label.empty()) resolved.label = child.label;
        resolved.coverage = child.coverage;
        if (!child.scheme_ids.empty()) resolved.scheme_ids = child.scheme_ids;
        if (child.eligibility_override) resolved.eligibility_override = child.eligibility_override;
        if (child.contribution_override) resolved.contribution_override = child.contribution_override;
        if (!child.notes.empty()) resolved.notes = child.notes;
    }
    resolved.inherit.reset();
    return resolved;
}

void CountryParameterSet::validate_references() const {
    std::set<std::string> ids;
    for (const auto& scheme : schemes) {
        if (!ids.insert(scheme.id).second) {
            throw ConfigurationError("Duplicate scheme id: " + scheme.id);
        }
    }

    for (const auto& [wt_id, rule] : worker_types) {
        for (const auto& sid : rule.scheme_ids) {
            if (ids.find(sid) == ids.end()) {
                throw ConfigurationError("Worker type '" + wt_id + "' references unknown scheme '" + sid + "'");
            }
        }
        if (rule.inherit && !has_worker_type(*rule.inherit)) {
            throw ConfigurationError("Worker type '" + wt_id + "' inherits from unknown worker type '" +
                                     *rule.inherit + "'");
        }
        // Detects cycles
        resolve_worker_type(wt_id);
    }
}

} // namespace pensioncalc
