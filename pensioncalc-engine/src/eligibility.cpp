#include "eligibility.hpp"
#include <algorithm>

namespace pensioncalc {

SchemeEligibility::SchemeEligibility()
    : active(true), payable(false), early_multiplier(1.0) {}

EligibilityOutcome::EligibilityOutcome()
    : worker_type_found(false),
      coverage(CoverageStatus::Covered),
      eligible(false),
      years_to_nra(0.0) {}

const SchemeEligibility* EligibilityOutcome::find(const std::string& scheme_id) const {
    for (const auto& s : schemes) {
        if (s.scheme_id == scheme_id) {
            return &s;
        }
    }
    return nullptr;
}

bool EligibilityOutcome::is_payable(const std::string& scheme_id) const {
    const SchemeEligibility* s = find(scheme_id);
    return s != nullptr && s->payable;
}

size_t EligibilityOutcome::payable_count() const {
    return static_cast<size_t>(std::count_if(schemes.begin(), schemes.end(),
        [](const SchemeEligibility& s) { return s.payable; }));
}

// ============================================================================
// EligibilityResolver Implementation
// ============================================================================

EligibilityResolver::EligibilityResolver(const CountryParameterSet& params)
    : params_(params) {}

EligibilityOutcome EligibilityResolver::resolve(const PersonProfile& profile, ReasoningTrace& trace) const {
    EligibilityOutcome outcome;
    outcome.worker_type_id = profile.worker_type_id;

    std::optional<WorkerTypeRule> rule;
    if (params_.has_worker_type(profile.worker_type_id)) {
        rule = params_.resolve_worker_type(profile.worker_type_id);
        outcome.worker_type_found = true;
        outcome.coverage = rule->coverage;
        outcome.contribution_override = rule->contribution_override;
    } else if (!params_.worker_types.empty()) {
        outcome.issues.emplace_back(IssueKind::EligibilityWarning, "",
            "Worker type '" + profile.worker_type_id + "' not found; using all active schemes");
    }

    trace.append(Stage::Eligibility, "Worker type",
                 rule ? rule->label : "(not defined)",
                 profile.worker_type_id + " (" + coverage_status_to_string(outcome.coverage) + ")");

    if (outcome.coverage == CoverageStatus::Excluded) {
        const std::string message = "Worker type '" + profile.worker_type_id +
                                    "' is excluded from pension coverage; benefit is zero";
        outcome.missing.push_back(message);
        outcome.issues.emplace_back(IssueKind::EligibilityWarning, "",
            rule->notes.empty() ? message : message + " (" + rule->notes + ")");
        trace.append(Stage::Eligibility, "Eligibility", "coverage == excluded", "NOT ELIGIBLE");
        return outcome;
    }
    if (outcome.coverage == CoverageStatus::Unknown) {
        outcome.issues.emplace_back(IssueKind::EligibilityWarning, "",
            "Coverage of worker type '" + profile.worker_type_id + "' is unknown; assuming covered");
    }

    const std::optional<EligibilityOverride> over = rule ? rule->eligibility_override : std::nullopt;
    const bool restricted = rule && !rule->scheme_ids.empty();
    bool headline_set = false;

    for (const auto& scheme : params_.schemes) {
        if (restricted &&
            std::find(rule->scheme_ids.begin(), rule->scheme_ids.end(), scheme.id) == rule->scheme_ids.end()) {
            continue;
        }
        if (!restricted && !scheme.active) {
            continue;
        }

        SchemeEligibility verdict = check_scheme(scheme, profile, over);
        trace.append(Stage::Eligibility, "Scheme eligibility", verdict.reason,
                     verdict.payable ? "PAYABLE" : "SKIPPED", scheme.id);
        if (verdict.early_multiplier < 1.0) {
            trace.append(Stage::Eligibility, "Early retirement adjustment",
                         "1 - " + format_number(scheme.eligibility.early_reduction_per_month) + " x " +
                         format_number((*verdict.normal_retirement_age - profile.age) * 12.0, 1) +
                         " months early",
                         format_number(verdict.early_multiplier), scheme.id);
        }

        // Headline thresholds come from the first applicable scheme
        if (scheme.active && !headline_set) {
            headline_set = true;
            outcome.normal_retirement_age = verdict.normal_retirement_age;
            outcome.minimum_service_years = verdict.minimum_service_years;
            outcome.early_retirement_age = (over && over->early_retirement_age(profile.sex))
                ? over->early_retirement_age(profile.sex)
                : scheme.eligibility.early_retirement_age(profile.sex);
        }
        outcome.schemes.push_back(verdict);
    }

    if (over) {
        if (over->normal_retirement_age(profile.sex)) {
            outcome.normal_retirement_age = over->normal_retirement_age(profile.sex);
        }
        if (over->early_retirement_age(profile.sex)) {
            outcome.early_retirement_age = over->early_retirement_age(profile.sex);
        }
        if (over->minimum_service_years) {
            outcome.minimum_service_years = over->minimum_service_years;
        }
    }

    const double years = profile.credited_years();
    if (outcome.normal_retirement_age) {
        const double nra = *outcome.normal_retirement_age;
        outcome.years_to_nra = std::max(0.0, nra - profile.age);
        if (profile.age < nra) {
            outcome.missing.push_back("Age " + format_number(profile.age, 0) + " < NRA " +
                                      format_number(nra, 0) + " (need " +
                                      format_number(nra - profile.age, 1) + " more year(s))");
        }
        trace.append(Stage::Eligibility, "Normal retirement age",
                     "NRA (" + sex_to_string(profile.sex) + ")", format_number(nra, 1));
    }
    if (outcome.minimum_service_years && years < *outcome.minimum_service_years) {
        outcome.missing.push_back("Contribution years " + format_number(years, 0) + " < minimum " +
                                  format_number(*outcome.minimum_service_years, 0) + " (need " +
                                  format_number(*outcome.minimum_service_years - years, 1) + " more)");
    }

    outcome.eligible = outcome.payable_count() > 0;
    if (!outcome.eligible) {
        outcome.issues.emplace_back(IssueKind::EligibilityWarning, "",
            "No payable scheme for worker type '" + profile.worker_type_id + "'");
    }
    trace.append(Stage::Eligibility, "Eligibility",
                 "age >= NRA or service >= minimum service, per scheme",
                 outcome.eligible
                     ? "ELIGIBLE (" + std::to_string(outcome.payable_count()) + " payable scheme(s))"
                     : "NOT ELIGIBLE");
    return outcome;
}

SchemeEligibility EligibilityResolver::check_scheme(const SchemeComponent& scheme,
                                                    const PersonProfile& profile,
                                                    const std::optional<EligibilityOverride>& over) const {
    SchemeEligibility verdict;
    verdict.scheme_id = scheme.id;
    verdict.active = scheme.active;

    std::optional<double> nra = scheme.eligibility.normal_retirement_age(profile.sex);
    std::optional<double> era = scheme.eligibility.early_retirement_age(profile.sex);
    std::optional<double> min_service = scheme.eligibility.minimum_service_years;
    if (over) {
        if (over->normal_retirement_age(profile.sex)) nra = over->normal_retirement_age(profile.sex);
        if (over->early_retirement_age(profile.sex)) era = over->early_retirement_age(profile.sex);
        if (over->minimum_service_years) min_service = over->minimum_service_years;
    }
    verdict.normal_retirement_age = nra;
    verdict.minimum_service_years = min_service;

    if (!scheme.active) {
        verdict.reason = "scheme inactive (" + reform_status_to_string(scheme.reform_status) + ")";
        return verdict;
    }

    const double years = profile.credited_years();
    const bool by_age = nra && profile.age >= *nra;
    const bool by_service = min_service && years >= *min_service;

    if (!nra && !min_service) {
        verdict.payable = true;
        verdict.reason = "no age or service threshold defined";
    } else if (by_age) {
        verdict.payable = true;
        verdict.reason = "age " + format_number(profile.age, 1) + " >= NRA " + format_number(*nra, 1);
    } else if (by_service) {
        verdict.payable = true;
        verdict.reason = "service " + format_number(years, 1) + " >= minimum " + format_number(*min_service, 1);
    } else {
        verdict.reason = "age " + format_number(profile.age, 1) +
                         (nra ? " < NRA " + format_number(*nra, 1) : std::string(", no NRA")) +
                         " and service " + format_number(years, 1) +
                         (min_service ? " < minimum " + format_number(*min_service, 1) : std::string(", no minimum"));
        return verdict;
    }

    // Payable through service before NRA: reduce when claimed from the ERA on
    if (nra && profile.age < *nra && era && profile.age >= *era) {
        const double months_early = (*nra - profile.age) * 12.0;
        verdict.early_multiplier =
            std::max(0.0, 1.0 - scheme.eligibility.early_reduction_per_month * months_early);
    }
    return verdict;
}

} // namespace pensioncalc
