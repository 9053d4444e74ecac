#include "work_incentive.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace pensioncalc {

WorkIncentive::WorkIncentive()
    : sex(Sex::Male),
      discount_rate(0.0),
      nra(65),
      nra_minus_5(60),
      indicator_60_65(0.0),
      indicator_own_nra(0.0),
      survival_from_table(false) {}

WorkIncentive compute_work_incentive(const PensionEngine& engine, Sex sex, std::optional<double> discount) {
    const GlobalAssumptions& asmp = engine.assumptions();
    const CountryParameterSet& params = engine.params();
    const std::string& country = params.metadata.iso3;

    WorkIncentive wi;
    wi.sex = sex;
    wi.discount_rate = discount.value_or(asmp.discount_rate);

    // NRA of the first listed scheme, active or not; 65 when it has none
    if (!params.schemes.empty()) {
        if (auto nra = params.schemes.front().eligibility.normal_retirement_age(sex)) {
            wi.nra = static_cast<int>(*nra);
        }
    }
    wi.nra_minus_5 = std::max(wi.nra - 5, 50);

    const std::set<int> ages = {60, 65, wi.nra_minus_5, wi.nra};
    const std::optional<double> s60 = engine.life_tables().survivorship(country, sex, 60);
    WealthCalculator wealth(engine.life_tables(), asmp);

    for (int age : ages) {
        PersonProfile profile = engine.standard_profile(sex);
        profile.age = age;
        profile.service_years = std::max(0.0, static_cast<double>(age - asmp.entry_age));
        profile.wage = 1.0;
        profile.wage_unit = WageUnit::AwMultiple;

        double benefit = 0.0;
        try {
            benefit = engine.compute(profile).gross_benefit;
        } catch (const ConfigurationError& e) {
            wi.issues.emplace_back(IssueKind::ConfigurationError, "",
                "Claiming age " + std::to_string(age) + ": " + e.what());
        }

        ReasoningTrace scratch;
        std::vector<Issue> af_issues;
        const AnnuityFactor af = wealth.annuity_factor(country, sex, age, scratch, af_issues);
        for (const auto& issue : af_issues) {
            const bool seen = std::any_of(wi.issues.begin(), wi.issues.end(), [&](const Issue& known) {
                return known.kind == issue.kind && known.message == issue.message;
            });
            if (!seen) {
                wi.issues.push_back(issue);
            }
        }

        double p = 1.0;
        if (age > 60 && s60 && *s60 > 0.0) {
            if (auto s = engine.life_tables().survivorship(country, sex, age)) {
                p = std::clamp(*s / *s60, 0.0, 1.0);
                wi.survival_from_table = true;
            }
        }

        wi.pw60[age] = benefit * af.value / std::pow(1.0 + wi.discount_rate, age - 60) * p /
                       engine.average_wage();
    }

    if (!wi.survival_from_table) {
        wi.issues.emplace_back(IssueKind::ComputationWarning, "",
            "No survivorship between 60 and claiming age for " + country + "; p(60->R) = 1");
    }

    wi.indicator_60_65 = (wi.pw60[65] - wi.pw60[60]) / 5.0 * 100.0;
    wi.indicator_own_nra = (wi.pw60[wi.nra] - wi.pw60[wi.nra_minus_5]) / 5.0 * 100.0;
    return wi;
}

} // namespace pensioncalc
