#include "wealth.hpp"
#include <algorithm>
#include <cmath>

namespace pensioncalc {

std::string wealth_method_to_string(WealthMethod method) {
    switch (method) {
        case WealthMethod::SurvivalWeighted: return "survival_weighted";
        case WealthMethod::ClosedForm: return "closed_form";
        default: return "unknown";
    }
}

AnnuityFactor::AnnuityFactor()
    : value(0.0),
      method(WealthMethod::ClosedForm),
      retirement_age(0),
      terms(0),
      life_expectancy(0.0) {}

// ============================================================================
// WealthCalculator Implementation
// ============================================================================

WealthCalculator::WealthCalculator(const LifeTableProvider& provider, const GlobalAssumptions& assumptions)
    : provider_(provider), assumptions_(assumptions) {}

AnnuityFactor WealthCalculator::annuity_factor(const std::string& country, Sex sex, int retirement_age,
                                               ReasoningTrace& trace, std::vector<Issue>& issues) const {
    AnnuityFactor af;
    af.retirement_age = retirement_age;

    const double r = assumptions_.discount_rate;
    const double g = assumptions_.pension_indexation_rate;

    std::optional<double> s_ret = provider_.survivorship(country, sex, retirement_age);
    if (s_ret) {
        s_ret = std::clamp(*s_ret, 0.0, 1.0);
    }

    if (s_ret && *s_ret > 0.0) {
        af.method = WealthMethod::SurvivalWeighted;
        bool clamped = false;
        int truncated_at = -1;
        double previous = *s_ret;
        double growth = 1.0;
        double discount = 1.0;

        for (int age = retirement_age; age <= assumptions_.max_age_for_wealth; ++age) {
            std::optional<double> s = provider_.survivorship(country, sex, age);
            if (!s) {
                truncated_at = age;
                break;
            }
            double sv = *s;
            if (sv < 0.0 || sv > 1.0 || sv > previous) {
                sv = std::min(std::clamp(sv, 0.0, 1.0), previous);
                clamped = true;
            }
            previous = sv;

            const double p = sv / *s_ret;
            if (p < SURVIVAL_CUTOFF) {
                break;
            }
            af.value += growth * p / discount;
            ++af.terms;
            growth *= (1.0 + g);
            discount *= (1.0 + r);
        }

        if (clamped) {
            issues.emplace_back(IssueKind::ComputationWarning, "",
                "Survivorship for " + country + "/" + sex_to_string(sex) +
                " was outside [0, 1] or increasing with age; clamped");
        }
        if (truncated_at >= 0) {
            issues.emplace_back(IssueKind::ComputationWarning, "",
                "Life table for " + country + "/" + sex_to_string(sex) + " ends before age " +
                std::to_string(truncated_at) + " with survival " + format_number(previous / *s_ret) +
                "; annuity factor truncated there");
        }
        trace.append(Stage::Wealth, "Annuity factor",
                     "sum (1+" + format_number(g) + ")^t x S(" + std::to_string(retirement_age) +
                     "+t)/S(" + std::to_string(retirement_age) + ") / (1+" + format_number(r) + ")^t, " +
                     std::to_string(af.terms) + " terms",
                     format_number(af.value));
        return af;
    }

    const LifeExpectancy le = life_expectancy(country, sex, retirement_age);
    af.method = WealthMethod::ClosedForm;
    af.life_expectancy = le.years;
    af.value = closed_form_factor(le.years);

    issues.emplace_back(IssueKind::ComputationWarning, "",
        "No life-table survivorship for " + country + "/" + sex_to_string(sex) +
        "; closed-form annuity with life expectancy " + format_number(le.years, 1) +
        (le.from_table ? " (life table)" : " (assumption fallback)"));
    trace.append(Stage::Wealth, "Annuity factor (fallback)",
                 "(1 - (1+d)^-" + format_number(le.years, 1) + ") / d, d = (1+r)/(1+g) - 1",
                 format_number(af.value));
    return af;
}

LifeExpectancy WealthCalculator::life_expectancy(const std::string& country, Sex sex, int age) const {
    std::optional<double> le = provider_.remaining_life_expectancy(country, sex, age);
    if (le && std::isfinite(*le) && *le > 0.0) {
        return LifeExpectancy(*le, true);
    }
    return LifeExpectancy(assumptions_.life_expectancy_fallback(sex), false);
}

double WealthCalculator::closed_form_factor(double life_expectancy) const {
    const double r = assumptions_.discount_rate;
    const double g = assumptions_.pension_indexation_rate;
    const double d = (1.0 + r) / (1.0 + g) - 1.0;
    if (std::fabs(d) < 1e-9) {
        return life_expectancy;
    }
    return (1.0 - std::pow(1.0 + d, -life_expectancy)) / d;
}

double WealthCalculator::wealth_aw_multiple(double annual_benefit, const AnnuityFactor& factor, double average_wage) {
    if (!(average_wage > 0.0)) {
        return 0.0;
    }
    return annual_benefit * factor.value / average_wage;
}

} // namespace pensioncalc
