#ifndef PENSIONCALC_WEALTH_HPP
#define PENSIONCALC_WEALTH_HPP

#include <string>
#include <vector>
#include "assumptions.hpp"
#include "reasoning.hpp"

namespace pensioncalc {

enum class WealthMethod : uint8_t {
    SurvivalWeighted = 0,   // life-table survivorship
    ClosedForm = 1          // level annuity over remaining life expectancy
};

std::string wealth_method_to_string(WealthMethod method);

// Present value at retirement of one unit of annual pension
struct AnnuityFactor {
    double value;
    WealthMethod method;
    int retirement_age;
    size_t terms;                 // payments summed (survival-weighted only)
    double life_expectancy;       // years used (closed form only)

    AnnuityFactor();
};

// Remaining life expectancy and where it came from
struct LifeExpectancy {
    double years;
    bool from_table;

    LifeExpectancy() : years(0.0), from_table(false) {}
    LifeExpectancy(double y, bool table) : years(y), from_table(table) {}
};

/**
 * @brief Survival-weighted present value of a pension stream
 *
 *   AF = sum_t (1+g)^t * S(R+t)/S(R) / (1+r)^t
 *
 * with g = pension_indexation_rate and r = discount_rate. The sum stops when
 * the conditional survival falls below SURVIVAL_CUTOFF, when the provider
 * has no value for the next age, or past max_age_for_wealth.
 *
 * Without life-table data the closed-form annuity over the remaining life
 * expectancy is used instead and a ComputationWarning is recorded.
 */
class WealthCalculator {
public:
    static constexpr double SURVIVAL_CUTOFF = 1e-9;

    WealthCalculator(const LifeTableProvider& provider, const GlobalAssumptions& assumptions);

    AnnuityFactor annuity_factor(const std::string& country, Sex sex, int retirement_age,
                                 ReasoningTrace& trace, std::vector<Issue>& issues) const;

    // Provider value when available, else the assumption fallback by sex
    LifeExpectancy life_expectancy(const std::string& country, Sex sex, int age) const;

    // Closed form: (1 - (1+d)^-LE)/d with d = (1+r)/(1+g) - 1, or LE when d ~ 0
    double closed_form_factor(double life_expectancy) const;

    // Benefit x AF, expressed in multiples of the average wage
    static double wealth_aw_multiple(double annual_benefit, const AnnuityFactor& factor, double average_wage);

private:
    const LifeTableProvider& provider_;
    const GlobalAssumptions& assumptions_;
};

} // namespace pensioncalc

#endif // PENSIONCALC_WEALTH_HPP
