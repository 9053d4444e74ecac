#ifndef PENSIONCALC_WORK_INCENTIVE_HPP
#define PENSIONCALC_WORK_INCENTIVE_HPP

#include <map>
#include <optional>
#include <vector>
#include "engine.hpp"

namespace pensioncalc {

// Annualised change in gross pension wealth from delaying the claim by five years
struct WorkIncentive {
    Sex sex;
    double discount_rate;
    int nra;
    int nra_minus_5;

    std::map<int, double> pw60;       // claiming age -> PW measured at 60, x AW
    double indicator_60_65;           // % of AW per year of delay
    double indicator_own_nra;         // same over [NRA-5, NRA]
    bool survival_from_table;         // p(60->R) from the life table, else 1.0
    std::vector<Issue> issues;

    WorkIncentive();
};

/**
 * @brief OECD-style work-incentive indicator
 *
 * For each claiming age R in {60, 65, NRA-5, NRA} a full-time 1.0 x AW
 * worker who entered at entry_age claims with R - entry_age service years:
 *
 *   PW60(R) = B(R) * AF(R) / (1+r)^(R-60) * p(60->R) / AW
 *   indicator = (PW60(later) - PW60(earlier)) / 5 * 100
 *
 * Negative values penalise working longer. NRA is taken from the first
 * active scheme (65 when undefined); NRA-5 is floored at 50.
 *
 * @param discount Deferral discount rate; the assumption's discount_rate when unset
 */
WorkIncentive compute_work_incentive(const PensionEngine& engine, Sex sex,
                                     std::optional<double> discount = std::nullopt);

} // namespace pensioncalc

#endif // PENSIONCALC_WORK_INCENTIVE_HPP
