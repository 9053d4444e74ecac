#ifndef PENSIONCALC_AGGREGATOR_HPP
#define PENSIONCALC_AGGREGATOR_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "parameters.hpp"
#include "reasoning.hpp"

namespace pensioncalc {

// One payable scheme's evaluated amount. For SchemeType::Minimum the amount
// is the floor level, not a benefit.
struct ComponentAmount {
    std::string scheme_id;
    SchemeType type;
    double amount;

    ComponentAmount(const std::string& id, SchemeType t, double value)
        : scheme_id(id), type(t), amount(value) {}
};

struct AggregateResult {
    double total;
    double pre_floor_total;                       // sum of non-minimum components
    std::map<std::string, double> breakdown;      // sums to total
    std::optional<std::string> floor_scheme_id;   // scheme providing the binding floor
    double floor;
    double top_up;
    double capped_amount;                         // amount removed by the country maximum

    AggregateResult();
};

/**
 * @brief Sums payable components and applies floors and caps
 *
 * Order of application:
 *   1. sum every non-minimum component
 *   2. binding floor = largest floor among minimum schemes; when the sum is
 *      below it the difference is credited to that scheme (first one on ties)
 *   3. country-wide maximum caps the total; components are scaled pro rata
 *
 * Every step is appended to the trace in that order.
 */
class Aggregator {
public:
    Aggregator(const CountryPayoutRules& payout, double average_wage);

    AggregateResult aggregate(const std::vector<ComponentAmount>& components,
                              ReasoningTrace& trace,
                              std::vector<Issue>& issues) const;

private:
    const CountryPayoutRules& payout_;
    double average_wage_;
};

} // namespace pensioncalc

#endif // PENSIONCALC_AGGREGATOR_HPP
