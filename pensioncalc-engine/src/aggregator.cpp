#include "aggregator.hpp"
#include <algorithm>

namespace pensioncalc {

AggregateResult::AggregateResult()
    : total(0.0), pre_floor_total(0.0), floor(0.0), top_up(0.0), capped_amount(0.0) {}

Aggregator::Aggregator(const CountryPayoutRules& payout, double average_wage)
    : payout_(payout), average_wage_(average_wage) {}

AggregateResult Aggregator::aggregate(const std::vector<ComponentAmount>& components,
                                      ReasoningTrace& trace,
                                      std::vector<Issue>& issues) const {
    AggregateResult result;

    std::vector<const ComponentAmount*> floors;
    for (const auto& c : components) {
        if (c.type == SchemeType::Minimum) {
            floors.push_back(&c);
            result.breakdown[c.scheme_id] = 0.0;
        } else {
            result.breakdown[c.scheme_id] += c.amount;
            result.pre_floor_total += c.amount;
        }
    }
    result.total = result.pre_floor_total;
    trace.append(Stage::Aggregate, "Sum of components",
                 std::to_string(components.size() - floors.size()) + " earnings and flat components",
                 format_amount(result.pre_floor_total));

    // Binding floor: the largest one, first scheme on ties
    for (const ComponentAmount* f : floors) {
        if (!result.floor_scheme_id || f->amount > result.floor) {
            result.floor = f->amount;
            result.floor_scheme_id = f->scheme_id;
        }
    }

    if (result.floor_scheme_id) {
        if (result.pre_floor_total < result.floor) {
            result.top_up = result.floor - result.pre_floor_total;
            result.total = result.floor;
            result.breakdown[*result.floor_scheme_id] = result.top_up;
            trace.append(Stage::Aggregate, "Minimum pension top-up",
                         format_amount(result.floor) + " - " + format_amount(result.pre_floor_total),
                         format_amount(result.top_up), *result.floor_scheme_id);
        } else {
            trace.append(Stage::Aggregate, "Minimum pension floor",
                         format_amount(result.pre_floor_total) + " >= floor " + format_amount(result.floor),
                         "not binding", *result.floor_scheme_id);
        }
    }

    if (payout_.maximum_benefit_aw_multiple) {
        const double cap = *payout_.maximum_benefit_aw_multiple * average_wage_;
        if (result.total > cap) {
            result.capped_amount = result.total - cap;
            const double scale = result.total > 0.0 ? cap / result.total : 0.0;
            for (auto& [id, amount] : result.breakdown) {
                amount *= scale;
            }
            trace.append(Stage::Aggregate, "Country maximum benefit",
                         format_number(*payout_.maximum_benefit_aw_multiple) + " x AW = " + format_amount(cap),
                         "clamped " + format_amount(result.capped_amount));
            issues.emplace_back(IssueKind::ComputationWarning, "",
                "Total benefit " + format_amount(result.total) + " capped at country maximum " +
                format_amount(cap) + " (clamped " + format_amount(result.capped_amount) + ")");
            result.total = cap;
        }
    }

    trace.append(Stage::Aggregate, "Gross pension", "sum after floor and cap", format_amount(result.total));
    return result;
}

} // namespace pensioncalc
