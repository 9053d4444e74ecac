#include "benefit_formula.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace pensioncalc {

namespace {

constexpr double RATE_EPSILON = 1e-12;

void require(bool present, const SchemeComponent& scheme, const std::string& field) {
    if (!present) {
        throw ConfigurationError(scheme.id + " (" + scheme_type_to_string(scheme.type) +
                                 "): missing required field '" + field + "'");
    }
}

double resolve_divisor(const std::optional<double>& configured, double fallback,
                       const std::string& fallback_label, const std::string& scheme_id,
                       ReasoningTrace& trace, std::vector<Issue>& issues) {
    double divisor = fallback;
    if (configured) {
        divisor = *configured;
    } else {
        issues.emplace_back(IssueKind::ComputationWarning, scheme_id,
            "annuity_divisor_at_nra undefined; using " + fallback_label + " " + format_number(fallback, 2));
        trace.append(Stage::Dispatch, "Annuity divisor (fallback)", fallback_label,
                     format_number(fallback, 4), scheme_id);
    }
    if (!std::isfinite(divisor) || divisor <= 0.0) {
        throw ComputationError(scheme_id + ": annuity divisor must be positive, got " + format_number(divisor));
    }
    return divisor;
}

// Visitor evaluating one alternative of SchemeFormula
struct FormulaEvaluator {
    const FormulaContext& ctx;
    const std::string& scheme_id;
    ReasoningTrace& trace;
    std::vector<Issue>& issues;

    double operator()(const DbFormula& f) const {
        double years = ctx.years;
        if (f.max_accrual_years && years > *f.max_accrual_years) {
            years = *f.max_accrual_years;
        }

        double reference = ctx.wage;
        std::string ref_desc = reference_wage_to_string(f.reference_wage) + " wage";
        if (f.ceiling_aw_multiple) {
            const double ceiling = *f.ceiling_aw_multiple * ctx.average_wage;
            if (reference > ceiling) {
                reference = ceiling;
                ref_desc = "ceiling " + format_number(*f.ceiling_aw_multiple, 2) + " x AW";
            }
        }

        const double gross = f.accrual_rate * years * reference;
        trace.append(Stage::Dispatch, "DB accrual",
                     format_number(f.accrual_rate) + " x " + format_number(years, 1) + " years x " +
                     format_amount(reference) + " (" + ref_desc + ")",
                     format_amount(gross), scheme_id);
        return bounded(gross, f.bounds);
    }

    double operator()(const NdcFormula& f) const {
        double balance = 0.0;
        if (ctx.notional_balance) {
            balance = *ctx.notional_balance;
            trace.append(Stage::Dispatch, "Notional account", "profile override",
                         format_amount(balance), scheme_id);
        } else {
            double rate = f.fixed_rate;
            if (f.index == NotionalIndex::Wages) {
                rate = ctx.assumptions.real_wage_growth + ctx.assumptions.inflation;
            } else if (f.index == NotionalIndex::Prices) {
                rate = ctx.assumptions.inflation;
            }
            const double fv = accumulation_factor(rate, ctx.years);
            balance = f.contribution_rate * ctx.wage * fv;
            trace.append(Stage::Dispatch, "Notional account",
                         format_number(f.contribution_rate) + " x " + format_amount(ctx.wage) +
                         " x FV(" + notional_index_to_string(f.index) + " " + format_number(rate) + ", " +
                         format_number(ctx.years, 1) + " years)",
                         format_amount(balance), scheme_id);
        }

        const double divisor = resolve_divisor(f.annuity_divisor, ctx.life_expectancy,
                                               "remaining life expectancy", scheme_id, trace, issues);
        const double gross = balance / divisor;
        trace.append(Stage::Dispatch, "NDC annuity", format_amount(balance) + " / " + format_number(divisor, 2),
                     format_amount(gross), scheme_id);
        return bounded(gross, f.bounds);
    }

    double operator()(const DcFormula& f) const {
        double fund = 0.0;
        if (ctx.dc_balance) {
            fund = *ctx.dc_balance;
            trace.append(Stage::Dispatch, "DC fund", "profile override", format_amount(fund), scheme_id);
        } else {
            const double r = ctx.assumptions.dc_net_real_return;
            fund = f.contribution_rate * ctx.wage * accumulation_factor(r, ctx.years);
            trace.append(Stage::Dispatch, "DC fund",
                         format_number(f.contribution_rate) + " x " + format_amount(ctx.wage) +
                         " x FV(" + format_number(r) + ", " + format_number(ctx.years, 1) + " years)",
                         format_amount(fund), scheme_id);
        }

        const double fallback = annuity_certain(ctx.assumptions.discount_rate, ctx.life_expectancy);
        const double divisor = resolve_divisor(f.annuity_divisor, fallback,
                                               "annuity over remaining life expectancy", scheme_id, trace, issues);
        const double gross = fund / divisor;
        trace.append(Stage::Dispatch, "DC annuity", format_amount(fund) + " / " + format_number(divisor, 2),
                     format_amount(gross), scheme_id);
        return bounded(gross, f.bounds);
    }

    double operator()(const PointsFormula& f) const {
        if (!(ctx.average_wage > 0.0)) {
            throw ComputationError(scheme_id + ": points require a positive average wage");
        }
        const double value = f.point_value ? *f.point_value : *f.point_value_aw_multiple * ctx.average_wage;
        const double points = (ctx.wage / ctx.average_wage) * f.points_per_year * ctx.years;
        const double gross = points * value;
        trace.append(Stage::Dispatch, "Points",
                     "(" + format_amount(ctx.wage) + " / " + format_amount(ctx.average_wage) + ") x " +
                     format_number(f.points_per_year, 2) + " x " + format_number(ctx.years, 1) +
                     " years x point value " + format_number(value, 2),
                     format_amount(gross), scheme_id);
        return bounded(gross, f.bounds);
    }

    double operator()(const BasicFormula& f) const {
        double gross = 0.0;
        if (f.amount_aw_multiple) {
            gross = *f.amount_aw_multiple * ctx.average_wage;
            trace.append(Stage::Dispatch, "Basic pension",
                         format_number(*f.amount_aw_multiple) + " x AW", format_amount(gross), scheme_id);
        } else {
            gross = *f.amount_absolute;
            trace.append(Stage::Dispatch, "Basic pension", "flat amount", format_amount(gross), scheme_id);
        }
        return checked(gross);
    }

    double operator()(const TargetedFormula& f) const {
        const double max_benefit = f.max_benefit_aw_multiple
            ? *f.max_benefit_aw_multiple * ctx.average_wage
            : *f.max_benefit_absolute;
        const double excess = std::max(0.0, ctx.wage - f.income_threshold);
        const double gross = std::max(0.0, max_benefit - f.taper_rate * excess);
        trace.append(Stage::Dispatch, "Targeted pension",
                     "max(0, " + format_amount(max_benefit) + " - " + format_number(f.taper_rate, 2) +
                     " x (" + format_amount(ctx.wage) + " - " + format_amount(f.income_threshold) + "))",
                     format_amount(gross), scheme_id);
        return checked(gross);
    }

    double operator()(const MinimumFormula& f) const {
        const double floor = f.floor_aw_multiple ? *f.floor_aw_multiple * ctx.average_wage : *f.floor_absolute;
        trace.append(Stage::Dispatch, "Minimum pension floor",
                     f.floor_aw_multiple ? format_number(*f.floor_aw_multiple) + " x AW" : "absolute floor",
                     format_amount(floor), scheme_id);
        return checked(floor);
    }

    double checked(double gross) const {
        if (!std::isfinite(gross)) {
            throw ComputationError(scheme_id + ": benefit is not a finite number");
        }
        return std::max(0.0, gross);
    }

    double bounded(double gross, const BenefitBounds& b) const {
        gross = checked(gross);
        const double original = gross;
        if (b.minimum_aw_multiple) gross = std::max(gross, *b.minimum_aw_multiple * ctx.average_wage);
        if (b.minimum_absolute) gross = std::max(gross, *b.minimum_absolute);
        if (b.maximum_aw_multiple) gross = std::min(gross, *b.maximum_aw_multiple * ctx.average_wage);
        if (b.maximum_absolute) gross = std::min(gross, *b.maximum_absolute);

        if (gross != original) {
            const std::string what = gross > original ? "raised to scheme minimum" : "capped at scheme maximum";
            trace.append(Stage::Dispatch, "Scheme bounds", what, format_amount(gross), scheme_id);
            issues.emplace_back(IssueKind::ComputationWarning, scheme_id,
                "Component " + what + ": " + format_amount(original) + " -> " + format_amount(gross));
        }
        return gross;
    }
};

} // anonymous namespace

// ============================================================================
// Formula Parameters
// ============================================================================

BenefitBounds::BenefitBounds() = default;

BenefitBounds::BenefitBounds(const BenefitRules& rules)
    : minimum_aw_multiple(rules.minimum_benefit_aw_multiple),
      minimum_absolute(rules.minimum_benefit_absolute),
      maximum_aw_multiple(rules.maximum_benefit_aw_multiple),
      maximum_absolute(rules.maximum_benefit_absolute) {}

bool BenefitBounds::empty() const {
    return !minimum_aw_multiple && !minimum_absolute && !maximum_aw_multiple && !maximum_absolute;
}

DbFormula::DbFormula() : accrual_rate(0.0), reference_wage(ReferenceWage::CareerAverage) {}

NdcFormula::NdcFormula() : contribution_rate(0.0), index(NotionalIndex::Wages), fixed_rate(0.0) {}

DcFormula::DcFormula() : contribution_rate(0.0) {}

PointsFormula::PointsFormula() : points_per_year(1.0) {}

BasicFormula::BasicFormula() = default;

TargetedFormula::TargetedFormula() : taper_rate(0.5), income_threshold(0.0) {}

MinimumFormula::MinimumFormula() = default;

SchemeFormula make_formula(const SchemeComponent& scheme,
                           const std::optional<ContributionRules>& contribution_override) {
    const BenefitRules& b = scheme.benefits;
    const ContributionRules contributions = contribution_override
        ? scheme.contributions.merged_with(*contribution_override)
        : scheme.contributions;

    switch (scheme.type) {
        case SchemeType::DB: {
            require(b.accrual_rate.has_value(), scheme, "accrual_rate");
            DbFormula f;
            f.accrual_rate = *b.accrual_rate;
            f.max_accrual_years = b.max_accrual_years;
            f.reference_wage = b.reference_wage;
            f.ceiling_aw_multiple = contributions.ceiling_aw_multiple;
            f.bounds = BenefitBounds(b);
            return f;
        }
        case SchemeType::NDC: {
            NdcFormula f;
            f.contribution_rate = contributions.combined_rate();
            f.index = b.notional_interest;
            if (f.index == NotionalIndex::Fixed) {
                require(b.notional_interest_fixed_rate.has_value(), scheme, "notional_interest_fixed_rate");
                f.fixed_rate = *b.notional_interest_fixed_rate;
            }
            f.annuity_divisor = b.annuity_divisor_at_nra;
            f.bounds = BenefitBounds(b);
            return f;
        }
        case SchemeType::DC: {
            DcFormula f;
            f.contribution_rate = contributions.combined_rate();
            f.annuity_divisor = b.annuity_divisor_at_nra;
            f.bounds = BenefitBounds(b);
            return f;
        }
        case SchemeType::Points: {
            require(b.point_value.has_value() || b.point_value_aw_multiple.has_value(), scheme,
                    "point_value or point_value_aw_multiple");
            PointsFormula f;
            f.points_per_year = b.points_per_year.value_or(1.0);
            f.point_value = b.point_value;
            f.point_value_aw_multiple = b.point_value_aw_multiple;
            f.bounds = BenefitBounds(b);
            return f;
        }
        case SchemeType::Basic: {
            BasicFormula f;
            if (b.flat_rate_aw_multiple) {
                f.amount_aw_multiple = b.flat_rate_aw_multiple;
            } else if (b.flat_rate_absolute) {
                f.amount_absolute = b.flat_rate_absolute;
            } else {
                require(b.minimum_benefit_aw_multiple.has_value(), scheme,
                        "flat_rate_aw_multiple or flat_rate_absolute");
                f.amount_aw_multiple = b.minimum_benefit_aw_multiple;
            }
            return f;
        }
        case SchemeType::Targeted: {
            TargetedFormula f;
            if (b.maximum_benefit_aw_multiple) {
                f.max_benefit_aw_multiple = b.maximum_benefit_aw_multiple;
            } else if (b.maximum_benefit_absolute) {
                f.max_benefit_absolute = b.maximum_benefit_absolute;
            } else {
                require(b.minimum_benefit_aw_multiple.has_value(), scheme,
                        "maximum_benefit_aw_multiple or maximum_benefit_absolute");
                f.max_benefit_aw_multiple = b.minimum_benefit_aw_multiple;
            }
            f.taper_rate = b.taper_rate.value_or(0.5);
            f.income_threshold = b.income_threshold.value_or(0.0);
            if (f.taper_rate < 0.0) {
                throw ConfigurationError(scheme.id + " (targeted): taper_rate must not be negative");
            }
            return f;
        }
        case SchemeType::Minimum: {
            require(b.minimum_benefit_aw_multiple.has_value() || b.minimum_benefit_absolute.has_value(), scheme,
                    "minimum_benefit_aw_multiple or minimum_benefit_absolute");
            MinimumFormula f;
            f.floor_aw_multiple = b.minimum_benefit_aw_multiple;
            if (!f.floor_aw_multiple) {
                f.floor_absolute = b.minimum_benefit_absolute;
            }
            return f;
        }
    }
    throw ConfigurationError("Unsupported scheme type for " + scheme.id);
}

// ============================================================================
// Evaluation
// ============================================================================

FormulaContext::FormulaContext(const GlobalAssumptions& asmp)
    : wage(0.0),
      average_wage(0.0),
      years(0.0),
      life_expectancy(asmp.life_expectancy_fallback_male),
      assumptions(asmp) {}

double accumulation_factor(double rate, double years) {
    if (std::fabs(rate) < RATE_EPSILON) {
        return years;
    }
    return (std::pow(1.0 + rate, years) - 1.0) / rate;
}

double annuity_certain(double rate, double years) {
    if (std::fabs(rate) < RATE_EPSILON) {
        return years;
    }
    return (1.0 - std::pow(1.0 + rate, -years)) / rate;
}

double evaluate_formula(const SchemeFormula& formula,
                        const FormulaContext& ctx,
                        const std::string& scheme_id,
                        ReasoningTrace& trace,
                        std::vector<Issue>& issues) {
    return std::visit(FormulaEvaluator{ctx, scheme_id, trace, issues}, formula);
}

} // namespace pensioncalc
