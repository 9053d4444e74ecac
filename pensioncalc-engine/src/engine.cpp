#include "engine.hpp"
#include "aggregator.hpp"
#include "benefit_formula.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace pensioncalc {

PensionResult::PensionResult()
    : sex(Sex::Male),
      earnings_multiple(0.0),
      individual_wage(0.0),
      average_wage(0.0),
      net_wage(0.0),
      gross_benefit(0.0),
      net_benefit(0.0),
      gross_replacement_rate(0.0),
      net_replacement_rate(0.0),
      gross_pension_level(0.0),
      net_pension_level(0.0),
      gross_pension_wealth(0.0),
      net_pension_wealth(0.0),
      annuity_factor(0.0),
      wealth_method(WealthMethod::ClosedForm),
      retirement_age(0) {}

bool PensionResult::has_errors() const {
    for (const auto& issue : warnings) {
        if (issue.kind == IssueKind::ComputationError || issue.kind == IssueKind::ConfigurationError) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// PensionEngine Implementation
// ============================================================================

namespace {

double validated_average_wage(double average_wage) {
    if (!std::isfinite(average_wage) || average_wage <= 0.0) {
        throw std::invalid_argument("Average wage must be a positive amount");
    }
    return average_wage;
}

} // anonymous namespace

PensionEngine::PensionEngine(const CountryParameterSet& params,
                             const GlobalAssumptions& assumptions,
                             double average_wage,
                             const LifeTableProvider& life_tables)
    : params_(params),
      assumptions_(assumptions),
      average_wage_(validated_average_wage(average_wage)),
      life_tables_(life_tables),
      tax_(params.tax, average_wage) {
    params_.validate_references();
}

PensionResult PensionEngine::compute(const PersonProfile& profile) const {
    const double wage = profile.resolve_wage(average_wage_);
    return run(profile, wage / average_wage_);
}

PensionResult PensionEngine::compute(const PersonProfile& profile, double earnings_multiple) const {
    if (!is_standard_multiple(earnings_multiple)) {
        throw std::invalid_argument("Earnings multiple " + format_number(earnings_multiple, 2) +
                                    " is not one of the standard multiples");
    }
    PersonProfile grid_profile = profile;
    grid_profile.wage = earnings_multiple;
    grid_profile.wage_unit = WageUnit::AwMultiple;
    return run(grid_profile, earnings_multiple);
}

std::vector<PensionResult> PensionEngine::run_all_multiples(const PersonProfile& profile) const {
    std::vector<PensionResult> results;
    results.reserve(EARNINGS_MULTIPLES.size());
    for (double multiple : EARNINGS_MULTIPLES) {
        results.push_back(compute(profile, multiple));
    }
    return results;
}

PersonProfile PensionEngine::standard_profile(Sex sex, const std::string& worker_type_id) const {
    PersonProfile profile;
    profile.sex = sex;
    profile.worker_type_id = worker_type_id;
    profile.wage = 1.0;
    profile.wage_unit = WageUnit::AwMultiple;
    profile.service_years = assumptions_.career_length * assumptions_.contribution_density;

    std::optional<double> nra;
    if (params_.has_worker_type(worker_type_id)) {
        const WorkerTypeRule rule = params_.resolve_worker_type(worker_type_id);
        if (rule.eligibility_override) {
            nra = rule.eligibility_override->normal_retirement_age(sex);
        }
    }
    for (const auto& scheme : params_.schemes) {
        if (nra) break;
        if (scheme.active) {
            nra = scheme.eligibility.normal_retirement_age(sex);
        }
    }
    profile.age = nra.value_or(assumptions_.entry_age + assumptions_.career_length);
    return profile;
}

PensionResult PensionEngine::run(const PersonProfile& profile, double earnings_multiple) const {
    const auto start = std::chrono::steady_clock::now();

    PensionResult result;
    result.country = params_.metadata.iso3;
    result.sex = profile.sex;
    result.worker_type_id = profile.worker_type_id;
    result.earnings_multiple = earnings_multiple;
    result.average_wage = average_wage_;
    result.warnings = tax_.warnings();

    Logger& logger = Logger::get_instance();
    const LogContext log_ctx(result.country, profile.worker_type_id, sex_to_string(profile.sex), earnings_multiple);
    logger.log_computation_start(log_ctx, params_.schemes.size());

    auto finish = [&]() {
        for (const auto& issue : result.warnings) {
            logger.log_issue(log_ctx, issue);
        }
        const double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        logger.log_computation_complete(log_ctx, result.gross_benefit, result.net_benefit,
                                        result.warnings.size(), elapsed_ms);
    };

    // 1. Wage
    result.individual_wage = profile.resolve_wage(average_wage_);
    result.trace.append(Stage::Wage, "Reference wage",
                        profile.wage_unit == WageUnit::AwMultiple
                            ? format_number(profile.wage, 2) + " x AW (" + format_amount(average_wage_) + ")"
                            : "individual wage (provided)",
                        params_.metadata.currency_code + " " + format_amount(result.individual_wage));
    result.net_wage = tax_.net_wage(result.individual_wage);

    // 2. Eligibility
    EligibilityResolver resolver(params_);
    result.eligibility = resolver.resolve(profile, result.trace);
    result.warnings.insert(result.warnings.end(),
                           result.eligibility.issues.begin(), result.eligibility.issues.end());

    const double nra = result.eligibility.normal_retirement_age.value_or(profile.age);
    result.retirement_age = static_cast<int>(std::floor(std::max(profile.age, nra)));

    if (result.eligibility.coverage == CoverageStatus::Excluded) {
        finish();
        return result;
    }

    // 3. Dispatch
    WealthCalculator wealth(life_tables_, assumptions_);
    FormulaContext fctx(assumptions_);
    fctx.wage = result.individual_wage;
    fctx.average_wage = average_wage_;
    fctx.years = profile.credited_years();
    fctx.life_expectancy = wealth.life_expectancy(result.country, profile.sex, result.retirement_age).years;
    fctx.dc_balance = profile.dc_balance;
    fctx.notional_balance = profile.notional_balance;

    std::vector<ComponentAmount> components;
    size_t usable = 0;
    size_t misconfigured = 0;
    for (const auto& verdict : result.eligibility.schemes) {
        if (!verdict.payable) {
            continue;
        }
        const SchemeComponent* scheme = params_.find_scheme(verdict.scheme_id);
        if (scheme == nullptr) {
            throw ConfigurationError("Scheme '" + verdict.scheme_id + "' is not defined");
        }

        try {
            const SchemeFormula formula = make_formula(*scheme, result.eligibility.contribution_override);
            double amount = evaluate_formula(formula, fctx, scheme->id, result.trace, result.warnings);
            if (scheme->type != SchemeType::Minimum && verdict.early_multiplier < 1.0) {
                amount *= verdict.early_multiplier;
                result.trace.append(Stage::Dispatch, "Early retirement reduction",
                                    "component x " + format_number(verdict.early_multiplier),
                                    format_amount(amount), scheme->id);
            }
            result.trace.append(Stage::Dispatch, "Scheme: " + scheme->id,
                                scheme_type_to_string(scheme->type) + " formula",
                                params_.metadata.currency_code + " " + format_amount(amount),
                                scheme->id, scheme->primary_citation());
            components.emplace_back(scheme->id, scheme->type, amount);
            ++usable;
        } catch (const ConfigurationError& e) {
            ++misconfigured;
            result.warnings.emplace_back(IssueKind::ConfigurationError, scheme->id, e.what());
            result.trace.append(Stage::Dispatch, "Scheme failed", e.what(), "0", scheme->id);
            components.emplace_back(scheme->id, scheme->type, 0.0);
        } catch (const ComputationError& e) {
            result.warnings.emplace_back(IssueKind::ComputationError, scheme->id, e.what());
            result.trace.append(Stage::Dispatch, "Scheme failed", e.what(), "0", scheme->id);
            components.emplace_back(scheme->id, scheme->type, 0.0);
        }
    }
    // A misconfiguration is fatal once no payable scheme produced a component
    if (misconfigured > 0 && usable == 0) {
        logger.log_error(log_ctx, "no payable scheme produced a usable component");
        throw ConfigurationError("No payable scheme of " + result.country + " for worker type '" +
                                 profile.worker_type_id + "' produced a usable component (" +
                                 std::to_string(misconfigured) + " misconfigured)");
    }

    // 4. Aggregate
    Aggregator aggregator(params_.payout, average_wage_);
    AggregateResult aggregate = aggregator.aggregate(components, result.trace, result.warnings);
    result.gross_benefit = aggregate.total;
    result.component_breakdown = aggregate.breakdown;

    // 5. Tax
    result.net_benefit = tax_.net_benefit(result.gross_benefit);
    result.trace.append(Stage::Tax, "Net pension", tax_.describe(),
                        params_.metadata.currency_code + " " + format_amount(result.net_benefit));

    if (result.individual_wage > 0.0) {
        result.gross_replacement_rate = result.gross_benefit / result.individual_wage;
        result.net_replacement_rate = result.net_benefit / result.individual_wage;
    }
    result.gross_pension_level = result.gross_benefit / average_wage_;
    result.net_pension_level = result.net_benefit / average_wage_;

    // 6. Wealth
    if (result.gross_benefit > 0.0) {
        const AnnuityFactor af = wealth.annuity_factor(result.country, profile.sex, result.retirement_age,
                                                       result.trace, result.warnings);
        result.annuity_factor = af.value;
        result.wealth_method = af.method;
        result.gross_pension_wealth = WealthCalculator::wealth_aw_multiple(result.gross_benefit, af, average_wage_);
        result.net_pension_wealth = WealthCalculator::wealth_aw_multiple(result.net_benefit, af, average_wage_);
        result.trace.append(Stage::Wealth, "Gross pension wealth",
                            format_amount(result.gross_benefit) + " x " + format_number(af.value) + " / AW",
                            format_number(result.gross_pension_wealth, 2) + " x AW");
    }

    finish();
    return result;
}

} // namespace pensioncalc
