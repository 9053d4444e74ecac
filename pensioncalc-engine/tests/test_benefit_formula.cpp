#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "benefit_formula.hpp"
#include "errors.hpp"

using namespace pensioncalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

constexpr double AW = 10000.0;

struct Evaluation {
    double amount;
    ReasoningTrace trace;
    std::vector<Issue> issues;
};

Evaluation evaluate(const SchemeComponent& scheme, const FormulaContext& ctx) {
    Evaluation e;
    e.amount = evaluate_formula(make_formula(scheme), ctx, scheme.id, e.trace, e.issues);
    return e;
}

FormulaContext context(const GlobalAssumptions& a, double wage, double years) {
    FormulaContext ctx(a);
    ctx.wage = wage;
    ctx.average_wage = AW;
    ctx.years = years;
    ctx.life_expectancy = 20.0;
    return ctx;
}

} // anonymous namespace

// ============================================================================
// Helpers
// ============================================================================

TEST_CASE("Accumulation and annuity factors", "[formula]") {
    REQUIRE_THAT(accumulation_factor(0.0, 40.0), WithinAbs(40.0, 1e-12));
    REQUIRE_THAT(annuity_certain(0.0, 20.0), WithinAbs(20.0, 1e-12));
    REQUIRE_THAT(accumulation_factor(0.05, 2.0), WithinRel(2.05, 1e-12));
    REQUIRE_THAT(annuity_certain(0.05, 1.0), WithinRel(1.0 / 1.05, 1e-12));
}

// ============================================================================
// DB
// ============================================================================

TEST_CASE("DB accrual", "[formula][db]") {
    GlobalAssumptions a;
    SchemeComponent db("db", SchemeType::DB);
    db.benefits.accrual_rate = 0.02;
    db.benefits.max_accrual_years = 35.0;

    SECTION("Years capped at the maximum") {
        Evaluation e = evaluate(db, context(a, 10000.0, 40.0));
        REQUIRE_THAT(e.amount, WithinAbs(7000.0, 1e-9));
        REQUIRE(e.trace.size() == 1);
        REQUIRE(e.issues.empty());
    }

    SECTION("Reference wage capped at the contribution ceiling") {
        db.contributions.ceiling_aw_multiple = 1.5;
        Evaluation e = evaluate(db, context(a, 25000.0, 30.0));
        REQUIRE_THAT(e.amount, WithinAbs(0.02 * 30.0 * 15000.0, 1e-9));
    }

    SECTION("Scheme maximum clamps with a warning") {
        db.benefits.maximum_benefit_aw_multiple = 0.5;
        Evaluation e = evaluate(db, context(a, 10000.0, 35.0));
        REQUIRE_THAT(e.amount, WithinAbs(5000.0, 1e-9));
        REQUIRE(e.issues.size() == 1);
        REQUIRE(e.issues[0].kind == IssueKind::ComputationWarning);
    }

    SECTION("Missing accrual rate") {
        db.benefits.accrual_rate.reset();
        REQUIRE_THROWS_AS(make_formula(db), ConfigurationError);
    }
}

TEST_CASE("DB benefit is non-decreasing in service then flat", "[formula][db][property]") {
    GlobalAssumptions a;
    SchemeComponent db("db", SchemeType::DB);
    db.benefits.accrual_rate = 0.015;
    db.benefits.max_accrual_years = 35.0;

    double previous = 0.0;
    for (double years = 0.0; years <= 45.0; years += 1.0) {
        const double amount = evaluate(db, context(a, 10000.0, years)).amount;
        REQUIRE(amount >= previous);
        if (years >= 35.0) {
            REQUIRE_THAT(amount, WithinAbs(0.015 * 35.0 * 10000.0, 1e-9));
        }
        previous = amount;
    }
}

// ============================================================================
// NDC and DC
// ============================================================================

TEST_CASE("NDC converts the notional account with the divisor", "[formula][ndc]") {
    GlobalAssumptions a;
    a.real_wage_growth = 0.0;
    a.inflation = 0.0;
    SchemeComponent ndc("ndc", SchemeType::NDC);
    ndc.contributions.total_rate = 0.2;
    ndc.benefits.annuity_divisor_at_nra = 16.0;

    Evaluation e = evaluate(ndc, context(a, 10000.0, 40.0));
    // 0.2 x 10000 x 40 / 16
    REQUIRE_THAT(e.amount, WithinAbs(5000.0, 1e-9));
    REQUIRE(e.issues.empty());

    SECTION("Missing divisor falls back to life expectancy") {
        ndc.benefits.annuity_divisor_at_nra.reset();
        Evaluation fb = evaluate(ndc, context(a, 10000.0, 40.0));
        REQUIRE_THAT(fb.amount, WithinAbs(80000.0 / 20.0, 1e-9));
        REQUIRE(fb.issues.size() == 1);
    }

    SECTION("Notional balance override") {
        FormulaContext ctx = context(a, 10000.0, 40.0);
        ctx.notional_balance = 32000.0;
        REQUIRE_THAT(evaluate(ndc, ctx).amount, WithinAbs(2000.0, 1e-9));
    }

    SECTION("Fixed index requires a rate") {
        ndc.benefits.notional_interest = NotionalIndex::Fixed;
        REQUIRE_THROWS_AS(make_formula(ndc), ConfigurationError);
    }

    SECTION("Non-positive divisor is a computation error") {
        ndc.benefits.annuity_divisor_at_nra = 0.0;
        ReasoningTrace trace;
        std::vector<Issue> issues;
        REQUIRE_THROWS_AS(evaluate_formula(make_formula(ndc), context(a, 10000.0, 40.0), "ndc", trace, issues),
                          ComputationError);
    }
}

TEST_CASE("DC annuitises the accumulated fund", "[formula][dc]") {
    GlobalAssumptions a;
    a.dc_net_real_return = 0.0;
    a.discount_rate = 0.0;
    SchemeComponent dc("dc", SchemeType::DC);
    dc.contributions.employee_rate = 0.05;
    dc.contributions.employer_rate = 0.05;

    // Fund 0.1 x 10000 x 40 = 40000, fallback divisor = 20 years at 0%
    Evaluation e = evaluate(dc, context(a, 10000.0, 40.0));
    REQUIRE_THAT(e.amount, WithinAbs(2000.0, 1e-9));
    REQUIRE(e.issues.size() == 1);

    SECTION("Worker-type contribution override") {
        ContributionRules over;
        over.total_rate = 0.2;
        ReasoningTrace trace;
        std::vector<Issue> issues;
        const double amount = evaluate_formula(make_formula(dc, over), context(a, 10000.0, 40.0),
                                               "dc", trace, issues);
        REQUIRE_THAT(amount, WithinAbs(4000.0, 1e-9));
    }

    SECTION("No contribution rate yields zero") {
        SchemeComponent bare("bare", SchemeType::DC);
        bare.benefits.annuity_divisor_at_nra = 20.0;
        REQUIRE(evaluate(bare, context(a, 10000.0, 40.0)).amount == 0.0);
    }
}

// ============================================================================
// Points, Basic, Targeted, Minimum
// ============================================================================

TEST_CASE("Points accrue by relative earnings", "[formula][points]") {
    GlobalAssumptions a;
    SchemeComponent points("points", SchemeType::Points);
    points.benefits.point_value_aw_multiple = 0.01;

    // 1.5 points a year x 40 years x 100
    Evaluation e = evaluate(points, context(a, 15000.0, 40.0));
    REQUIRE_THAT(e.amount, WithinAbs(6000.0, 1e-9));

    SECTION("Zero average wage") {
        FormulaContext ctx = context(a, 15000.0, 40.0);
        ctx.average_wage = 0.0;
        ReasoningTrace trace;
        std::vector<Issue> issues;
        REQUIRE_THROWS_AS(evaluate_formula(make_formula(points), ctx, "points", trace, issues), ComputationError);
    }

    SECTION("Missing point value") {
        SchemeComponent bare("bare", SchemeType::Points);
        REQUIRE_THROWS_AS(make_formula(bare), ConfigurationError);
    }
}

TEST_CASE("Basic pension is flat", "[formula][basic]") {
    GlobalAssumptions a;
    SchemeComponent basic("basic", SchemeType::Basic);

    SECTION("Indexed to the average wage") {
        basic.benefits.flat_rate_aw_multiple = 0.15;
        REQUIRE_THAT(evaluate(basic, context(a, 50000.0, 5.0)).amount, WithinAbs(1500.0, 1e-9));
    }

    SECTION("Absolute amount") {
        basic.benefits.flat_rate_absolute = 1200.0;
        REQUIRE_THAT(evaluate(basic, context(a, 0.0, 0.0)).amount, WithinAbs(1200.0, 1e-9));
    }

    SECTION("No amount at all") {
        REQUIRE_THROWS_AS(make_formula(basic), ConfigurationError);
    }
}

TEST_CASE("Targeted pension tapers above the threshold", "[formula][targeted]") {
    GlobalAssumptions a;
    SchemeComponent targeted("targeted", SchemeType::Targeted);
    targeted.benefits.maximum_benefit_absolute = 5000.0;
    targeted.benefits.taper_rate = 0.5;
    targeted.benefits.income_threshold = 2000.0;

    REQUIRE_THAT(evaluate(targeted, context(a, 6000.0, 40.0)).amount, WithinAbs(3000.0, 1e-9));
    REQUIRE_THAT(evaluate(targeted, context(a, 1000.0, 40.0)).amount, WithinAbs(5000.0, 1e-9));
    REQUIRE(evaluate(targeted, context(a, 20000.0, 40.0)).amount == 0.0);

    SECTION("Negative taper") {
        targeted.benefits.taper_rate = -0.1;
        REQUIRE_THROWS_AS(make_formula(targeted), ConfigurationError);
    }
}

TEST_CASE("Minimum formula returns the floor level", "[formula][minimum]") {
    GlobalAssumptions a;
    SchemeComponent minimum("min", SchemeType::Minimum);
    minimum.benefits.minimum_benefit_aw_multiple = 0.3;

    REQUIRE_THAT(evaluate(minimum, context(a, 50000.0, 40.0)).amount, WithinAbs(3000.0, 1e-9));

    SchemeComponent bare("bare", SchemeType::Minimum);
    REQUIRE_THROWS_AS(make_formula(bare), ConfigurationError);
}

TEST_CASE("Formula variant matches the scheme type", "[formula]") {
    SchemeComponent basic("basic", SchemeType::Basic);
    basic.benefits.flat_rate_aw_multiple = 0.1;
    REQUIRE(std::holds_alternative<BasicFormula>(make_formula(basic)));

    SchemeComponent dc("dc", SchemeType::DC);
    REQUIRE(std::holds_alternative<DcFormula>(make_formula(dc)));
}
