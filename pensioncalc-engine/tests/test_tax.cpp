#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "errors.hpp"
#include "tax.hpp"

using namespace pensioncalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

constexpr double AW = 10000.0;

BracketTax progressive_schedule() {
    BracketTax tax;
    tax.brackets = {
        TaxBracket(5000.0, 0.0),
        TaxBracket(15000.0, 0.10),
        TaxBracket(30000.0, 0.20),
        TaxBracket(BracketTax::UNBOUNDED, 0.30)
    };
    tax.basic_allowance = 1000.0;
    tax.social_contribution_rate = 0.05;
    return tax;
}

} // anonymous namespace

// ============================================================================
// Flat Rate
// ============================================================================

TEST_CASE("Flat rate tax applies one rate to benefit and wage", "[tax]") {
    TaxConverter tax(FlatRateTax(0.2), AW);

    REQUIRE(tax.is_flat_rate());
    REQUIRE_THAT(tax.net_benefit(5000.0), WithinRel(4000.0, 1e-12));
    REQUIRE_THAT(tax.net_wage(10000.0), WithinRel(8000.0, 1e-12));
    REQUIRE_THAT(tax.effective_rate(1234.0), WithinAbs(0.2, 1e-12));
    REQUIRE(tax.income_tax(5000.0) == 0.0);
    REQUIRE(tax.warnings().empty());
    REQUIRE(tax.describe() == "gross x (1 - 0.2000)");
}

TEST_CASE("Flat rate outside [0,1] is clamped with a warning", "[tax][edge]") {
    SECTION("Above one") {
        TaxConverter tax(FlatRateTax(1.4), AW);
        REQUIRE(tax.warnings().size() == 1);
        REQUIRE(tax.warnings()[0].kind == IssueKind::ComputationWarning);
        REQUIRE(tax.net(5000.0) == 0.0);
    }

    SECTION("Negative") {
        TaxConverter tax(FlatRateTax(-0.1), AW);
        REQUIRE(tax.warnings().size() == 1);
        REQUIRE(tax.net(5000.0) == 5000.0);
    }
}

TEST_CASE("Non-finite flat rate is a configuration error", "[tax][error]") {
    REQUIRE_THROWS_AS(TaxConverter(FlatRateTax(std::numeric_limits<double>::quiet_NaN()), AW),
                      ConfigurationError);
}

// ============================================================================
// Brackets
// ============================================================================

TEST_CASE("Bracket tax computes marginal bands over the allowance", "[tax]") {
    TaxConverter tax(progressive_schedule(), AW);

    REQUIRE_FALSE(tax.is_flat_rate());

    // Taxable 20000: 5000 at 0, 10000 at 10%, 5000 at 20%
    REQUIRE_THAT(tax.income_tax(21000.0), WithinAbs(2000.0, 1e-9));
    REQUIRE_THAT(tax.net(21000.0), WithinAbs(21000.0 - 2000.0 - 1050.0, 1e-9));

    // Below the allowance only the social contribution applies
    REQUIRE(tax.income_tax(800.0) == 0.0);
    REQUIRE_THAT(tax.net(800.0), WithinAbs(760.0, 1e-9));

    // Top bracket
    REQUIRE_THAT(tax.income_tax(41000.0), WithinAbs(0.0 + 1000.0 + 3000.0 + 3000.0, 1e-9));
}

TEST_CASE("Bracket allowance as a multiple of the average wage", "[tax]") {
    BracketTax schedule = progressive_schedule();
    schedule.basic_allowance_aw_multiple = 0.5;
    TaxConverter tax(schedule, AW);

    // Allowance 5000 replaces the absolute 1000
    REQUIRE_THAT(tax.income_tax(15000.0), WithinAbs(500.0, 1e-9));
}

TEST_CASE("Unordered brackets are sorted before use", "[tax]") {
    BracketTax schedule;
    schedule.brackets = {TaxBracket(BracketTax::UNBOUNDED, 0.3), TaxBracket(10000.0, 0.1)};
    TaxConverter tax(schedule, AW);

    REQUIRE_THAT(tax.income_tax(20000.0), WithinAbs(1000.0 + 3000.0, 1e-9));
}

TEST_CASE("Invalid bracket schedules are rejected", "[tax][error]") {
    SECTION("Rate above one") {
        BracketTax schedule;
        schedule.brackets = {TaxBracket(BracketTax::UNBOUNDED, 1.2)};
        REQUIRE_THROWS_AS(TaxConverter(schedule, AW), ConfigurationError);
    }

    SECTION("Duplicate thresholds") {
        BracketTax schedule;
        schedule.brackets = {TaxBracket(5000.0, 0.1), TaxBracket(5000.0, 0.2)};
        REQUIRE_THROWS_AS(TaxConverter(schedule, AW), ConfigurationError);
    }

    SECTION("Combined marginal rate above one") {
        BracketTax schedule;
        schedule.brackets = {TaxBracket(BracketTax::UNBOUNDED, 0.9)};
        schedule.social_contribution_rate = 0.2;
        REQUIRE_THROWS_AS(TaxConverter(schedule, AW), ConfigurationError);
    }

    SECTION("Negative allowance") {
        BracketTax schedule = progressive_schedule();
        schedule.basic_allowance = -1.0;
        REQUIRE_THROWS_AS(TaxConverter(schedule, AW), ConfigurationError);
    }
}

TEST_CASE("Net never exceeds gross and is non-decreasing", "[tax][property]") {
    TaxConverter flat(FlatRateTax(0.25), AW);
    TaxConverter brackets(progressive_schedule(), AW);

    for (const TaxConverter* tax : {&flat, &brackets}) {
        double previous_net = 0.0;
        for (double gross = 0.0; gross <= 60000.0; gross += 250.0) {
            const double net = tax->net(gross);
            REQUIRE(net <= gross + 1e-9);
            REQUIRE(net >= previous_net - 1e-9);
            previous_net = net;
        }
    }
}

TEST_CASE("Zero gross has zero net and a defined effective rate", "[tax][edge]") {
    TaxConverter brackets(progressive_schedule(), AW);
    REQUIRE(brackets.net(0.0) == 0.0);
    REQUIRE_THAT(brackets.effective_rate(0.0), WithinAbs(0.05, 1e-12));
}
