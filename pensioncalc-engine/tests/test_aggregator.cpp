#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "aggregator.hpp"

using namespace pensioncalc;
using Catch::Matchers::WithinAbs;

namespace {

constexpr double AW = 10000.0;

} // anonymous namespace

TEST_CASE("Aggregator sums non-minimum components", "[aggregator]") {
    CountryPayoutRules payout;
    Aggregator aggregator(payout, AW);
    ReasoningTrace trace;
    std::vector<Issue> issues;

    std::vector<ComponentAmount> components = {
        {"basic", SchemeType::Basic, 1500.0},
        {"db", SchemeType::DB, 4000.0},
        {"dc", SchemeType::DC, 500.0}
    };

    AggregateResult r = aggregator.aggregate(components, trace, issues);

    REQUIRE_THAT(r.total, WithinAbs(6000.0, 1e-9));
    REQUIRE_THAT(r.pre_floor_total, WithinAbs(6000.0, 1e-9));
    REQUIRE_FALSE(r.floor_scheme_id.has_value());
    REQUIRE(r.top_up == 0.0);
    REQUIRE(issues.empty());
    REQUIRE(r.breakdown.size() == 3);
    REQUIRE_THAT(r.breakdown.at("db"), WithinAbs(4000.0, 1e-9));
    REQUIRE(trace.steps().back().label == "Gross pension");
}

TEST_CASE("Minimum floor tops up to the floor exactly", "[aggregator][floor]") {
    CountryPayoutRules payout;
    Aggregator aggregator(payout, AW);
    ReasoningTrace trace;
    std::vector<Issue> issues;

    SECTION("Sum below floor") {
        std::vector<ComponentAmount> components = {
            {"db", SchemeType::DB, 1200.0},
            {"min", SchemeType::Minimum, 3000.0}
        };
        AggregateResult r = aggregator.aggregate(components, trace, issues);

        REQUIRE_THAT(r.total, WithinAbs(3000.0, 1e-9));
        REQUIRE_THAT(r.top_up, WithinAbs(1800.0, 1e-9));
        REQUIRE(r.floor_scheme_id == std::optional<std::string>("min"));
        REQUIRE_THAT(r.breakdown.at("min"), WithinAbs(1800.0, 1e-9));
        REQUIRE_THAT(r.breakdown.at("db") + r.breakdown.at("min"), WithinAbs(r.total, 1e-9));
    }

    SECTION("Sum above floor is untouched") {
        std::vector<ComponentAmount> components = {
            {"db", SchemeType::DB, 5000.0},
            {"min", SchemeType::Minimum, 3000.0}
        };
        AggregateResult r = aggregator.aggregate(components, trace, issues);

        REQUIRE_THAT(r.total, WithinAbs(5000.0, 1e-9));
        REQUIRE(r.top_up == 0.0);
        REQUIRE(r.breakdown.at("min") == 0.0);
        REQUIRE(r.total > r.floor);
    }

    SECTION("Largest floor binds, first on ties") {
        std::vector<ComponentAmount> components = {
            {"min_a", SchemeType::Minimum, 2000.0},
            {"min_b", SchemeType::Minimum, 2500.0},
            {"min_c", SchemeType::Minimum, 2500.0}
        };
        AggregateResult r = aggregator.aggregate(components, trace, issues);

        REQUIRE(r.floor_scheme_id == std::optional<std::string>("min_b"));
        REQUIRE_THAT(r.total, WithinAbs(2500.0, 1e-9));
        REQUIRE(r.breakdown.at("min_a") == 0.0);
        REQUIRE(r.breakdown.at("min_c") == 0.0);
    }
}

TEST_CASE("Country maximum caps the total pro rata", "[aggregator][cap]") {
    CountryPayoutRules payout;
    payout.maximum_benefit_aw_multiple = 0.5;
    Aggregator aggregator(payout, AW);
    ReasoningTrace trace;
    std::vector<Issue> issues;

    std::vector<ComponentAmount> components = {
        {"basic", SchemeType::Basic, 2000.0},
        {"db", SchemeType::DB, 6000.0}
    };
    AggregateResult r = aggregator.aggregate(components, trace, issues);

    REQUIRE_THAT(r.total, WithinAbs(5000.0, 1e-9));
    REQUIRE_THAT(r.capped_amount, WithinAbs(3000.0, 1e-9));
    REQUIRE_THAT(r.breakdown.at("basic"), WithinAbs(1250.0, 1e-9));
    REQUIRE_THAT(r.breakdown.at("db"), WithinAbs(3750.0, 1e-9));
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0].kind == IssueKind::ComputationWarning);
}

TEST_CASE("Aggregator with no components yields zero", "[aggregator]") {
    CountryPayoutRules payout;
    Aggregator aggregator(payout, AW);
    ReasoningTrace trace;
    std::vector<Issue> issues;

    AggregateResult r = aggregator.aggregate({}, trace, issues);
    REQUIRE(r.total == 0.0);
    REQUIRE(r.breakdown.empty());
}
