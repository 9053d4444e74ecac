#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "engine.hpp"
#include "errors.hpp"
#include "io/json_writer.hpp"
#include "io/params_reader.hpp"
#include "io/parquet_writer.hpp"

using namespace pensioncalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

const std::string DATA_DIR = PENSIONCALC_DATA_DIR;

const char* MINIMAL_COUNTRY = R"({
  "metadata": { "iso3": "TST", "country_name": "Testland" },
  "schemes": [
    {
      "id": "db",
      "type": "DB",
      "eligibility": {
        "normal_retirement_age_male": 65,
        "normal_retirement_age_female": 63,
        "minimum_contribution_years": 20
      },
      "contributions": { "employee_rate": 0.05, "contribution_ceiling_aw_multiple": 3.0 },
      "benefits": {
        "accrual_rate_per_year": { "value": 0.02, "source_citation": "Act 1" },
        "max_accrual_years": 35
      }
    }
  ],
  "worker_types": {
    "private_employee": { "coverage": "mandatory", "scheme_ids": ["db"] },
    "public": {
      "inherit": "private_employee",
      "coverage_status": "mandatory",
      "eligibility_override": { "normal_retirement_age_male": 60 }
    }
  },
  "taxes": { "simplified_net_rate": 0.15 }
})";

std::string with_schemes(const std::string& schemes) {
    return R"({"metadata": {"iso3": "TST"}, "schemes": )" + schemes + "}";
}

} // anonymous namespace

// ============================================================================
// Country parameters
// ============================================================================

TEST_CASE("Parse a minimal country document", "[io][params]") {
    CountryParameterSet params = io::parse_country_params_from_string(MINIMAL_COUNTRY);

    REQUIRE(params.metadata.iso3 == "TST");
    REQUIRE(params.metadata.country_name == "Testland");
    REQUIRE(params.schemes.size() == 1);

    const SchemeComponent& db = params.schemes[0];
    REQUIRE(db.type == SchemeType::DB);
    REQUIRE(db.name == "db");
    REQUIRE(db.active);

    SECTION("Sourced values and field aliases") {
        REQUIRE(db.benefits.accrual_rate.has_value());
        REQUIRE_THAT(*db.benefits.accrual_rate, WithinAbs(0.02, 1e-12));
        REQUIRE(*db.eligibility.minimum_service_years == 20.0);
        REQUIRE(*db.contributions.ceiling_aw_multiple == 3.0);
        REQUIRE_FALSE(db.contributions.employer_rate.has_value());
    }

    SECTION("Source citations are kept under the canonical name") {
        REQUIRE(db.citations.size() == 1);
        REQUIRE(db.citations.at("accrual_rate") == "Act 1");
        REQUIRE(db.primary_citation() == "Act 1");
    }

    SECTION("Sex-specific ages") {
        REQUIRE(*db.eligibility.normal_retirement_age(Sex::Male) == 65.0);
        REQUIRE(*db.eligibility.normal_retirement_age(Sex::Female) == 63.0);
        REQUIRE_FALSE(db.eligibility.early_retirement_age(Sex::Male).has_value());
    }

    SECTION("Worker types and inheritance") {
        REQUIRE(params.worker_types.size() == 2);
        REQUIRE(params.worker_types.at("private_employee").label == "private_employee");

        WorkerTypeRule resolved = params.resolve_worker_type("public");
        REQUIRE(resolved.coverage == CoverageStatus::Mandatory);
        REQUIRE(resolved.scheme_ids == std::vector<std::string>{"db"});
        REQUIRE(resolved.eligibility_override.has_value());
        REQUIRE(*resolved.eligibility_override->normal_retirement_age(Sex::Male) == 60.0);
    }

    SECTION("Flat tax without brackets") {
        REQUIRE(std::holds_alternative<FlatRateTax>(params.tax));
        REQUIRE_THAT(std::get<FlatRateTax>(params.tax).simplified_net_rate, WithinAbs(0.15, 1e-12));
    }
}

TEST_CASE("Parse progressive tax brackets", "[io][params][tax]") {
    const std::string doc = R"({
      "metadata": {"iso3": "TST"},
      "schemes": [{"id": "basic", "type": "basic", "benefits": {"flat_rate_aw_multiple": 0.1}}],
      "taxes": {
        "brackets": [{"upper": 1000, "rate": 0.0}, {"upper": null, "rate": 0.25}],
        "pension_tax_allowance_aw_multiple": 0.1,
        "social_contribution_rate": 0.03
      }
    })";

    CountryParameterSet params = io::parse_country_params_from_string(doc);

    REQUIRE(std::holds_alternative<BracketTax>(params.tax));
    const BracketTax& tax = std::get<BracketTax>(params.tax);
    REQUIRE(tax.brackets.size() == 2);
    REQUIRE(tax.brackets[0].upper_threshold == 1000.0);
    REQUIRE(tax.brackets[1].upper_threshold == BracketTax::UNBOUNDED);
    REQUIRE(tax.brackets[1].marginal_rate == 0.25);
    REQUIRE(*tax.basic_allowance_aw_multiple == 0.1);
    REQUIRE(tax.social_contribution_rate == 0.03);

    SECTION("Bracket without a rate") {
        const std::string bad = R"({
          "metadata": {"iso3": "TST"},
          "schemes": [{"id": "basic", "type": "basic"}],
          "taxes": {"brackets": [{"upper": 1000}]}
        })";
        REQUIRE_THROWS_AS(io::parse_country_params_from_string(bad), ConfigParseError);
    }
}

TEST_CASE("Malformed country documents", "[io][params][error]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(io::parse_country_params_from_string("{ not json"), ConfigParseError);
    }

    SECTION("Missing metadata") {
        REQUIRE_THROWS_AS(io::parse_country_params_from_string(R"({"schemes": []})"), ConfigParseError);
    }

    SECTION("Bad ISO3 code") {
        const std::string doc = R"({"metadata": {"iso3": "TEST"}, "schemes": [{"id": "b", "type": "basic"}]})";
        REQUIRE_THROWS_AS(io::parse_country_params_from_string(doc), ConfigParseError);
    }

    SECTION("Empty scheme list") {
        REQUIRE_THROWS_AS(io::parse_country_params_from_string(with_schemes("[]")), ConfigParseError);
    }

    SECTION("Scheme without a type") {
        REQUIRE_THROWS_AS(io::parse_country_params_from_string(with_schemes(R"([{"id": "x"}])")),
                          ConfigParseError);
    }

    SECTION("Wrong value type") {
        const std::string schemes = R"([{"id": "x", "type": "DB", "benefits": {"accrual_rate": "two"}}])";
        REQUIRE_THROWS_AS(io::parse_country_params_from_string(with_schemes(schemes)), ConfigParseError);
    }

    SECTION("Unsupported scheme type") {
        REQUIRE_THROWS_AS(io::parse_country_params_from_string(with_schemes(R"([{"id": "x", "type": "lottery"}])")),
                          ConfigurationError);
    }

    SECTION("Duplicate scheme id") {
        const std::string schemes = R"([{"id": "x", "type": "basic"}, {"id": "x", "type": "DC"}])";
        REQUIRE_THROWS_AS(io::parse_country_params_from_string(with_schemes(schemes)), ConfigurationError);
    }

    SECTION("Worker type references an unknown scheme") {
        const std::string doc = R"({
          "metadata": {"iso3": "TST"},
          "schemes": [{"id": "x", "type": "basic"}],
          "worker_types": {"w": {"scheme_ids": ["y"]}}
        })";
        REQUIRE_THROWS_WITH(io::parse_country_params_from_string(doc), ContainsSubstring("unknown scheme 'y'"));
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(io::load_country_params("no_such_country.json"), ConfigParseError);
    }
}

// ============================================================================
// Assumptions
// ============================================================================

TEST_CASE("Parse assumptions", "[io][assumptions]") {
    SECTION("Omitted fields keep their defaults") {
        GlobalAssumptions defaults;
        GlobalAssumptions a = io::parse_assumptions_from_string(R"({"discount_rate": 0.03})");
        REQUIRE(a.discount_rate == 0.03);
        REQUIRE(a.career_length == defaults.career_length);
        REQUIRE(a.entry_age == defaults.entry_age);
    }

    SECTION("Density outside [0, 1]") {
        REQUIRE_THROWS_AS(io::parse_assumptions_from_string(R"({"contribution_density": 1.2})"), ConfigParseError);
    }

    SECTION("Negative career") {
        REQUIRE_THROWS_AS(io::parse_assumptions_from_string(R"({"career_length": -1})"), ConfigParseError);
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(io::parse_assumptions_from_string("[1, 2]"), ConfigParseError);
    }
}

// ============================================================================
// Sample inputs
// ============================================================================

TEST_CASE("Load the sample inputs", "[io][sample]") {
    CountryParameterSet params = io::load_country_params(DATA_DIR + "/sample_country.json");
    GlobalAssumptions assumptions = io::load_assumptions(DATA_DIR + "/sample_assumptions.json");

    REQUIRE(params.metadata.iso3 == "EXA");
    REQUIRE(params.schemes.size() == 5);
    REQUIRE(params.worker_types.size() == 4);
    REQUIRE(std::holds_alternative<BracketTax>(params.tax));
    REQUIRE(*params.payout.maximum_benefit_aw_multiple == 2.0);

    const SchemeComponent* closed = params.find_scheme("old_provident_fund");
    REQUIRE(closed != nullptr);
    REQUIRE_FALSE(closed->active);
    REQUIRE(closed->reform_status == ReformStatus::Closed);
    REQUIRE(params.find_scheme("earnings_related")->primary_citation() == "Social Insurance Law art. 41");
    REQUIRE(params.find_scheme("basic_pension")->primary_citation() == "Social Security Act s.12");
    REQUIRE(params.find_scheme("occupational_dc")->citations.empty());

    REQUIRE(assumptions.career_length == 45.0);
    REQUIRE(assumptions.life_table_year == 2022);

    TableLifeTableProvider provider;
    provider.add_table("EXA", LifeTable::load_from_csv(DATA_DIR + "/sample_life_table.csv"));
    PensionEngine engine(params, assumptions, 10000.0, provider);

    SECTION("Private employee across the grid") {
        std::vector<PensionResult> results = engine.run_all_multiples(engine.standard_profile(Sex::Female));
        REQUIRE(results.size() == EARNINGS_MULTIPLES.size());

        for (const PensionResult& r : results) {
            REQUIRE(r.eligibility.eligible);
            REQUIRE(r.component_breakdown.count("basic_pension") == 1);
            REQUIRE(r.component_breakdown.count("earnings_related") == 1);
            REQUIRE(r.component_breakdown.count("old_provident_fund") == 0);
            // Guaranteed minimum of 0.3 AW
            REQUIRE(r.gross_benefit >= 3000.0 - 1e-9);
            REQUIRE(r.net_benefit <= r.gross_benefit);
            REQUIRE(r.wealth_method == WealthMethod::SurvivalWeighted);
        }
    }

    SECTION("Informal workers are excluded") {
        PensionResult r = engine.compute(engine.standard_profile(Sex::Male, "informal"));
        REQUIRE(r.gross_benefit == 0.0);
        REQUIRE_FALSE(r.eligibility.eligible);
    }
}

// ============================================================================
// JSON output
// ============================================================================

TEST_CASE("Pension results serialize to JSON", "[io][json]") {
    CountryParameterSet params = io::parse_country_params_from_string(MINIMAL_COUNTRY);
    GlobalAssumptions assumptions;
    NullLifeTableProvider provider;
    PensionEngine engine(params, assumptions, 10000.0, provider);

    PersonProfile profile = engine.standard_profile(Sex::Male);
    PensionResult result = engine.compute(profile, 1.0);

    SECTION("Single result with trace") {
        std::ostringstream os;
        io::write_pension_result_json(os, result);
        json j = json::parse(os.str());

        REQUIRE(j["country"] == "TST");
        REQUIRE(j["sex"] == "male");
        REQUIRE(j["worker_type_id"] == "private_employee");
        REQUIRE_THAT(j["gross_benefit"].get<double>(), WithinAbs(result.gross_benefit, 1e-9));
        REQUIRE_THAT(j["net_replacement_rate"].get<double>(), WithinAbs(result.net_replacement_rate, 1e-12));
        REQUIRE(j["component_breakdown"].contains("db"));
        REQUIRE(j["eligibility"]["eligible"] == true);
        REQUIRE(j["reasoning"].is_array());
        REQUIRE(j["reasoning"].size() == result.trace.size());
        REQUIRE(j["warnings"].is_array());

        bool cited = false;
        for (const auto& step : j["reasoning"]) {
            if (step.contains("citation")) {
                REQUIRE(step["citation"] == "Act 1");
                REQUIRE(step["scheme_id"] == "db");
                cited = true;
            }
        }
        REQUIRE(cited);
    }

    SECTION("Compact results without trace") {
        std::ostringstream os;
        io::write_pension_results_json(os, engine.run_all_multiples(profile), false, false);
        const std::string text = os.str();
        REQUIRE(text.find('\n') == text.size() - 1);

        json j = json::parse(text);
        REQUIRE(j.is_array());
        REQUIRE(j.size() == EARNINGS_MULTIPLES.size());
        REQUIRE(j[0]["earnings_multiple"] == 0.5);
        REQUIRE_FALSE(j[0].contains("reasoning"));
    }

    SECTION("Results file") {
        const std::string path = "test_pensioncalc_results.json";
        io::write_pension_results_json(path, {result});

        std::ifstream file(path);
        json j = json::parse(file);
        file.close();
        REQUIRE(j.size() == 1);
        std::filesystem::remove(path);
    }

    SECTION("Unwritable results file") {
        REQUIRE_THROWS_AS(io::write_pension_results_json("no_such_dir/out.json", {result}), std::runtime_error);
    }
}

// ============================================================================
// Parquet output
// ============================================================================

#ifndef HAVE_ARROW
TEST_CASE("Parquet output needs Arrow", "[io][parquet]") {
    PensionResult result;
    REQUIRE_THROWS_WITH(ParquetWriter::write_results({result}, "out.parquet"),
                        ContainsSubstring("Apache Arrow not available"));
}
#else
TEST_CASE("Parquet output rejects an empty result set", "[io][parquet]") {
    REQUIRE_THROWS_AS(ParquetWriter::write_results({}, "empty.parquet"), std::runtime_error);
}
#endif
