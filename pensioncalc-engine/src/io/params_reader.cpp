#include "params_reader.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <map>
#include <sstream>

using json = nlohmann::json;

namespace pensioncalc {
namespace io {

namespace {

std::string read_file(const std::string& file_path, const std::string& what) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open " + what + " file: " + file_path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Bare number, null, or {"value": x, "source_citation": ...}
std::optional<double> read_number(const json& obj, const std::string& key) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    const json& v = obj[key];
    if (v.is_null()) {
        return std::nullopt;
    }
    if (v.is_object()) {
        if (!v.contains("value") || v["value"].is_null()) {
            return std::nullopt;
        }
        return v["value"].get<double>();
    }
    return v.get<double>();
}

using Citations = std::map<std::string, std::string>;

// read_number that also keeps a sourced value's citation under `name`
std::optional<double> read_cited(const json& obj, const std::string& key, Citations& citations,
                                 const std::string& name = "") {
    std::optional<double> value = read_number(obj, key);
    if (value && obj[key].is_object() && obj[key].contains("source_citation") &&
        obj[key]["source_citation"].is_string()) {
        const std::string citation = obj[key]["source_citation"].get<std::string>();
        if (!citation.empty()) {
            citations[name.empty() ? key : name] = citation;
        }
    }
    return value;
}

std::string read_string(const json& obj, const std::string& key, const std::string& fallback = "") {
    if (!obj.contains(key) || obj[key].is_null()) {
        return fallback;
    }
    return obj[key].get<std::string>();
}

EligibilityRules parse_eligibility(const json& j, Citations& citations) {
    EligibilityRules rules;
    rules.normal_retirement_age_male = read_cited(j, "normal_retirement_age_male", citations);
    rules.normal_retirement_age_female = read_cited(j, "normal_retirement_age_female", citations);
    rules.early_retirement_age_male = read_cited(j, "early_retirement_age_male", citations);
    rules.early_retirement_age_female = read_cited(j, "early_retirement_age_female", citations);
    rules.minimum_service_years = read_cited(j, "minimum_service_years", citations);
    if (!rules.minimum_service_years) {
        rules.minimum_service_years = read_cited(j, "minimum_contribution_years", citations, "minimum_service_years");
    }
    if (auto per_month = read_cited(j, "early_reduction_per_month", citations)) {
        rules.early_reduction_per_month = *per_month;
    }
    return rules;
}

ContributionRules parse_contributions(const json& j, Citations& citations) {
    ContributionRules rules;
    rules.employee_rate = read_cited(j, "employee_rate", citations);
    rules.employer_rate = read_cited(j, "employer_rate", citations);
    rules.total_rate = read_cited(j, "total_rate", citations);
    rules.ceiling_aw_multiple = read_cited(j, "ceiling_aw_multiple", citations);
    if (!rules.ceiling_aw_multiple) {
        rules.ceiling_aw_multiple = read_cited(j, "contribution_ceiling_aw_multiple", citations, "ceiling_aw_multiple");
    }
    return rules;
}

BenefitRules parse_benefits(const json& j, Citations& citations) {
    BenefitRules rules;
    rules.accrual_rate = read_cited(j, "accrual_rate", citations);
    if (!rules.accrual_rate) {
        rules.accrual_rate = read_cited(j, "accrual_rate_per_year", citations, "accrual_rate");
    }
    rules.max_accrual_years = read_cited(j, "max_accrual_years", citations);
    if (j.contains("reference_wage") && !j["reference_wage"].is_null()) {
        rules.reference_wage = parse_reference_wage(j["reference_wage"].get<std::string>());
    }

    rules.point_value = read_cited(j, "point_value", citations);
    rules.point_value_aw_multiple = read_cited(j, "point_value_aw_multiple", citations);
    rules.points_per_year = read_cited(j, "points_per_year", citations);

    if (j.contains("notional_interest") && !j["notional_interest"].is_null()) {
        rules.notional_interest = parse_notional_index(j["notional_interest"].get<std::string>());
    }
    rules.notional_interest_fixed_rate = read_cited(j, "notional_interest_fixed_rate", citations);
    rules.annuity_divisor_at_nra = read_cited(j, "annuity_divisor_at_nra", citations);

    rules.flat_rate_aw_multiple = read_cited(j, "flat_rate_aw_multiple", citations);
    rules.flat_rate_absolute = read_cited(j, "flat_rate_absolute", citations);

    rules.taper_rate = read_cited(j, "taper_rate", citations);
    rules.income_threshold = read_cited(j, "income_threshold", citations);

    rules.minimum_benefit_aw_multiple = read_cited(j, "minimum_benefit_aw_multiple", citations);
    rules.minimum_benefit_absolute = read_cited(j, "minimum_benefit_absolute", citations);
    rules.maximum_benefit_aw_multiple = read_cited(j, "maximum_benefit_aw_multiple", citations);
    rules.maximum_benefit_absolute = read_cited(j, "maximum_benefit_absolute", citations);
    return rules;
}

SchemeComponent parse_scheme(const json& j) {
    SchemeComponent scheme;

    scheme.id = read_string(j, "id", read_string(j, "scheme_id"));
    if (scheme.id.empty()) {
        throw ConfigParseError("Scheme missing required field: id");
    }
    if (!j.contains("type")) {
        throw ConfigParseError("Scheme '" + scheme.id + "' missing required field: type");
    }
    scheme.type = parse_scheme_type(j["type"].get<std::string>());
    scheme.name = read_string(j, "name", scheme.id);
    if (j.contains("tier")) {
        scheme.tier = parse_scheme_tier(j["tier"].get<std::string>());
    }
    if (j.contains("active")) {
        scheme.active = j["active"].get<bool>();
    }
    if (j.contains("reform_status")) {
        scheme.reform_status = parse_reform_status(j["reform_status"].get<std::string>());
    }
    if (j.contains("eligibility")) {
        scheme.eligibility = parse_eligibility(j["eligibility"], scheme.citations);
    }
    if (j.contains("contributions") && !j["contributions"].is_null()) {
        scheme.contributions = parse_contributions(j["contributions"], scheme.citations);
    }
    if (j.contains("benefits")) {
        scheme.benefits = parse_benefits(j["benefits"], scheme.citations);
    }
    return scheme;
}

WorkerTypeRule parse_worker_type(const std::string& id, const json& j) {
    WorkerTypeRule rule;
    rule.label = read_string(j, "label", id);

    const std::string coverage = read_string(j, "coverage", read_string(j, "coverage_status"));
    if (!coverage.empty()) {
        rule.coverage = parse_coverage_status(coverage);
    }
    if (j.contains("scheme_ids")) {
        for (const auto& sid : j["scheme_ids"]) {
            rule.scheme_ids.push_back(sid.get<std::string>());
        }
    }
    if (j.contains("eligibility_override") && !j["eligibility_override"].is_null()) {
        const json& o = j["eligibility_override"];
        EligibilityOverride over;
        over.normal_retirement_age_male = read_number(o, "normal_retirement_age_male");
        over.normal_retirement_age_female = read_number(o, "normal_retirement_age_female");
        over.early_retirement_age_male = read_number(o, "early_retirement_age_male");
        over.early_retirement_age_female = read_number(o, "early_retirement_age_female");
        over.minimum_service_years = read_number(o, "minimum_service_years");
        if (!over.minimum_service_years) {
            over.minimum_service_years = read_number(o, "minimum_contribution_years");
        }
        rule.eligibility_override = over;
    }
    const std::string contrib_key = j.contains("contribution_override") ? "contribution_override"
                                                                        : "contributions_override";
    if (j.contains(contrib_key) && !j[contrib_key].is_null()) {
        Citations override_citations;
        rule.contribution_override = parse_contributions(j[contrib_key], override_citations);
    }
    if (j.contains("inherit") && !j["inherit"].is_null()) {
        rule.inherit = j["inherit"].get<std::string>();
    }
    rule.notes = read_string(j, "notes");
    return rule;
}

TaxStrategy parse_taxes(const json& j) {
    if (j.contains("brackets") && !j["brackets"].is_null()) {
        BracketTax tax;
        for (const auto& b : j["brackets"]) {
            const std::optional<double> upper = read_number(b, "upper");
            const std::optional<double> rate = read_number(b, "rate");
            if (!rate) {
                throw ConfigParseError("Tax bracket missing required field: rate");
            }
            tax.brackets.emplace_back(upper.value_or(BracketTax::UNBOUNDED), *rate);
        }
        tax.basic_allowance = read_number(j, "basic_allowance").value_or(0.0);
        tax.basic_allowance_aw_multiple = read_number(j, "basic_allowance_aw_multiple");
        if (!tax.basic_allowance_aw_multiple) {
            tax.basic_allowance_aw_multiple = read_number(j, "pension_tax_allowance_aw_multiple");
        }
        tax.social_contribution_rate = read_number(j, "social_contribution_rate").value_or(0.0);
        return tax;
    }
    return FlatRateTax(read_number(j, "simplified_net_rate").value_or(0.0));
}

} // anonymous namespace

CountryParameterSet parse_country_params_from_string(const std::string& json_string) {
    CountryParameterSet params;

    try {
        json j = json::parse(json_string);

        if (!j.contains("metadata")) {
            throw ConfigParseError("Missing required field: metadata");
        }
        const json& meta = j["metadata"];
        params.metadata.iso3 = read_string(meta, "iso3");
        if (params.metadata.iso3.size() != 3) {
            throw ConfigParseError("metadata.iso3 must be a three-letter code");
        }
        params.metadata.country_name = read_string(meta, "country_name", params.metadata.iso3);
        params.metadata.currency_code = read_string(meta, "currency_code");
        if (meta.contains("reference_year")) {
            params.metadata.reference_year = meta["reference_year"].get<int>();
        }

        if (!j.contains("schemes") || !j["schemes"].is_array() || j["schemes"].empty()) {
            throw ConfigParseError("Missing required field: schemes (non-empty array)");
        }
        for (const auto& scheme_json : j["schemes"]) {
            params.schemes.push_back(parse_scheme(scheme_json));
        }

        if (j.contains("worker_types")) {
            for (auto it = j["worker_types"].begin(); it != j["worker_types"].end(); ++it) {
                params.worker_types[it.key()] = parse_worker_type(it.key(), it.value());
            }
        }

        if (j.contains("taxes")) {
            params.tax = parse_taxes(j["taxes"]);
        }

        if (j.contains("payout")) {
            params.payout.maximum_benefit_aw_multiple = read_number(j["payout"], "maximum_benefit_aw_multiple");
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    params.validate_references();
    return params;
}

CountryParameterSet load_country_params(const std::string& file_path) {
    return parse_country_params_from_string(read_file(file_path, "country parameter"));
}

GlobalAssumptions parse_assumptions_from_string(const std::string& json_string) {
    GlobalAssumptions a;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Assumptions document must be a JSON object");
        }

        if (j.contains("entry_age")) a.entry_age = j["entry_age"].get<int>();
        if (j.contains("career_length")) a.career_length = j["career_length"].get<double>();
        if (j.contains("contribution_density")) a.contribution_density = j["contribution_density"].get<double>();
        if (j.contains("real_wage_growth")) a.real_wage_growth = j["real_wage_growth"].get<double>();
        if (j.contains("inflation")) a.inflation = j["inflation"].get<double>();
        if (j.contains("discount_rate")) a.discount_rate = j["discount_rate"].get<double>();
        if (j.contains("dc_net_real_return")) a.dc_net_real_return = j["dc_net_real_return"].get<double>();
        if (j.contains("pension_indexation_rate")) {
            a.pension_indexation_rate = j["pension_indexation_rate"].get<double>();
        }
        if (j.contains("life_expectancy_fallback_male")) {
            a.life_expectancy_fallback_male = j["life_expectancy_fallback_male"].get<double>();
        }
        if (j.contains("life_expectancy_fallback_female")) {
            a.life_expectancy_fallback_female = j["life_expectancy_fallback_female"].get<double>();
        }
        if (j.contains("max_age_for_wealth")) a.max_age_for_wealth = j["max_age_for_wealth"].get<int>();
        if (j.contains("life_table_year")) a.life_table_year = j["life_table_year"].get<int>();

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    if (a.contribution_density < 0.0 || a.contribution_density > 1.0) {
        throw ConfigParseError("contribution_density must lie in [0, 1]");
    }
    if (a.career_length < 0.0) {
        throw ConfigParseError("career_length must not be negative");
    }
    return a;
}

GlobalAssumptions load_assumptions(const std::string& file_path) {
    return parse_assumptions_from_string(read_file(file_path, "assumptions"));
}

} // namespace io
} // namespace pensioncalc
