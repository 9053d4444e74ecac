#include "json_writer.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace pensioncalc {

namespace {

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

int indent_width(bool pretty_print) {
    return pretty_print ? 2 : -1;
}

} // anonymous namespace

void to_json(json& j, const Issue& issue) {
    j = json{
        {"kind", issue_kind_to_string(issue.kind)},
        {"scheme_id", issue.scheme_id},
        {"message", issue.message}
    };
}

void to_json(json& j, const ReasoningStep& step) {
    j = json{
        {"stage", stage_to_string(step.stage)},
        {"label", step.label},
        {"formula", step.formula},
        {"value", step.value}
    };
    if (!step.scheme_id.empty()) {
        j["scheme_id"] = step.scheme_id;
    }
    if (!step.citation.empty()) {
        j["citation"] = step.citation;
    }
}

void to_json(json& j, const SchemeEligibility& verdict) {
    j = json{
        {"scheme_id", verdict.scheme_id},
        {"active", verdict.active},
        {"payable", verdict.payable},
        {"reason", verdict.reason},
        {"early_multiplier", verdict.early_multiplier},
        {"normal_retirement_age", optional_to_json(verdict.normal_retirement_age)},
        {"minimum_service_years", optional_to_json(verdict.minimum_service_years)}
    };
}

void to_json(json& j, const EligibilityOutcome& outcome) {
    j = json{
        {"worker_type_id", outcome.worker_type_id},
        {"worker_type_found", outcome.worker_type_found},
        {"coverage", coverage_status_to_string(outcome.coverage)},
        {"eligible", outcome.eligible},
        {"schemes", outcome.schemes},
        {"normal_retirement_age", optional_to_json(outcome.normal_retirement_age)},
        {"early_retirement_age", optional_to_json(outcome.early_retirement_age)},
        {"minimum_service_years", optional_to_json(outcome.minimum_service_years)},
        {"years_to_nra", outcome.years_to_nra},
        {"missing", outcome.missing}
    };
}

void to_json(json& j, const PensionResult& result) {
    j = json{
        {"country", result.country},
        {"sex", sex_to_string(result.sex)},
        {"worker_type_id", result.worker_type_id},
        {"earnings_multiple", result.earnings_multiple},
        {"individual_wage", result.individual_wage},
        {"average_wage", result.average_wage},
        {"net_wage", result.net_wage},
        {"gross_benefit", result.gross_benefit},
        {"net_benefit", result.net_benefit},
        {"gross_replacement_rate", result.gross_replacement_rate},
        {"net_replacement_rate", result.net_replacement_rate},
        {"gross_pension_level", result.gross_pension_level},
        {"net_pension_level", result.net_pension_level},
        {"gross_pension_wealth", result.gross_pension_wealth},
        {"net_pension_wealth", result.net_pension_wealth},
        {"annuity_factor", result.annuity_factor},
        {"wealth_method", wealth_method_to_string(result.wealth_method)},
        {"retirement_age", result.retirement_age},
        {"component_breakdown", result.component_breakdown},
        {"eligibility", result.eligibility},
        {"warnings", result.warnings},
        {"reasoning", result.trace.steps()}
    };
}

void to_json(json& j, const WorkIncentive& wi) {
    json pw = json::object();
    for (const auto& [age, value] : wi.pw60) {
        pw[std::to_string(age)] = value;
    }
    j = json{
        {"sex", sex_to_string(wi.sex)},
        {"discount_rate", wi.discount_rate},
        {"normal_retirement_age", wi.nra},
        {"nra_minus_5", wi.nra_minus_5},
        {"pension_wealth_at_60", pw},
        {"indicator_60_65", wi.indicator_60_65},
        {"indicator_own_nra", wi.indicator_own_nra},
        {"survival_from_table", wi.survival_from_table},
        {"warnings", wi.issues}
    };
}

namespace io {

namespace {

json result_document(const PensionResult& result, bool include_trace) {
    json j = result;
    if (!include_trace) {
        j.erase("reasoning");
    }
    return j;
}

} // anonymous namespace

void write_pension_result_json(std::ostream& os, const PensionResult& result,
                               bool pretty_print, bool include_trace) {
    os << result_document(result, include_trace).dump(indent_width(pretty_print)) << "\n";
}

void write_pension_results_json(std::ostream& os, const std::vector<PensionResult>& results,
                                bool pretty_print, bool include_trace) {
    json doc = json::array();
    for (const auto& result : results) {
        doc.push_back(result_document(result, include_trace));
    }
    os << doc.dump(indent_width(pretty_print)) << "\n";
}

void write_pension_results_json(const std::string& filepath, const std::vector<PensionResult>& results,
                                bool pretty_print, bool include_trace) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_pension_results_json(file, results, pretty_print, include_trace);
}

void write_work_incentive_json(std::ostream& os, const WorkIncentive& wi, bool pretty_print) {
    os << json(wi).dump(indent_width(pretty_print)) << "\n";
}

} // namespace io
} // namespace pensioncalc
