#ifndef PENSIONCALC_IO_JSON_WRITER_HPP
#define PENSIONCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../engine.hpp"
#include "../work_incentive.hpp"

namespace pensioncalc {

// nlohmann ADL hooks
void to_json(nlohmann::json& j, const Issue& issue);
void to_json(nlohmann::json& j, const ReasoningStep& step);
void to_json(nlohmann::json& j, const SchemeEligibility& verdict);
void to_json(nlohmann::json& j, const EligibilityOutcome& outcome);
void to_json(nlohmann::json& j, const PensionResult& result);
void to_json(nlohmann::json& j, const WorkIncentive& wi);

namespace io {

// Write one PensionResult; the reasoning trace is included when `include_trace`
void write_pension_result_json(std::ostream& os, const PensionResult& result,
                               bool pretty_print = true, bool include_trace = true);

// Write results as a JSON array, in order
void write_pension_results_json(std::ostream& os, const std::vector<PensionResult>& results,
                                bool pretty_print = true, bool include_trace = true);

void write_pension_results_json(const std::string& filepath, const std::vector<PensionResult>& results,
                                bool pretty_print = true, bool include_trace = true);

void write_work_incentive_json(std::ostream& os, const WorkIncentive& wi, bool pretty_print = true);

} // namespace io
} // namespace pensioncalc

#endif // PENSIONCALC_IO_JSON_WRITER_HPP
