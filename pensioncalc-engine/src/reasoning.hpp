#ifndef PENSIONCALC_REASONING_HPP
#define PENSIONCALC_REASONING_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace pensioncalc {

// Category of a recorded (non-fatal) problem
enum class IssueKind : uint8_t {
    EligibilityWarning = 0,   // worker type excluded, no payable scheme
    ComputationWarning = 1,   // clamp, cap, floor, fallback substituted
    ComputationError = 2,     // scheme-local arithmetic failure, scheme contributes zero
    ConfigurationError = 3    // scheme-local missing field, scheme contributes zero
};

std::string issue_kind_to_string(IssueKind kind);

struct Issue {
    IssueKind kind;
    std::string scheme_id;    // empty when the issue is not tied to a scheme
    std::string message;

    Issue();
    Issue(IssueKind k, const std::string& scheme, const std::string& msg);

    bool operator==(const Issue& other) const;
};

// Pipeline stage that produced a reasoning step
enum class Stage : uint8_t {
    Wage = 0,
    Eligibility = 1,
    Dispatch = 2,
    Aggregate = 3,
    Tax = 4,
    Wealth = 5
};

std::string stage_to_string(Stage stage);

// One step of the audit log: what was done, how, and the resulting value
struct ReasoningStep {
    Stage stage;
    std::string label;
    std::string formula;
    std::string value;
    std::string scheme_id;
    std::string citation;     // source of the governing parameter, empty when uncited

    ReasoningStep();
    ReasoningStep(Stage s, const std::string& lbl, const std::string& fml,
                  const std::string& val, const std::string& scheme = "",
                  const std::string& cite = "");
};

/**
 * @brief Append-only, ordered audit log of a single computation
 *
 * Steps are only ever appended, in the order the pipeline applies them.
 * The trace is returned as part of PensionResult and consumed by
 * explainability tooling, so identical inputs must yield identical traces.
 */
class ReasoningTrace {
public:
    void append(const ReasoningStep& step);
    void append(Stage stage, const std::string& label, const std::string& formula,
                const std::string& value, const std::string& scheme_id = "",
                const std::string& citation = "");

    const std::vector<ReasoningStep>& steps() const { return steps_; }
    size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }

    // Steps produced by one stage, in order
    std::vector<ReasoningStep> steps_for(Stage stage) const;

private:
    std::vector<ReasoningStep> steps_;
};

// Format a currency amount with thousands separators and no decimals
std::string format_amount(double amount);

// Format a scalar with a fixed number of decimals
std::string format_number(double value, int decimals = 4);

} // namespace pensioncalc

#endif // PENSIONCALC_REASONING_HPP
