#ifndef PENSIONCALC_PROFILE_HPP
#define PENSIONCALC_PROFILE_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace pensioncalc {

enum class Sex : uint8_t {
    Male = 0,
    Female = 1
};

std::string sex_to_string(Sex sex);

// Accepts "male"/"m" and "female"/"f" (case-insensitive)
Sex parse_sex(const std::string& value);

enum class WageUnit : uint8_t {
    Currency = 0,      // absolute annual amount in national currency
    AwMultiple = 1     // multiple of the national average wage
};

std::string wage_unit_to_string(WageUnit unit);
WageUnit parse_wage_unit(const std::string& value);

// The individual whose entitlement is being computed
struct PersonProfile {
    Sex sex;
    double age;
    double service_years;
    double wage;
    WageUnit wage_unit;
    std::string worker_type_id;

    // Optional overrides
    std::optional<double> dc_balance;           // accumulated DC fund at retirement
    std::optional<double> notional_balance;     // NDC notional account at retirement
    std::optional<double> contribution_years;   // if different from service_years

    PersonProfile();

    // Years credited in benefit formulas: contribution_years if given, else service_years
    double credited_years() const;

    // Annual wage in currency; throws std::invalid_argument on a negative result
    double resolve_wage(double average_wage) const;
};

} // namespace pensioncalc

#endif // PENSIONCALC_PROFILE_HPP
