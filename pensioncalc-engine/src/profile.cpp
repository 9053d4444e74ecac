#include "profile.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace pensioncalc {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // anonymous namespace

std::string sex_to_string(Sex sex) {
    switch (sex) {
        case Sex::Male: return "male";
        case Sex::Female: return "female";
        default: return "unknown";
    }
}

Sex parse_sex(const std::string& value) {
    const std::string v = to_lower(value);
    if (v == "male" || v == "m") return Sex::Male;
    if (v == "female" || v == "f") return Sex::Female;
    throw std::invalid_argument("Unknown sex: " + value);
}

std::string wage_unit_to_string(WageUnit unit) {
    switch (unit) {
        case WageUnit::Currency: return "currency";
        case WageUnit::AwMultiple: return "aw_multiple";
        default: return "unknown";
    }
}

WageUnit parse_wage_unit(const std::string& value) {
    const std::string v = to_lower(value);
    if (v == "currency") return WageUnit::Currency;
    if (v == "aw_multiple") return WageUnit::AwMultiple;
    throw std::invalid_argument("Unknown wage unit: " + value);
}

PersonProfile::PersonProfile()
    : sex(Sex::Male),
      age(65.0),
      service_years(40.0),
      wage(1.0),
      wage_unit(WageUnit::AwMultiple),
      worker_type_id("private_employee") {}

double PersonProfile::credited_years() const {
    return contribution_years.value_or(service_years);
}

double PersonProfile::resolve_wage(double average_wage) const {
    const double resolved = (wage_unit == WageUnit::AwMultiple) ? wage * average_wage : wage;
    if (!std::isfinite(resolved) || resolved < 0.0) {
        throw std::invalid_argument("Resolved wage must be a non-negative amount");
    }
    return resolved;
}

} // namespace pensioncalc
