#ifndef PENSIONCALC_IO_PARAMS_READER_HPP
#define PENSIONCALC_IO_PARAMS_READER_HPP

#include <string>
#include "../assumptions.hpp"
#include "../parameters.hpp"

namespace pensioncalc {
namespace io {

/**
 * @brief Parse a country parameter document
 *
 * Top-level keys: metadata, schemes (required, non-empty), worker_types,
 * taxes, payout. Every numeric field accepts either a bare number, null,
 * or a sourced value object {"value": x, "source_citation": "..."}.
 *
 * Taxes select the strategy: a "brackets" array gives BracketTax,
 * otherwise FlatRateTax from "simplified_net_rate" (0 when absent).
 *
 * @throws ConfigParseError on malformed JSON, wrong types or missing required keys
 * @throws ConfigurationError on an unknown enumeration value or broken references
 */
CountryParameterSet parse_country_params_from_string(const std::string& json_string);

CountryParameterSet load_country_params(const std::string& file_path);

// Every GlobalAssumptions field is optional; omitted ones keep their defaults
GlobalAssumptions parse_assumptions_from_string(const std::string& json_string);

GlobalAssumptions load_assumptions(const std::string& file_path);

} // namespace io
} // namespace pensioncalc

#endif // PENSIONCALC_IO_PARAMS_READER_HPP
