#ifndef PENSIONCALC_ERRORS_HPP
#define PENSIONCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pensioncalc {

/**
 * @brief Thrown when a scheme or country configuration is inconsistent
 *
 * Raised for a missing formula field of a scheme's declared type, a worker
 * type referencing an unknown scheme, or an unusable tax schedule. Inside
 * the engine it is scoped to one scheme where possible; it escapes
 * PensionEngine::compute only when no usable result can be produced.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Thrown for an arithmetic failure local to one scheme
 *
 * The engine catches it, records the scheme's contribution as zero and
 * carries on with the remaining schemes.
 */
class ComputationError : public std::runtime_error {
public:
    explicit ComputationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised by the JSON readers when an input file cannot be read or parsed
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace pensioncalc

#endif // PENSIONCALC_ERRORS_HPP
