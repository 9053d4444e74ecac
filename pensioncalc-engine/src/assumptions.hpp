#ifndef PENSIONCALC_ASSUMPTIONS_HPP
#define PENSIONCALC_ASSUMPTIONS_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include "profile.hpp"

namespace pensioncalc {

// Earnings multiples (x average wage) at which country indicators are reported
inline constexpr std::array<double, 6> EARNINGS_MULTIPLES = {0.5, 0.75, 1.0, 1.5, 2.0, 2.5};

bool is_standard_multiple(double multiple);

// GlobalAssumptions: economic and career assumptions shared across computations.
// Always passed explicitly; never held as process-wide state.
struct GlobalAssumptions {
    int entry_age;                          // age of labour-market entry
    double career_length;                   // years of contributions in a full career
    double contribution_density;            // fraction of the career with contributions (0-1)
    double real_wage_growth;
    double inflation;
    double discount_rate;                   // real, used for pension wealth
    double dc_net_real_return;              // real, net of fees
    double pension_indexation_rate;         // real post-retirement indexation (g)
    double life_expectancy_fallback_male;   // years remaining at retirement
    double life_expectancy_fallback_female;
    int max_age_for_wealth;
    int life_table_year;

    GlobalAssumptions();

    double life_expectancy_fallback(Sex sex) const;

    bool operator==(const GlobalAssumptions& other) const;
};

// LifeTable: qx rates by age (0-120) and sex
// qx = probability of death within one year for a life aged x
class LifeTable {
public:
    static constexpr size_t MAX_AGE = 120;
    static constexpr size_t NUM_AGES = MAX_AGE + 1;  // 0 to 120 inclusive
    static constexpr size_t NUM_SEXES = 2;

    LifeTable();

    void set_qx(uint8_t age, Sex sex, double qx);
    double get_qx(uint8_t age, Sex sex) const;

    // Survivorship from birth: l(0) = 1, l(x+1) = l(x) * (1 - qx)
    double survivorship(uint8_t age, Sex sex) const;

    // Complete expectation of life at age x (curtate + 0.5).
    // Returns std::nullopt when nobody survives to age x.
    std::optional<double> remaining_life_expectancy(uint8_t age, Sex sex) const;

    // Ages with known qx; the full 0-120 range unless loaded from a shorter CSV
    uint8_t first_age() const { return first_age_; }
    uint8_t last_age() const { return last_age_; }

    // Load from CSV: expects columns age,male_qx,female_qx over contiguous ages
    static LifeTable load_from_csv(const std::string& filepath);
    static LifeTable load_from_csv(std::istream& is);

private:
    // rates_[sex][age] = qx
    std::array<std::array<double, NUM_AGES>, NUM_SEXES> rates_;
    uint8_t first_age_;
    uint8_t last_age_;
};

/**
 * @brief Source of mortality data, keyed by country, sex and age
 *
 * Both queries return std::nullopt when the provider has no data for the
 * country/sex (or the age lies outside its table). Implementations must be
 * safe to query concurrently.
 */
class LifeTableProvider {
public:
    virtual ~LifeTableProvider() = default;

    // Probability of surviving from birth to `age`, in [0,1]
    virtual std::optional<double> survivorship(const std::string& country, Sex sex, int age) const = 0;

    // Expected remaining years of life at `age`
    virtual std::optional<double> remaining_life_expectancy(const std::string& country, Sex sex, int age) const = 0;
};

// Provider with no data at all; every query reports "unavailable"
class NullLifeTableProvider : public LifeTableProvider {
public:
    std::optional<double> survivorship(const std::string& country, Sex sex, int age) const override;
    std::optional<double> remaining_life_expectancy(const std::string& country, Sex sex, int age) const override;
};

// Provider backed by in-memory LifeTables, one per country (ISO3 code)
class TableLifeTableProvider : public LifeTableProvider {
public:
    void add_table(const std::string& country, const LifeTable& table);
    bool has_table(const std::string& country) const;
    size_t size() const { return tables_.size(); }

    std::optional<double> survivorship(const std::string& country, Sex sex, int age) const override;
    std::optional<double> remaining_life_expectancy(const std::string& country, Sex sex, int age) const override;

private:
    std::map<std::string, LifeTable> tables_;
};

} // namespace pensioncalc

#endif // PENSIONCALC_ASSUMPTIONS_HPP
