#include "assumptions.hpp"
#include "io/csv_reader.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>
#include <stdexcept>

namespace pensioncalc {

bool is_standard_multiple(double multiple) {
    for (double m : EARNINGS_MULTIPLES) {
        if (std::fabs(m - multiple) < 1e-12) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// GlobalAssumptions Implementation
// ============================================================================

GlobalAssumptions::GlobalAssumptions()
    : entry_age(20),
      career_length(40.0),
      contribution_density(1.0),
      real_wage_growth(0.02),
      inflation(0.02),
      discount_rate(0.02),
      dc_net_real_return(0.03),
      pension_indexation_rate(0.0),
      life_expectancy_fallback_male(20.0),
      life_expectancy_fallback_female(25.0),
      max_age_for_wealth(110),
      life_table_year(2020) {}

double GlobalAssumptions::life_expectancy_fallback(Sex sex) const {
    return sex == Sex::Female ? life_expectancy_fallback_female : life_expectancy_fallback_male;
}

bool GlobalAssumptions::operator==(const GlobalAssumptions& other) const {
    return entry_age == other.entry_age &&
           career_length == other.career_length &&
           contribution_density == other.contribution_density &&
           real_wage_growth == other.real_wage_growth &&
           inflation == other.inflation &&
           discount_rate == other.discount_rate &&
           dc_net_real_return == other.dc_net_real_return &&
           pension_indexation_rate == other.pension_indexation_rate &&
           life_expectancy_fallback_male == other.life_expectancy_fallback_male &&
           life_expectancy_fallback_female == other.life_expectancy_fallback_female &&
           max_age_for_wealth == other.max_age_for_wealth &&
           life_table_year == other.life_table_year;
}

// ============================================================================
// LifeTable Implementation
// ============================================================================

LifeTable::LifeTable()
    : first_age_(0),
      last_age_(static_cast<uint8_t>(MAX_AGE)) {
    for (auto& sex_rates : rates_) {
        sex_rates.fill(0.0);
    }
}

void LifeTable::set_qx(uint8_t age, Sex sex, double qx) {
    if (age > MAX_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " exceeds maximum age " + std::to_string(MAX_AGE));
    }
    if (qx < 0.0 || qx > 1.0) {
        throw std::invalid_argument("qx must be between 0.0 and 1.0");
    }
    rates_[static_cast<size_t>(sex)][age] = qx;
}

double LifeTable::get_qx(uint8_t age, Sex sex) const {
    if (age > MAX_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " exceeds maximum age " + std::to_string(MAX_AGE));
    }
    return rates_[static_cast<size_t>(sex)][age];
}

double LifeTable::survivorship(uint8_t age, Sex sex) const {
    if (age > MAX_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " exceeds maximum age " + std::to_string(MAX_AGE));
    }
    const auto& qx = rates_[static_cast<size_t>(sex)];
    double lx = 1.0;
    for (size_t x = 0; x < age; ++x) {
        lx *= (1.0 - qx[x]);
    }
    return lx;
}

std::optional<double> LifeTable::remaining_life_expectancy(uint8_t age, Sex sex) const {
    if (age > MAX_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " exceeds maximum age " + std::to_string(MAX_AGE));
    }
    if (survivorship(age, sex) <= 0.0) {
        return std::nullopt;
    }
    const auto& qx = rates_[static_cast<size_t>(sex)];

    // Conditional survival to each later age, summed (curtate expectation)
    double survival = 1.0;
    double curtate = 0.0;
    for (size_t x = age; x < MAX_AGE; ++x) {
        if (x > last_age_) {
            return std::nullopt;
        }
        survival *= (1.0 - qx[x]);
        if (survival < 1e-12) {
            break;
        }
        curtate += survival;
    }

    return curtate + 0.5;
}

LifeTable LifeTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open life table file: " + filepath);
    }
    return load_from_csv(file);
}

LifeTable LifeTable::load_from_csv(std::istream& is) {
    LifeTable table;
    CsvReader reader(is);

    auto header = reader.read_header();
    auto age_col = header.find("age");
    auto male_col = header.find("male_qx");
    auto female_col = header.find("female_qx");
    if (age_col == header.end() || male_col == header.end() || female_col == header.end()) {
        throw ConfigParseError("Life table CSV requires columns: age,male_qx,female_qx");
    }
    const size_t min_cells = std::max({age_col->second, male_col->second, female_col->second}) + 1;

    std::set<int> ages;
    size_t line = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.empty()) continue;

        if (row.size() < min_cells) {
            throw ConfigParseError("Life table CSV row has too few columns");
        }

        try {
            const int age = std::stoi(row[age_col->second]);
            if (age < 0 || age > static_cast<int>(MAX_AGE)) {
                throw std::out_of_range("age out of range: " + row[age_col->second]);
            }
            if (!ages.insert(age).second) {
                throw std::invalid_argument("duplicate age " + std::to_string(age));
            }
            table.set_qx(static_cast<uint8_t>(age), Sex::Male, std::stod(row[male_col->second]));
            table.set_qx(static_cast<uint8_t>(age), Sex::Female, std::stod(row[female_col->second]));
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError("Life table CSV line " + std::to_string(line) + ": " + e.what());
        } catch (const std::out_of_range& e) {
            throw ConfigParseError("Life table CSV line " + std::to_string(line) + ": " + e.what());
        }
    }

    if (ages.empty()) {
        throw ConfigParseError("Life table CSV has no rows");
    }
    // Ages must be contiguous; qx outside the loaded range is unknown, not zero
    const int first = *ages.begin();
    const int last = *ages.rbegin();
    if (static_cast<int>(ages.size()) != last - first + 1) {
        throw ConfigParseError("Life table CSV has gaps between ages " + std::to_string(first) +
                               " and " + std::to_string(last));
    }
    table.first_age_ = static_cast<uint8_t>(first);
    table.last_age_ = static_cast<uint8_t>(last);

    return table;
}

// ============================================================================
// Providers
// ============================================================================

std::optional<double> NullLifeTableProvider::survivorship(const std::string&, Sex, int) const {
    return std::nullopt;
}

std::optional<double> NullLifeTableProvider::remaining_life_expectancy(const std::string&, Sex, int) const {
    return std::nullopt;
}

void TableLifeTableProvider::add_table(const std::string& country, const LifeTable& table) {
    tables_[country] = table;
}

bool TableLifeTableProvider::has_table(const std::string& country) const {
    return tables_.find(country) != tables_.end();
}

std::optional<double> TableLifeTableProvider::survivorship(const std::string& country, Sex sex, int age) const {
    auto it = tables_.find(country);
    if (it == tables_.end() || age < 0 || age > static_cast<int>(LifeTable::MAX_AGE)) {
        return std::nullopt;
    }
    // S(x) needs qx up to x - 1
    if (age > static_cast<int>(it->second.last_age()) + 1) {
        return std::nullopt;
    }
    return it->second.survivorship(static_cast<uint8_t>(age), sex);
}

std::optional<double> TableLifeTableProvider::remaining_life_expectancy(const std::string& country, Sex sex, int age) const {
    auto it = tables_.find(country);
    if (it == tables_.end() || age < 0 || age > static_cast<int>(LifeTable::MAX_AGE)) {
        return std::nullopt;
    }
    return it->second.remaining_life_expectancy(static_cast<uint8_t>(age), sex);
}

} // namespace pensioncalc
