#ifndef PENSIONCALC_PARQUET_WRITER_HPP
#define PENSIONCALC_PARQUET_WRITER_HPP

#include "../engine.hpp"
#include <string>
#include <vector>

namespace pensioncalc {

class ParquetWriter {
public:
    /**
     * Write pension results to a Parquet file, one row per result.
     *
     * Output schema:
     *   - country, sex, worker_type: utf8
     *   - earnings_multiple, individual_wage, average_wage: float64
     *   - gross_benefit, net_benefit: float64
     *   - gross_replacement_rate, net_replacement_rate: float64
     *   - gross_pension_level, net_pension_level: float64
     *   - gross_pension_wealth, net_pension_wealth, annuity_factor: float64
     *   - wealth_method: utf8
     *   - retirement_age: int32
     *   - warning_count: uint32
     *
     * @throws std::runtime_error if the file cannot be written or Arrow is unavailable
     */
    static void write_results(const std::vector<PensionResult>& results, const std::string& filepath);
};

} // namespace pensioncalc

#endif // PENSIONCALC_PARQUET_WRITER_HPP
