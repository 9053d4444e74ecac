#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace pensioncalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

template <typename Builder>
std::shared_ptr<arrow::Array> finish(Builder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_results(const std::vector<PensionResult>& results, const std::string& filepath) {
    if (results.empty()) {
        throw std::runtime_error("No pension results to write");
    }

    auto schema = arrow::schema({
        arrow::field("country", arrow::utf8()),
        arrow::field("sex", arrow::utf8()),
        arrow::field("worker_type", arrow::utf8()),
        arrow::field("earnings_multiple", arrow::float64()),
        arrow::field("individual_wage", arrow::float64()),
        arrow::field("average_wage", arrow::float64()),
        arrow::field("gross_benefit", arrow::float64()),
        arrow::field("net_benefit", arrow::float64()),
        arrow::field("gross_replacement_rate", arrow::float64()),
        arrow::field("net_replacement_rate", arrow::float64()),
        arrow::field("gross_pension_level", arrow::float64()),
        arrow::field("net_pension_level", arrow::float64()),
        arrow::field("gross_pension_wealth", arrow::float64()),
        arrow::field("net_pension_wealth", arrow::float64()),
        arrow::field("annuity_factor", arrow::float64()),
        arrow::field("wealth_method", arrow::utf8()),
        arrow::field("retirement_age", arrow::int32()),
        arrow::field("warning_count", arrow::uint32())
    });

    arrow::StringBuilder country_builder;
    arrow::StringBuilder sex_builder;
    arrow::StringBuilder worker_type_builder;
    arrow::StringBuilder wealth_method_builder;
    arrow::Int32Builder retirement_age_builder;
    arrow::UInt32Builder warning_count_builder;

    // Numeric columns in schema order, from earnings_multiple to annuity_factor
    constexpr size_t kDoubleColumns = 12;
    std::vector<arrow::DoubleBuilder> doubles(kDoubleColumns);
    for (auto& builder : doubles) {
        check(builder.Reserve(results.size()), "reserve numeric column");
    }

    for (const auto& r : results) {
        check(country_builder.Append(r.country), "append country");
        check(sex_builder.Append(sex_to_string(r.sex)), "append sex");
        check(worker_type_builder.Append(r.worker_type_id), "append worker_type");

        const double values[kDoubleColumns] = {
            r.earnings_multiple, r.individual_wage, r.average_wage,
            r.gross_benefit, r.net_benefit,
            r.gross_replacement_rate, r.net_replacement_rate,
            r.gross_pension_level, r.net_pension_level,
            r.gross_pension_wealth, r.net_pension_wealth,
            r.annuity_factor
        };
        for (size_t c = 0; c < kDoubleColumns; ++c) {
            check(doubles[c].Append(values[c]), "append numeric value");
        }

        check(wealth_method_builder.Append(wealth_method_to_string(r.wealth_method)), "append wealth_method");
        check(retirement_age_builder.Append(r.retirement_age), "append retirement_age");
        check(warning_count_builder.Append(static_cast<uint32_t>(r.warnings.size())), "append warning_count");
    }

    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.push_back(finish(country_builder, "country"));
    columns.push_back(finish(sex_builder, "sex"));
    columns.push_back(finish(worker_type_builder, "worker_type"));
    for (size_t c = 0; c < kDoubleColumns; ++c) {
        columns.push_back(finish(doubles[c], schema->field(static_cast<int>(c + 3))->name()));
    }
    columns.push_back(finish(wealth_method_builder, "wealth_method"));
    columns.push_back(finish(retirement_age_builder, "retirement_age"));
    columns.push_back(finish(warning_count_builder, "warning_count"));

    auto table = arrow::Table::Make(schema, columns);

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_results(const std::vector<PensionResult>& /* results */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace pensioncalc
