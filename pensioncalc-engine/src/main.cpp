#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cstdlib>
#include "assumptions.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "parameters.hpp"
#include "profile.hpp"
#include "work_incentive.hpp"
#include "io/json_writer.hpp"
#include "io/params_reader.hpp"
#include "io/parquet_writer.hpp"

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

struct CLIArgs {
    std::string params_path;
    std::string assumptions_path;
    std::string life_table_path;
    std::string output_path;
    std::string parquet_path;
    std::string log_file_path;
    std::string worker_type = "private_employee";
    std::string sex = "male";
    std::string wage_unit = "aw_multiple";
    double average_wage = 0.0;
    // Optional profile overrides; the standard full-career profile otherwise
    double age = -1.0;
    double service_years = -1.0;
    double wage = -1.0;
    bool all_multiples = false;
    bool work_incentive = false;
    bool include_trace = true;
    std::string log_level = "INFO";
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "PensionCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --params <path>             JSON country parameter file (required)\n";
    std::cerr << "  --average-wage <amount>     Annual national average wage (required)\n";
    std::cerr << "  --assumptions <path>        JSON global assumptions (default: built-in)\n";
    std::cerr << "  --life-table <path>         CSV life table (age,male_qx,female_qx)\n\n";
    std::cerr << "Profile options:\n";
    std::cerr << "  --worker-type <id>          Worker type (default: private_employee)\n";
    std::cerr << "  --sex <male|female|all>     Sex; 'all' runs both (default: male)\n";
    std::cerr << "  --age <years>               Claiming age (default: first scheme NRA)\n";
    std::cerr << "  --service-years <years>     Service years (default: career x density)\n";
    std::cerr << "  --wage <amount>             Individual wage (default: 1.0 x AW)\n";
    std::cerr << "  --wage-unit <unit>          currency or aw_multiple (default: aw_multiple)\n";
    std::cerr << "  --all-multiples             Run the standard earnings grid (0.5 .. 2.5 x AW)\n";
    std::cerr << "  --work-incentive            Add the work-incentive indicator per sex\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --parquet <path>            Also write results as Parquet\n";
    std::cerr << "  --no-trace                  Omit the reasoning trace from JSON output\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also write JSON log lines to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Standard full-career worker across the earnings grid:\n";
    std::cerr << "     " << program_name << " --params data/sample_country.json \\\n";
    std::cerr << "         --average-wage 10000 --life-table data/sample_life_table.csv \\\n";
    std::cerr << "         --sex all --all-multiples --output results.json\n\n";
    std::cerr << "  2. Personal calculation with an absolute wage:\n";
    std::cerr << "     " << program_name << " --params data/sample_country.json \\\n";
    std::cerr << "         --assumptions data/sample_assumptions.json --average-wage 10000 \\\n";
    std::cerr << "         --age 62 --service-years 25 --wage 14000 --wage-unit currency\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--params" && i + 1 < argc) {
            args.params_path = argv[++i];
        } else if (arg == "--average-wage" && i + 1 < argc) {
            args.average_wage = std::stod(argv[++i]);
        } else if (arg == "--assumptions" && i + 1 < argc) {
            args.assumptions_path = argv[++i];
        } else if (arg == "--life-table" && i + 1 < argc) {
            args.life_table_path = argv[++i];
        } else if (arg == "--worker-type" && i + 1 < argc) {
            args.worker_type = argv[++i];
        } else if (arg == "--sex" && i + 1 < argc) {
            args.sex = argv[++i];
        } else if (arg == "--age" && i + 1 < argc) {
            args.age = std::stod(argv[++i]);
        } else if (arg == "--service-years" && i + 1 < argc) {
            args.service_years = std::stod(argv[++i]);
        } else if (arg == "--wage" && i + 1 < argc) {
            args.wage = std::stod(argv[++i]);
        } else if (arg == "--wage-unit" && i + 1 < argc) {
            args.wage_unit = argv[++i];
        } else if (arg == "--all-multiples") {
            args.all_multiples = true;
        } else if (arg == "--work-incentive") {
            args.work_incentive = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--no-trace") {
            args.include_trace = false;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file_path = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.params_path.empty()) {
        std::cerr << "Error: --params is required\n";
        valid = false;
    } else if (!file_exists(args.params_path)) {
        std::cerr << "Error: Country parameter file not found: " << args.params_path << "\n";
        valid = false;
    }

    if (args.average_wage <= 0) {
        std::cerr << "Error: --average-wage must be positive\n";
        valid = false;
    }

    if (!args.assumptions_path.empty() && !file_exists(args.assumptions_path)) {
        std::cerr << "Error: Assumptions file not found: " << args.assumptions_path << "\n";
        valid = false;
    }

    if (!args.life_table_path.empty() && !file_exists(args.life_table_path)) {
        std::cerr << "Error: Life table file not found: " << args.life_table_path << "\n";
        valid = false;
    }

    if (args.sex != "male" && args.sex != "female" && args.sex != "all") {
        std::cerr << "Error: --sex must be male, female or all\n";
        valid = false;
    }

    if (args.wage_unit != "currency" && args.wage_unit != "aw_multiple") {
        std::cerr << "Error: --wage-unit must be currency or aw_multiple\n";
        valid = false;
    }

    if (args.all_multiples && args.wage >= 0) {
        std::cerr << "Error: --wage cannot be combined with --all-multiples\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

std::vector<pensioncalc::Sex> requested_sexes(const std::string& sex) {
    if (sex == "all") {
        return {pensioncalc::Sex::Male, pensioncalc::Sex::Female};
    }
    return {pensioncalc::parse_sex(sex)};
}

pensioncalc::PersonProfile build_profile(const pensioncalc::PensionEngine& engine,
                                         const CLIArgs& args, pensioncalc::Sex sex) {
    pensioncalc::PersonProfile profile = engine.standard_profile(sex, args.worker_type);
    if (args.age >= 0) profile.age = args.age;
    if (args.service_years >= 0) profile.service_years = args.service_years;
    if (args.wage >= 0) {
        profile.wage = args.wage;
        profile.wage_unit = pensioncalc::parse_wage_unit(args.wage_unit);
    }
    return profile;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    pensioncalc::LoggerConfig log_config;
    log_config.min_level = pensioncalc::string_to_level(args.log_level);
    if (!args.log_file_path.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file_path;
    }
    pensioncalc::Logger& logger = pensioncalc::Logger::get_instance();
    logger.configure(log_config);

    try {
        pensioncalc::CountryParameterSet params = pensioncalc::io::load_country_params(args.params_path);
        logger.log_parameters_loaded(params.metadata.iso3, args.params_path,
                                     params.schemes.size(), params.worker_types.size());

        pensioncalc::GlobalAssumptions assumptions;
        if (!args.assumptions_path.empty()) {
            assumptions = pensioncalc::io::load_assumptions(args.assumptions_path);
            logger.log_message(pensioncalc::LogLevel::INFO, "Assumptions loaded",
                               {{"path", args.assumptions_path}});
        }

        pensioncalc::TableLifeTableProvider life_tables;
        if (!args.life_table_path.empty()) {
            life_tables.add_table(params.metadata.iso3,
                                  pensioncalc::LifeTable::load_from_csv(args.life_table_path));
            logger.log_life_table_loaded(params.metadata.iso3, args.life_table_path);
        }

        pensioncalc::PensionEngine engine(params, assumptions, args.average_wage, life_tables);

        const std::vector<pensioncalc::Sex> sexes = requested_sexes(args.sex);
        std::vector<pensioncalc::PersonProfile> profiles;
        for (pensioncalc::Sex sex : sexes) {
            profiles.push_back(build_profile(engine, args, sex));
        }

        // Grid is laid out sex-major, one slot per (sex, multiple)
        const size_t per_sex = args.all_multiples ? pensioncalc::EARNINGS_MULTIPLES.size() : 1;
        const size_t total = profiles.size() * per_sex;
        std::vector<pensioncalc::PensionResult> results(total);
        std::vector<std::string> failures(total);

        #ifdef HAVE_OPENMP
        #pragma omp parallel for schedule(dynamic)
        #endif
        for (long long k = 0; k < static_cast<long long>(total); ++k) {
            const size_t idx = static_cast<size_t>(k);
            const pensioncalc::PersonProfile& profile = profiles[idx / per_sex];
            try {
                if (args.all_multiples) {
                    results[idx] = engine.compute(profile, pensioncalc::EARNINGS_MULTIPLES[idx % per_sex]);
                } else {
                    results[idx] = engine.compute(profile);
                }
            } catch (const std::exception& e) {
                failures[idx] = e.what();
            }
        }

        for (const auto& failure : failures) {
            if (!failure.empty()) {
                throw pensioncalc::ConfigurationError(failure);
            }
        }

        std::ofstream out_file;
        if (!args.output_path.empty()) {
            out_file.open(args.output_path);
            if (!out_file) {
                throw std::runtime_error("Failed to open output file: " + args.output_path);
            }
        }
        std::ostream& out = args.output_path.empty() ? std::cout : out_file;

        if (args.work_incentive) {
            json doc;
            json result_docs = json::array();
            for (const auto& result : results) {
                json j = result;
                if (!args.include_trace) {
                    j.erase("reasoning");
                }
                result_docs.push_back(j);
            }
            doc["results"] = result_docs;
            doc["work_incentive"] = json::array();
            for (pensioncalc::Sex sex : sexes) {
                doc["work_incentive"].push_back(json(pensioncalc::compute_work_incentive(engine, sex)));
            }
            out << doc.dump(2) << "\n";
        } else {
            pensioncalc::io::write_pension_results_json(out, results, true, args.include_trace);
        }

        if (!args.parquet_path.empty()) {
            pensioncalc::ParquetWriter::write_results(results, args.parquet_path);
            logger.log_message(pensioncalc::LogLevel::INFO, "Parquet results written",
                               {{"path", args.parquet_path}, {"rows", std::to_string(results.size())}});
        }

        size_t warning_count = 0;
        for (const auto& result : results) {
            warning_count += result.warnings.size();
        }
        logger.log_message(pensioncalc::LogLevel::INFO, "Run complete",
                           {{"country", params.metadata.iso3},
                            {"computations", std::to_string(results.size())},
                            {"warnings", std::to_string(warning_count)}});
        logger.flush();

    } catch (const pensioncalc::ConfigParseError& e) {
        logger.log_message(pensioncalc::LogLevel::ERROR, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const pensioncalc::ConfigurationError& e) {
        logger.log_message(pensioncalc::LogLevel::ERROR, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        logger.log_message(pensioncalc::LogLevel::ERROR, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    return 0;
}
