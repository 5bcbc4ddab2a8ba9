#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include "config.hpp"
#include "errors.hpp"
#include "evaluation.hpp"
#include "logger.hpp"
#include "pay_table.hpp"
#include "portfolio.hpp"
#include "probability_matrix.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/output_file.hpp"
#include "io/parquet_writer.hpp"

#include <nlohmann/json.hpp>

namespace {

using namespace poolrisk;

struct CLIArgs {
    std::optional<std::string> probabilities_path;
    std::optional<std::string> portfolio_path;
    std::string config_path;
    std::optional<std::string> paytable_json;
    std::optional<size_t> num_simulations;
    std::optional<double> alpha;
    std::optional<uint64_t> seed;
    std::optional<size_t> expected_matches;
    std::optional<std::string> returns_path;
    std::optional<std::string> risk_path;
    std::optional<std::string> summary_path;
    std::optional<std::string> returns_parquet_path;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool log_text = false;
    bool help = false;
};

// Fully resolved run settings after config and command line are merged
struct RunSettings {
    std::string probabilities_path;
    std::string portfolio_path;
    std::optional<ProbabilityColumns> probability_columns;
    std::optional<size_t> expected_matches;
    std::optional<std::string> paytable_text;   // --paytable-json, parsed late
    std::optional<nlohmann::json> paytable;     // from the run configuration
    EvaluationConfig evaluation;
    std::optional<std::string> returns_path;
    std::optional<std::string> risk_path;
    std::optional<std::string> summary_path;
    std::optional<std::string> returns_parquet_path;
    LoggerConfig logging;
};

void print_usage(const char* program_name) {
    std::cerr << "Pool Risk Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --probabilities <csv> --portfolio <csv> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --probabilities <path>      CSV with per-match outcome probabilities\n";
    std::cerr << "  --portfolio <path>          CSV portfolio plan (J1..JM pick columns, optional stake_weight)\n";
    std::cerr << "  --config <path>             JSON run configuration (command-line options override it)\n";
    std::cerr << "  --paytable-json <json>      Pay table, e.g. '{\"14\": 1000, \"13\": 25}'\n";
    std::cerr << "                              (default: 1 for a full hit, 0 otherwise)\n";
    std::cerr << "  --matches <count>           Expected number of matches in the round\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --sims <count>              Number of simulations (default: 50000)\n";
    std::cerr << "  --alpha <level>             Confidence level for VaR/ES (default: 0.95)\n";
    std::cerr << "  --seed <value>              Random seed (default: 2025)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --returns-out <path>        CSV with one portfolio return per simulation\n";
    std::cerr << "  --risk-out <path>           CSV risk report (default: stdout)\n";
    std::cerr << "  --summary-out <path>        JSON summary with per-ticket statistics\n";
    std::cerr << "  --returns-parquet <path>    Parquet returns (requires Arrow support)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log events to a file\n";
    std::cerr << "  --log-text                  Plain text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --probabilities data/sample_probabilities.csv \\\n";
    std::cerr << "      --portfolio data/sample_portfolio_plan.csv \\\n";
    std::cerr << "      --sims 50000 --alpha 0.95 --seed 2025 \\\n";
    std::cerr << "      --returns-out returns.csv --risk-out risk.csv\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

size_t parse_count(const std::string& option, const std::string& text) {
    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + text);
    }
    if (consumed != text.size() || text.find('-') != std::string::npos) {
        throw std::invalid_argument("Invalid value for " + option + ": " + text);
    }
    return static_cast<size_t>(value);
}

double parse_real(const std::string& option, const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("Invalid value for " + option + ": " + text);
    }
    return value;
}

// Throws std::invalid_argument on a malformed numeric value
bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--probabilities" && i + 1 < argc) {
            args.probabilities_path = argv[++i];
        } else if (arg == "--portfolio" && i + 1 < argc) {
            args.portfolio_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--paytable-json" && i + 1 < argc) {
            args.paytable_json = argv[++i];
        } else if (arg == "--sims" && i + 1 < argc) {
            args.num_simulations = parse_count(arg, argv[++i]);
        } else if (arg == "--alpha" && i + 1 < argc) {
            args.alpha = parse_real(arg, argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            args.seed = static_cast<uint64_t>(parse_count(arg, argv[++i]));
        } else if (arg == "--matches" && i + 1 < argc) {
            args.expected_matches = parse_count(arg, argv[++i]);
        } else if (arg == "--returns-out" && i + 1 < argc) {
            args.returns_path = argv[++i];
        } else if (arg == "--risk-out" && i + 1 < argc) {
            args.risk_path = argv[++i];
        } else if (arg == "--summary-out" && i + 1 < argc) {
            args.summary_path = argv[++i];
        } else if (arg == "--returns-parquet" && i + 1 < argc) {
            args.returns_parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

template <typename T>
std::optional<T> first_of(const std::optional<T>& cli, const std::optional<T>& config) {
    return cli ? cli : config;
}

// Layer the command line over the run configuration.
// Throws ConfigParseError for an unreadable config and std::invalid_argument
// for an unknown log level.
RunSettings merge_settings(const CLIArgs& args) {
    RunConfig config;
    if (!args.config_path.empty()) {
        config = parse_run_config_from_file(args.config_path);
    }

    RunSettings settings;
    settings.probabilities_path = first_of(args.probabilities_path, config.probabilities_path).value_or("");
    settings.portfolio_path = first_of(args.portfolio_path, config.portfolio_path).value_or("");
    settings.probability_columns = config.probability_columns;
    settings.expected_matches = first_of(args.expected_matches, config.expected_matches);

    settings.paytable_text = args.paytable_json;
    if (!settings.paytable_text) {
        settings.paytable = config.paytable;
    }

    settings.evaluation.num_simulations =
        first_of(args.num_simulations, config.num_simulations).value_or(EvaluationConfig::DEFAULT_SIMULATIONS);
    settings.evaluation.alpha = first_of(args.alpha, config.alpha).value_or(EvaluationConfig::DEFAULT_ALPHA);
    settings.evaluation.seed = first_of(args.seed, config.seed).value_or(EvaluationConfig::DEFAULT_SEED);
    settings.evaluation.store_returns = true;

    settings.returns_path = first_of(args.returns_path, config.returns_path);
    settings.risk_path = first_of(args.risk_path, config.risk_path);
    settings.summary_path = first_of(args.summary_path, config.summary_path);
    settings.returns_parquet_path = first_of(args.returns_parquet_path, config.returns_parquet_path);

    if (auto level = first_of(args.log_level, config.log_level)) {
        settings.logging.min_level = string_to_level(*level);
    }
    settings.logging.enable_json = args.log_text ? false : config.log_json.value_or(true);
    if (auto log_file = first_of(args.log_file, config.log_file)) {
        settings.logging.enable_file = true;
        settings.logging.log_file_path = *log_file;
    }

    return settings;
}

bool validate_settings(const RunSettings& settings) {
    bool valid = true;

    if (settings.probabilities_path.empty()) {
        std::cerr << "Error: --probabilities is required\n";
        valid = false;
    } else if (!file_exists(settings.probabilities_path)) {
        std::cerr << "Error: Probabilities file not found: " << settings.probabilities_path << "\n";
        valid = false;
    }

    if (settings.portfolio_path.empty()) {
        std::cerr << "Error: --portfolio is required\n";
        valid = false;
    } else if (!file_exists(settings.portfolio_path)) {
        std::cerr << "Error: Portfolio file not found: " << settings.portfolio_path << "\n";
        valid = false;
    }

    if (settings.evaluation.num_simulations == 0) {
        std::cerr << "Error: --sims must be positive\n";
        valid = false;
    }

    double alpha = settings.evaluation.alpha;
    if (!(alpha > 0.0 && alpha < 1.0)) {
        std::cerr << "Error: --alpha must be in (0, 1)\n";
        valid = false;
    }

    if (settings.expected_matches && *settings.expected_matches == 0) {
        std::cerr << "Error: --matches must be positive\n";
        valid = false;
    }

    if (settings.returns_parquet_path && !io::ParquetWriter::available()) {
        std::cerr << "Error: --returns-parquet requires a build with Apache Arrow support\n";
        valid = false;
    }

    return valid;
}

// Resolve the pay table; a malformed table falls back to the default scheme
PayTable resolve_pay_table(const RunSettings& settings, std::vector<std::string>& warnings) {
    if (!settings.paytable_text && !settings.paytable) {
        return PayTable();
    }
    try {
        PayTable table = settings.paytable_text
            ? PayTable::from_json_string(*settings.paytable_text)
            : PayTable::from_json(*settings.paytable);
        Logger::get_instance().log_input_loaded(
            "paytable", settings.paytable_text ? "inline" : "config", table.entries().size());
        return table;
    } catch (const std::invalid_argument& e) {
        std::string warning = std::string("Malformed pay table, using default full-hit scheme: ") + e.what();
        Logger::get_instance().log_recovered("paytable", warning);
        warnings.push_back(warning);
        return PayTable();
    }
}

int run(const RunSettings& settings) {
    Logger& logger = Logger::get_instance();
    std::vector<std::string> warnings;

    logger.log_run_start({
        {"probabilities", settings.probabilities_path},
        {"portfolio", settings.portfolio_path},
        {"simulations", std::to_string(settings.evaluation.num_simulations)},
        {"alpha", std::to_string(settings.evaluation.alpha)},
        {"seed", std::to_string(settings.evaluation.seed.value_or(EvaluationConfig::DEFAULT_SEED))}
    });

    ProbabilityMatrix matrix =
        ProbabilityMatrix::load_from_csv(settings.probabilities_path, settings.probability_columns);
    logger.log_input_loaded("probabilities", settings.probabilities_path, matrix.num_matches());

    if (settings.expected_matches && *settings.expected_matches != matrix.num_matches()) {
        throw ShapeMismatch("Probability matrix has " + std::to_string(matrix.num_matches()) +
                            " matches, expected " + std::to_string(*settings.expected_matches));
    }
    if (matrix.rows_renormalized() > 0) {
        std::string warning = std::to_string(matrix.rows_renormalized()) +
                              " probability rows did not sum to 1 and were renormalized";
        logger.log_recovered("probabilities", warning);
        warnings.push_back(warning);
    }

    PortfolioPlan plan = PortfolioPlan::load_from_csv(settings.portfolio_path, matrix.num_matches());
    logger.log_input_loaded("portfolio", settings.portfolio_path, plan.tickets.size());
    for (const auto& warning : plan.warnings) {
        logger.log_recovered("portfolio", warning);
        warnings.push_back(warning);
    }

    PayTable pay_table = resolve_pay_table(settings, warnings);

    Portfolio portfolio(std::move(plan.tickets), pay_table);
    if (portfolio.uniform_weight_fallback()) {
        std::string warning = "Stake weights are invalid or sum to zero, using uniform weights";
        logger.log_recovered("weights", warning);
        warnings.push_back(warning);
    }

    RiskEvaluation result = evaluate_portfolio_risk(matrix, portfolio, settings.evaluation);

    logger.log_stage_complete("simulate", result.simulate_time_ms);
    logger.log_stage_complete("score", result.score_time_ms);
    logger.log_stage_complete("aggregate", result.aggregate_time_ms);
    logger.log_stage_complete("metrics", result.metrics_time_ms);
    logger.log_run_complete(result);

    std::cerr << "\nResults:\n";
    std::cerr << "  Simulations: " << result.num_simulations << " (seed " << result.seed << ")\n";
    std::cerr << "  Tickets:     " << portfolio.num_tickets() << " over " << result.num_matches << " matches\n";
    std::cerr << "  Pay table:   " << pay_table.describe() << "\n";
    std::cerr << "  Mean:        " << result.summary.mean << "\n";
    std::cerr << "  Std Dev:     " << result.summary.std_dev << "\n";
    std::cerr << "  P(return>0): " << result.summary.prob_positive << "\n";
    std::cerr << "  " << result.risk.var_label() << ":       " << result.risk.value_at_risk << "\n";
    std::cerr << "  " << result.risk.es_label() << ":        " << result.risk.expected_shortfall << "\n";
    std::cerr << "  Execution:   " << result.execution_time_ms << " ms\n\n";

    // Every requested file is written before any is published, so a failing
    // write leaves no outputs from this run behind
    io::OutputBatch outputs;
    if (settings.returns_path) {
        outputs.add(*settings.returns_path, [&](std::ostream& os) {
            io::write_returns_csv(os, result.returns);
        });
    }
    if (settings.returns_parquet_path) {
        io::ParquetWriter::stage_returns(outputs, result.returns, *settings.returns_parquet_path);
    }
    if (settings.summary_path) {
        io::SummaryMetadata metadata;
        metadata.probabilities_source = settings.probabilities_path;
        metadata.portfolio_source = settings.portfolio_path;
        metadata.pay_table = pay_table.describe();
        metadata.warnings = warnings;
        outputs.add(*settings.summary_path, [&](std::ostream& os) {
            io::write_summary_json(os, result, metadata);
        });
    }
    if (settings.risk_path) {
        outputs.add(*settings.risk_path, [&](std::ostream& os) {
            io::write_risk_csv(os, result.risk);
        });
    }
    outputs.commit();

    if (settings.returns_path) {
        logger.log_output_written("returns", *settings.returns_path);
    }
    if (settings.returns_parquet_path) {
        logger.log_output_written("returns_parquet", *settings.returns_parquet_path);
    }
    if (settings.summary_path) {
        logger.log_output_written("summary", *settings.summary_path);
    }
    if (settings.risk_path) {
        logger.log_output_written("risk", *settings.risk_path);
    } else {
        io::write_risk_csv(std::cout, result.risk);
    }

    logger.flush();
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\nUse --help for usage information.\n";
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    RunSettings settings;
    try {
        settings = merge_settings(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\nUse --help for usage information.\n";
        return 1;
    }

    if (!validate_settings(settings)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    Logger::get_instance().configure(settings.logging);

    try {
        return run(settings);
    } catch (const std::exception& e) {
        Logger::get_instance().log_error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
