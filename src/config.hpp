#ifndef POOLRISK_CONFIG_HPP
#define POOLRISK_CONFIG_HPP

#include "probability_matrix.hpp"
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace poolrisk {

/**
 * @brief Run configuration loaded from JSON
 *
 * Every field is optional; command-line options are layered on top and the
 * engine defaults fill whatever is still unset.
 */
struct RunConfig {
    // inputs
    std::optional<std::string> probabilities_path;
    std::optional<std::string> portfolio_path;

    // round
    std::optional<size_t> expected_matches;
    std::optional<ProbabilityColumns> probability_columns;

    // simulation / risk
    std::optional<size_t> num_simulations;
    std::optional<uint64_t> seed;
    std::optional<double> alpha;

    // Raw pay table value; validated when the portfolio is built so a
    // malformed table can fall back to the default scheme.
    std::optional<nlohmann::json> paytable;

    // outputs
    std::optional<std::string> returns_path;
    std::optional<std::string> risk_path;
    std::optional<std::string> summary_path;
    std::optional<std::string> returns_parquet_path;

    // logging
    std::optional<std::string> log_level;
    std::optional<bool> log_json;
    std::optional<std::string> log_file;
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative paths are resolved against the directory containing the file.
 *
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * Paths are returned as written (after environment expansion).
 *
 * @throws ConfigParseError on a JSON syntax error or a value of the wrong type
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports ${VAR_NAME} and $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of the config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace poolrisk

#endif // POOLRISK_CONFIG_HPP
