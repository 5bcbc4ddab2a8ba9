/**
 * @file logger.hpp
 * @brief Structured logging for the risk engine
 *
 * One event per line, either JSON or plain text, written to stderr and
 * optionally appended to a file. Events carry an "event" field so runs can
 * be filtered by stage (input_loaded, recovered, stage_complete, ...).
 *
 * The logger is process-scoped: configure() installs a configuration and
 * reset() restores the defaults (used between tests).
 */

#ifndef POOLRISK_LOGGER_HPP
#define POOLRISK_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace poolrisk {

struct RiskEvaluation;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-stage details
    INFO,    ///< Run start/end, inputs loaded
    WARN,    ///< Recovered input conditions (fallbacks)
    ERROR    ///< Fatal errors that abort the run
};

std::string level_to_string(LogLevel level);

/**
 * @brief Parse log level from string (case-insensitive)
 * @throws std::invalid_argument for an unknown level name
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig();
};

/**
 * @brief Process-wide structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   Logger::get_instance().log_input_loaded("probabilities", "probs.csv", 14);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    /**
     * @brief Restore the default configuration and close any log file
     */
    void reset();

    const LoggerConfig& config() const { return config_; }

    void log_run_start(const std::map<std::string, std::string>& parameters);

    /**
     * @param kind Input kind ("probabilities", "portfolio", "paytable")
     * @param source File path or "inline"
     * @param rows Rows accepted
     */
    void log_input_loaded(const std::string& kind, const std::string& source, size_t rows);

    /**
     * @brief Log a recovered condition (fallback applied, run continues)
     */
    void log_recovered(const std::string& kind, const std::string& detail);

    void log_stage_complete(const std::string& stage, double duration_ms);

    void log_run_complete(const RiskEvaluation& result);

    void log_output_written(const std::string& kind, const std::string& path);

    void log_error(const std::string& error_message);

    void debug(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void info(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void warn(const std::string& message, const std::map<std::string, std::string>& fields = {});

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

    /**
     * @brief Render one event the way write_output() would emit it
     */
    std::string format_event(LogLevel level, const std::string& message,
                             const std::map<std::string, std::string>& fields) const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    void write_output(const std::string& output);
};

} // namespace poolrisk

#endif // POOLRISK_LOGGER_HPP
