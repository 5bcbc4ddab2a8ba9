/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "evaluation.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace poolrisk {

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel string_to_level(const std::string& level_str) {
    std::string upper;
    for (char c : level_str) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + level_str);
}

LoggerConfig::LoggerConfig()
    : min_level(LogLevel::INFO),
      enable_console(true),
      enable_file(false),
      log_file_path("poolrisk.log"),
      enable_json(true) {}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : config_(LoggerConfig()) {}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    flush();
    file_stream_.reset();
    config_ = config;

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::reset() {
    configure(LoggerConfig());
}

// ============================================================================
// Events
// ============================================================================

void Logger::log_run_start(const std::map<std::string, std::string>& parameters) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    for (const auto& [key, value] : parameters) {
        fields["param." + key] = value;
    }
    log(LogLevel::INFO, "Starting risk evaluation", fields);
}

void Logger::log_input_loaded(const std::string& kind, const std::string& source, size_t rows) {
    std::map<std::string, std::string> fields;
    fields["event"] = "input_loaded";
    fields["input"] = kind;
    fields["source"] = source;
    fields["rows"] = std::to_string(rows);
    log(LogLevel::INFO, "Loaded " + kind, fields);
}

void Logger::log_recovered(const std::string& kind, const std::string& detail) {
    std::map<std::string, std::string> fields;
    fields["event"] = "recovered";
    fields["condition"] = kind;
    fields["detail"] = detail;
    log(LogLevel::WARN, detail, fields);
}

void Logger::log_stage_complete(const std::string& stage, double duration_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "stage_complete";
    fields["stage"] = stage;
    fields["duration_ms"] = std::to_string(duration_ms);
    log(LogLevel::DEBUG, "Stage complete: " + stage, fields);
}

void Logger::log_run_complete(const RiskEvaluation& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    fields["simulations"] = std::to_string(result.num_simulations);
    fields["matches"] = std::to_string(result.num_matches);
    fields["tickets"] = std::to_string(result.tickets.size());
    fields["seed"] = std::to_string(result.seed);
    fields[result.risk.var_label()] = std::to_string(result.risk.value_at_risk);
    fields[result.risk.es_label()] = std::to_string(result.risk.expected_shortfall);
    fields["mean_return"] = std::to_string(result.summary.mean);
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);
    fields["throughput_sims_per_sec"] = std::to_string(
        result.execution_time_ms > 0 ? (result.num_simulations * 1000.0 / result.execution_time_ms) : 0
    );
    log(LogLevel::INFO, "Risk evaluation complete", fields);
}

void Logger::log_output_written(const std::string& kind, const std::string& path) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_written";
    fields["output"] = kind;
    fields["path"] = path;
    log(LogLevel::INFO, "Wrote " + kind, fields);
}

void Logger::log_error(const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;
    log(LogLevel::ERROR, "Risk evaluation failed", fields);
}

void Logger::debug(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::info(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::warn(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::WARN, message, fields);
}

// ============================================================================
// Formatting / output
// ============================================================================

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

std::string Logger::format_event(LogLevel level, const std::string& message,
                                  const std::map<std::string, std::string>& fields) const {
    if (config_.enable_json) {
        nlohmann::json j(fields);
        j["timestamp"] = get_timestamp();
        j["level"] = level_to_string(level);
        j["message"] = message;
        return j.dump();
    }

    std::ostringstream oss;
    oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;
    if (!fields.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }
    return oss.str();
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::map<std::string, std::string>& fields) {
    if (level < config_.min_level) {
        return;
    }
    write_output(format_event(level, message, fields));
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }
    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace poolrisk
