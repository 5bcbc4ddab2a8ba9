#ifndef POOLRISK_ERRORS_HPP
#define POOLRISK_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace poolrisk {

// Base class for every fatal error raised by the engine
class RiskEngineError : public std::runtime_error {
public:
    explicit RiskEngineError(const std::string& message)
        : std::runtime_error(message) {}
};

// A probability row is negative, non-finite, or cannot be renormalized to 1
class InvalidProbabilityRow : public RiskEngineError {
public:
    InvalidProbabilityRow(const std::string& match_id, const std::string& reason)
        : RiskEngineError("Invalid probability row for match '" + match_id + "': " + reason),
          match_id_(match_id) {}

    const std::string& match_id() const { return match_id_; }

private:
    std::string match_id_;
};

// An input file violates its column contract (missing columns, no rows, ...)
class SchemaError : public RiskEngineError {
public:
    explicit SchemaError(const std::string& message)
        : RiskEngineError(message) {}
};

// Two collaborating structures disagree on a dimension
class ShapeMismatch : public RiskEngineError {
public:
    explicit ShapeMismatch(const std::string& message)
        : RiskEngineError(message) {}
};

// Ticket length differs from the number of matches in the round
class TicketShapeMismatch : public ShapeMismatch {
public:
    TicketShapeMismatch(size_t ticket_length, size_t num_matches)
        : ShapeMismatch("Ticket covers " + std::to_string(ticket_length) +
                        " matches but the round has " + std::to_string(num_matches)),
          ticket_length_(ticket_length), num_matches_(num_matches) {}

    size_t ticket_length() const { return ticket_length_; }
    size_t num_matches() const { return num_matches_; }

private:
    size_t ticket_length_;
    size_t num_matches_;
};

// Not enough data to compute a statistic (e.g. empty return distribution)
class InsufficientData : public RiskEngineError {
public:
    explicit InsufficientData(const std::string& message)
        : RiskEngineError(message) {}
};

// Run configuration file cannot be read or has the wrong shape
class ConfigParseError : public RiskEngineError {
public:
    explicit ConfigParseError(const std::string& message)
        : RiskEngineError(message) {}
};

} // namespace poolrisk

#endif // POOLRISK_ERRORS_HPP
