#include "portfolio.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace poolrisk {

// ============================================================================
// Weight normalization
// ============================================================================

bool weights_fall_back_to_uniform(const std::vector<double>& weights) {
    double sum = 0.0;
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            return true;
        }
        sum += w;
    }
    return !(sum > 0.0);
}

std::vector<double> normalize_weights(const std::vector<double>& weights) {
    if (weights.empty()) {
        return {};
    }
    if (weights_fall_back_to_uniform(weights)) {
        return std::vector<double>(weights.size(), 1.0 / static_cast<double>(weights.size()));
    }
    double sum = std::accumulate(weights.begin(), weights.end(), 0.0);
    std::vector<double> normalized;
    normalized.reserve(weights.size());
    for (double w : weights) {
        normalized.push_back(w / sum);
    }
    return normalized;
}

// ============================================================================
// Portfolio Implementation
// ============================================================================

Portfolio::Portfolio(std::vector<Ticket> tickets, PayTable pay_table)
    : tickets_(std::move(tickets)), pay_table_(std::move(pay_table)), uniform_fallback_(false) {
    if (tickets_.empty()) {
        throw SchemaError("Portfolio has no tickets");
    }

    const size_t num_matches = tickets_.front().size();
    std::vector<double> raw;
    raw.reserve(tickets_.size());
    for (size_t t = 0; t < tickets_.size(); ++t) {
        if (tickets_[t].size() != num_matches) {
            throw ShapeMismatch("Ticket " + std::to_string(t + 1) + " covers " +
                                std::to_string(tickets_[t].size()) + " matches, ticket 1 covers " +
                                std::to_string(num_matches));
        }
        raw.push_back(tickets_[t].stake_weight);
    }

    uniform_fallback_ = weights_fall_back_to_uniform(raw);
    weights_ = normalize_weights(raw);
}

const Ticket& Portfolio::ticket(size_t index) const {
    if (index >= tickets_.size()) {
        throw std::out_of_range("Ticket index out of range");
    }
    return tickets_[index];
}

// ============================================================================
// PortfolioPlan loading
// ============================================================================

PortfolioPlan::PortfolioPlan() : has_stake_weight_column(false) {}

PortfolioPlan PortfolioPlan::load_from_csv(const std::string& filepath, size_t num_matches) {
    std::ifstream file(filepath);
    if (!file) {
        throw SchemaError("Cannot open portfolio plan: " + filepath);
    }
    return load_from_csv(file, num_matches);
}

namespace {

// "J7" / "j7" -> 7, anything else -> 0
size_t pick_column_number(const std::string& name) {
    if (name.size() < 2 || (name[0] != 'J' && name[0] != 'j')) {
        return 0;
    }
    for (size_t i = 1; i < name.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return 0;
        }
    }
    if (name[1] == '0') {
        return 0;
    }
    try {
        return static_cast<size_t>(std::stoul(name.substr(1)));
    } catch (const std::exception&) {
        return 0;
    }
}

// Column index of each pick slot, in J1..JM order
std::vector<size_t> resolve_pick_columns(const std::vector<std::string>& header,
                                         size_t num_matches) {
    std::map<size_t, size_t> by_number;
    for (size_t i = 0; i < header.size(); ++i) {
        size_t number = pick_column_number(header[i]);
        if (number == 0) {
            continue;
        }
        if (!by_number.emplace(number, i).second) {
            throw SchemaError("Portfolio plan has duplicate pick column J" + std::to_string(number));
        }
    }

    if (by_number.empty()) {
        throw SchemaError("Portfolio plan has no pick columns (expected J1..J" +
                          std::to_string(num_matches) + ")");
    }

    std::vector<size_t> indices;
    size_t expected = 1;
    for (const auto& [number, column] : by_number) {
        if (number != expected) {
            throw SchemaError("Portfolio plan pick columns are not contiguous: J" +
                              std::to_string(expected) + " is missing");
        }
        indices.push_back(column);
        ++expected;
    }

    if (indices.size() != num_matches) {
        throw TicketShapeMismatch(indices.size(), num_matches);
    }
    return indices;
}

double parse_stake_weight(const std::string& cell) {
    if (cell.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::exception&) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return consumed == cell.size() ? value : std::numeric_limits<double>::quiet_NaN();
}

} // anonymous namespace

PortfolioPlan PortfolioPlan::load_from_csv(std::istream& is, size_t num_matches) {
    io::CsvReader reader(is);

    auto header = reader.read_header();
    if (header.empty()) {
        throw SchemaError("Portfolio plan is empty (no header row)");
    }

    const std::vector<size_t> pick_columns = resolve_pick_columns(header, num_matches);
    const auto weight_column = io::find_column(header, "stake_weight");

    PortfolioPlan plan;
    plan.has_stake_weight_column = weight_column.has_value();

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            continue;
        }
        const size_t ticket_number = plan.tickets.size() + 1;

        // Cells past the end of a short row read as empty (full cover)
        std::vector<std::string> cells(pick_columns.size());
        std::string fallback_slots;
        for (size_t j = 0; j < pick_columns.size(); ++j) {
            if (pick_columns[j] < row.size()) {
                cells[j] = row[pick_columns[j]];
            }
            if (!is_recognized_pick(cells[j])) {
                if (!fallback_slots.empty()) fallback_slots += ",";
                fallback_slots += "J" + std::to_string(j + 1);
            }
        }

        Ticket ticket = parse_ticket_row(cells, num_matches);

        if (weight_column) {
            const std::string cell = *weight_column < row.size() ? row[*weight_column] : std::string();
            ticket.stake_weight = parse_stake_weight(cell);
            if (!std::isfinite(ticket.stake_weight) || ticket.stake_weight < 0.0) {
                plan.warnings.push_back("Ticket " + std::to_string(ticket_number) +
                                        ": invalid stake_weight '" + cell + "'");
            }
        }

        if (!fallback_slots.empty()) {
            plan.warnings.push_back("Ticket " + std::to_string(ticket_number) +
                                    ": unrecognized or missing picks in " + fallback_slots +
                                    ", using full cover 1X2");
        }

        plan.tickets.push_back(std::move(ticket));
    }

    if (plan.tickets.empty()) {
        throw SchemaError("Portfolio plan has no tickets");
    }
    return plan;
}

} // namespace poolrisk
