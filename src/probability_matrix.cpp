#include "probability_matrix.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace poolrisk {

// ============================================================================
// MatchProbabilities / ProbabilityColumns
// ============================================================================

MatchProbabilities::MatchProbabilities()
    : p_home(0.0), p_draw(0.0), p_away(0.0) {}

MatchProbabilities::MatchProbabilities(std::string id, double home, double draw, double away)
    : match_id(std::move(id)), p_home(home), p_draw(draw), p_away(away) {}

double MatchProbabilities::probability(Outcome outcome) const {
    switch (outcome) {
        case Outcome::Home: return p_home;
        case Outcome::Draw: return p_draw;
        case Outcome::Away: return p_away;
    }
    return 0.0;
}

ProbabilityColumns::ProbabilityColumns()
    : match_id("match_id"), home("p_home"), draw("p_draw"), away("p_away") {}

ProbabilityColumns::ProbabilityColumns(std::string id, std::string h, std::string d, std::string a)
    : match_id(std::move(id)), home(std::move(h)), draw(std::move(d)), away(std::move(a)) {}

std::vector<ProbabilityColumns> ProbabilityColumns::default_candidates() {
    return {
        ProbabilityColumns("match_id", "p_home_final", "p_draw_final", "p_away_final"),
        ProbabilityColumns("match_id", "p_home", "p_draw", "p_away"),
    };
}

// ============================================================================
// Row normalization
// ============================================================================

bool normalize_row(MatchProbabilities& row, double tolerance) {
    const double values[NUM_OUTCOMES] = {row.p_home, row.p_draw, row.p_away};
    for (double p : values) {
        if (!std::isfinite(p)) {
            throw InvalidProbabilityRow(row.match_id, "probability is not finite");
        }
        if (p < 0.0) {
            throw InvalidProbabilityRow(row.match_id, "probability is negative");
        }
    }

    double sum = row.total();
    if (!(sum > 0.0)) {
        throw InvalidProbabilityRow(row.match_id, "probabilities sum to zero");
    }

    bool drifted = std::fabs(sum - 1.0) > tolerance;
    row.p_home /= sum;
    row.p_draw /= sum;
    row.p_away /= sum;

    if (std::fabs(row.total() - 1.0) > tolerance) {
        throw InvalidProbabilityRow(row.match_id, "cannot renormalize to 1");
    }
    return drifted;
}

// ============================================================================
// ProbabilityMatrix
// ============================================================================

ProbabilityMatrix::ProbabilityMatrix(std::vector<MatchProbabilities> rows)
    : rows_(std::move(rows)), rows_renormalized_(0) {
    for (size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].match_id.empty()) {
            rows_[i].match_id = "M" + std::to_string(i + 1);
        }
        if (normalize_row(rows_[i])) {
            ++rows_renormalized_;
        }
    }
}

const MatchProbabilities& ProbabilityMatrix::row(size_t match) const {
    if (match >= rows_.size()) {
        throw std::out_of_range("Match index out of range");
    }
    return rows_[match];
}

double ProbabilityMatrix::probability(size_t match, Outcome outcome) const {
    return row(match).probability(outcome);
}

ProbabilityMatrix ProbabilityMatrix::load_from_csv(
    const std::string& filepath,
    const std::optional<ProbabilityColumns>& columns) {
    std::ifstream file(filepath);
    if (!file) {
        throw SchemaError("Cannot open probability matrix: " + filepath);
    }
    return load_from_csv(file, columns);
}

namespace {

struct ResolvedColumns {
    std::optional<size_t> match_id;
    size_t home;
    size_t draw;
    size_t away;
};

std::optional<ResolvedColumns> resolve(const std::vector<std::string>& header,
                                       const ProbabilityColumns& columns) {
    auto home = io::find_column(header, columns.home);
    auto draw = io::find_column(header, columns.draw);
    auto away = io::find_column(header, columns.away);
    if (!home || !draw || !away) {
        return std::nullopt;
    }
    ResolvedColumns resolved;
    resolved.home = *home;
    resolved.draw = *draw;
    resolved.away = *away;
    if (!columns.match_id.empty()) {
        resolved.match_id = io::find_column(header, columns.match_id);
    }
    return resolved;
}

double parse_probability(const std::string& cell, const std::string& match_id,
                         const std::string& column) {
    if (cell.empty()) {
        throw InvalidProbabilityRow(match_id, "missing value in column '" + column + "'");
    }
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::exception&) {
        throw InvalidProbabilityRow(match_id, "non-numeric value '" + cell +
                                    "' in column '" + column + "'");
    }
    if (consumed != cell.size()) {
        throw InvalidProbabilityRow(match_id, "non-numeric value '" + cell +
                                    "' in column '" + column + "'");
    }
    return value;
}

} // anonymous namespace

ProbabilityMatrix ProbabilityMatrix::load_from_csv(
    std::istream& is,
    const std::optional<ProbabilityColumns>& columns) {
    io::CsvReader reader(is);

    auto header = reader.read_header();
    if (header.empty()) {
        throw SchemaError("Probability matrix is empty (no header row)");
    }

    std::optional<ResolvedColumns> resolved;
    ProbabilityColumns used;
    if (columns) {
        resolved = resolve(header, *columns);
        used = *columns;
        if (!resolved) {
            throw SchemaError("Probability matrix is missing columns " + columns->home +
                              ", " + columns->draw + ", " + columns->away);
        }
    } else {
        for (const auto& candidate : ProbabilityColumns::default_candidates()) {
            resolved = resolve(header, candidate);
            if (resolved) {
                used = candidate;
                break;
            }
        }
        if (!resolved) {
            throw SchemaError("Probability matrix has no recognized probability columns "
                              "(expected p_home,p_draw,p_away or p_home_final,p_draw_final,p_away_final)");
        }
    }

    std::vector<MatchProbabilities> rows;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            continue;
        }

        MatchProbabilities match;
        if (resolved->match_id && *resolved->match_id < row.size()) {
            match.match_id = row[*resolved->match_id];
        }
        if (match.match_id.empty()) {
            match.match_id = "M" + std::to_string(rows.size() + 1);
        }

        auto cell = [&row](size_t idx) {
            return idx < row.size() ? row[idx] : std::string();
        };
        match.p_home = parse_probability(cell(resolved->home), match.match_id, used.home);
        match.p_draw = parse_probability(cell(resolved->draw), match.match_id, used.draw);
        match.p_away = parse_probability(cell(resolved->away), match.match_id, used.away);

        rows.push_back(std::move(match));
    }

    if (rows.empty()) {
        throw SchemaError("Probability matrix has no match rows");
    }

    return ProbabilityMatrix(std::move(rows));
}

} // namespace poolrisk
