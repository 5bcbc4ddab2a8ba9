#include "ticket.hpp"
#include <cctype>
#include <optional>
#include <utility>

namespace poolrisk {

Ticket::Ticket() : stake_weight(1.0) {}

Ticket::Ticket(std::vector<CoverageSet> cov, double weight)
    : coverage(std::move(cov)), stake_weight(weight) {}

size_t Ticket::singles() const {
    size_t n = 0;
    for (const auto& c : coverage) n += c.size() == 1;
    return n;
}

size_t Ticket::doubles() const {
    size_t n = 0;
    for (const auto& c : coverage) n += c.size() == 2;
    return n;
}

size_t Ticket::triples() const {
    size_t n = 0;
    for (const auto& c : coverage) n += c.size() == 3;
    return n;
}

std::string Ticket::to_string() const {
    std::string out;
    for (size_t i = 0; i < coverage.size(); ++i) {
        if (i > 0) out += '|';
        out += coverage[i].to_code();
    }
    return out;
}

namespace {

std::optional<Outcome> symbol_to_outcome(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case '1': return Outcome::Home;
        case 'X': return Outcome::Draw;
        case '2': return Outcome::Away;
        default: return std::nullopt;
    }
}

} // anonymous namespace

CoverageSet parse_pick(const std::string& code) {
    uint8_t mask = 0;
    for (char c : code) {
        if (auto outcome = symbol_to_outcome(c)) {
            mask |= static_cast<uint8_t>(1u << static_cast<uint8_t>(*outcome));
        }
    }
    return mask == 0 ? CoverageSet::full() : CoverageSet(mask);
}

bool is_recognized_pick(const std::string& code) {
    for (char c : code) {
        if (symbol_to_outcome(c)) {
            return true;
        }
    }
    return false;
}

Ticket parse_ticket_row(const std::vector<std::string>& cells, size_t num_matches) {
    Ticket ticket;
    ticket.coverage.reserve(num_matches);
    for (size_t j = 0; j < num_matches; ++j) {
        if (j < cells.size()) {
            ticket.coverage.push_back(parse_pick(cells[j]));
        } else {
            ticket.coverage.push_back(CoverageSet::full());
        }
    }
    return ticket;
}

} // namespace poolrisk
