#ifndef POOLRISK_TICKET_HPP
#define POOLRISK_TICKET_HPP

#include "outcome.hpp"
#include <string>
#include <vector>

namespace poolrisk {

// Ticket: one coverage set per match of the round plus a stake weight.
struct Ticket {
    std::vector<CoverageSet> coverage;
    double stake_weight;

    Ticket();
    explicit Ticket(std::vector<CoverageSet> cov, double weight = 1.0);

    size_t size() const { return coverage.size(); }
    const CoverageSet& operator[](size_t match) const { return coverage[match]; }

    size_t singles() const;
    size_t doubles() const;
    size_t triples() const;

    // Pick codes joined with '|', e.g. "1|1X|X2"
    std::string to_string() const;
};

// Parse a pick code into a coverage set. '1' -> Home, 'X' -> Draw, '2' -> Away,
// case-insensitive; other characters are ignored. A code with no recognized
// character yields the full triple cover.
CoverageSet parse_pick(const std::string& code);

// True if the code contains at least one of '1', 'X', '2'
bool is_recognized_pick(const std::string& code);

// Build a ticket from the pick cells of one portfolio-plan row. Slots beyond
// the end of `cells` are treated as missing and get the full triple cover.
// The result always has exactly num_matches coverage sets.
Ticket parse_ticket_row(const std::vector<std::string>& cells, size_t num_matches);

} // namespace poolrisk

#endif // POOLRISK_TICKET_HPP
