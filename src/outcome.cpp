#include "outcome.hpp"
#include <stdexcept>

namespace poolrisk {

char outcome_symbol(Outcome outcome) {
    switch (outcome) {
        case Outcome::Home: return '1';
        case Outcome::Draw: return 'X';
        case Outcome::Away: return '2';
    }
    return '?';
}

CoverageSet::CoverageSet(uint8_t mask) : mask_(mask) {
    if (mask == 0 || mask > FULL_MASK) {
        throw std::invalid_argument("Coverage mask must be in 1..7, got " +
                                    std::to_string(static_cast<int>(mask)));
    }
}

CoverageSet CoverageSet::single(Outcome outcome) {
    return CoverageSet(static_cast<uint8_t>(1u << static_cast<uint8_t>(outcome)));
}

size_t CoverageSet::size() const {
    size_t count = 0;
    for (uint8_t m = mask_; m != 0; m >>= 1) {
        count += m & 1u;
    }
    return count;
}

CoverageSet CoverageSet::with(Outcome outcome) const {
    return CoverageSet(static_cast<uint8_t>(mask_ | (1u << static_cast<uint8_t>(outcome))));
}

std::string CoverageSet::to_code() const {
    std::string code;
    for (uint8_t i = 0; i < NUM_OUTCOMES; ++i) {
        Outcome outcome = static_cast<Outcome>(i);
        if (contains(outcome)) {
            code += outcome_symbol(outcome);
        }
    }
    return code;
}

} // namespace poolrisk
