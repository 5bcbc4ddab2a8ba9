#ifndef POOLRISK_OUTCOME_HPP
#define POOLRISK_OUTCOME_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace poolrisk {

enum class Outcome : uint8_t {
    Home = 0,
    Draw = 1,
    Away = 2
};

constexpr size_t NUM_OUTCOMES = 3;

// Pick-code symbol for an outcome ('1', 'X', '2')
char outcome_symbol(Outcome outcome);

// CoverageSet: non-empty subset of {Home, Draw, Away} accepted for one match.
// Stored as a 3-bit mask, bit i set <=> Outcome(i) is covered.
class CoverageSet {
public:
    static constexpr uint8_t FULL_MASK = 0x7;

    // Default is the full triple cover
    CoverageSet() : mask_(FULL_MASK) {}

    // Mask must be in 1..7; an empty mask throws std::invalid_argument
    explicit CoverageSet(uint8_t mask);

    static CoverageSet single(Outcome outcome);
    static CoverageSet full() { return CoverageSet(); }

    bool contains(Outcome outcome) const {
        return (mask_ >> static_cast<uint8_t>(outcome)) & 1u;
    }

    size_t size() const;
    bool is_full() const { return mask_ == FULL_MASK; }
    uint8_t mask() const { return mask_; }

    CoverageSet with(Outcome outcome) const;

    // Canonical pick code, e.g. "1", "X2", "1X2"
    std::string to_code() const;

    bool operator==(const CoverageSet& other) const { return mask_ == other.mask_; }
    bool operator!=(const CoverageSet& other) const { return mask_ != other.mask_; }

private:
    uint8_t mask_;
};

} // namespace poolrisk

#endif // POOLRISK_OUTCOME_HPP
