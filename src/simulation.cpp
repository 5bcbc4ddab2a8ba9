#include "simulation.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace poolrisk {

// ============================================================================
// SimulationBatch Implementation
// ============================================================================

SimulationBatch::SimulationBatch()
    : num_simulations_(0), num_matches_(0), seed_(0) {}

SimulationBatch::SimulationBatch(size_t num_simulations, size_t num_matches, uint64_t seed)
    : num_simulations_(num_simulations),
      num_matches_(num_matches),
      seed_(seed),
      outcomes_(num_simulations * num_matches, Outcome::Home) {}

Outcome SimulationBatch::at(size_t simulation, size_t match) const {
    if (simulation >= num_simulations_ || match >= num_matches_) {
        throw std::out_of_range("Simulation batch index out of range");
    }
    return outcomes_[simulation * num_matches_ + match];
}

void SimulationBatch::set(size_t simulation, size_t match, Outcome outcome) {
    if (simulation >= num_simulations_ || match >= num_matches_) {
        throw std::out_of_range("Simulation batch index out of range");
    }
    outcomes_[simulation * num_matches_ + match] = outcome;
}

bool SimulationBatch::operator==(const SimulationBatch& other) const {
    return num_simulations_ == other.num_simulations_ &&
           num_matches_ == other.num_matches_ &&
           outcomes_ == other.outcomes_;
}

// ============================================================================
// Categorical sampling
// ============================================================================

namespace {

// Cumulative thresholds for one match. An outcome with zero probability gets
// a threshold that a uniform in [0,1) can never land on, so rounding in the
// cumulative sum cannot select it.
struct Thresholds {
    double home;
    double home_draw;
};

Thresholds make_thresholds(const MatchProbabilities& p) {
    Thresholds t;
    const bool tail_after_home = p.p_draw > 0.0 || p.p_away > 0.0;
    t.home = tail_after_home ? p.p_home : 2.0;
    t.home_draw = p.p_away > 0.0 ? p.p_home + p.p_draw : 2.0;
    return t;
}

inline Outcome draw_outcome(const Thresholds& t, double u) {
    if (u < t.home) return Outcome::Home;
    if (u < t.home_draw) return Outcome::Draw;
    return Outcome::Away;
}

// Uniform in [0,1) from the top 53 bits; identical on every standard library
inline double to_unit(uint64_t bits) {
    return static_cast<double>(bits >> 11) * (1.0 / 9007199254740992.0);
}

std::mt19937_64 chunk_engine(uint64_t seed, uint64_t chunk) {
    std::seed_seq seq{
        static_cast<uint32_t>(seed & 0xFFFFFFFFu),
        static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(chunk & 0xFFFFFFFFu),
        static_cast<uint32_t>(chunk >> 32)
    };
    return std::mt19937_64(seq);
}

} // anonymous namespace

SimulationBatch simulate_outcomes(const ProbabilityMatrix& matrix,
                                  size_t num_simulations,
                                  std::optional<uint64_t> seed) {
    if (num_simulations == 0) {
        throw std::invalid_argument("Number of simulations must be at least 1");
    }

    uint64_t run_seed;
    if (seed) {
        run_seed = *seed;
    } else {
        std::random_device rd;
        run_seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    }

    const size_t num_matches = matrix.num_matches();
    SimulationBatch batch(num_simulations, num_matches, run_seed);
    if (num_matches == 0) {
        return batch;
    }

    std::vector<Thresholds> thresholds;
    thresholds.reserve(num_matches);
    for (const auto& row : matrix.rows()) {
        thresholds.push_back(make_thresholds(row));
    }

    const size_t num_chunks = (num_simulations + SIMULATION_CHUNK_SIZE - 1) / SIMULATION_CHUNK_SIZE;

    // Chunks write disjoint ranges of the batch
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t c = 0; c < num_chunks; ++c) {
        std::mt19937_64 rng = chunk_engine(run_seed, c);
        const size_t begin = c * SIMULATION_CHUNK_SIZE;
        const size_t end = std::min(begin + SIMULATION_CHUNK_SIZE, num_simulations);

        for (size_t s = begin; s < end; ++s) {
            Outcome* out = batch.row(s);
            for (size_t m = 0; m < num_matches; ++m) {
                out[m] = draw_outcome(thresholds[m], to_unit(rng()));
            }
        }
    }

    return batch;
}

} // namespace poolrisk
