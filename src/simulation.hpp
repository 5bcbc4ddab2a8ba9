#ifndef POOLRISK_SIMULATION_HPP
#define POOLRISK_SIMULATION_HPP

#include "outcome.hpp"
#include "probability_matrix.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace poolrisk {

// SimulationBatch: S x M matrix of simulated match outcomes, simulation-major.
// row(s) points at the M outcomes of simulation s.
class SimulationBatch {
public:
    SimulationBatch();
    SimulationBatch(size_t num_simulations, size_t num_matches, uint64_t seed);

    size_t num_simulations() const { return num_simulations_; }
    size_t num_matches() const { return num_matches_; }
    uint64_t seed() const { return seed_; }

    Outcome at(size_t simulation, size_t match) const;
    void set(size_t simulation, size_t match, Outcome outcome);

    const Outcome* row(size_t simulation) const { return outcomes_.data() + simulation * num_matches_; }
    Outcome* row(size_t simulation) { return outcomes_.data() + simulation * num_matches_; }

    const std::vector<Outcome>& outcomes() const { return outcomes_; }

    bool operator==(const SimulationBatch& other) const;

private:
    size_t num_simulations_;
    size_t num_matches_;
    uint64_t seed_;
    std::vector<Outcome> outcomes_;
};

// Draw num_simulations independent results of the round.
//
// The simulation axis is cut into chunks of SIMULATION_CHUNK_SIZE; chunk c
// draws from a Mersenne Twister seeded with (seed, c). The batch is therefore
// bit-identical for a given (matrix, num_simulations, seed) whatever the
// number of threads. Without a seed one is taken from std::random_device and
// stored in the batch.
//
// Throws std::invalid_argument if num_simulations is zero.
SimulationBatch simulate_outcomes(const ProbabilityMatrix& matrix,
                                  size_t num_simulations,
                                  std::optional<uint64_t> seed = std::nullopt);

constexpr size_t SIMULATION_CHUNK_SIZE = 4096;

} // namespace poolrisk

#endif // POOLRISK_SIMULATION_HPP
