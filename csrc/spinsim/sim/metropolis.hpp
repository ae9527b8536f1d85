// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file metropolis.hpp
 * @brief Metropolis single-spin-flip engine over dense spin vectors.
 *
 * One sweep draws n_vars variables uniformly WITH replacement and, for each
 * draw in order, flips it with the Metropolis probability
 *
 *   P(accept) = 1                 if dE <= 0
 *             = exp(-dE / T)      if dE > 0 and T > 0
 *             = 0                 if dE > 0 and T == 0
 *
 * so T == 0 is greedy descent. Before every sweep the pre-sweep state is
 * pushed to the history buffer.
 *
 * All argument validation happens before the first mutation: a call either
 * completes or throws with state, history and random stream untouched.
 */

#pragma once

#include <spinsim/sim/adjacency.hpp>
#include <spinsim/sim/history.hpp>
#include <spinsim/sim/random_source.hpp>
#include <spinsim/utils/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace spinsim {

/// One schedule phase: run `sweeps` sweeps at `temperature`.
struct Phase {
    double temperature;
    i64 sweeps;
};

class MetropolisEngine {
public:
    /**
     * @param adjacency Incidence index of the spin model
     * @param initial   Initial spins, one per variable, each +1 or -1
     * @param memory    History capacity
     * @param seed      Seed of the owned random source; random_device if empty
     * @throws InvalidStateValue if initial has the wrong size or a non-+-1 entry
     */
    MetropolisEngine(AdjacencyIndex adjacency,
                     SpinVector initial,
                     std::size_t memory,
                     std::optional<u64> seed = std::nullopt);

    /**
     * Run `sweeps` sweeps at temperature T.
     *
     * @param seed Re-seed the random source before sampling
     * @return Number of accepted flips
     * @throws InvalidScheduleEntry if T < 0 or NaN
     * @throws InvalidUpdateCount if sweeps < 0
     */
    i64 update(double temperature, i64 sweeps = 1,
               std::optional<u64> seed = std::nullopt);

    /**
     * Run phases in order; identical to the equivalent update() sequence with
     * the same seeding point. Every phase is validated before any runs.
     *
     * @return Total accepted flips
     */
    i64 schedule(std::span<const Phase> phases,
                 std::optional<u64> seed = std::nullopt);

    /// Restore initial spins and clear history.
    void reset();

    /// Replace current spins (history untouched).
    void set_state(SpinVector spins);

    /**
     * Past snapshots followed by the current state, oldest first.
     *
     *   n == 1 (or 0)  current state only
     *   n empty        up to memory() snapshots + current
     *   otherwise      up to n-1 snapshots + current
     */
    [[nodiscard]] std::vector<SpinVector> past_states(
        std::optional<std::size_t> n = std::nullopt) const;

    [[nodiscard]] const SpinVector& spins() const noexcept { return spins_; }
    [[nodiscard]] const SpinVector& initial_spins() const noexcept { return initial_; }
    [[nodiscard]] std::size_t memory() const noexcept { return history_.capacity(); }
    [[nodiscard]] u32 n_vars() const noexcept { return adj_.n_vars(); }
    [[nodiscard]] const AdjacencyIndex& adjacency() const noexcept { return adj_; }
    [[nodiscard]] const HistoryBuffer& history() const noexcept { return history_; }

    /// Energy of the current spins (offset excluded).
    [[nodiscard]] double energy() const noexcept { return adj_.energy(spins_); }

    /// Energy change of flipping var in the current state.
    [[nodiscard]] double flip_delta(u32 var) const;

private:
    static void check_temperature(double temperature);
    static void check_sweeps(i64 sweeps);
    void check_spins(const SpinVector& spins) const;

    i64 sweep(double temperature);

    AdjacencyIndex adj_;
    SpinVector initial_;
    SpinVector spins_;
    HistoryBuffer history_;
    RandomSource rng_;
};

} // namespace spinsim
