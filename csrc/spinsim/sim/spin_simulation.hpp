// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file spin_simulation.hpp
 * @brief Metropolis simulation of a spin (PUSO) model over arbitrary labels.
 *
 * Wraps MetropolisEngine with a LabelMap: callers read and write assignments
 * keyed by their own labels, the engine works on dense spin vectors.
 *
 * Usage:
 * @code
 *   EnergyModel<int> chain;
 *   for (int i = 0; i < 49; ++i) chain.add({i, i + 1}, -1.0);
 *
 *   SpinSimulation<int> sim(chain, std::nullopt, {.memory = 30});
 *   const std::vector<Phase> schedule{{4.0, 25}, {2.0, 25}, {1.0, 10}};
 *   sim.schedule_update(schedule, 42);
 *   auto last = sim.get_past_states(30);
 * @endcode
 */

#pragma once

#include <spinsim/model/domain.hpp>
#include <spinsim/model/energy_model.hpp>
#include <spinsim/sim/adjacency.hpp>
#include <spinsim/sim/label_map.hpp>
#include <spinsim/sim/metropolis.hpp>
#include <spinsim/utils/constants.hpp>
#include <spinsim/utils/errors.hpp>

#include <cstddef>
#include <format>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace spinsim {

/**
 * Construction-time configuration.
 */
struct SimOptions {
    std::size_t memory = DEFAULT_MEMORY;  ///< Number of past states retained
    std::optional<u64> seed;              ///< Initial seed; random_device if empty
};

template<LabelLike L>
class SpinSimulation {
public:
    /**
     * @param model         Spin model; indexed once, later edits are not seen
     * @param initial_state Value in {-1, +1} for every model variable; all +1
     *                      if empty. Labels outside the model are ignored.
     * @throws InvalidStateValue on a missing variable or a non-+-1 value
     */
    explicit SpinSimulation(const EnergyModel<L>& model,
                            std::optional<Assignment<L>> initial_state = std::nullopt,
                            SimOptions opt = {})
        : labels_(LabelMap<L>::from_list(model.variables())),
          offset_(model.offset()),
          engine_(AdjacencyIndex(index_terms(model, labels_)),
                  initial_state ? to_spins(*initial_state)
                                : SpinVector(labels_.size(), Spin{1}),
                  opt.memory,
                  opt.seed) {}

    // --- State ---

    /// Copy of the current state.
    [[nodiscard]] Assignment<L> state() const { return to_assignment(engine_.spins()); }

    /// Copy of the initial state.
    [[nodiscard]] Assignment<L> initial_state() const {
        return to_assignment(engine_.initial_spins());
    }

    /// Replace the current state; history is kept.
    void set_state(const Assignment<L>& state) { engine_.set_state(to_spins(state)); }

    [[nodiscard]] const std::vector<L>& variables() const noexcept { return labels_.all_labels(); }
    [[nodiscard]] std::size_t memory() const noexcept { return engine_.memory(); }

    // --- Dynamics ---

    /// @copydoc MetropolisEngine::update
    i64 update(double temperature, i64 sweeps = 1, std::optional<u64> seed = std::nullopt) {
        return engine_.update(temperature, sweeps, seed);
    }

    /// @copydoc MetropolisEngine::schedule
    i64 schedule_update(std::span<const Phase> schedule,
                        std::optional<u64> seed = std::nullopt) {
        return engine_.schedule(schedule, seed);
    }

    /// Back to the initial state with empty history.
    void reset() { engine_.reset(); }

    /// @copydoc MetropolisEngine::past_states
    [[nodiscard]] std::vector<Assignment<L>> get_past_states(
        std::optional<std::size_t> n = std::nullopt) const {
        std::vector<Assignment<L>> out;
        for (const auto& spins : engine_.past_states(n)) {
            out.push_back(to_assignment(spins));
        }
        return out;
    }

    // --- Observables ---

    /// Model value of the current state, offset included.
    [[nodiscard]] double energy() const noexcept { return offset_ + engine_.energy(); }

    /// Energy change if `label` were flipped now.
    [[nodiscard]] double flip_delta(const L& label) const {
        const auto idx = labels_.get_idx(label);
        if (!idx) {
            throw std::out_of_range("SpinSimulation::flip_delta: label is not a model variable");
        }
        return engine_.flip_delta(*idx);
    }

    /// Energies of the states get_past_states(n) returns, same order.
    [[nodiscard]] std::vector<double> trajectory_energies(
        std::optional<std::size_t> n = std::nullopt) const {
        const auto states = engine_.past_states(n);
        auto out = engine_.adjacency().energies(states);
        for (double& e : out) {
            e += offset_;
        }
        return out;
    }

    [[nodiscard]] std::string describe() const {
        return std::format("SpinSimulation(memory={})", memory());
    }

    [[nodiscard]] const MetropolisEngine& engine() const noexcept { return engine_; }
    [[nodiscard]] const LabelMap<L>& label_map() const noexcept { return labels_; }

private:
    [[nodiscard]] Assignment<L> to_assignment(const SpinVector& spins) const {
        Assignment<L> out;
        out.reserve(spins.size());
        for (u32 i = 0; i < spins.size(); ++i) {
            out.emplace(labels_.get_label(i), static_cast<int>(spins[i]));
        }
        return out;
    }

    [[nodiscard]] SpinVector to_spins(const Assignment<L>& state) const {
        SpinVector out(labels_.size());
        for (u32 i = 0; i < labels_.size(); ++i) {
            auto it = state.find(labels_.get_label(i));
            if (it == state.end()) {
                throw InvalidStateValue("SpinSimulation: state is missing a model variable");
            }
            if (!is_valid_value(Domain::Spin, it->second)) {
                throw InvalidStateValue("SpinSimulation: state must contain only 1's and -1's");
            }
            out[i] = static_cast<Spin>(it->second);
        }
        return out;
    }

    LabelMap<L> labels_;
    double offset_;
    MetropolisEngine engine_;
};

} // namespace spinsim
