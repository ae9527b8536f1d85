// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file boolean_simulation.hpp
 * @brief Metropolis simulation of a Boolean (PUBO) model.
 *
 * Owns a SpinSimulation over pubo_to_puso(model) and translates values at the
 * boundary (b = (1 - s)/2) on every read and write. No Boolean state is kept
 * here. The default initial state, all zeros, is the spin default (all +1).
 *
 * Variables whose spin-domain coefficients cancel entirely are absent from
 * the converted model and therefore from every returned state. Labels that
 * are not variables of the converted model are ignored on input.
 */

#pragma once

#include <spinsim/model/domain.hpp>
#include <spinsim/model/energy_model.hpp>
#include <spinsim/sim/spin_simulation.hpp>
#include <spinsim/utils/errors.hpp>

#include <format>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace spinsim {

template<LabelLike L>
class BooleanSimulation {
public:
    /**
     * @param model         Boolean model
     * @param initial_state Value in {0, 1} per variable; all 0 if empty
     * @throws InvalidStateValue on a variable value outside {0, 1} or a missing variable
     */
    explicit BooleanSimulation(const EnergyModel<L>& model,
                               std::optional<Assignment<L>> initial_state = std::nullopt,
                               SimOptions opt = {})
        : BooleanSimulation(SpinModelTag{}, pubo_to_puso(model), initial_state, opt) {}

    [[nodiscard]] Assignment<L> state() const { return spin_to_boolean(spin_.state()); }

    [[nodiscard]] Assignment<L> initial_state() const {
        return spin_to_boolean(spin_.initial_state());
    }

    void set_state(const Assignment<L>& state) {
        spin_.set_state(to_spins(state, spin_.variables()));
    }

    [[nodiscard]] const std::vector<L>& variables() const noexcept { return spin_.variables(); }
    [[nodiscard]] std::size_t memory() const noexcept { return spin_.memory(); }

    i64 update(double temperature, i64 sweeps = 1, std::optional<u64> seed = std::nullopt) {
        return spin_.update(temperature, sweeps, seed);
    }

    i64 schedule_update(std::span<const Phase> schedule,
                        std::optional<u64> seed = std::nullopt) {
        return spin_.schedule_update(schedule, seed);
    }

    void reset() { spin_.reset(); }

    [[nodiscard]] std::vector<Assignment<L>> get_past_states(
        std::optional<std::size_t> n = std::nullopt) const {
        std::vector<Assignment<L>> out;
        for (const auto& s : spin_.get_past_states(n)) {
            out.push_back(spin_to_boolean(s));
        }
        return out;
    }

    /// Boolean model value of the current state.
    [[nodiscard]] double energy() const noexcept { return spin_.energy(); }

    [[nodiscard]] double flip_delta(const L& label) const { return spin_.flip_delta(label); }

    [[nodiscard]] std::vector<double> trajectory_energies(
        std::optional<std::size_t> n = std::nullopt) const {
        return spin_.trajectory_energies(n);
    }

    [[nodiscard]] std::string describe() const {
        return std::format("BooleanSimulation(memory={})", memory());
    }

    /// Underlying spin-domain simulation.
    [[nodiscard]] const SpinSimulation<L>& spin_simulation() const noexcept { return spin_; }

private:
    struct SpinModelTag {};

    BooleanSimulation(SpinModelTag, const EnergyModel<L>& puso,
                      const std::optional<Assignment<L>>& initial_state, SimOptions opt)
        : spin_(puso,
                initial_state ? std::optional<Assignment<L>>(
                                    to_spins(*initial_state, puso.variables()))
                              : std::nullopt,
                opt) {}

    /// Spin values of the model variables in state. Missing variables are left
    /// out so the spin simulation reports them.
    [[nodiscard]] static Assignment<L> to_spins(const Assignment<L>& state,
                                                const std::vector<L>& variables) {
        Assignment<L> out;
        out.reserve(variables.size());
        for (const auto& v : variables) {
            const auto it = state.find(v);
            if (it == state.end()) continue;
            if (!is_valid_value(Domain::Boolean, it->second)) {
                throw InvalidStateValue("BooleanSimulation: state must contain only 0's and 1's");
            }
            out.emplace(v, boolean_to_spin(it->second));
        }
        return out;
    }

    SpinSimulation<L> spin_;
};

} // namespace spinsim
