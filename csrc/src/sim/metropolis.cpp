// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file metropolis.cpp
 * @brief Metropolis single-spin-flip engine.
 */

#include <spinsim/sim/metropolis.hpp>
#include <spinsim/utils/errors.hpp>

#include <cmath>
#include <format>
#include <stdexcept>
#include <utility>

namespace spinsim {

namespace {

[[nodiscard]] RandomSource make_source(std::optional<u64> seed) {
    return seed ? RandomSource(*seed) : RandomSource();
}

} // namespace

MetropolisEngine::MetropolisEngine(AdjacencyIndex adjacency,
                                   SpinVector initial,
                                   std::size_t memory,
                                   std::optional<u64> seed)
    : adj_(std::move(adjacency)),
      initial_(std::move(initial)),
      history_(memory),
      rng_(make_source(seed)) {
    check_spins(initial_);
    spins_ = initial_;
}

// ============================================================================
// Validation
// ============================================================================

void MetropolisEngine::check_temperature(double temperature) {
    if (!(temperature >= 0.0)) {
        throw InvalidScheduleEntry(std::format(
            "MetropolisEngine: temperature must be >= 0, got {}", temperature));
    }
}

void MetropolisEngine::check_sweeps(i64 sweeps) {
    if (sweeps < 0) {
        throw InvalidUpdateCount(std::format(
            "MetropolisEngine: cannot update a negative number of times ({})", sweeps));
    }
}

void MetropolisEngine::check_spins(const SpinVector& spins) const {
    if (spins.size() != adj_.n_vars()) {
        throw InvalidStateValue(std::format(
            "MetropolisEngine: state has {} values for {} variables",
            spins.size(), adj_.n_vars()));
    }
    for (Spin s : spins) {
        if (s != 1 && s != -1) {
            throw InvalidStateValue("MetropolisEngine: state must contain only 1's and -1's");
        }
    }
}

// ============================================================================
// Dynamics
// ============================================================================

i64 MetropolisEngine::update(double temperature, i64 sweeps, std::optional<u64> seed) {
    check_temperature(temperature);
    check_sweeps(sweeps);

    if (seed) {
        rng_.seed(*seed);
    }

    i64 accepted = 0;
    for (i64 n = 0; n < sweeps; ++n) {
        history_.push(spins_);
        accepted += sweep(temperature);
    }
    return accepted;
}

i64 MetropolisEngine::schedule(std::span<const Phase> phases, std::optional<u64> seed) {
    for (const auto& phase : phases) {
        check_temperature(phase.temperature);
        check_sweeps(phase.sweeps);
    }

    if (seed) {
        rng_.seed(*seed);
    }

    i64 accepted = 0;
    for (const auto& phase : phases) {
        accepted += update(phase.temperature, phase.sweeps);
    }
    return accepted;
}

i64 MetropolisEngine::sweep(double temperature) {
    const u32 n = adj_.n_vars();
    i64 accepted = 0;

    for (u32 draw = 0; draw < n; ++draw) {
        const u32 var = rng_.uniform_index(n);
        const double dE = adj_.flip_delta(var, spins_);

        // Short-circuit: the random draw is consumed only for uphill moves at T > 0
        if (dE <= 0.0 ||
            (temperature > 0.0 && rng_.uniform01() < std::exp(-dE / temperature))) {
            spins_[var] = static_cast<Spin>(-spins_[var]);
            ++accepted;
        }
    }
    return accepted;
}

// ============================================================================
// State access
// ============================================================================

void MetropolisEngine::reset() {
    history_.clear();
    spins_ = initial_;
}

void MetropolisEngine::set_state(SpinVector spins) {
    check_spins(spins);
    spins_ = std::move(spins);
}

std::vector<SpinVector> MetropolisEngine::past_states(std::optional<std::size_t> n) const {
    std::vector<SpinVector> out;
    if (!n) {
        out = history_.recent(history_.capacity());
    } else if (*n > 1) {
        out = history_.recent(*n - 1);
    }
    out.push_back(spins_);
    return out;
}

double MetropolisEngine::flip_delta(u32 var) const {
    if (var >= adj_.n_vars()) {
        throw std::out_of_range(std::format(
            "MetropolisEngine::flip_delta: variable {} out of range [0, {})",
            var, adj_.n_vars()));
    }
    return adj_.flip_delta(var, spins_);
}

} // namespace spinsim
