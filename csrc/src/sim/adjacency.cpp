// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file adjacency.cpp
 * @brief Construction and evaluation of the variable -> term incidence index.
 */

#include <spinsim/sim/adjacency.hpp>
#include <spinsim/utils/constants.hpp>

#include <format>
#include <stdexcept>
#include <utility>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace spinsim {

AdjacencyIndex::AdjacencyIndex(IndexedTerms terms)
    : terms_(std::move(terms)) {
    const std::size_t n_terms = terms_.n_terms();
    if (terms_.offsets.size() != n_terms + 1) {
        throw std::invalid_argument(std::format(
            "AdjacencyIndex: {} offsets for {} terms", terms_.offsets.size(), n_terms));
    }

    // Pass 1: degree histogram
    std::vector<u32> counts(terms_.n_vars, 0);
    for (u32 v : terms_.vars) {
        if (v >= terms_.n_vars) {
            throw std::out_of_range(std::format(
                "AdjacencyIndex: variable {} out of range [0, {})", v, terms_.n_vars));
        }
        ++counts[v];
    }

    var_offsets_.assign(terms_.n_vars + 1, 0);
    for (u32 i = 0; i < terms_.n_vars; ++i) {
        var_offsets_[i + 1] = var_offsets_[i] + counts[i];
    }

    // Pass 2: scatter incidences
    incidences_.resize(terms_.vars.size());
    std::vector<u32> cursor(var_offsets_.begin(), var_offsets_.end() - 1);
    for (std::size_t k = 0; k < n_terms; ++k) {
        const Incidence inc{static_cast<u32>(k), terms_.coeffs[k]};
        for (u32 v : terms_.term_vars(k)) {
            incidences_[cursor[v]++] = inc;
        }
    }
}

double AdjacencyIndex::term_product(u32 term, std::span<const Spin> spins) const noexcept {
    int sign = 1;
    for (u32 v : terms_.term_vars(term)) {
        sign *= spins[v];
    }
    return static_cast<double>(sign);
}

double AdjacencyIndex::local_energy(u32 var, std::span<const Spin> spins) const noexcept {
    double e = 0.0;
    for (const auto& inc : incident(var)) {
        e += inc.coeff * term_product(inc.term, spins);
    }
    return e;
}

double AdjacencyIndex::energy(std::span<const Spin> spins) const noexcept {
    double e = 0.0;
    for (std::size_t k = 0; k < terms_.n_terms(); ++k) {
        e += terms_.coeffs[k] * term_product(static_cast<u32>(k), spins);
    }
    return e;
}

std::vector<double> AdjacencyIndex::energies(std::span<const SpinVector> states) const {
    const std::size_t n = states.size();
    for (const auto& s : states) {
        if (s.size() != terms_.n_vars) {
            throw std::invalid_argument(std::format(
                "AdjacencyIndex::energies: state of size {} for {} variables",
                s.size(), terms_.n_vars));
        }
    }

    std::vector<double> out(n, 0.0);

#pragma omp parallel for schedule(static) if(n > PARALLEL_EVAL_THRESHOLD)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n); ++i) {
        out[static_cast<std::size_t>(i)] = energy(states[static_cast<std::size_t>(i)]);
    }
    return out;
}

} // namespace spinsim
