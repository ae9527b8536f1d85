// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file adjacency.hpp
 * @brief Per-variable term incidence for O(degree) flip-energy evaluation.
 *
 * Layout (CSR twice over):
 *   IndexedTerms    term k -> vars[offsets[k] .. offsets[k+1]), coeffs[k]
 *   AdjacencyIndex  var  i -> incidences[var_offsets[i] .. var_offsets[i+1])
 *
 * Flipping spin i negates every term that contains i exactly once (labels in
 * a term are distinct), hence
 *   dE_i = -2 * sum_{k ni i} c_k prod_{v in k} s_v
 *
 * Built once; read-only afterwards. Rebuild to reflect a changed model.
 */

#pragma once

#include <spinsim/model/energy_model.hpp>
#include <spinsim/sim/label_map.hpp>
#include <spinsim/utils/types.hpp>

#include <cstddef>
#include <span>
#include <stdexcept>
#include <vector>

namespace spinsim {

/**
 * Model terms flattened onto dense variable indices.
 */
struct IndexedTerms {
    std::vector<u32> offsets{0};  ///< length n_terms + 1
    std::vector<u32> vars;        ///< concatenated term variables
    std::vector<double> coeffs;   ///< one per term
    u32 n_vars = 0;

    [[nodiscard]] std::size_t n_terms() const noexcept { return coeffs.size(); }

    [[nodiscard]] std::span<const u32> term_vars(std::size_t k) const noexcept {
        return {vars.data() + offsets[k], offsets[k + 1] - offsets[k]};
    }
};

/**
 * Flatten a model over the given label map.
 *
 * Every model variable must be present in the map (std::invalid_argument).
 */
template<LabelLike L>
[[nodiscard]] IndexedTerms index_terms(const EnergyModel<L>& model,
                                       const LabelMap<L>& labels) {
    IndexedTerms out;
    out.n_vars = static_cast<u32>(labels.size());
    out.offsets.reserve(model.size() + 1);
    out.coeffs.reserve(model.size());

    for (const auto& [term, coeff] : model) {
        for (const auto& label : term) {
            const auto idx = labels.get_idx(label);
            if (!idx) {
                throw std::invalid_argument("index_terms: term label missing from label map");
            }
            out.vars.push_back(*idx);
        }
        out.offsets.push_back(static_cast<u32>(out.vars.size()));
        out.coeffs.push_back(coeff);
    }
    return out;
}

/**
 * Variable -> incident (term, coefficient) list.
 */
class AdjacencyIndex {
public:
    struct Incidence {
        u32 term;      ///< Term index into IndexedTerms
        double coeff;  ///< Copy of the term coefficient
    };

    AdjacencyIndex() = default;

    /// O(total term arity).
    explicit AdjacencyIndex(IndexedTerms terms);

    [[nodiscard]] u32 n_vars() const noexcept { return terms_.n_vars; }
    [[nodiscard]] std::size_t n_terms() const noexcept { return terms_.n_terms(); }
    [[nodiscard]] const IndexedTerms& terms() const noexcept { return terms_; }

    /// Terms incident to var.
    [[nodiscard]] std::span<const Incidence> incident(u32 var) const noexcept {
        return {incidences_.data() + var_offsets_[var],
                var_offsets_[var + 1] - var_offsets_[var]};
    }

    [[nodiscard]] std::size_t degree(u32 var) const noexcept {
        return var_offsets_[var + 1] - var_offsets_[var];
    }

    /// Energy of the subgraph touching var: sum_{k ni var} c_k prod s. O(degree).
    [[nodiscard]] double local_energy(u32 var, std::span<const Spin> spins) const noexcept;

    /// Energy change if var were flipped.
    [[nodiscard]] double flip_delta(u32 var, std::span<const Spin> spins) const noexcept {
        return -2.0 * local_energy(var, spins);
    }

    /// Full sum over all terms (no offset). O(total arity).
    [[nodiscard]] double energy(std::span<const Spin> spins) const noexcept;

    /// energy() for each state; parallel over states for large batches.
    [[nodiscard]] std::vector<double> energies(std::span<const SpinVector> states) const;

private:
    [[nodiscard]] double term_product(u32 term, std::span<const Spin> spins) const noexcept;

    IndexedTerms terms_;
    std::vector<u32> var_offsets_{0};
    std::vector<Incidence> incidences_;
};

} // namespace spinsim
