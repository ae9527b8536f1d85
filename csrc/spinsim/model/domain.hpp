// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file domain.hpp
 * @brief Bipolar (spin) and Boolean variable domains and the maps between them.
 *
 * Value map:  b = (1 - s) / 2,   s = 1 - 2b
 *   s = +1 <-> b = 0
 *   s = -1 <-> b = 1
 *
 * Model maps substitute the value map into every term and expand:
 *   PUBO -> PUSO:  prod_i b_i = prod_i (1 - s_i)/2
 *   PUSO -> PUBO:  prod_i s_i = prod_i (1 - 2 b_i)
 * A term of arity k yields up to 2^k terms (one per label subset); the empty
 * subset goes to the offset. Objective values are preserved exactly under the
 * value map, up to floating-point rounding.
 */

#pragma once

#include <spinsim/model/energy_model.hpp>
#include <spinsim/utils/bit_utils.hpp>
#include <spinsim/utils/constants.hpp>

#include <cmath>
#include <format>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace spinsim {

enum class Domain : u8 {
    Spin,     ///< values in {-1, +1}
    Boolean,  ///< values in {0, 1}
};

/// Label -> variable value, in either domain.
template<LabelLike L>
using Assignment = std::unordered_map<L, int>;

[[nodiscard]] constexpr std::string_view domain_name(Domain d) noexcept {
    return d == Domain::Spin ? "spin" : "boolean";
}

[[nodiscard]] constexpr bool is_valid_value(Domain d, int value) noexcept {
    return d == Domain::Spin ? (value == 1 || value == -1)
                             : (value == 0 || value == 1);
}

[[nodiscard]] constexpr int spin_to_boolean(int spin) noexcept {
    return (1 - spin) / 2;
}

[[nodiscard]] constexpr int boolean_to_spin(int boolean) noexcept {
    return 1 - 2 * boolean;
}

template<LabelLike L>
[[nodiscard]] Assignment<L> spin_to_boolean(const Assignment<L>& spins) {
    Assignment<L> out;
    out.reserve(spins.size());
    for (const auto& [label, s] : spins) {
        out.emplace(label, spin_to_boolean(s));
    }
    return out;
}

template<LabelLike L>
[[nodiscard]] Assignment<L> boolean_to_spin(const Assignment<L>& booleans) {
    Assignment<L> out;
    out.reserve(booleans.size());
    for (const auto& [label, b] : booleans) {
        out.emplace(label, boolean_to_spin(b));
    }
    return out;
}

namespace detail {

/**
 * Substitute x_v = a + b * y_v for every variable and expand.
 *
 * prod_{i in T} (a + b y_i) = sum_{S subset T} a^{|T|-|S|} b^{|S|} prod_{i in S} y_i
 */
template<LabelLike L>
[[nodiscard]] EnergyModel<L> substitute_affine(const EnergyModel<L>& model,
                                               double a, double b) {
    EnergyModel<L> out;
    out.set_offset(model.offset());

    for (const auto& [term, coeff] : model) {
        const int k = static_cast<int>(term.arity());
        if (k > MAX_TERM_EXPANSION_ARITY) {
            throw std::length_error(std::format(
                "substitute_affine: term arity {} exceeds expansion limit {}",
                k, MAX_TERM_EXPANSION_ARITY));
        }
        const auto& labels = term.labels();

        for_each_subset<u64>(k, [&](u64 mask) {
            const int m = popcount(mask);
            const double c = coeff * std::pow(a, k - m) * std::pow(b, m);
            if (mask == 0) {
                out.add_offset(c);
                return;
            }
            std::vector<L> sub;
            sub.reserve(m);
            for (int pos : extract_bits(mask)) {
                sub.push_back(labels[pos]);
            }
            out.add(Term<L>(std::move(sub)), c);
        });
    }
    return out;
}

} // namespace detail

/// Boolean-domain model -> equivalent spin-domain model (b = (1 - s)/2).
template<LabelLike L>
[[nodiscard]] EnergyModel<L> pubo_to_puso(const EnergyModel<L>& pubo) {
    return detail::substitute_affine(pubo, 0.5, -0.5);
}

/// Spin-domain model -> equivalent Boolean-domain model (s = 1 - 2b).
template<LabelLike L>
[[nodiscard]] EnergyModel<L> puso_to_pubo(const EnergyModel<L>& puso) {
    return detail::substitute_affine(puso, 1.0, -2.0);
}

} // namespace spinsim
