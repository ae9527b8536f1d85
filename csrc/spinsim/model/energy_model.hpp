// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file energy_model.hpp
 * @brief Sparse multilinear polynomial over opaque variable labels.
 *
 * E(x) = offset + sum_k c_k * prod_{v in term_k} x_v
 *
 * The same container serves both variable domains: as a PUSO the values are
 * spins in {-1, +1}, as a PUBO they are Booleans in {0, 1}. The constant part
 * lives in a separate offset because empty terms are not valid keys.
 *
 * Once handed to a simulation the model is indexed and treated as immutable;
 * later edits are not seen by the simulation.
 */

#pragma once

#include <spinsim/model/term.hpp>
#include <spinsim/model/term_map.hpp>

#include <algorithm>
#include <initializer_list>
#include <utility>
#include <vector>

namespace spinsim {

template<LabelLike L>
class EnergyModel : public TermMap<EnergyModel<L>, Term<L>> {
    using Base = TermMap<EnergyModel<L>, Term<L>>;
    friend Base;

public:
    using label_type = L;
    using term_type = Term<L>;

    EnergyModel() = default;

    /// Terms listed more than once are accumulated.
    EnergyModel(std::initializer_list<std::pair<Term<L>, double>> terms) {
        for (const auto& [term, coeff] : terms) {
            this->add(term, coeff);
        }
    }

    /// From any (labels-or-term, coefficient) collection; duplicates accumulate.
    template<CoefficientRange<Term<L>> R>
    explicit EnergyModel(const R& terms) {
        *this += terms;
    }

    using Base::add;
    using Base::get;
    using Base::set;

    void set(std::initializer_list<L> labels, double coeff) {
        Base::set(Term<L>(labels), coeff);
    }

    void add(std::initializer_list<L> labels, double coeff) {
        Base::add(Term<L>(labels), coeff);
    }

    [[nodiscard]] double get(std::initializer_list<L> labels) const {
        return Base::get(Term<L>(labels));
    }

    // --- Constant part ---

    [[nodiscard]] double offset() const noexcept { return offset_; }
    void set_offset(double value) noexcept { offset_ = value; }
    void add_offset(double value) noexcept { offset_ += value; }

    // --- Structure ---

    /// Distinct labels referenced by any term, ascending.
    [[nodiscard]] std::vector<L> variables() const {
        std::vector<L> out;
        for (const auto& [term, coeff] : *this) {
            out.insert(out.end(), term.begin(), term.end());
        }
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return out;
    }

    [[nodiscard]] std::size_t num_variables() const { return variables().size(); }

    /// Largest term arity (0 for a constant model).
    [[nodiscard]] std::size_t degree() const noexcept {
        std::size_t d = 0;
        for (const auto& [term, coeff] : *this) {
            d = std::max(d, term.arity());
        }
        return d;
    }

    /**
     * Objective value for an assignment.
     *
     * @param state Map-like label -> value with at(); every referenced label
     *              must be present (std::out_of_range otherwise).
     */
    template<typename Assignment>
    [[nodiscard]] double value(const Assignment& state) const {
        double total = offset_;
        for (const auto& [term, coeff] : *this) {
            double prod = coeff;
            for (const auto& label : term) {
                prod *= static_cast<double>(state.at(label));
            }
            total += prod;
        }
        return total;
    }

private:
    void merge_extra(const EnergyModel& other, double sign) {
        offset_ += sign * other.offset_;
    }

    template<class Op>
    void apply_extra(Op op) {
        offset_ = op(offset_);
    }

    void clear_extra() noexcept { offset_ = 0.0; }

    [[nodiscard]] bool extra_equal(const EnergyModel& other) const {
        return offset_ == other.offset_;
    }

    double offset_ = 0.0;
};

} // namespace spinsim
