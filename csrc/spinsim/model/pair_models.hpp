// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file pair_models.hpp
 * @brief Index-labelled quadratic and linear models: QUBO matrix, Ising J and h.
 *
 * Specializations of the energy-model container contract for producers that
 * emit dense-indexable problems:
 *   - QuboMatrix:    keys (i, j), i <= j after canonicalization; (i, i) is the
 *                    linear coefficient of x_i (x_i^2 = x_i for Booleans)
 *   - IsingCoupling: keys (i, j) with i < j; i == j throws InvalidTerm
 *   - IsingField:    keys i (per-spin bias h_i)
 *
 * Each converts to an EnergyModel<u32> for simulation and to Eigen dense form
 * for interop with linear-algebra tooling.
 */

#pragma once

#include <spinsim/model/energy_model.hpp>
#include <spinsim/model/term_map.hpp>
#include <spinsim/utils/constants.hpp>
#include <spinsim/utils/types.hpp>

#include <Eigen/Dense>

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <utility>

namespace spinsim {

/**
 * Unordered index pair stored as (min, max).
 */
struct IndexPair {
    u32 first;
    u32 second;

    IndexPair(u32 i, u32 j) noexcept
        : first(i < j ? i : j), second(i < j ? j : i) {}

    explicit IndexPair(std::pair<u32, u32> p) noexcept
        : IndexPair(p.first, p.second) {}

    [[nodiscard]] bool is_diagonal() const noexcept { return first == second; }

    bool operator==(const IndexPair&) const = default;
    auto operator<=>(const IndexPair&) const = default;
};

} // namespace spinsim

namespace std {

template<>
struct hash<spinsim::IndexPair> {
    [[nodiscard]]
    std::size_t operator()(const spinsim::IndexPair& p) const noexcept {
        const std::size_t h_i = std::hash<spinsim::u32>{}(p.first);
        const std::size_t h_j = std::hash<spinsim::u32>{}(p.second);
        return spinsim::hash_combine(h_i, h_j);
    }
};

} // namespace std

namespace spinsim {

// ============================================================================
// QUBO Matrix
// ============================================================================

class QuboMatrix : public TermMap<QuboMatrix, IndexPair> {
    using Base = TermMap<QuboMatrix, IndexPair>;

public:
    QuboMatrix() = default;

    template<CoefficientRange<IndexPair> R>
    explicit QuboMatrix(const R& entries) {
        *this += entries;
    }

    using Base::add;
    using Base::get;
    using Base::set;

    void set(u32 i, u32 j, double coeff) { Base::set(IndexPair(i, j), coeff); }
    void add(u32 i, u32 j, double coeff) { Base::add(IndexPair(i, j), coeff); }
    [[nodiscard]] double get(u32 i, u32 j) const { return Base::get(IndexPair(i, j)); }

    /// 1 + largest index referenced (0 when empty).
    [[nodiscard]] u32 num_variables() const noexcept;

    /**
     * Upper-triangular dense matrix Q with E(x) = x^T Q x.
     *
     * @param dim Matrix size; defaults to num_variables(). Must cover every
     *            stored index (std::invalid_argument otherwise).
     */
    [[nodiscard]] Eigen::MatrixXd to_dense(std::optional<u32> dim = std::nullopt) const;

    /// Read a square matrix; Q(i,j) and Q(j,i) are summed into key (i,j).
    [[nodiscard]] static QuboMatrix from_dense(const Eigen::MatrixXd& q);

    /// Boolean-domain model: (i,i) -> {i}, (i,j) -> {i,j}.
    [[nodiscard]] EnergyModel<u32> to_model() const;

    /// E(x) for a Boolean vector indexed by variable.
    [[nodiscard]] double value(std::span<const int> x) const;
};

// ============================================================================
// Ising Coupling (J)
// ============================================================================

class IsingCoupling : public TermMap<IsingCoupling, IndexPair> {
    using Base = TermMap<IsingCoupling, IndexPair>;
    friend Base;

public:
    IsingCoupling() = default;

    template<CoefficientRange<IndexPair> R>
    explicit IsingCoupling(const R& entries) {
        *this += entries;
    }

    using Base::add;
    using Base::get;
    using Base::set;

    void set(u32 i, u32 j, double coeff) { Base::set(IndexPair(i, j), coeff); }
    void add(u32 i, u32 j, double coeff) { Base::add(IndexPair(i, j), coeff); }
    [[nodiscard]] double get(u32 i, u32 j) const { return Base::get(IndexPair(i, j)); }

    [[nodiscard]] u32 num_variables() const noexcept;

    /// Strictly upper-triangular J with E(s) = s^T J s.
    [[nodiscard]] Eigen::MatrixXd to_dense(std::optional<u32> dim = std::nullopt) const;

    /// Spin-domain model of pairwise terms.
    [[nodiscard]] EnergyModel<u32> to_model() const;

private:
    static void check_key(const IndexPair& key);
};

// ============================================================================
// Ising Field (h)
// ============================================================================

class IsingField : public TermMap<IsingField, u32> {
    using Base = TermMap<IsingField, u32>;

public:
    IsingField() = default;

    template<CoefficientRange<u32> R>
    explicit IsingField(const R& entries) {
        *this += entries;
    }

    [[nodiscard]] u32 num_variables() const noexcept;

    [[nodiscard]] Eigen::VectorXd to_dense(std::optional<u32> dim = std::nullopt) const;

    /// Spin-domain model of arity-1 terms.
    [[nodiscard]] EnergyModel<u32> to_model() const;
};

/// Combined Ising model E(s) = sum_i h_i s_i + sum_{i<j} J_ij s_i s_j.
[[nodiscard]] EnergyModel<u32> ising_to_model(const IsingField& h,
                                              const IsingCoupling& J);

} // namespace spinsim
