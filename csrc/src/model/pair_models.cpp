// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file pair_models.cpp
 * @brief QUBO / Ising container conversions to EnergyModel and Eigen form.
 */

#include <spinsim/model/pair_models.hpp>
#include <spinsim/utils/errors.hpp>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace spinsim {

namespace {

/// Resolve requested dense size against the largest stored index.
[[nodiscard]] Eigen::Index dense_dim(std::optional<u32> dim, u32 required,
                                     const char* who) {
    const u32 n = dim.value_or(required);
    if (n < required) {
        throw std::invalid_argument(std::format(
            "{}: dense size {} does not cover index {}", who, n, required - 1));
    }
    return static_cast<Eigen::Index>(n);
}

template<class PairMap>
[[nodiscard]] u32 pair_num_variables(const PairMap& m) noexcept {
    u32 n = 0;
    for (const auto& [key, coeff] : m) {
        n = std::max(n, key.second + 1);
    }
    return n;
}

template<class PairMap>
[[nodiscard]] Eigen::MatrixXd pair_to_dense(const PairMap& m, Eigen::Index n) {
    Eigen::MatrixXd out = Eigen::MatrixXd::Zero(n, n);
    for (const auto& [key, coeff] : m) {
        out(key.first, key.second) = coeff;
    }
    return out;
}

} // namespace

// ============================================================================
// QuboMatrix
// ============================================================================

u32 QuboMatrix::num_variables() const noexcept {
    return pair_num_variables(*this);
}

Eigen::MatrixXd QuboMatrix::to_dense(std::optional<u32> dim) const {
    return pair_to_dense(*this, dense_dim(dim, num_variables(), "QuboMatrix::to_dense"));
}

QuboMatrix QuboMatrix::from_dense(const Eigen::MatrixXd& q) {
    if (q.rows() != q.cols()) {
        throw std::invalid_argument(std::format(
            "QuboMatrix::from_dense: matrix must be square, got {}x{}",
            q.rows(), q.cols()));
    }
    QuboMatrix out;
    const auto n = q.rows();
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            out.add(static_cast<u32>(i), static_cast<u32>(j), q(i, j));
        }
    }
    return out;
}

EnergyModel<u32> QuboMatrix::to_model() const {
    EnergyModel<u32> model;
    for (const auto& [key, coeff] : *this) {
        if (key.is_diagonal()) {
            model.add({key.first}, coeff);
        } else {
            model.add({key.first, key.second}, coeff);
        }
    }
    return model;
}

double QuboMatrix::value(std::span<const int> x) const {
    double total = 0.0;
    for (const auto& [key, coeff] : *this) {
        if (key.second >= x.size()) {
            throw std::out_of_range(std::format(
                "QuboMatrix::value: index {} outside assignment of size {}",
                key.second, x.size()));
        }
        total += coeff * x[key.first] * x[key.second];
    }
    return total;
}

// ============================================================================
// IsingCoupling
// ============================================================================

void IsingCoupling::check_key(const IndexPair& key) {
    if (key.is_diagonal()) {
        throw InvalidTerm(std::format(
            "IsingCoupling: key ({}, {}) couples a spin to itself",
            key.first, key.second));
    }
}

u32 IsingCoupling::num_variables() const noexcept {
    return pair_num_variables(*this);
}

Eigen::MatrixXd IsingCoupling::to_dense(std::optional<u32> dim) const {
    return pair_to_dense(*this, dense_dim(dim, num_variables(), "IsingCoupling::to_dense"));
}

EnergyModel<u32> IsingCoupling::to_model() const {
    EnergyModel<u32> model;
    for (const auto& [key, coeff] : *this) {
        model.add({key.first, key.second}, coeff);
    }
    return model;
}

// ============================================================================
// IsingField
// ============================================================================

u32 IsingField::num_variables() const noexcept {
    u32 n = 0;
    for (const auto& [i, coeff] : *this) {
        n = std::max(n, i + 1);
    }
    return n;
}

Eigen::VectorXd IsingField::to_dense(std::optional<u32> dim) const {
    const auto n = dense_dim(dim, num_variables(), "IsingField::to_dense");
    Eigen::VectorXd out = Eigen::VectorXd::Zero(n);
    for (const auto& [i, coeff] : *this) {
        out(i) = coeff;
    }
    return out;
}

EnergyModel<u32> IsingField::to_model() const {
    EnergyModel<u32> model;
    for (const auto& [i, coeff] : *this) {
        model.add({i}, coeff);
    }
    return model;
}

EnergyModel<u32> ising_to_model(const IsingField& h, const IsingCoupling& J) {
    EnergyModel<u32> model = h.to_model();
    model += J.to_model();
    return model;
}

} // namespace spinsim
