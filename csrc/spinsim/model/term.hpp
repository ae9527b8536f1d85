// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file term.hpp
 * @brief Canonical multilinear term: a non-empty set of distinct variable labels.
 *
 * Labels are opaque: only a total order (for canonical sorting) and std::hash
 * (for unordered containers) are required. Two terms built from the same
 * labels in any order compare equal and hash identically.
 */

#pragma once

#include <spinsim/utils/constants.hpp>
#include <spinsim/utils/errors.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <vector>

namespace spinsim {

/**
 * Requirements on variable labels.
 */
template<typename L>
concept LabelLike = std::totally_ordered<L> && std::copyable<L> &&
    requires(const L& label) {
        { std::hash<L>{}(label) } -> std::convertible_to<std::size_t>;
    };

/**
 * Product of distinct variables, stored in ascending label order.
 *
 * Invariants (enforced on construction, InvalidTerm otherwise):
 *   - at least one label
 *   - labels pairwise distinct
 */
template<LabelLike L>
class Term {
public:
    using label_type = L;
    using const_iterator = typename std::vector<L>::const_iterator;

    /// Canonicalize arbitrary label order.
    explicit Term(std::vector<L> labels) : labels_(std::move(labels)) {
        if (labels_.empty()) {
            throw InvalidTerm("Term: a term needs at least one label");
        }
        std::sort(labels_.begin(), labels_.end());
        if (std::adjacent_find(labels_.begin(), labels_.end()) != labels_.end()) {
            throw InvalidTerm("Term: labels within a term must be distinct");
        }
    }

    Term(std::initializer_list<L> labels) : Term(std::vector<L>(labels)) {}

    [[nodiscard]] const std::vector<L>& labels() const noexcept { return labels_; }
    [[nodiscard]] std::size_t arity() const noexcept { return labels_.size(); }

    [[nodiscard]] bool contains(const L& label) const {
        return std::binary_search(labels_.begin(), labels_.end(), label);
    }

    [[nodiscard]] const_iterator begin() const noexcept { return labels_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return labels_.end(); }

    bool operator==(const Term&) const = default;
    auto operator<=>(const Term&) const = default;

private:
    std::vector<L> labels_;
};

} // namespace spinsim

// ============================================================================
// Standard Library Hash Specialization
// ============================================================================

namespace std {

/**
 * Hash functor for spinsim::Term (enables use as unordered container key).
 *
 * Folds element hashes in canonical order, so equal terms hash equally
 * regardless of the order labels were supplied in.
 */
template<spinsim::LabelLike L>
struct hash<spinsim::Term<L>> {
    [[nodiscard]]
    std::size_t operator()(const spinsim::Term<L>& term) const noexcept {
        std::size_t h = term.arity();
        for (const auto& label : term) {
            h = spinsim::hash_combine(h, std::hash<L>{}(label));
        }
        return h;
    }
};

} // namespace std
