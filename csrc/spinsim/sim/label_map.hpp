// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file label_map.hpp
 * @brief Bidirectional mapping between opaque variable labels and dense indices.
 *
 * The Metropolis kernel works on dense spin vectors; this map is the boundary
 * between caller labels and kernel indices.
 *
 * Thread-safety: Read-only after construction.
 */

#pragma once

#include <spinsim/model/term.hpp>
#include <spinsim/utils/types.hpp>

#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace spinsim {

/**
 * Immutable bidirectional mapping: label <-> dense index [0, N).
 *
 * Canonical ordering (sorted, deduplicated), so two maps built from the same
 * label set agree on every index.
 */
template<LabelLike L>
class LabelMap {
public:
    LabelMap() = default;

    /// Canonical map: sorted and deduplicated.
    [[nodiscard]] static LabelMap from_list(std::vector<L> labels) {
        std::sort(labels.begin(), labels.end());
        labels.erase(std::unique(labels.begin(), labels.end()), labels.end());
        return LabelMap(std::move(labels));
    }

    /// Query index by label.
    [[nodiscard]] std::optional<u32> get_idx(const L& label) const {
        auto it = label2idx_.find(label);
        return (it != label2idx_.end()) ? std::optional{it->second} : std::nullopt;
    }

    /// O(1) membership test.
    [[nodiscard]] bool contains(const L& label) const {
        return label2idx_.find(label) != label2idx_.end();
    }

    /// Index -> label (bounds-checked).
    [[nodiscard]] const L& get_label(u32 i) const {
        if (i >= labels_.size()) {
            throw std::out_of_range(
                "LabelMap::get_label: index " + std::to_string(i) +
                " out of range [0, " + std::to_string(labels_.size()) + ")");
        }
        return labels_[i];
    }

    [[nodiscard]] std::size_t size() const noexcept { return labels_.size(); }
    [[nodiscard]] const std::vector<L>& all_labels() const noexcept { return labels_; }

private:
    explicit LabelMap(std::vector<L> ordered_unique)
        : labels_(std::move(ordered_unique)) {
        if (labels_.size() > std::numeric_limits<u32>::max()) {
            throw std::length_error("LabelMap size exceeds u32 index capacity");
        }
        label2idx_.reserve(labels_.size());
        for (std::size_t i = 0; i < labels_.size(); ++i) {
            label2idx_.emplace(labels_[i], static_cast<u32>(i));
        }
    }

    std::vector<L> labels_;
    std::unordered_map<L, u32> label2idx_;
};

} // namespace spinsim
