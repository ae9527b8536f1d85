// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file history.hpp
 * @brief Bounded FIFO of past spin configurations.
 *
 * Holds at most capacity() snapshots; pushing onto a full buffer evicts the
 * oldest. A zero-capacity buffer stores nothing.
 */

#pragma once

#include <spinsim/utils/types.hpp>

#include <cstddef>
#include <deque>
#include <vector>

namespace spinsim {

class HistoryBuffer {
public:
    explicit HistoryBuffer(std::size_t capacity = 0) noexcept : capacity_(capacity) {}

    /// Append a copy of snapshot, evicting the oldest when full.
    void push(const SpinVector& snapshot);

    void clear() noexcept { states_.clear(); }

    /// Most recent min(n, size()) snapshots, oldest first (copies).
    [[nodiscard]] std::vector<SpinVector> recent(std::size_t n) const;

    [[nodiscard]] std::size_t size() const noexcept { return states_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return states_.empty(); }

private:
    std::size_t capacity_;
    std::deque<SpinVector> states_;
};

} // namespace spinsim
