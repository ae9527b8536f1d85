// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file history.cpp
 * @brief Bounded FIFO of past spin configurations.
 */

#include <spinsim/sim/history.hpp>

#include <algorithm>

namespace spinsim {

void HistoryBuffer::push(const SpinVector& snapshot) {
    if (capacity_ == 0) return;
    if (states_.size() == capacity_) {
        states_.pop_front();
    }
    states_.push_back(snapshot);
}

std::vector<SpinVector> HistoryBuffer::recent(std::size_t n) const {
    const std::size_t k = std::min(n, states_.size());
    return {states_.end() - static_cast<std::ptrdiff_t>(k), states_.end()};
}

} // namespace spinsim
