// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bit_utils.hpp
 * @brief Bit manipulation for subset enumeration over term labels.
 *
 * Domain conversions expand a k-label term into one term per subset of its
 * labels; subsets are encoded as k-bit masks (bit i -> i-th label of the
 * canonical term).
 */

#pragma once

#include "types.hpp"
#include <bit>
#include <concepts>
#include <vector>

namespace spinsim {

// ============================================================================
// Bit Counting and Scanning
// ============================================================================

/**
 * Count set bits (population count).
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr int popcount(T x) noexcept {
    return static_cast<int>(std::popcount(x));
}

/**
 * Count trailing zeros (lowest set bit position).
 * Returns sizeof(T)*8 if x == 0.
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr int ctz(T x) noexcept {
    return static_cast<int>(std::countr_zero(x));
}

/**
 * Clear lowest set bit: x & (x - 1).
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr T clear_lsb(T x) noexcept {
    return x & (x - 1);
}

// ============================================================================
// Bitmask Utilities
// ============================================================================

/**
 * Create mask with n lowest bits set.
 * Example: make_mask(3) = 0b111
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr T make_mask(int n) noexcept {
    if (n <= 0) return 0;
    if (n >= static_cast<int>(sizeof(T) * 8)) return ~T{0};
    return (T{1} << n) - 1;
}

/**
 * Positions of set bits, ascending.
 */
template<std::unsigned_integral T>
[[nodiscard]] std::vector<int> extract_bits(T mask) {
    std::vector<int> indices;
    indices.reserve(popcount(mask));

    while (mask) {
        indices.push_back(ctz(mask));
        mask = clear_lsb(mask);
    }

    return indices;
}

/**
 * Visit every subset of {0, ..., n-1} as a bitmask, empty set first.
 *
 * Requires n < bit width of T.
 */
template<std::unsigned_integral T, class Visitor>
constexpr void for_each_subset(int n, Visitor&& visit) {
    const T full = make_mask<T>(n);
    T mask = 0;
    while (true) {
        visit(mask);
        if (mask == full) break;
        ++mask;
    }
}

} // namespace spinsim
