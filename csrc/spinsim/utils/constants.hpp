// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file constants.hpp
 * @brief Library-wide compile-time constants.
 */

#pragma once

#include "types.hpp"
#include <cstddef>

namespace spinsim {

// ============================================================================
// Simulation Defaults
// ============================================================================

/// History capacity when none is requested: only the current state is kept.
inline constexpr std::size_t DEFAULT_MEMORY = 0;

/// Minimum batch size before state energies are evaluated in parallel.
inline constexpr std::size_t PARALLEL_EVAL_THRESHOLD = 256;

// ============================================================================
// Domain Conversion
// ============================================================================

/**
 * Widest term expanded by pubo_to_puso / puso_to_pubo.
 *
 * A term of arity k expands into 2^k terms; subsets are enumerated with a
 * 64-bit mask.
 */
inline constexpr int MAX_TERM_EXPANSION_ARITY = 30;

// ============================================================================
// Hashing
// ============================================================================

/// 2^64 / phi, used by hash_combine.
inline constexpr std::size_t HASH_GOLDEN_RATIO = 0x9e3779b97f4a7c15ULL;

/**
 * Boost-style hash mixing: h ^ (v + phi_64 + (h << 6) + (h >> 2)).
 */
[[nodiscard]] constexpr std::size_t hash_combine(std::size_t h, std::size_t v) noexcept {
    return h ^ (v + HASH_GOLDEN_RATIO + (h << 6) + (h >> 2));
}

} // namespace spinsim
