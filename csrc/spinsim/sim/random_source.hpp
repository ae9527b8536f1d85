// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file random_source.hpp
 * @brief Engine-owned pseudo-random source.
 *
 * Each simulation owns its own generator, so seeding one simulation never
 * perturbs another and runs are reproducible per instance. Not thread-safe;
 * a simulation is driven by one thread at a time.
 */

#pragma once

#include <spinsim/utils/types.hpp>

#include <random>

namespace spinsim {

class RandomSource {
public:
    /// Seeded from std::random_device.
    RandomSource();

    explicit RandomSource(u64 seed);

    /// Restart the stream deterministically.
    void seed(u64 seed);

    /// Uniform integer in [0, n). Throws std::invalid_argument if n == 0.
    [[nodiscard]] u32 uniform_index(u32 n);

    /// Uniform real in [0, 1).
    [[nodiscard]] double uniform01();

private:
    std::mt19937_64 rng_;
};

} // namespace spinsim
