// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_RANDOM_HPP
#define GRAFT_RANDOM_HPP

#include <cstdint>
#include <random>
#include <vector>

namespace graft {

/// Seeded source of weights. Only the raw output of `std::mt19937` is used,
/// so a seed yields the same sequence on every platform.
class Random {
   public:
    explicit Random(uint32_t seed = 42);

    uint32_t next_u32();

    /// Uniform value in (0, 1].
    double uniform();

    /// Normal value by the Box-Muller transform.
    double normal(double mean = 0.0, double stddev = 1.0);

    /// `n` standard normal values multiplied by `scale`.
    std::vector<float> normal_vector(size_t n, float scale = 1.0f);

   private:
    std::mt19937 engine_;
    bool has_spare_;
    double spare_;
};

}  // namespace graft

#endif  // GRAFT_RANDOM_HPP
