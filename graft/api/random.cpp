// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/random.hpp"

#include <cmath>

namespace graft {

Random::Random(uint32_t seed) : engine_(seed), has_spare_(false), spare_(0) {}

uint32_t Random::next_u32() { return static_cast<uint32_t>(engine_()); }

double Random::uniform() {
    return (static_cast<double>(next_u32()) + 1.0) / 4294967296.0;
}

double Random::normal(double mean, double stddev) {
    if (has_spare_) {
        has_spare_ = false;
        return mean + stddev * spare_;
    }
    const double two_pi = 6.283185307179586476925286766559;
    double u1 = uniform();
    double u2 = uniform();
    double r = std::sqrt(-2.0 * std::log(u1));
    spare_ = r * std::sin(two_pi * u2);
    has_spare_ = true;
    return mean + stddev * r * std::cos(two_pi * u2);
}

std::vector<float> Random::normal_vector(size_t n, float scale) {
    std::vector<float> values;
    values.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        values.push_back(static_cast<float>(normal()) * scale);
    }
    return values;
}

}  // namespace graft
