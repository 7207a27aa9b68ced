// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_PARTITION_HPP
#define GRAFT_PARTITION_HPP

#include <vector>

#include "dims.hpp"

namespace graft {

/// Activation applied to a region of a partitioned vector.
enum class RegionPolicy {
    /// Sigmoid into (0, 1).
    BoundedUnit,
    /// Relu, then multiply by the region scale.
    NonNegativeScaled,
};

struct Region {
    DimType width;
    RegionPolicy policy;
    float scale;

    static Region bounded_unit(DimType width) {
        return {width, RegionPolicy::BoundedUnit, 1.0f};
    }

    static Region non_negative_scaled(DimType width, float scale) {
        return {width, RegionPolicy::NonNegativeScaled, scale};
    }
};

/// Placement of a region on the last axis of the partitioned tensor.
struct RegionSpan {
    DimType offset;
    DimType width;
    RegionPolicy policy;
    float scale;
};

/// Lay `regions` out along the last axis of `source_shape`. Throws
/// PartitionWidthError unless every width is positive and the widths add up
/// to the last extent.
std::vector<RegionSpan> partition_layout(const Dims &source_shape,
                                         const std::vector<Region> &regions);

}  // namespace graft

#endif  // GRAFT_PARTITION_HPP
