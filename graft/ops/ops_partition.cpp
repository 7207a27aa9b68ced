// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/partition.hpp"

#include "graft/model.hpp"
#include "logging.hpp"
#include "model/model_buffer.hpp"
#include "model/model_graph_impl.hpp"

namespace graft {

std::vector<RegionSpan> partition_layout(const Dims &source_shape,
                                         const std::vector<Region> &regions) {
    if (source_shape.is_no_dim()) {
        ERR(PartitionWidthError, "cannot partition a scalar");
    }
    DimType width = source_shape[-1];
    if (width == DYNAMIC_DIM) {
        ERR(PartitionWidthError, "cannot partition a dynamic axis of ",
            source_shape);
    }
    if (regions.empty()) {
        ERR(PartitionWidthError, "partition of ", source_shape,
            " needs at least one region");
    }
    std::vector<RegionSpan> spans;
    DimType offset = 0;
    for (size_t i = 0; i < regions.size(); ++i) {
        const Region &region = regions[i];
        if (region.width <= 0) {
            ERR(PartitionWidthError, "region ", i,
                " should have a positive width. Given: ", region.width);
        }
        spans.push_back({offset, region.width, region.policy, region.scale});
        offset += region.width;
    }
    if (offset != width) {
        ERR(PartitionWidthError, "region widths add up to ", offset,
            " but the last axis of ", source_shape, " has ", width);
    }
    return spans;
}

Tensor Model::partition(Tensor source, const std::vector<Region> &regions,
                        const std::string &name) {
    Tensor input = resolve(source);
    if (input.data_type() != FP32) {
        ERR(ModelError, "partition expects an FP32 source. Given: ",
            input.name(), " of ", input.data_type().name());
    }
    auto spans = partition_layout(input.shape(), regions);

    std::vector<Tensor> parts;
    for (size_t i = 0; i < spans.size(); ++i) {
        const RegionSpan &span = spans[i];
        std::string prefix = "region" + std::to_string(i);
        Tensor part = slice(input, span.offset, span.offset + span.width, -1,
                            prefix + "_slice");
        switch (span.policy) {
            case RegionPolicy::BoundedUnit:
                part = sigmoid(part, prefix + "_sigmoid");
                break;
            case RegionPolicy::NonNegativeScaled: {
                part = relu(part, prefix + "_relu");
                Tensor factor = impl_->add_constant(
                    prefix + "_scale", FP32.ref(), Dims(),
                    ModelBuffer::from_floats({span.scale}), false);
                part = mul(part, factor, prefix + "_scaled");
                break;
            }
            default:
                ERR(InternalError, "unknown region policy");
        }
        parts.push_back(part);
    }
    return concat(parts, -1, name.empty() ? "partition" : name);
}

}  // namespace graft
