// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_OPS_SLICE_HPP_
#define GRAFT_OPS_SLICE_HPP_

#include "model/model_op.hpp"

namespace graft {

/// Range `[Start, End)` along `Axis`. The node carries its bounds as three
/// INT64 constants of shape [1], in the order starts, ends, axes.
class ModelOpSlice : public ModelOp {
   public:
    ModelOpSlice(const Json &args) : ModelOp("Slice", args) {}

    Dims infer_shape(const std::vector<Dims> &input_shapes) const override;

    std::vector<ModelOpConstant> implicit_constants(
        const std::string &node_name,
        const std::vector<Dims> &input_shapes) const override;
};

}  // namespace graft

#endif  // GRAFT_OPS_SLICE_HPP_
