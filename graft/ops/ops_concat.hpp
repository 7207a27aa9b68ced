// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_OPS_CONCAT_HPP_
#define GRAFT_OPS_CONCAT_HPP_

#include "model/model_op.hpp"

namespace graft {

class ModelOpConcat : public ModelOp {
   public:
    ModelOpConcat(const Json &args) : ModelOp("Concat", args) {}

    Dims infer_shape(const std::vector<Dims> &input_shapes) const override;
};

}  // namespace graft

#endif  // GRAFT_OPS_CONCAT_HPP_
