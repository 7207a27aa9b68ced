// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_OPS_MATMUL_HPP_
#define GRAFT_OPS_MATMUL_HPP_

#include "model/model_op.hpp"

namespace graft {

/// `input[M,K] @ other[K,N] -> [M,N]`.
class ModelOpMatmul : public ModelOp {
   public:
    ModelOpMatmul(const Json &args) : ModelOp("Matmul", args) {}

    Dims infer_shape(const std::vector<Dims> &input_shapes) const override;
};

}  // namespace graft

#endif  // GRAFT_OPS_MATMUL_HPP_
