// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_OPS_ARITHMETIC_HPP_
#define GRAFT_OPS_ARITHMETIC_HPP_

#include "model/model_op.hpp"

namespace graft {

/// Element-wise add of equal shapes, or of a rank-1 operand against the last
/// axis of the other.
class ModelOpAdd : public ModelOp {
   public:
    ModelOpAdd(const Json &args) : ModelOp("Add", args) {}

    Dims infer_shape(const std::vector<Dims> &input_shapes) const override;
};

/// Multiply by a scalar.
class ModelOpMul : public ModelOp {
   public:
    ModelOpMul(const Json &args) : ModelOp("Mul", args) {}

    Dims infer_shape(const std::vector<Dims> &input_shapes) const override;
};

}  // namespace graft

#endif  // GRAFT_OPS_ARITHMETIC_HPP_
