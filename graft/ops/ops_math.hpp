// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_OPS_MATH_HPP_
#define GRAFT_OPS_MATH_HPP_

#include "model/model_op.hpp"

namespace graft {

/// Unary element-wise op. The result has the shape of the input.
class ModelOpMath : public ModelOp {
   public:
    ModelOpMath(const std::string &type_name, const Json &args)
        : ModelOp(type_name, args) {}

    Dims infer_shape(const std::vector<Dims> &input_shapes) const override;
};

class ModelOpRelu : public ModelOpMath {
   public:
    ModelOpRelu(const Json &args) : ModelOpMath("Relu", args) {}
};

class ModelOpSigmoid : public ModelOpMath {
   public:
    ModelOpSigmoid(const Json &args) : ModelOpMath("Sigmoid", args) {}
};

class ModelOpTanh : public ModelOpMath {
   public:
    ModelOpTanh(const Json &args) : ModelOpMath("Tanh", args) {}
};

}  // namespace graft

#endif  // GRAFT_OPS_MATH_HPP_
