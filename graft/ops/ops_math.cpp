// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "ops_math.hpp"

#include "graft/model.hpp"
#include "ops_common.hpp"

namespace graft {

Dims ModelOpMath::infer_shape(const std::vector<Dims> &input_shapes) const {
    check_arity(type_->type_name(), input_shapes, 1);
    return input_shapes[0];
}

Tensor Model::relu(Tensor input, const std::string &name) {
    return append_one("Relu", {input}, {}, name);
}

Tensor Model::sigmoid(Tensor input, const std::string &name) {
    return append_one("Sigmoid", {input}, {}, name);
}

Tensor Model::tanh(Tensor input, const std::string &name) {
    return append_one("Tanh", {input}, {}, name);
}

}  // namespace graft
