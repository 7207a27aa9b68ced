// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "ops_matmul.hpp"

#include "graft/model.hpp"
#include "ops_common.hpp"

namespace graft {

Dims ModelOpMatmul::infer_shape(const std::vector<Dims> &input_shapes) const {
    check_arity("Matmul", input_shapes, 2);
    const Dims &input_shape = input_shapes[0];
    const Dims &other_shape = input_shapes[1];
    if (input_shape.ndims() != 2 || other_shape.ndims() != 2) {
        ERR(ShapeMismatchError, "Matmul expects rank-2 operands. Given: ",
            input_shape, " and ", other_shape);
    }
    if (!dim_match(input_shape[-1], other_shape[0])) {
        ERR(ShapeMismatchError, "Matmul inner dimensions mismatch: ",
            input_shape, " and ", other_shape);
    }
    return {input_shape[0], other_shape[1]};
}

Tensor Model::matmul(Tensor input, Tensor other, const std::string &name) {
    return append_one("Matmul", {input, other}, {}, name);
}

Tensor Model::linear(Tensor input, Tensor weight, Tensor bias,
                     const std::string &name) {
    Tensor projected = matmul(input, weight);
    return add(projected, bias, name);
}

}  // namespace graft
