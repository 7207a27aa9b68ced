// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "ops_concat.hpp"

#include "graft/model.hpp"
#include "ops_common.hpp"

namespace graft {

Dims ModelOpConcat::infer_shape(const std::vector<Dims> &input_shapes) const {
    check_min_arity("Concat", input_shapes, 1);
    Dims output_shape = input_shapes[0];
    int ndims = output_shape.ndims();
    if (ndims == 0) {
        ERR(ConcatShapeError, "Concat cannot join scalars");
    }
    int axis = normalize_axis("Concat", arg_int("Axis", -1), ndims);
    for (size_t i = 1; i < input_shapes.size(); ++i) {
        const Dims &shape = input_shapes[i];
        if (shape.ndims() != ndims) {
            ERR(ConcatShapeError, "Concat input ", i, " has rank ",
                shape.ndims(), " but input 0 has rank ", ndims, ". Given: ",
                shape, " and ", input_shapes[0]);
        }
        for (int d = 0; d < ndims; ++d) {
            if (d == axis) {
                if (output_shape[d] == DYNAMIC_DIM ||
                    shape[d] == DYNAMIC_DIM) {
                    output_shape[d] = DYNAMIC_DIM;
                } else {
                    output_shape[d] += shape[d];
                }
            } else if (!dim_match(output_shape[d], shape[d])) {
                ERR(ConcatShapeError, "Concat input ", i,
                    " mismatches on axis ", d, ": ", shape, " and ",
                    input_shapes[0]);
            } else {
                output_shape[d] = dim_merge(output_shape[d], shape[d]);
            }
        }
    }
    return output_shape;
}

Tensor Model::concat(const std::vector<Tensor> &inputs, int axis,
                     const std::string &name) {
    return append_one("Concat", inputs, {{"Axis", axis}}, name);
}

}  // namespace graft
