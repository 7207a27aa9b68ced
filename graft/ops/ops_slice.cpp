// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "ops_slice.hpp"

#include "graft/model.hpp"
#include "model/model_buffer.hpp"
#include "ops_common.hpp"

namespace graft {

Dims ModelOpSlice::infer_shape(const std::vector<Dims> &input_shapes) const {
    check_arity("Slice", input_shapes, 1);
    const Dims &input_shape = input_shapes[0];
    if (input_shape.is_no_dim()) {
        ERR(SliceRangeError, "Slice cannot be applied to a scalar");
    }
    int64_t start = arg_int("Start");
    int64_t end = arg_int("End");
    int axis = normalize_axis("Slice", arg_int("Axis", -1),
                              input_shape.ndims());
    DimType extent = input_shape[axis];
    if (start < 0 || end <= start) {
        ERR(SliceRangeError, "Slice range [", start, ", ", end,
            ") is empty or negative");
    }
    if (extent != DYNAMIC_DIM && end > extent) {
        ERR(SliceRangeError, "Slice range [", start, ", ", end,
            ") exceeds extent ", extent, " of axis ", axis, " of ",
            input_shape);
    }
    Dims output_shape = input_shape;
    output_shape[axis] = end - start;
    return output_shape;
}

std::vector<ModelOpConstant> ModelOpSlice::implicit_constants(
    const std::string &node_name,
    const std::vector<Dims> &input_shapes) const {
    int64_t axis = normalize_axis("Slice", arg_int("Axis", -1),
                                  input_shapes[0].ndims());
    return {
        {node_name + "_starts", INT64.ref(), {1},
         ModelBuffer::from_int64s({arg_int("Start")})},
        {node_name + "_ends", INT64.ref(), {1},
         ModelBuffer::from_int64s({arg_int("End")})},
        {node_name + "_axes", INT64.ref(), {1},
         ModelBuffer::from_int64s({axis})},
    };
}

Tensor Model::slice(Tensor input, DimType start, DimType end, int axis,
                    const std::string &name) {
    return append_one("Slice", {input},
                      {{"Start", start}, {"End", end}, {"Axis", axis}}, name);
}

}  // namespace graft
