// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "ops_common.hpp"

namespace graft {

void check_arity(const std::string &op_type,
                 const std::vector<Dims> &input_shapes, size_t expected) {
    if (input_shapes.size() != expected) {
        ERR(InvalidUsageError, op_type, " expects ", expected,
            " inputs, but ", input_shapes.size(), " are given");
    }
}

void check_min_arity(const std::string &op_type,
                     const std::vector<Dims> &input_shapes, size_t minimum) {
    if (input_shapes.size() < minimum) {
        ERR(InvalidUsageError, op_type, " expects at least ", minimum,
            " inputs, but ", input_shapes.size(), " are given");
    }
}

void check_match_data_type(const std::string &op_type, ModelTensorRef a,
                           ModelTensorRef b) {
    if (a->data_type() != b->data_type()) {
        ERR(ModelError, op_type, " inputs differ in data type: ", a->name(),
            " is ", a->data_type()->type_name(), " but ", b->name(), " is ",
            b->data_type()->type_name());
    }
}

bool dim_match(DimType a, DimType b) {
    return a == b || a == DYNAMIC_DIM || b == DYNAMIC_DIM;
}

DimType dim_merge(DimType a, DimType b) { return a == DYNAMIC_DIM ? b : a; }

bool shape_match(const Dims &a, const Dims &b) {
    if (a.ndims() != b.ndims()) {
        return false;
    }
    for (int i = 0; i < a.ndims(); ++i) {
        if (!dim_match(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

int normalize_axis(const std::string &op_type, int64_t axis, int ndims) {
    int64_t normalized = axis < 0 ? axis + ndims : axis;
    if (normalized < 0 || normalized >= ndims) {
        ERR(ShapeError, op_type, " axis ", axis,
            " is out of range for a tensor of rank ", ndims);
    }
    return static_cast<int>(normalized);
}

}  // namespace graft
