// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_OPS_COMMON_HPP_
#define GRAFT_OPS_COMMON_HPP_

#include <string>
#include <vector>

#include "graft/dims.hpp"
#include "logging.hpp"
#include "model/model_data_type.hpp"
#include "model/model_op.hpp"
#include "model/model_tensor.hpp"

namespace graft {

/// Throw InvalidUsageError unless exactly `expected` inputs are given.
void check_arity(const std::string &op_type,
                 const std::vector<Dims> &input_shapes, size_t expected);

/// Throw InvalidUsageError unless at least `minimum` inputs are given.
void check_min_arity(const std::string &op_type,
                     const std::vector<Dims> &input_shapes, size_t minimum);

/// Throw ModelError unless `a` and `b` have the same data type.
void check_match_data_type(const std::string &op_type, ModelTensorRef a,
                           ModelTensorRef b);

/// True if two extents agree. A dynamic extent agrees with any extent.
bool dim_match(DimType a, DimType b);

/// The known one of two agreeing extents.
DimType dim_merge(DimType a, DimType b);

/// True if both shapes have the same rank and agreeing extents.
bool shape_match(const Dims &a, const Dims &b);

/// Map a possibly negative axis onto [0, ndims). Throws ShapeError if it is
/// out of range.
int normalize_axis(const std::string &op_type, int64_t axis, int ndims);

}  // namespace graft

#endif  // GRAFT_OPS_COMMON_HPP_
