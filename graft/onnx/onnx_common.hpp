// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_ONNX_COMMON_HPP_
#define GRAFT_ONNX_COMMON_HPP_

#include <string>

#include <onnx/onnx_pb.h>

#include "graft/graph.hpp"

#ifndef ONNX_NAMESPACE
#define ONNX_NAMESPACE onnx
#endif

namespace graft {
namespace onnx {

/// Messages of the ONNX library.
namespace pb = ::ONNX_NAMESPACE;

/// Name of a symbolic extent in exported shapes.
extern const char *const DYNAMIC_DIM_PARAM;

/// Interchange operator name of a model op type, e.g. `Matmul` -> `MatMul`.
const std::string &to_onnx_op_type(const std::string &op_type);

/// Model op type of an interchange operator name. Throws ValidationError if
/// the operator is not supported.
const std::string &from_onnx_op_type(const std::string &onnx_op_type);

/// Build the model message of @p graph.
pb::ModelProto to_proto(const Graph &graph);

}  // namespace onnx
}  // namespace graft

#endif  // GRAFT_ONNX_COMMON_HPP_
