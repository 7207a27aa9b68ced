// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODEL_GRAPH_IMPL_HPP_
#define GRAFT_MODEL_GRAPH_IMPL_HPP_

#include <string>
#include <vector>

#include "graft/dims.hpp"
#include "graft/model_graph.hpp"
#include "model_json.hpp"
#include "model_op.hpp"
#include "tensor_namespace.hpp"

namespace graft {

class ModelGraph::Impl {
   public:
    Impl() = default;

    Impl(const Impl &other) = default;

    Impl &operator=(const Impl &other) = default;

    /// Declare a graph input. An empty name is generated from `input`.
    ModelTensorRef add_input(const std::string &name, ModelDataType data_type,
                             const Dims &shape);

    /// Declare a constant. `exact` declares `name` as is, otherwise `name`
    /// is a base name that may get a suffix.
    ModelTensorRef add_constant(const std::string &name,
                                ModelDataType data_type, const Dims &shape,
                                ModelBufferRef buffer, bool exact);

    /// The sole mutation point of the node list.
    ModelOpRef append(const std::string &op_type,
                      const std::vector<std::string> &input_names,
                      const Json &args, const std::string &name);

    ModelTensorRef lookup(const std::string &name) const {
        return namespace_.lookup(name);
    }

    bool has_tensor(const std::string &name) const {
        return namespace_.contains(name);
    }

    size_t num_tensors() const { return namespace_.size(); }

    const std::vector<ModelOpRef> &ops() const { return ops_; }

    const std::vector<ModelTensorRef> &inputs() const { return inputs_; }

    const std::vector<ModelTensorRef> &constants() const { return constants_; }

    bool verify() const;

    Json to_json() const;

    std::string serialize(bool pretty = true) const;

   private:
    /// Names and descriptors of every tensor in this graph.
    TensorNamespace namespace_;

    /// The list of @ref ModelOp in append order, which is topological.
    std::vector<ModelOpRef> ops_;

    /// Graph inputs in declaration order.
    std::vector<ModelTensorRef> inputs_;

    /// Constants in declaration order.
    std::vector<ModelTensorRef> constants_;
};

}  // namespace graft

#endif  // GRAFT_MODEL_GRAPH_IMPL_HPP_
