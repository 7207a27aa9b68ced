// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_GRAPH_HPP
#define GRAFT_GRAPH_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "model_ref.hpp"
#include "tensor.hpp"

namespace graft {

/// Metadata carried by an assembled graph into the exported model.
struct GraphInfo {
    std::string name;
    std::string producer_name = "telemetry_ai";
    std::string producer_version;
    std::string doc_string;
    int64_t ir_version = 10;
    int64_t opset_version = 13;
};

/// Immutable snapshot of a model: its node list in topological order, its
/// constants, and its input and output signatures.
class Graph {
   public:
    Graph(const Graph &other) = default;

    const GraphInfo &info() const { return info_; }

    const std::string &name() const { return info_.name; }

    /// Graph inputs in declaration order.
    const std::vector<Tensor> &inputs() const { return inputs_; }

    /// Graph outputs in request order.
    const std::vector<Tensor> &outputs() const { return outputs_; }

    /// Constants in declaration order.
    const std::vector<Tensor> &constants() const { return constants_; }

    /// Nodes in topological order. They cannot be modified.
    const std::vector<ModelOpConstRef> &nodes() const { return nodes_; }

    size_t num_nodes() const { return nodes_.size(); }

    std::string serialize(bool pretty = true) const;

   private:
    friend class Model;

    Graph(const GraphInfo &info, const std::vector<Tensor> &inputs,
          const std::vector<Tensor> &outputs,
          const std::vector<Tensor> &constants,
          const std::vector<ModelOpRef> &nodes);

    GraphInfo info_;
    std::vector<Tensor> inputs_;
    std::vector<Tensor> outputs_;
    std::vector<Tensor> constants_;
    std::vector<ModelOpConstRef> nodes_;
};

}  // namespace graft

#endif  // GRAFT_GRAPH_HPP
