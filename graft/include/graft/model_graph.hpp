// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODEL_GRAPH_HPP
#define GRAFT_MODEL_GRAPH_HPP

#include <graft/model_ref.hpp>
#include <memory>
#include <string>
#include <vector>

namespace graft {

class ModelGraph {
   public:
    ModelGraph();

    ModelGraph(const ModelGraph &other);

    ~ModelGraph();

    ModelGraph &operator=(const ModelGraph &other);

    /// Return true if every node only consumes tensors declared before it.
    bool verify() const;

    std::string serialize(bool pretty = true) const;

    /// Get the list of @ref ModelOp in append order.
    std::vector<ModelOpConstRef> nodes() const;

    size_t num_nodes() const;

    size_t num_tensors() const;

    bool has_tensor(const std::string &name) const;

   protected:
    friend class Model;

    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace graft

#endif  // GRAFT_MODEL_GRAPH_HPP
