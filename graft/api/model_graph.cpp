// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/model_graph.hpp"

#include "logging.hpp"
#include "model/model_graph_impl.hpp"

namespace graft {

ModelGraph::ModelGraph() : impl_(std::make_unique<ModelGraph::Impl>()) {}

ModelGraph::ModelGraph(const ModelGraph &other)
    : impl_(std::make_unique<ModelGraph::Impl>(*other.impl_)) {}

ModelGraph::~ModelGraph() = default;

ModelGraph &ModelGraph::operator=(const ModelGraph &other) {
    *impl_ = *other.impl_;
    return *this;
}

std::vector<ModelOpConstRef> ModelGraph::nodes() const {
    return std::vector<ModelOpConstRef>(impl_->ops().begin(),
                                        impl_->ops().end());
}

size_t ModelGraph::num_nodes() const { return impl_->ops().size(); }

size_t ModelGraph::num_tensors() const { return impl_->num_tensors(); }

bool ModelGraph::has_tensor(const std::string &name) const {
    return impl_->has_tensor(name);
}

std::string ModelGraph::serialize(bool pretty) const {
    return impl_->serialize(pretty);
}

bool ModelGraph::verify() const { return impl_->verify(); }

}  // namespace graft
