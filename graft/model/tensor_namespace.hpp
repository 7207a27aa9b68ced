// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_TENSOR_NAMESPACE_HPP_
#define GRAFT_TENSOR_NAMESPACE_HPP_

#include <map>
#include <string>
#include <vector>

#include "graft/dims.hpp"
#include "graft/model_ref.hpp"

namespace graft {

class ModelDataT;
using ModelDataType = std::shared_ptr<ModelDataT>;

/// Issues unique tensor names of one graph and owns the table of declared
/// tensor descriptors.
class TensorNamespace {
   public:
    TensorNamespace() = default;

    /// Return the name that `declare(base)` would issue next. `base` itself
    /// if it is unused, otherwise `base_<n>` with the smallest unused n >= 1.
    std::string unique_name(const std::string &base) const;

    /// Declare a tensor under a unique name derived from `base`.
    ModelTensorRef declare(const std::string &base, ModelDataType data_type,
                           const Dims &shape, ModelBufferRef buffer = nullptr);

    /// Declare a tensor under exactly `name`. Throws
    /// DuplicateDeclarationError if `name` has already been issued.
    ModelTensorRef declare_exact(const std::string &name,
                                 ModelDataType data_type, const Dims &shape,
                                 ModelBufferRef buffer = nullptr);

    /// Throws UnknownTensorError if `name` has not been declared.
    ModelTensorRef lookup(const std::string &name) const;

    bool contains(const std::string &name) const;

    size_t size() const { return order_.size(); }

    /// Declared tensors in declaration order.
    const std::vector<ModelTensorRef> &tensors() const { return order_; }

   private:
    ModelTensorRef insert(const std::string &name, ModelDataType data_type,
                          const Dims &shape, ModelBufferRef buffer);

    std::map<std::string, ModelTensorRef> table_;
    std::vector<ModelTensorRef> order_;
    size_t next_id_ = 0;
};

}  // namespace graft

#endif  // GRAFT_TENSOR_NAMESPACE_HPP_
