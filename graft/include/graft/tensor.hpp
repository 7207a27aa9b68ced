// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_TENSOR_HPP
#define GRAFT_TENSOR_HPP

#include <ostream>
#include <string>

#include "data_type.hpp"
#include "dims.hpp"
#include "model_ref.hpp"

namespace graft {

/// Handle of a tensor declared in a @ref Model.
class Tensor {
   protected:
    friend class Model;
    ModelTensorRef ref_;

   public:
    Tensor() = default;
    Tensor(ModelTensorRef ref) : ref_(ref) {}
    Tensor(const Tensor &other) = default;
    Tensor &operator=(const Tensor &other) = default;

    bool operator==(const Tensor &other) const { return ref_ == other.ref_; }
    bool operator!=(const Tensor &other) const { return ref_ != other.ref_; }

    bool is_null() const { return !ref_; }

    ModelTensorRef ref() const { return ref_; }

    size_t id() const;

    const std::string &name() const;

    Dims shape() const;

    const DataType &data_type() const;

    bool is_constant() const;
};

const Tensor NullTensor;

std::ostream &operator<<(std::ostream &os, const Tensor &tensor);

}  // namespace graft

#endif  // GRAFT_TENSOR_HPP
