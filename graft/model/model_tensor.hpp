// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODEL_TENSOR_HPP_
#define GRAFT_MODEL_TENSOR_HPP_

#include <string>

#include "graft/dims.hpp"
#include "graft/model_ref.hpp"
#include "model_json.hpp"

namespace graft {

class ModelDataT;
using ModelDataType = std::shared_ptr<ModelDataT>;

/// Immutable tensor descriptor. A tensor with a buffer is a constant.
class ModelTensor {
   public:
    ModelTensor(size_t id, const std::string &name, ModelDataType data_type,
                const Dims &shape, ModelBufferRef buffer = nullptr);

    ModelTensor(const ModelTensor &other) = default;

    size_t id() const { return id_; }

    const std::string &name() const { return name_; }

    ModelDataType data_type() const { return data_type_; }

    const Dims &shape() const { return shape_; }

    ModelBufferRef buffer() const { return buffer_; }

    bool is_constant() const { return buffer_ != nullptr; }

    size_t shape_bytes() const;

    Json serialize() const;

   private:
    size_t id_;
    std::string name_;
    ModelDataType data_type_;
    Dims shape_;
    ModelBufferRef buffer_;
};

}  // namespace graft

#endif  // GRAFT_MODEL_TENSOR_HPP_
