// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODEL_DATA_TYPE_HPP_
#define GRAFT_MODEL_DATA_TYPE_HPP_

#include <memory>
#include <string>

#include "named_type.hpp"

namespace graft {

class ModelDataT : public NamedT {
   public:
    ModelDataT(const std::string &type_name, const std::string &type_str,
               size_t bytes, int onnx_type)
        : NamedT(type_name),
          type_str_(type_str),
          bytes_(bytes),
          onnx_type_(onnx_type) {}

    ModelDataT(const ModelDataT &) = default;

    const std::string &type_str() const { return type_str_; }

    size_t bytes() const { return bytes_; }

    int onnx_type() const { return onnx_type_; }

   private:
    std::string type_str_;
    size_t bytes_;
    int onnx_type_;
};

using ModelDataType = std::shared_ptr<ModelDataT>;

}  // namespace graft

#endif  // GRAFT_MODEL_DATA_TYPE_HPP_
