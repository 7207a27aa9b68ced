// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "tensor_namespace.hpp"

#include "logging.hpp"
#include "model_tensor.hpp"

namespace graft {

std::string TensorNamespace::unique_name(const std::string &base) const {
    if (base.empty()) {
        ERR(InvalidUsageError, "tensor base name should not be empty");
    }
    if (!contains(base)) {
        return base;
    }
    for (size_t n = 1;; ++n) {
        std::string candidate = base + "_" + std::to_string(n);
        if (!contains(candidate)) {
            return candidate;
        }
    }
}

ModelTensorRef TensorNamespace::declare(const std::string &base,
                                        ModelDataType data_type,
                                        const Dims &shape,
                                        ModelBufferRef buffer) {
    return insert(unique_name(base), data_type, shape, buffer);
}

ModelTensorRef TensorNamespace::declare_exact(const std::string &name,
                                              ModelDataType data_type,
                                              const Dims &shape,
                                              ModelBufferRef buffer) {
    if (name.empty()) {
        ERR(InvalidUsageError, "tensor name should not be empty");
    }
    if (contains(name)) {
        ERR(DuplicateDeclarationError, "tensor ", name,
            " is already declared");
    }
    return insert(name, data_type, shape, buffer);
}

ModelTensorRef TensorNamespace::lookup(const std::string &name) const {
    auto it = table_.find(name);
    if (it == table_.end()) {
        ERR(UnknownTensorError, "unknown tensor: ", name);
    }
    return it->second;
}

bool TensorNamespace::contains(const std::string &name) const {
    return table_.find(name) != table_.end();
}

ModelTensorRef TensorNamespace::insert(const std::string &name,
                                       ModelDataType data_type,
                                       const Dims &shape,
                                       ModelBufferRef buffer) {
    auto tensor = std::make_shared<ModelTensor>(next_id_, name, data_type,
                                                shape, buffer);
    ++next_id_;
    table_.emplace(name, tensor);
    order_.push_back(tensor);
    return tensor;
}

}  // namespace graft
