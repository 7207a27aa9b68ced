// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/tensor.hpp"

#include "model/model_data_type.hpp"
#include "model/model_tensor.hpp"

namespace graft {

size_t Tensor::id() const {
    if (ref_) {
        return ref_->id();
    }
    return 0;
}

const std::string &Tensor::name() const {
    static const std::string empty;
    if (ref_) {
        return ref_->name();
    }
    return empty;
}

Dims Tensor::shape() const {
    if (ref_) {
        return ref_->shape();
    }
    return Dims();
}

const DataType &Tensor::data_type() const {
    if (ref_) {
        return DataType::from_name(ref_->data_type()->type_name());
    }
    return NONE;
}

bool Tensor::is_constant() const { return ref_ && ref_->is_constant(); }

std::ostream &operator<<(std::ostream &os, const Tensor &tensor) {
    if (tensor.is_null()) {
        os << "null";
    } else {
        os << tensor.ref()->serialize().dump();
    }
    return os;
}

}  // namespace graft
