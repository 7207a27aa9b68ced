// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "model_tensor.hpp"

#include "logging.hpp"
#include "model_buffer.hpp"
#include "model_data_type.hpp"

namespace graft {

ModelTensor::ModelTensor(size_t id, const std::string &name,
                         ModelDataType data_type, const Dims &shape,
                         ModelBufferRef buffer)
    : id_(id),
      name_(name),
      data_type_(data_type),
      shape_(shape),
      buffer_(buffer) {
    if (name_.empty()) {
        ERR(InvalidUsageError, "tensor name should not be empty");
    }
    if (!data_type_) {
        ERR(InvalidUsageError, "tensor ", name_, " has no data type");
    }
    if (buffer_) {
        if (shape_.has_dynamic()) {
            ERR(ModelError, "constant ", name_,
                " should have a static shape. Given: ", shape_);
        }
        if (buffer_->bytes() != shape_bytes()) {
            ERR(ModelError, "constant ", name_, " of shape ", shape_, " and ",
                data_type_->type_name(), " expects ", shape_bytes(),
                " bytes, but the payload has ", buffer_->bytes());
        }
    }
}

size_t ModelTensor::shape_bytes() const {
    return static_cast<size_t>(shape_.nelems()) * data_type_->bytes();
}

Json ModelTensor::serialize() const {
    Json j;
    j["Id"] = id_;
    j["Name"] = name_;
    j["DataType"] = data_type_->type_name();
    j["Shape"] = shape_.vector();
    if (buffer_) {
        j["Buffer"] = buffer_->serialize();
    }
    return j;
}

}  // namespace graft
