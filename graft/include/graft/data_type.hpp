// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_DATA_TYPE_HPP
#define GRAFT_DATA_TYPE_HPP

#include <memory>
#include <string>

namespace graft {

class DataType;

extern const DataType NONE;
extern const DataType FP32;
extern const DataType INT32;
extern const DataType INT64;

class ModelDataT;
using ModelDataType = std::shared_ptr<ModelDataT>;

class DataType {
   protected:
    friend class Model;
    ModelDataType ref_;

   public:
    DataType() = default;
    DataType(ModelDataType ref) : ref_(ref) {}
    DataType(const DataType &other) = default;
    DataType &operator=(const DataType &other) = default;

    bool operator==(const DataType &other) const { return ref_ == other.ref_; }
    bool operator!=(const DataType &other) const { return ref_ != other.ref_; }

    bool is_none() const { return !ref_; }

    ModelDataType ref() const { return ref_; }

    size_t bytes() const;

    const std::string &name() const;

    /// Element type code of the ONNX interchange format.
    int onnx_type() const;

    static const DataType &from_name(const std::string &type_name);

    static const DataType &from_onnx_type(int onnx_type);
};

}  // namespace graft

#endif  // GRAFT_DATA_TYPE_HPP
