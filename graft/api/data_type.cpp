// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/data_type.hpp"

#include <cstdint>
#include <map>

#include "logging.hpp"
#include "model/model_data_type.hpp"

namespace graft {

///
/// NOTE: how to add a new data type
///   1. Add an instance using `DATA_TYPE_INSTANCE()` macro with its ONNX
///      element type code.
///   2. Add a registration using `DATA_TYPE_REGISTER()` macro.
///   3. Expose the symbol in `include/graft/data_type.hpp`.
///

#define DATA_TYPE_INSTANCE(_name, _type, _onnx)                           \
    extern const DataType _name(                                          \
        std::make_shared<ModelDataT>(#_name, #_type, sizeof(_type), _onnx));

#define DATA_TYPE_REGISTER(_name) instances[#_name] = &_name;

extern const DataType NONE(std::make_shared<ModelDataT>("NONE", "void", 0, 0));
DATA_TYPE_INSTANCE(FP32, float, 1);
DATA_TYPE_INSTANCE(INT32, int32_t, 6);
DATA_TYPE_INSTANCE(INT64, int64_t, 7);

static const std::map<std::string, const DataType *> &data_type_instances() {
    static const std::map<std::string, const DataType *> registry = [] {
        std::map<std::string, const DataType *> instances;
        DATA_TYPE_REGISTER(NONE);
        DATA_TYPE_REGISTER(FP32);
        DATA_TYPE_REGISTER(INT32);
        DATA_TYPE_REGISTER(INT64);
        return instances;
    }();
    return registry;
}

const DataType &DataType::from_name(const std::string &type_name) {
    const auto &instances = data_type_instances();
    auto it = instances.find(type_name);
    if (it == instances.end()) {
        ERR(InvalidUsageError, "Unknown data type: ", type_name);
    }
    return *(it->second);
}

const DataType &DataType::from_onnx_type(int onnx_type) {
    for (const auto &p : data_type_instances()) {
        if (onnx_type != 0 && p.second->onnx_type() == onnx_type) {
            return *p.second;
        }
    }
    ERR(InvalidUsageError, "Unsupported ONNX element type: ", onnx_type);
    return NONE;
}

size_t DataType::bytes() const { return ref_->bytes(); }

const std::string &DataType::name() const { return ref_->type_name(); }

int DataType::onnx_type() const { return ref_->onnx_type(); }

}  // namespace graft
