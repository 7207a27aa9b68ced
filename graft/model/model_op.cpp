// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "model_op.hpp"

#include "model_tensor.hpp"
#include "ops/ops_arithmetic.hpp"
#include "ops/ops_concat.hpp"
#include "ops/ops_math.hpp"
#include "ops/ops_matmul.hpp"
#include "ops/ops_slice.hpp"

///
/// NOTE: how to add a new operator
///   1. Define `class ModelOp.*` in `ops/` directory and include it here.
///   2. Register the new operator in `ModelOpT::from_name()` by
///      `MODEL_OP_TYPE_REGISTER(.*)`.
///   3. Add an operator function in `class Model` in `model.hpp`.
///   4. Map the type to its interchange name in `onnx/onnx_exporter.cpp`.
///

namespace graft {

std::shared_ptr<ModelOpFactory> model_op_factory() {
    static auto factory = std::make_shared<ModelOpFactory>();
    return factory;
}

#define MODEL_OP_TYPE_REGISTER(_name)                       \
    instances[#_name] = std::make_shared<ModelOpT>(#_name); \
    model_op_factory()->register_op<ModelOp##_name>(#_name);

static const std::unordered_map<std::string, ModelOpType> &
model_op_type_instances() {
    static const std::unordered_map<std::string, ModelOpType> registry = [] {
        std::unordered_map<std::string, ModelOpType> instances;
        MODEL_OP_TYPE_REGISTER(Add);
        MODEL_OP_TYPE_REGISTER(Concat);
        MODEL_OP_TYPE_REGISTER(Matmul);
        MODEL_OP_TYPE_REGISTER(Mul);
        MODEL_OP_TYPE_REGISTER(Relu);
        MODEL_OP_TYPE_REGISTER(Sigmoid);
        MODEL_OP_TYPE_REGISTER(Slice);
        MODEL_OP_TYPE_REGISTER(Tanh);
        return instances;
    }();
    return registry;
}

const ModelOpType ModelOpT::from_name(const std::string &type_name) {
    const auto &instances = model_op_type_instances();
    auto it = instances.find(type_name);
    if (it == instances.end()) {
        ERR(InvalidUsageError, "Unknown model op type: ", type_name);
    }
    return it->second;
}

std::shared_ptr<ModelOp> ModelOpFactory::construct(
    const std::string &class_name, const Json &args) const {
    // Resolving the type name fills the factory on first use.
    ModelOpT::from_name(class_name);
    auto it = constructors_.find(class_name);
    if (it == constructors_.end()) {
        ERR(InvalidUsageError,
            "Tried to construct an unknown class: ", class_name);
    }
    return it->second(args);
}

ModelOp::ModelOp(const std::string &type_name, const Json &args)
    : type_(ModelOpT::from_name(type_name)),
      args_(args.is_null() ? Json::object() : args) {
    if (!args_.is_object()) {
        ERR(InvalidUsageError, type_name,
            " arguments should be an object. Given: ", args_.dump());
    }
}

std::vector<std::string> ModelOp::input_names() const {
    std::vector<std::string> names;
    for (auto &t : input_tensors_) {
        names.push_back(t->name());
    }
    return names;
}

std::vector<std::string> ModelOp::output_names() const {
    std::vector<std::string> names;
    for (auto &t : result_tensors_) {
        names.push_back(t->name());
    }
    return names;
}

int64_t ModelOp::arg_int(const std::string &key) const {
    auto it = args_.find(key);
    if (it == args_.end()) {
        ERR(InvalidUsageError, type_->type_name(), " requires argument ",
            key);
    }
    if (!it->is_number_integer()) {
        ERR(InvalidUsageError, type_->type_name(), " argument ", key,
            " should be an integer. Given: ", it->dump());
    }
    return it->get<int64_t>();
}

int64_t ModelOp::arg_int(const std::string &key,
                         int64_t default_value) const {
    if (args_.find(key) == args_.end()) {
        return default_value;
    }
    return arg_int(key);
}

Json ModelOp::serialize() const {
    Json j;
    j["Type"] = type_->type_name();
    j["Name"] = name_;
    j["InputTensors"] = input_names();
    j["ResultTensors"] = Json::array();
    for (auto &t : result_tensors_) {
        j["ResultTensors"].push_back(t->serialize());
    }
    j["Args"] = args_;
    return j;
}

}  // namespace graft
