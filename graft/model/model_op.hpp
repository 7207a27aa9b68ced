// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODEL_OP_HPP_
#define GRAFT_MODEL_OP_HPP_

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "graft/dims.hpp"
#include "graft/model_ref.hpp"
#include "logging.hpp"
#include "model_json.hpp"
#include "named_type.hpp"

namespace graft {

class ModelDataT;
using ModelDataType = std::shared_ptr<ModelDataT>;

class ModelOpT;
using ModelOpType = std::shared_ptr<ModelOpT>;

class ModelOpT : public NamedT {
   public:
    ModelOpT(const std::string &type_name) : NamedT(type_name) {}

    ModelOpT(const ModelOpT &) = default;

    static const ModelOpType from_name(const std::string &type_name);
};

/// A constant tensor that an operator declares for itself when it is
/// appended, such as the index arrays of a slice.
struct ModelOpConstant {
    std::string name;
    ModelDataType data_type;
    Dims shape;
    ModelBufferRef buffer;
};

/// Operator node. The shape rules of a type are implemented by
/// `infer_shape()`, which runs before the node becomes part of a graph.
class ModelOp {
   public:
    ModelOp(const std::string &type_name, const Json &args);

    ModelOp(const ModelOp &) = default;

    virtual ~ModelOp() = default;

    /// Return the result shape for the given input shapes, or throw a
    /// ShapeError. Arity violations throw InvalidUsageError.
    virtual Dims infer_shape(const std::vector<Dims> &input_shapes) const = 0;

    /// Constants to declare before the result. `node_name` is the name the
    /// node will take.
    virtual std::vector<ModelOpConstant> implicit_constants(
        [[maybe_unused]] const std::string &node_name,
        [[maybe_unused]] const std::vector<Dims> &input_shapes) const {
        return {};
    }

    void set_name(const std::string &name) { name_ = name; }

    void set_tensors(const std::vector<ModelTensorRef> &inputs,
                     const std::vector<ModelTensorRef> &results) {
        input_tensors_ = inputs;
        result_tensors_ = results;
    }

    ModelOpType type() const { return type_; }

    const std::string &name() const { return name_; }

    const Json &args() const { return args_; }

    const std::vector<ModelTensorRef> &input_tensors() const {
        return input_tensors_;
    }

    const std::vector<ModelTensorRef> &result_tensors() const {
        return result_tensors_;
    }

    std::vector<std::string> input_names() const;

    std::vector<std::string> output_names() const;

    Json serialize() const;

   protected:
    /// Return the integer argument `key`, or throw InvalidUsageError.
    int64_t arg_int(const std::string &key) const;

    /// Return the integer argument `key`, or `default_value` if it is unset.
    int64_t arg_int(const std::string &key, int64_t default_value) const;

    ModelOpType type_;
    std::string name_;
    Json args_;
    std::vector<ModelTensorRef> input_tensors_;
    std::vector<ModelTensorRef> result_tensors_;
};

class ModelOpFactory {
   private:
    std::unordered_map<std::string,
                       std::function<std::shared_ptr<ModelOp>(const Json &)>>
        constructors_;

   public:
    ModelOpFactory() = default;

    template <class DerivedModelOp>
    void register_op(const std::string &class_name) {
        if (constructors_.find(class_name) != constructors_.end()) {
            ERR(InvalidUsageError, "Class already registered: ", class_name);
        }
        constructors_[class_name] = [](const Json &args) {
            return std::shared_ptr<ModelOp>(new DerivedModelOp(args));
        };
    }

    std::shared_ptr<ModelOp> construct(const std::string &class_name,
                                       const Json &args) const;

    bool contains(const std::string &class_name) const {
        return constructors_.find(class_name) != constructors_.end();
    }
};

std::shared_ptr<ModelOpFactory> model_op_factory();

}  // namespace graft

#endif  // GRAFT_MODEL_OP_HPP_
