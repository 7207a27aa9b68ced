// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/model.hpp"

#include "logging.hpp"
#include "model/model_buffer.hpp"
#include "model/model_data_type.hpp"
#include "model/model_graph_impl.hpp"
#include "model/model_tensor.hpp"

namespace graft {

static Json to_args(const OpAttributes &attributes) {
    Json args = Json::object();
    for (auto &kv : attributes) {
        args[kv.first] = kv.second;
    }
    return args;
}

Tensor Model::tensor(const Dims &shape, const DataType &data_type,
                     const std::string &name) {
    if (data_type == NONE || data_type.is_none()) {
        ERR(InvalidUsageError, "input ", name, " needs a data type");
    }
    return impl_->add_input(name, data_type.ref(), shape);
}

Tensor Model::constant(const std::vector<float> &values, const Dims &shape,
                       const std::string &name) {
    if (static_cast<DimType>(values.size()) != shape.nelems()) {
        ERR(InvalidUsageError, "constant ", name, " of shape ", shape,
            " needs ", shape.nelems(), " values, but ", values.size(),
            " are given");
    }
    return impl_->add_constant(name.empty() ? "constant" : name, FP32.ref(),
                               shape, ModelBuffer::from_floats(values),
                               !name.empty());
}

Tensor Model::constant(const std::vector<int64_t> &values, const Dims &shape,
                       const std::string &name) {
    if (static_cast<DimType>(values.size()) != shape.nelems()) {
        ERR(InvalidUsageError, "constant ", name, " of shape ", shape,
            " needs ", shape.nelems(), " values, but ", values.size(),
            " are given");
    }
    return impl_->add_constant(name.empty() ? "constant" : name, INT64.ref(),
                               shape, ModelBuffer::from_int64s(values),
                               !name.empty());
}

Tensor Model::constant(float value, const std::string &name) {
    return constant(std::vector<float>{value}, Dims(), name);
}

Tensor Model::lookup(const std::string &name) const {
    return impl_->lookup(name);
}

std::vector<std::string> Model::append(
    const std::string &op_type, const std::vector<std::string> &input_names,
    const OpAttributes &attributes, const std::string &name) {
    return impl_->append(op_type, input_names, to_args(attributes), name)
        ->output_names();
}

Tensor Model::resolve(const Tensor &tensor) const {
    if (tensor.is_null()) {
        ERR(UnknownTensorError, "null tensor is not part of any model");
    }
    ModelTensorRef ref = impl_->lookup(tensor.name());
    if (ref != tensor.ref()) {
        ERR(UnknownTensorError, "tensor ", tensor.name(),
            " belongs to another model");
    }
    return ref;
}

Tensor Model::append_one(const std::string &op_type,
                         const std::vector<Tensor> &inputs,
                         const OpAttributes &attributes,
                         const std::string &name) {
    std::vector<std::string> input_names;
    for (auto &input : inputs) {
        input_names.push_back(resolve(input).name());
    }
    auto op = impl_->append(op_type, input_names, to_args(attributes), name);
    return op->result_tensors()[0];
}

Graph Model::assemble(const std::vector<Tensor> &outputs,
                      const GraphInfo &info) const {
    std::vector<std::string> output_names;
    for (auto &output : outputs) {
        if (output.is_null()) {
            ERR(UnresolvedOutputError, "graph ", info.name,
                " requests a null output");
        }
        output_names.push_back(output.name());
    }
    return assemble(info.name, output_names, info);
}

Graph Model::assemble(const std::string &name,
                      const std::vector<std::string> &output_names,
                      const GraphInfo &info) const {
    if (output_names.empty()) {
        ERR(UnresolvedOutputError, "graph ", name, " has no outputs");
    }
    std::vector<Tensor> outputs;
    for (auto &output_name : output_names) {
        if (!impl_->has_tensor(output_name)) {
            ERR(UnresolvedOutputError, "graph ", name, " output ",
                output_name, " is never produced");
        }
        outputs.push_back(Tensor(impl_->lookup(output_name)));
    }
    std::vector<Tensor> inputs(impl_->inputs().begin(), impl_->inputs().end());
    std::vector<Tensor> constants(impl_->constants().begin(),
                                  impl_->constants().end());
    GraphInfo graph_info = info;
    graph_info.name = name;
    LOG(DEBUG, "assemble ", name, ": ", impl_->ops().size(), " nodes, ",
        constants.size(), " constants");
    return Graph(graph_info, inputs, outputs, constants, impl_->ops());
}

}  // namespace graft
