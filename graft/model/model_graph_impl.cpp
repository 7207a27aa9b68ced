// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "model_graph_impl.hpp"

#include <set>

#include "logging.hpp"
#include "model_data_type.hpp"
#include "model_tensor.hpp"
#include "ops/ops_common.hpp"
#include "utils/utils_string.hpp"

namespace graft {

ModelTensorRef ModelGraph::Impl::add_input(const std::string &name,
                                           ModelDataType data_type,
                                           const Dims &shape) {
    ModelTensorRef tensor;
    if (name.empty()) {
        tensor = namespace_.declare("input", data_type, shape);
    } else {
        tensor = namespace_.declare_exact(name, data_type, shape);
    }
    inputs_.push_back(tensor);
    LOG(DEBUG, "input ", tensor->name(), " ", shape);
    return tensor;
}

ModelTensorRef ModelGraph::Impl::add_constant(const std::string &name,
                                              ModelDataType data_type,
                                              const Dims &shape,
                                              ModelBufferRef buffer,
                                              bool exact) {
    if (!buffer) {
        ERR(InternalError, "constant ", name, " has no payload");
    }
    ModelTensorRef tensor;
    if (exact) {
        tensor = namespace_.declare_exact(name, data_type, shape, buffer);
    } else {
        tensor = namespace_.declare(name, data_type, shape, buffer);
    }
    constants_.push_back(tensor);
    LOG(DEBUG, "constant ", tensor->name(), " ", shape);
    return tensor;
}

ModelOpRef ModelGraph::Impl::append(const std::string &op_type,
                                    const std::vector<std::string> &input_names,
                                    const Json &args,
                                    const std::string &name) {
    // Resolve and check everything before the graph is touched.
    std::vector<ModelTensorRef> inputs;
    std::vector<Dims> input_shapes;
    for (auto &input_name : input_names) {
        inputs.push_back(namespace_.lookup(input_name));
        input_shapes.push_back(inputs.back()->shape());
    }
    ModelOpRef op = model_op_factory()->construct(op_type, args);
    for (size_t i = 1; i < inputs.size(); ++i) {
        check_match_data_type(op_type, inputs[0], inputs[i]);
    }
    Dims output_shape = op->infer_shape(input_shapes);
    ModelDataType output_data_type =
        inputs.empty() ? ModelDataType() : inputs[0]->data_type();
    if (!output_data_type) {
        ERR(InvalidUsageError, op_type, " has no inputs");
    }

    std::string node_name =
        namespace_.unique_name(name.empty() ? pascal_to_snake(op_type) : name);

    for (auto &c : op->implicit_constants(node_name, input_shapes)) {
        inputs.push_back(
            add_constant(c.name, c.data_type, c.shape, c.buffer, false));
    }
    ModelTensorRef output =
        namespace_.declare_exact(node_name, output_data_type, output_shape);

    op->set_name(node_name);
    op->set_tensors(inputs, {output});
    ops_.push_back(op);
    LOG(DEBUG, "append ", op_type, " ", node_name, " ", output_shape);
    return op;
}

bool ModelGraph::Impl::verify() const {
    std::set<std::string> defined;
    for (auto &t : inputs_) {
        defined.insert(t->name());
    }
    for (auto &t : constants_) {
        defined.insert(t->name());
    }
    for (auto &op : ops_) {
        for (auto &t : op->input_tensors()) {
            if (defined.find(t->name()) == defined.end()) {
                LOG(WARN, "node ", op->name(), " consumes ", t->name(),
                    " before it is defined");
                return false;
            }
        }
        for (auto &t : op->result_tensors()) {
            if (!defined.insert(t->name()).second) {
                LOG(WARN, "tensor ", t->name(), " is defined twice");
                return false;
            }
        }
    }
    if (defined.size() != namespace_.size()) {
        LOG(WARN, "graph defines ", defined.size(), " tensors but ",
            namespace_.size(), " are declared");
        return false;
    }
    return true;
}

Json ModelGraph::Impl::to_json() const {
    Json j;
    j["Inputs"] = Json::array();
    for (auto &t : inputs_) {
        j["Inputs"].push_back(t->serialize());
    }
    j["Constants"] = Json::array();
    for (auto &t : constants_) {
        j["Constants"].push_back(t->serialize());
    }
    j["Nodes"] = Json::array();
    for (auto &op : ops_) {
        j["Nodes"].push_back(op->serialize());
    }
    return j;
}

std::string ModelGraph::Impl::serialize(bool pretty) const {
    if (pretty) {
        return to_json().dump(4);
    }
    return to_json().dump();
}

}  // namespace graft
