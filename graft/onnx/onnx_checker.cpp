// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include <onnx/checker.h>

#include <map>

#include "graft/data_type.hpp"
#include "graft/model.hpp"
#include "graft/onnx.hpp"
#include "logging.hpp"
#include "model/model_buffer.hpp"
#include "onnx_common.hpp"
#include "ops/ops_common.hpp"

namespace graft {
namespace onnx {

namespace {

struct ValueState {
    Dims shape;
    int elem_type;
};

/// Runs the ONNX checker on one parsed model, then walks it in node order
/// and re-propagates every shape with the rules the builder uses.
class ModelChecker {
   public:
    ModelChecker(const pb::ModelProto &model) : model_(model) {}

    ModelSummary check();

   private:
    void check_format();

    void define(const std::string &name, const Dims &shape, int elem_type,
                const std::string &what);

    Dims to_dims(const std::string &name,
                 const std::vector<int64_t> &extents) const;

    ValueSummary check_value_info(const pb::ValueInfoProto &value,
                                  const std::string &what);

    void check_initializer(const pb::TensorProto &initializer);

    void check_node(const pb::NodeProto &node, size_t index);

    int64_t scalar_index(const pb::NodeProto &node,
                         const std::string &name) const;

    const pb::ModelProto &model_;
    int64_t opset_version_ = 0;
    std::map<std::string, ValueState> values_;
    std::map<std::string, std::vector<int64_t>> index_constants_;
};

void ModelChecker::check_format() {
    // Structural rules of the format: versions, SSA names, topological
    // order, operator schemas and attribute types.
    try {
        pb::checker::check_model(model_);
    } catch (const pb::checker::ValidationError &e) {
        ERR(ValidationError, "model is rejected by the ONNX checker: ",
            e.what());
    }
    for (const auto &opset : model_.opset_import()) {
        if (opset.domain().empty() || opset.domain() == "ai.onnx") {
            opset_version_ = opset.version();
        }
    }
}

void ModelChecker::define(const std::string &name, const Dims &shape,
                          int elem_type, const std::string &what) {
    if (name.empty()) {
        ERR(ValidationError, what, " has an empty name");
    }
    if (!values_.emplace(name, ValueState{shape, elem_type}).second) {
        ERR(ValidationError, what, " ", name,
            " redefines a name that is already defined");
    }
}

Dims ModelChecker::to_dims(const std::string &name,
                           const std::vector<int64_t> &extents) const {
    if (extents.size() > static_cast<size_t>(DIMS_LEN)) {
        ERR(ValidationError, name, " has rank ", extents.size(),
            ", more than ", DIMS_LEN);
    }
    for (int64_t d : extents) {
        if (d < 0) {
            ERR(ValidationError, name, " has a negative extent ", d);
        }
    }
    return Dims(extents);
}

ValueSummary ModelChecker::check_value_info(const pb::ValueInfoProto &value,
                                            const std::string &what) {
    if (!value.has_type() || !value.type().has_tensor_type()) {
        ERR(ValidationError, what, " ", value.name(), " has no tensor type");
    }
    const auto &tensor_type = value.type().tensor_type();
    ValueSummary summary;
    summary.name = value.name();
    summary.elem_type = tensor_type.elem_type();
    if (tensor_type.has_shape()) {
        for (const auto &dim : tensor_type.shape().dim()) {
            if (dim.has_dim_value()) {
                summary.dims.push_back(dim.dim_value());
            } else {
                summary.dims.push_back(DYNAMIC_DIM);
            }
        }
    }
    try {
        DataType::from_onnx_type(summary.elem_type);
    } catch (const InvalidUsageError &) {
        ERR(ValidationError, what, " ", value.name(),
            " has an unsupported element type ", summary.elem_type);
    }
    // Validates the extents.
    to_dims(value.name(), summary.dims);
    return summary;
}

void ModelChecker::check_initializer(const pb::TensorProto &initializer) {
    const std::string &name = initializer.name();
    int elem_type = initializer.data_type();
    const DataType *data_type = nullptr;
    try {
        data_type = &DataType::from_onnx_type(elem_type);
    } catch (const InvalidUsageError &) {
        ERR(ValidationError, "initializer ", name,
            " has an unsupported element type ", elem_type);
    }
    std::vector<int64_t> extents(initializer.dims().begin(),
                                 initializer.dims().end());
    Dims shape = to_dims(name, extents);
    size_t expected = static_cast<size_t>(shape.nelems()) * data_type->bytes();
    size_t actual = 0;
    if (initializer.has_raw_data()) {
        actual = initializer.raw_data().size();
    } else if (*data_type == FP32) {
        actual = initializer.float_data_size() * sizeof(float);
    } else if (*data_type == INT64) {
        actual = initializer.int64_data_size() * sizeof(int64_t);
    } else if (*data_type == INT32) {
        actual = initializer.int32_data_size() * sizeof(int32_t);
    }
    if (actual != expected) {
        ERR(ValidationError, "initializer ", name, " of shape ", shape,
            " needs ", expected, " bytes of payload, but has ", actual);
    }
    if (*data_type == INT64) {
        if (initializer.has_raw_data()) {
            index_constants_[name] = decode_int64s(initializer.raw_data());
        } else {
            index_constants_[name] = std::vector<int64_t>(
                initializer.int64_data().begin(),
                initializer.int64_data().end());
        }
    }
    define(name, shape, elem_type, "initializer");
}

int64_t ModelChecker::scalar_index(const pb::NodeProto &node,
                                   const std::string &name) const {
    auto it = index_constants_.find(name);
    if (it == index_constants_.end() || it->second.size() != 1) {
        ERR(ValidationError, "node ", node.name(), " expects ", name,
            " to be a one-element INT64 initializer");
    }
    return it->second[0];
}

void ModelChecker::check_node(const pb::NodeProto &node, size_t index) {
    std::string label =
        node.name().empty() ? "#" + std::to_string(index) : node.name();
    if (!node.domain().empty() && node.domain() != "ai.onnx") {
        ERR(ValidationError, "node ", label, " uses unsupported domain ",
            node.domain());
    }
    const std::string &op_type = from_onnx_op_type(node.op_type());
    if (node.output_size() != 1) {
        ERR(ValidationError, "node ", label, " (", node.op_type(),
            ") should have one output, but has ", node.output_size());
    }
    for (const auto &input : node.input()) {
        if (values_.find(input) == values_.end()) {
            ERR(ValidationError, "node ", label, " (", node.op_type(),
                ") consumes ", input, ", which is not defined before it");
        }
    }

    std::vector<std::string> data_inputs(node.input().begin(),
                                         node.input().end());
    OpAttributes attributes;
    if (op_type == "Slice") {
        if (node.input_size() != 4) {
            ERR(ValidationError, "node ", label,
                " (Slice) should have 4 inputs, but has ", node.input_size());
        }
        attributes["Start"] = scalar_index(node, node.input(1));
        attributes["End"] = scalar_index(node, node.input(2));
        attributes["Axis"] = scalar_index(node, node.input(3));
        data_inputs.resize(1);
    } else if (op_type == "Concat") {
        bool has_axis = false;
        for (const auto &attr : node.attribute()) {
            if (attr.name() == "axis" &&
                attr.type() == pb::AttributeProto::INT) {
                attributes["Axis"] = attr.i();
                has_axis = true;
            }
        }
        if (!has_axis) {
            ERR(ValidationError, "node ", label,
                " (Concat) has no integer axis attribute");
        }
    } else if (node.attribute_size() > 0) {
        ERR(ValidationError, "node ", label, " (", node.op_type(),
            ") takes no attributes");
    }

    std::vector<Dims> input_shapes;
    int elem_type = 0;
    for (auto &input : data_inputs) {
        const ValueState &state = values_.at(input);
        if (elem_type == 0) {
            elem_type = state.elem_type;
        } else if (state.elem_type != elem_type) {
            ERR(ValidationError, "node ", label, " (", node.op_type(),
                ") mixes element types ", elem_type, " and ",
                state.elem_type);
        }
        input_shapes.push_back(state.shape);
    }
    Dims output_shape;
    try {
        output_shape = propagate_shape(op_type, input_shapes, attributes);
    } catch (const ShapeError &e) {
        ERR(ValidationError, "node ", label, " (", node.op_type(),
            ") has inconsistent shapes: ", e.what());
    } catch (const InvalidUsageError &e) {
        ERR(ValidationError, "node ", label, " (", node.op_type(),
            ") is malformed: ", e.what());
    }
    define(node.output(0), output_shape, elem_type, "node output");
}

ModelSummary ModelChecker::check() {
    check_format();
    const pb::GraphProto &graph = model_.graph();

    ModelSummary summary;
    summary.graph_name = graph.name();
    summary.producer_name = model_.producer_name();
    summary.producer_version = model_.producer_version();
    summary.ir_version = model_.ir_version();
    summary.opset_version = opset_version_;
    summary.num_nodes = graph.node_size();
    summary.num_initializers = graph.initializer_size();

    for (const auto &input : graph.input()) {
        ValueSummary value = check_value_info(input, "input");
        define(value.name, to_dims(value.name, value.dims), value.elem_type,
               "input");
        summary.inputs.push_back(value);
    }
    for (const auto &initializer : graph.initializer()) {
        check_initializer(initializer);
    }
    for (int i = 0; i < graph.node_size(); ++i) {
        check_node(graph.node(i), static_cast<size_t>(i));
    }
    if (graph.output_size() == 0) {
        ERR(ValidationError, "graph ", graph.name(), " has no outputs");
    }
    for (const auto &output : graph.output()) {
        ValueSummary value = check_value_info(output, "output");
        auto it = values_.find(value.name);
        if (it == values_.end()) {
            ERR(ValidationError, "output ", value.name, " is never produced");
        }
        Dims declared = to_dims(value.name, value.dims);
        if (!shape_match(declared, it->second.shape)) {
            ERR(ValidationError, "output ", value.name, " is declared as ",
                declared, " but computes to ", it->second.shape);
        }
        if (value.elem_type != it->second.elem_type) {
            ERR(ValidationError, "output ", value.name,
                " is declared with element type ", value.elem_type,
                " but computes to ", it->second.elem_type);
        }
        summary.outputs.push_back(value);
    }
    return summary;
}

}  // namespace

ModelSummary check_model(const std::string &bytes) {
    pb::ModelProto model;
    if (!model.ParseFromString(bytes)) {
        ERR(ValidationError, "failed to parse ", bytes.size(),
            " bytes as a model");
    }
    ModelSummary summary = ModelChecker(model).check();
    LOG(DEBUG, "checked ", summary.graph_name, ": ", summary.num_nodes,
        " nodes, ", summary.num_initializers, " initializers");
    return summary;
}

bool validate(const Graph &graph, std::string *error) {
    try {
        check_model(serialize(graph));
    } catch (const ValidationError &e) {
        LOG(WARN, "graph ", graph.name(), " failed validation");
        if (error) {
            *error = e.what();
        }
        return false;
    }
    return true;
}

}  // namespace onnx
}  // namespace graft
