// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <map>

#include "graft/onnx.hpp"
#include "logging.hpp"
#include "model/model_buffer.hpp"
#include "model/model_data_type.hpp"
#include "model/model_op.hpp"
#include "model/model_tensor.hpp"
#include "onnx_common.hpp"

namespace graft {
namespace onnx {

const char *const DYNAMIC_DIM_PARAM = "N";

static const std::map<std::string, std::string> &op_type_table() {
    static const std::map<std::string, std::string> table{
        {"Add", "Add"},         {"Concat", "Concat"}, {"Matmul", "MatMul"},
        {"Mul", "Mul"},         {"Relu", "Relu"},     {"Sigmoid", "Sigmoid"},
        {"Slice", "Slice"},     {"Tanh", "Tanh"},
    };
    return table;
}

const std::string &to_onnx_op_type(const std::string &op_type) {
    const auto &table = op_type_table();
    auto it = table.find(op_type);
    if (it == table.end()) {
        ERR(InvalidUsageError, "op type ", op_type,
            " has no interchange equivalent");
    }
    return it->second;
}

const std::string &from_onnx_op_type(const std::string &onnx_op_type) {
    for (const auto &kv : op_type_table()) {
        if (kv.second == onnx_op_type) {
            return kv.first;
        }
    }
    ERR(ValidationError, "unsupported operator: ", onnx_op_type);
    return onnx_op_type;
}

static void fill_value_info(pb::ValueInfoProto *value, const Tensor &tensor) {
    value->set_name(tensor.name());
    auto *tensor_type = value->mutable_type()->mutable_tensor_type();
    tensor_type->set_elem_type(tensor.data_type().onnx_type());
    auto *shape = tensor_type->mutable_shape();
    const Dims &dims = tensor.ref()->shape();
    for (DimType d : dims.vector()) {
        auto *dim = shape->add_dim();
        if (d == DYNAMIC_DIM) {
            dim->set_dim_param(DYNAMIC_DIM_PARAM);
        } else {
            dim->set_dim_value(d);
        }
    }
}

static void fill_initializer(pb::TensorProto *initializer,
                             const Tensor &constant) {
    ModelTensorRef ref = constant.ref();
    initializer->set_name(ref->name());
    initializer->set_data_type(ref->data_type()->onnx_type());
    for (DimType d : ref->shape().vector()) {
        initializer->add_dims(d);
    }
    initializer->set_raw_data(ref->buffer()->data());
}

static void fill_node(pb::NodeProto *node, const ModelOpConstRef &op) {
    const std::string &op_type = op->type()->type_name();
    node->set_name(op->name());
    node->set_op_type(to_onnx_op_type(op_type));
    for (auto &name : op->input_names()) {
        node->add_input(name);
    }
    for (auto &name : op->output_names()) {
        node->add_output(name);
    }
    if (op_type == "Concat") {
        int64_t axis = op->args().value("Axis", int64_t{-1});
        int ndims = op->result_tensors()[0]->shape().ndims();
        auto *attr = node->add_attribute();
        attr->set_name("axis");
        attr->set_type(pb::AttributeProto::INT);
        attr->set_i(axis < 0 ? axis + ndims : axis);
    }
}

pb::ModelProto to_proto(const Graph &graph) {
    const GraphInfo &info = graph.info();
    pb::ModelProto model;
    model.set_ir_version(info.ir_version);
    model.set_producer_name(info.producer_name);
    model.set_producer_version(info.producer_version);
    if (!info.doc_string.empty()) {
        model.set_doc_string(info.doc_string);
    }
    auto *opset = model.add_opset_import();
    opset->set_domain("");
    opset->set_version(info.opset_version);

    auto *graph_proto = model.mutable_graph();
    graph_proto->set_name(info.name);
    for (auto &op : graph.nodes()) {
        fill_node(graph_proto->add_node(), op);
    }
    for (auto &constant : graph.constants()) {
        fill_initializer(graph_proto->add_initializer(), constant);
    }
    for (auto &input : graph.inputs()) {
        fill_value_info(graph_proto->add_input(), input);
    }
    for (auto &output : graph.outputs()) {
        fill_value_info(graph_proto->add_output(), output);
    }
    return model;
}

std::string serialize(const Graph &graph) {
    pb::ModelProto model = to_proto(graph);
    std::string bytes;
    {
        google::protobuf::io::StringOutputStream stream(&bytes);
        google::protobuf::io::CodedOutputStream coded(&stream);
        coded.SetSerializationDeterministic(true);
        if (!model.SerializeToCodedStream(&coded)) {
            ERR(InternalError, "failed to serialize graph ", graph.name());
        }
    }
    LOG(DEBUG, "serialized ", graph.name(), " into ", bytes.size(),
        " bytes");
    return bytes;
}

}  // namespace onnx
}  // namespace graft
