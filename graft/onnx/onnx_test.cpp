// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/onnx.hpp"

#include "file_io.hpp"
#include "graft/model.hpp"
#include "model/model_buffer.hpp"
#include "onnx_common.hpp"
#include "unittest/unittest_utils.hpp"

static graft::Graph build_small_graph() {
    graft::Model model;
    graft::Tensor x = model.tensor({1, 6}, graft::FP32, "input");
    graft::Tensor w = model.constant(std::vector<float>(6 * 5, 0.25f), {6, 5},
                                     "weights");
    graft::Tensor b = model.constant(
        std::vector<float>{0.1f, 0.2f, 0.3f, 4.0f, 5.0f}, {5}, "bias");
    graft::Tensor y = model.partition(
        model.linear(x, w, b),
        {graft::Region::bounded_unit(2),
         graft::Region::non_negative_scaled(3, 10.0f)},
        "output");
    graft::GraphInfo info;
    info.name = "small_model";
    info.producer_version = "test";
    info.doc_string = "small";
    return model.assemble({y}, info);
}

static std::string reserialize(const graft::onnx::pb::ModelProto &model) {
    std::string bytes;
    if (!model.SerializeToString(&bytes)) {
        UNITTEST_UEXIT("failed to serialize a model");
    }
    return bytes;
}

graft::unittest::State test_onnx_to_proto() {
    graft::Graph graph = build_small_graph();
    graft::onnx::pb::ModelProto model = graft::onnx::to_proto(graph);
    UNITTEST_EQ(model.ir_version(), 10);
    UNITTEST_EQ(model.producer_name(), "telemetry_ai");
    UNITTEST_EQ(model.opset_import_size(), 1);
    UNITTEST_EQ(model.opset_import(0).domain(), "");
    UNITTEST_EQ(model.opset_import(0).version(), 13);

    const auto &g = model.graph();
    UNITTEST_EQ(g.name(), "small_model");
    UNITTEST_EQ(g.input_size(), 1);
    UNITTEST_EQ(g.input(0).name(), "input");
    UNITTEST_EQ(g.input(0).type().tensor_type().elem_type(), 1);
    UNITTEST_EQ(g.input(0).type().tensor_type().shape().dim(1).dim_value(),
                6);
    UNITTEST_EQ(g.output(0).name(), "output");
    UNITTEST_EQ(g.node(0).op_type(), "MatMul");
    UNITTEST_EQ(g.node(1).op_type(), "Add");

    // weights, bias, 2 x 3 slice indices, 1 scale
    UNITTEST_EQ(g.initializer_size(), 9);
    UNITTEST_EQ(g.initializer(0).name(), "weights");
    UNITTEST_EQ(g.initializer(0).raw_data().size(), 6 * 5 * 4);
    UNITTEST_EQ(g.initializer(2).data_type(), 7);

    const auto &concat = g.node(g.node_size() - 1);
    UNITTEST_EQ(concat.op_type(), "Concat");
    UNITTEST_EQ(concat.attribute_size(), 1);
    UNITTEST_EQ(concat.attribute(0).name(), "axis");
    UNITTEST_EQ(concat.attribute(0).i(), 1);

    // The scale factor is a rank-0 initializer.
    bool found_scale = false;
    for (const auto &init : g.initializer()) {
        if (init.name() == "region1_scale") {
            found_scale = true;
            UNITTEST_EQ(init.dims_size(), 0);
            UNITTEST_EQ(graft::decode_floats(init.raw_data())[0], 10.0f);
        }
    }
    UNITTEST_TRUE(found_scale);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_onnx_deterministic() {
    std::string a = graft::onnx::serialize(build_small_graph());
    std::string b = graft::onnx::serialize(build_small_graph());
    UNITTEST_TRUE(a == b);
    UNITTEST_LT(0, a.size());
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_onnx_dynamic_dim() {
    graft::Model model;
    graft::Tensor x =
        model.tensor({graft::DYNAMIC_DIM, 4}, graft::FP32, "input");
    graft::Tensor y = model.relu(x, "output");
    graft::GraphInfo info;
    info.name = "dynamic";
    graft::Graph graph = model.assemble({y}, info);

    auto proto = graft::onnx::to_proto(graph);
    const auto &dim = proto.graph().input(0).type().tensor_type().shape().dim(0);
    UNITTEST_TRUE(dim.has_dim_param());
    UNITTEST_EQ(dim.dim_param(), "N");

    auto summary = graft::onnx::check_model(graft::onnx::serialize(graph));
    UNITTEST_EQ(summary.inputs[0].dims[0], 0);
    UNITTEST_EQ(summary.outputs[0].dims[1], 4);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_onnx_check_model() {
    graft::Graph graph = build_small_graph();
    std::string error;
    UNITTEST_TRUE(graft::onnx::validate(graph, &error));
    UNITTEST_TRUE(error.empty());

    auto summary = graft::onnx::check_model(graft::onnx::serialize(graph));
    UNITTEST_EQ(summary.graph_name, "small_model");
    UNITTEST_EQ(summary.ir_version, 10);
    UNITTEST_EQ(summary.opset_version, 13);
    UNITTEST_EQ(summary.num_nodes, graph.num_nodes());
    UNITTEST_EQ(summary.outputs[0].dims.size(), 2);
    UNITTEST_EQ(summary.outputs[0].dims[1], 5);

    UNITTEST_THROW(graft::onnx::check_model("not a model"),
                   graft::ValidationError);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_onnx_check_model_rejects() {
    const graft::onnx::pb::ModelProto base =
        graft::onnx::to_proto(build_small_graph());

    {
        // Missing IR version.
        auto model = base;
        model.clear_ir_version();
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    {
        // Missing operator set.
        auto model = base;
        model.clear_opset_import();
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    {
        // Nodes out of topological order.
        auto model = base;
        model.mutable_graph()->mutable_node()->SwapElements(0, 1);
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    {
        // Duplicate names.
        auto model = base;
        model.mutable_graph()->mutable_initializer(1)->set_name("weights");
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    {
        // Payload does not match the dims.
        auto model = base;
        model.mutable_graph()->mutable_initializer(0)->set_dims(0, 7);
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    {
        // Unsupported operator.
        auto model = base;
        model.mutable_graph()->mutable_node(0)->set_op_type("Conv");
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    {
        // Wrong arity.
        auto model = base;
        model.mutable_graph()->mutable_node(0)->add_input("bias");
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    {
        // Declared output shape disagrees with the computed one.
        auto model = base;
        model.mutable_graph()
            ->mutable_output(0)
            ->mutable_type()
            ->mutable_tensor_type()
            ->mutable_shape()
            ->mutable_dim(1)
            ->set_dim_value(6);
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    {
        // Output that nothing produces.
        auto model = base;
        model.mutable_graph()->mutable_output(0)->set_name("ghost");
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    {
        // Slice bounds outside of the input.
        auto model = base;
        for (auto &init : *model.mutable_graph()->mutable_initializer()) {
            if (init.name() == "region1_slice_ends") {
                init.set_raw_data(graft::ModelBuffer::from_int64s({9})->data());
            }
        }
        UNITTEST_THROW(graft::onnx::check_model(reserialize(model)),
                       graft::ValidationError);
    }
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_onnx_artifact() {
    std::string dir = graft::unittest::temp_dir("graft_onnx_test");
    std::string path = graft::join_path(graft::join_path(dir, "nested"),
                                        "small.onnx");
    graft::Graph graph = build_small_graph();
    graft::onnx::save(graph, path);
    UNITTEST_TRUE(graft::is_file(path));
    UNITTEST_TRUE(graft::read_file(path) == graft::onnx::serialize(graph));

    graft::ModelContract good{"small_model", "small.onnx", {1, 6}, {1, 5}};
    auto summary = graft::onnx::check_artifact(path, good);
    UNITTEST_EQ(summary.inputs[0].name, "input");

    graft::ModelContract bad{"small_model", "small.onnx", {1, 7}, {1, 4}};
    UNITTEST_THROW(graft::onnx::check_artifact(path, bad),
                   graft::ValidationError);

    UNITTEST_THROW(graft::onnx::load(graft::join_path(dir, "missing.onnx")),
                   graft::SystemError);

    graft::write_file(path, "garbage");
    UNITTEST_THROW(graft::onnx::load(path), graft::ValidationError);
    graft::remove_file(path);
    return graft::unittest::SUCCESS;
}

int main() {
    UNITTEST(test_onnx_to_proto);
    UNITTEST(test_onnx_deterministic);
    UNITTEST(test_onnx_dynamic_dim);
    UNITTEST(test_onnx_check_model);
    UNITTEST(test_onnx_check_model_rejects);
    UNITTEST(test_onnx_artifact);
    return 0;
}
