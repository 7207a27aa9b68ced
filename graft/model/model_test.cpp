// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/model.hpp"

#include <type_traits>

#include "model_buffer.hpp"
#include "model_op.hpp"
#include "model_tensor.hpp"
#include "unittest/unittest_utils.hpp"

graft::unittest::State test_model_basics() {
    graft::Model model;

    // Model graph:
    //
    //   input --+--> Matmul --> matmul --+--> Add --> add
    //           |                        |
    //   w ------+               b -------+
    //

    graft::Tensor input = model.tensor({1, 4}, graft::FP32, "input");
    graft::Tensor w = model.constant(std::vector<float>(8, 0.5f), {4, 2}, "w");
    graft::Tensor b = model.constant(std::vector<float>{1, 2}, {2}, "b");
    graft::Tensor y = model.linear(input, w, b);

    UNITTEST_TRUE(model.verify());
    UNITTEST_EQ(model.num_nodes(), 2);
    UNITTEST_EQ(model.num_tensors(), 5);
    UNITTEST_EQ(y.shape(), graft::Dims(1, 2));
    UNITTEST_EQ(y.name(), "add");
    UNITTEST_TRUE(y.data_type() == graft::FP32);
    UNITTEST_FALSE(y.is_constant());
    UNITTEST_TRUE(w.is_constant());

    auto nodes = model.nodes();
    UNITTEST_EQ(nodes[0]->type()->type_name(), "Matmul");
    UNITTEST_EQ(nodes[0]->name(), "matmul");
    UNITTEST_EQ(nodes[0]->input_tensors()[0], input.ref());
    UNITTEST_EQ(nodes[0]->input_tensors()[1], w.ref());
    UNITTEST_EQ(nodes[1]->input_tensors()[0], nodes[0]->result_tensors()[0]);
    UNITTEST_EQ(nodes[1]->result_tensors()[0], y.ref());
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_model_append_by_name() {
    graft::Model model;
    model.tensor({1, 7}, graft::FP32, "x");
    auto out = model.append("Sigmoid", {"x"});
    UNITTEST_EQ(out.size(), 1);
    UNITTEST_EQ(out[0], "sigmoid");
    out = model.append("Sigmoid", {"x"});
    UNITTEST_EQ(out[0], "sigmoid_1");
    out = model.append("Relu", {"sigmoid_1"}, {}, "act");
    UNITTEST_EQ(out[0], "act");
    UNITTEST_EQ(model.lookup("act").shape(), graft::Dims(1, 7));

    // A user name that is taken is made unique as well.
    out = model.append("Relu", {"x"}, {}, "act");
    UNITTEST_EQ(out[0], "act_1");
    UNITTEST_TRUE(model.verify());
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_model_slice_constants() {
    graft::Model model;
    graft::Tensor x = model.tensor({1, 7}, graft::FP32, "x");
    graft::Tensor s = model.slice(x, 4, 7, -1, "tail");
    UNITTEST_EQ(s.name(), "tail");
    UNITTEST_EQ(s.shape(), graft::Dims(1, 3));

    auto op = model.nodes().back();
    UNITTEST_EQ(op->input_tensors().size(), 4);
    UNITTEST_EQ(op->input_names()[1], "tail_starts");
    UNITTEST_EQ(op->input_names()[2], "tail_ends");
    UNITTEST_EQ(op->input_names()[3], "tail_axes");

    graft::Tensor starts = model.lookup("tail_starts");
    graft::Tensor axes = model.lookup("tail_axes");
    UNITTEST_TRUE(starts.data_type() == graft::INT64);
    UNITTEST_EQ(starts.shape(), graft::Dims(1));
    UNITTEST_TRUE(starts.is_constant());
    // The axis is stored normalized.
    UNITTEST_EQ(axes.ref()->buffer()->int64s()[0], 1);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_model_failed_append_is_atomic() {
    graft::Model model;
    graft::Tensor x = model.tensor({1, 269}, graft::FP32, "x");
    graft::Tensor w = model.constant(std::vector<float>(268 * 7, 0.0f),
                                     {268, 7}, "w");
    size_t num_tensors = model.num_tensors();
    std::string before = model.serialize();

    UNITTEST_THROW(model.matmul(x, w), graft::ShapeMismatchError);
    UNITTEST_THROW(model.slice(x, 0, 300), graft::SliceRangeError);
    UNITTEST_THROW(model.append("Add", {"x", "missing"}),
                   graft::UnknownTensorError);
    UNITTEST_THROW(model.append("Concat", {}), graft::InvalidUsageError);
    UNITTEST_THROW(model.append("Sigmoid", {"x", "w"}),
                   graft::InvalidUsageError);
    UNITTEST_THROW(model.scale(graft::Tensor(), 2.0f),
                   graft::UnknownTensorError);

    UNITTEST_EQ(model.num_nodes(), 0);
    UNITTEST_EQ(model.num_tensors(), num_tensors);
    UNITTEST_EQ(model.serialize(), before);

    // The model is still usable after a failure.
    graft::Tensor y = model.sigmoid(x);
    UNITTEST_EQ(y.name(), "sigmoid");
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_model_duplicate_and_foreign_tensors() {
    graft::Model model;
    model.tensor({1, 4}, graft::FP32, "input");
    UNITTEST_THROW(model.tensor({1, 4}, graft::FP32, "input"),
                   graft::DuplicateDeclarationError);
    UNITTEST_THROW(model.constant(1.0f, "input"),
                   graft::DuplicateDeclarationError);

    // Unnamed declarations get generated names.
    graft::Tensor anon = model.tensor({1, 4});
    UNITTEST_EQ(anon.name(), "input_1");

    // A tensor of another model is rejected even if its name exists here.
    graft::Model other;
    graft::Tensor foreign = other.tensor({1, 4}, graft::FP32, "input");
    UNITTEST_THROW(model.relu(foreign), graft::UnknownTensorError);
    UNITTEST_EQ(model.num_nodes(), 0);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_model_data_types() {
    graft::Model model;
    graft::Tensor x = model.tensor({1, 3}, graft::FP32, "x");
    graft::Tensor idx =
        model.constant(std::vector<int64_t>{1, 2, 3}, {1, 3}, "idx");
    size_t num_tensors = model.num_tensors();
    UNITTEST_THROW(model.add(x, idx), graft::ModelError);
    UNITTEST_THROW(model.append("Concat", {"x", "x", "idx"}, {{"Axis", 0}}),
                   graft::ModelError);
    UNITTEST_THROW(model.scale(idx, 2.0f), graft::ModelError);
    UNITTEST_EQ(model.num_tensors(), num_tensors);
    UNITTEST_THROW(model.constant(std::vector<float>{1, 2}, {3}, "short"),
                   graft::InvalidUsageError);
    UNITTEST_EQ(model.num_nodes(), 0);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_model_scale() {
    graft::Model model;
    graft::Tensor x = model.tensor({1, 3}, graft::FP32, "x");
    graft::Tensor y = model.scale(x, 100.0f);
    graft::Tensor z = model.scale(y, 0.5f, "half");
    UNITTEST_EQ(y.name(), "mul");
    UNITTEST_EQ(z.name(), "half");

    graft::Tensor factor = model.lookup("scale");
    UNITTEST_EQ(factor.shape().ndims(), 0);
    UNITTEST_EQ(factor.ref()->buffer()->floats()[0], 100.0f);
    UNITTEST_EQ(model.lookup("half_factor").ref()->buffer()->floats()[0],
                0.5f);

    // Repeated calls get fresh factor names like every other helper.
    graft::Tensor w = model.scale(z, 2.0f);
    graft::Tensor v = model.scale(w, 3.0f);
    UNITTEST_EQ(w.name(), "mul_1");
    UNITTEST_EQ(v.name(), "mul_2");
    UNITTEST_EQ(model.lookup("scale_1").ref()->buffer()->floats()[0], 2.0f);
    UNITTEST_EQ(model.lookup("scale_2").ref()->buffer()->floats()[0], 3.0f);
    graft::Tensor u = model.scale(v, 4.0f, "half");
    UNITTEST_EQ(u.name(), "half_1");
    UNITTEST_EQ(model.lookup("half_factor_1").ref()->buffer()->floats()[0],
                4.0f);
    UNITTEST_TRUE(model.verify());
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_model_assemble() {
    graft::Model model;
    graft::Tensor x = model.tensor({1, 4}, graft::FP32, "input");
    graft::Tensor w = model.constant(std::vector<float>(4, 1.0f), {4, 1}, "w");
    graft::Tensor y = model.tanh(model.matmul(x, w), "output");

    graft::GraphInfo info;
    info.doc_string = "tiny";
    graft::Graph graph = model.assemble("tiny_model", {"output"}, info);
    UNITTEST_EQ(graph.name(), "tiny_model");
    UNITTEST_EQ(graph.info().producer_name, "telemetry_ai");
    UNITTEST_EQ(graph.info().ir_version, 10);
    UNITTEST_EQ(graph.info().opset_version, 13);
    UNITTEST_EQ(graph.inputs().size(), 1);
    UNITTEST_EQ(graph.inputs()[0], x);
    UNITTEST_EQ(graph.outputs().size(), 1);
    UNITTEST_EQ(graph.outputs()[0], y);
    UNITTEST_EQ(graph.constants().size(), 1);
    UNITTEST_EQ(graph.num_nodes(), 2);

    UNITTEST_THROW(model.assemble("tiny_model", {"nope"}),
                   graft::UnresolvedOutputError);
    UNITTEST_THROW(model.assemble("tiny_model", {}),
                   graft::UnresolvedOutputError);

    // The graph does not change when the model grows afterwards.
    model.relu(y);
    UNITTEST_EQ(graph.num_nodes(), 2);
    UNITTEST_EQ(model.num_nodes(), 3);

    // Nodes are handed out read-only.
    static_assert(std::is_const<std::remove_reference<
                      decltype(*graph.nodes()[0])>::type>::value,
                  "graph nodes must be immutable");
    static_assert(std::is_const<std::remove_reference<
                      decltype(*model.nodes()[0])>::type>::value,
                  "model nodes must be immutable");
    UNITTEST_EQ(graph.nodes()[1]->name(), "output");
    UNITTEST_EQ(graph.nodes()[1]->output_names()[0], "output");
    return graft::unittest::SUCCESS;
}

int main() {
    UNITTEST(test_model_basics);
    UNITTEST(test_model_append_by_name);
    UNITTEST(test_model_slice_constants);
    UNITTEST(test_model_failed_append_is_atomic);
    UNITTEST(test_model_duplicate_and_foreign_tensors);
    UNITTEST(test_model_data_types);
    UNITTEST(test_model_scale);
    UNITTEST(test_model_assemble);
    return 0;
}
