// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/model.hpp"
#include "graft/models.hpp"
#include "graft/version.hpp"
#include "logging.hpp"
#include "utils/utils_string.hpp"

namespace graft {

Graph build_decision_graph(Random &random) {
    const ModelContract &contract = decision_contract();
    Model model;

    Tensor input = model.tensor(contract.input_shape, FP32, "input");
    Tensor weights = model.constant(
        random.normal_vector(DECISION_FEATURES * DECISION_OUTPUTS, 0.01f),
        {DECISION_FEATURES, DECISION_OUTPUTS}, "weights");
    // Biases put the scheduler weights near 50/30/20 before scaling.
    Tensor bias = model.constant(
        std::vector<float>{0.5f, 0.3f, 0.4f, 0.2f, 50.0f, 30.0f, 20.0f},
        {DECISION_OUTPUTS}, "bias");

    Tensor logits = model.linear(input, weights, bias);
    Tensor output = model.partition(
        logits,
        {Region::bounded_unit(DECISION_BOUNDED_OUTPUTS),
         Region::non_negative_scaled(DECISION_SCALED_OUTPUTS,
                                     DECISION_OUTPUT_SCALE)},
        "output");

    GraphInfo info;
    info.name = contract.name;
    info.producer_version = version();
    info.doc_string = "Decision model: " +
                      std::to_string(DECISION_FEATURES) + " features -> " +
                      join(decision_output_fields(), ", ");
    Graph graph = model.assemble({output}, info);
    LOG(INFO, "built ", graph.name(), " with ", graph.num_nodes(), " nodes");
    return graph;
}

}  // namespace graft
