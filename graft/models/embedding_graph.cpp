// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/model.hpp"
#include "graft/models.hpp"
#include "graft/version.hpp"
#include "logging.hpp"

namespace graft {

Graph build_embedding_graph(Random &random) {
    const ModelContract &contract = embedding_contract();
    Model model;

    Tensor input = model.tensor(contract.input_shape, FP32, "input");
    Tensor weights = model.constant(
        random.normal_vector(EMBEDDING_INPUT_DIM * EMBEDDING_DIM, 0.1f),
        {EMBEDDING_INPUT_DIM, EMBEDDING_DIM}, "embed_weights");
    Tensor bias = model.constant(random.normal_vector(EMBEDDING_DIM, 0.1f),
                                 {EMBEDDING_DIM}, "embed_bias");

    Tensor projected = model.linear(input, weights, bias);
    Tensor output = model.tanh(projected, "output");

    GraphInfo info;
    info.name = contract.name;
    info.producer_version = version();
    info.doc_string = "Embedding model: " +
                      std::to_string(EMBEDDING_INPUT_DIM) + " -> " +
                      std::to_string(EMBEDDING_DIM) + " dimensions";
    Graph graph = model.assemble({output}, info);
    LOG(INFO, "built ", graph.name(), " with ", graph.num_nodes(), " nodes");
    return graph;
}

}  // namespace graft
