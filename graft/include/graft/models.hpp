// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODELS_HPP
#define GRAFT_MODELS_HPP

#include <string>
#include <vector>

#include "dims.hpp"
#include "graph.hpp"
#include "random.hpp"

namespace graft {

/// Number of input features of the decision graph.
constexpr DimType DECISION_FEATURES = 269;
/// Number of outputs of the decision graph.
constexpr DimType DECISION_OUTPUTS = 7;
/// Leading outputs squashed into (0, 1).
constexpr DimType DECISION_BOUNDED_OUTPUTS = 4;
/// Trailing outputs clamped at zero and scaled.
constexpr DimType DECISION_SCALED_OUTPUTS = 3;
constexpr float DECISION_OUTPUT_SCALE = 100.0f;

constexpr DimType EMBEDDING_INPUT_DIM = 1024;
constexpr DimType EMBEDDING_DIM = 128;

/// Expected signature of an exported model file.
struct ModelContract {
    std::string name;
    std::string file_name;
    Dims input_shape;
    Dims output_shape;
};

const ModelContract &decision_contract();

const ModelContract &embedding_contract();

/// Names of the decision outputs in the order of the output vector.
const std::vector<std::string> &decision_output_fields();

/// Build the decision graph `slm_model`, `input[1,269] -> output[1,7]`.
/// Weights are drawn from @p random.
Graph build_decision_graph(Random &random);

/// Build the embedding graph `embedder_model`,
/// `input[1,1024] -> output[1,128]`. Weights, then biases, are drawn from
/// @p random.
Graph build_embedding_graph(Random &random);

}  // namespace graft

#endif  // GRAFT_MODELS_HPP
