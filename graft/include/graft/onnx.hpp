// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_ONNX_HPP
#define GRAFT_ONNX_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "dims.hpp"
#include "graph.hpp"
#include "models.hpp"

namespace graft {
namespace onnx {

/// Signature entry of a loaded model.
struct ValueSummary {
    std::string name;
    int elem_type;
    /// Extents of the value. A symbolic extent is reported as zero.
    std::vector<int64_t> dims;
};

/// Structure of a loaded model file.
struct ModelSummary {
    std::string graph_name;
    std::string producer_name;
    std::string producer_version;
    int64_t ir_version;
    int64_t opset_version;
    std::vector<ValueSummary> inputs;
    std::vector<ValueSummary> outputs;
    size_t num_nodes;
    size_t num_initializers;
};

/// Serialize @p graph into ONNX model bytes. Equal graphs give equal bytes.
std::string serialize(const Graph &graph);

/// Parse and structurally check ONNX model bytes. Throws ValidationError on
/// the first violation.
ModelSummary check_model(const std::string &bytes);

/// Serialize then check @p graph. Returns false and fills @p error instead
/// of throwing.
bool validate(const Graph &graph, std::string *error = nullptr);

/// Write @p graph to @p path. Throws SystemError if the file cannot be
/// written.
void save(const Graph &graph, const std::string &path);

/// Read and check the model at @p path.
ModelSummary load(const std::string &path);

/// Load the model at @p path and check its single input and output against
/// @p contract. All mismatches are reported in one ValidationError.
ModelSummary check_artifact(const std::string &path,
                            const ModelContract &contract);

}  // namespace onnx
}  // namespace graft

#endif  // GRAFT_ONNX_HPP
