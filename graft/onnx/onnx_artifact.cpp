// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include <sstream>

#include "file_io.hpp"
#include "graft/onnx.hpp"
#include "logging.hpp"
#include "utils/utils_string.hpp"

namespace graft {
namespace onnx {

static std::string dims_string(const std::vector<int64_t> &dims) {
    std::stringstream ss;
    ss << Dims(dims);
    return ss.str();
}

void save(const Graph &graph, const std::string &path) {
    std::string bytes = serialize(graph);
    std::string dir = get_dir(path);
    if (!dir.empty() && !is_exist(dir)) {
        create_dir(dir);
    }
    write_file(path, bytes);
    LOG(INFO, "saved ", graph.name(), " to ", path, " (", bytes.size(),
        " bytes)");
}

ModelSummary load(const std::string &path) {
    if (!is_file(path)) {
        ERR(SystemError, "model file ", path, " does not exist");
    }
    return check_model(read_file(path));
}

ModelSummary check_artifact(const std::string &path,
                            const ModelContract &contract) {
    ModelSummary summary = load(path);
    std::vector<std::string> mismatches;
    if (summary.graph_name != contract.name) {
        mismatches.push_back("graph name is " + summary.graph_name +
                             ", expected " + contract.name);
    }
    if (summary.inputs.size() != 1) {
        mismatches.push_back("has " + std::to_string(summary.inputs.size()) +
                             " inputs, expected 1");
    } else if (summary.inputs[0].dims != contract.input_shape.vector()) {
        mismatches.push_back(
            "input shape is " + dims_string(summary.inputs[0].dims) +
            ", expected " + dims_string(contract.input_shape.vector()));
    }
    if (summary.outputs.size() != 1) {
        mismatches.push_back("has " + std::to_string(summary.outputs.size()) +
                             " outputs, expected 1");
    } else if (summary.outputs[0].dims != contract.output_shape.vector()) {
        mismatches.push_back(
            "output shape is " + dims_string(summary.outputs[0].dims) +
            ", expected " + dims_string(contract.output_shape.vector()));
    }
    if (!mismatches.empty()) {
        ERR(ValidationError, path, " breaks the ", contract.name,
            " contract: ", join(mismatches, "; "));
    }
    return summary;
}

}  // namespace onnx
}  // namespace graft
