// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/graph.hpp"

#include "model/model_json.hpp"
#include "model/model_op.hpp"
#include "model/model_tensor.hpp"

namespace graft {

Graph::Graph(const GraphInfo &info, const std::vector<Tensor> &inputs,
             const std::vector<Tensor> &outputs,
             const std::vector<Tensor> &constants,
             const std::vector<ModelOpRef> &nodes)
    : info_(info),
      inputs_(inputs),
      outputs_(outputs),
      constants_(constants),
      nodes_(nodes.begin(), nodes.end()) {}

std::string Graph::serialize(bool pretty) const {
    Json j;
    j["Name"] = info_.name;
    j["ProducerName"] = info_.producer_name;
    j["ProducerVersion"] = info_.producer_version;
    j["DocString"] = info_.doc_string;
    j["IrVersion"] = info_.ir_version;
    j["OpsetVersion"] = info_.opset_version;
    j["Inputs"] = Json::array();
    for (auto &t : inputs_) {
        j["Inputs"].push_back(t.ref()->serialize());
    }
    j["Outputs"] = Json::array();
    for (auto &t : outputs_) {
        j["Outputs"].push_back(t.name());
    }
    j["Constants"] = Json::array();
    for (auto &t : constants_) {
        j["Constants"].push_back(t.ref()->serialize());
    }
    j["Nodes"] = Json::array();
    for (auto &op : nodes_) {
        j["Nodes"].push_back(op->serialize());
    }
    if (pretty) {
        return j.dump(4);
    }
    return j.dump();
}

}  // namespace graft
