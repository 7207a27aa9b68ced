// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/models.hpp"

namespace graft {

const ModelContract &decision_contract() {
    static const ModelContract contract{"slm_model", "slm.onnx",
                                        {1, DECISION_FEATURES},
                                        {1, DECISION_OUTPUTS}};
    return contract;
}

const ModelContract &embedding_contract() {
    static const ModelContract contract{"embedder_model", "embedder.onnx",
                                        {1, EMBEDDING_INPUT_DIM},
                                        {1, EMBEDDING_DIM}};
    return contract;
}

const std::vector<std::string> &decision_output_fields() {
    static const std::vector<std::string> fields{
        "route", "severity", "p2_enable", "congestion",
        "wfq_p0", "wfq_p1", "wfq_p2"};
    return fields;
}

}  // namespace graft
