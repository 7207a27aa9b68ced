// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/model.hpp"
#include "model/model_op.hpp"

namespace graft {

Dims propagate_shape(const std::string &op_type,
                     const std::vector<Dims> &input_shapes,
                     const OpAttributes &attributes) {
    Json args = Json::object();
    for (auto &kv : attributes) {
        args[kv.first] = kv.second;
    }
    return model_op_factory()->construct(op_type, args)->infer_shape(
        input_shapes);
}

}  // namespace graft
