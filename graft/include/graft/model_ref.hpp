// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODEL_REF_HPP
#define GRAFT_MODEL_REF_HPP

#include <memory>

namespace graft {

class ModelOp;
using ModelOpRef = std::shared_ptr<ModelOp>;
using ModelOpConstRef = std::shared_ptr<const ModelOp>;

class ModelBuffer;
using ModelBufferRef = std::shared_ptr<ModelBuffer>;

class ModelTensor;
using ModelTensorRef = std::shared_ptr<ModelTensor>;

}  // namespace graft

#endif  // GRAFT_MODEL_REF_HPP
