// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_HPP
#define GRAFT_HPP

// clang-format off
#include <graft/version.hpp>
// clang-format on

#include <graft/data_type.hpp>
#include <graft/dims.hpp>
#include <graft/error.hpp>
#include <graft/graph.hpp>
#include <graft/init.hpp>
#include <graft/log.hpp>
#include <graft/model.hpp>
#include <graft/model_graph.hpp>
#include <graft/model_ref.hpp>
#include <graft/models.hpp>
#include <graft/onnx.hpp>
#include <graft/partition.hpp>
#include <graft/random.hpp>
#include <graft/tensor.hpp>

#endif  // GRAFT_HPP
