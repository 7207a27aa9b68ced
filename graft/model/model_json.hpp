// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODEL_JSON_HPP_
#define GRAFT_MODEL_JSON_HPP_

#include <nlohmann/json.hpp>

namespace graft {

using Json = ::nlohmann::ordered_json;

}  // namespace graft

#endif  // GRAFT_MODEL_JSON_HPP_
