// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_ENV_HPP_
#define GRAFT_ENV_HPP_

#include <string>

namespace graft {

// Environment variables.
struct Env {
    Env();
    // Log level.
    std::string log_level;
    // Directory where exported model artifacts are written and read.
    std::string path_output_dir;
    // Default seed of the weight generator.
    int seed;
    // If true, a JSON dump is written next to each exported artifact.
    bool dump_json;
};

// Get the global Env.
const Env &get_env(bool reset = false);

}  // namespace graft

#endif  // GRAFT_ENV_HPP_
