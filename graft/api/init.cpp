// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/init.hpp"

#include "env.hpp"
#include "logging.hpp"

namespace graft {

void init() {
    // Get the environment variables.
    const Env &env = get_env(true);
    get_logging().set_level(parse_log_level(env.log_level));
    LOG(DEBUG, "init graft: output_dir ", env.path_output_dir, " seed ",
        env.seed);
}

}  // namespace graft
