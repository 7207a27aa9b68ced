// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "env.hpp"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <type_traits>

#define DEFAULT_GRAFT_LOG_LEVEL "INFO"
#define DEFAULT_GRAFT_OUTPUT_DIR "models"
#define DEFAULT_GRAFT_SEED 42
#define DEFAULT_GRAFT_DUMP_JSON false

template <typename T>
T env(const std::string &env_name, const T &default_val) {
    const char *env_ca = getenv(env_name.c_str());
    if (env_ca == nullptr) {
        return default_val;
    }
    if constexpr (std::is_same<T, int>::value) {
        return atoi(env_ca);
    } else if constexpr (std::is_same<T, bool>::value) {
        std::string env_str(env_ca);
        return (env_str == "1");
    } else {
        return std::string(env_ca);
    }
}

namespace graft {

Env::Env() {
    // Get log level.
    this->log_level =
        env<std::string>("GRAFT_LOG_LEVEL", DEFAULT_GRAFT_LOG_LEVEL);
    // Artifact directory.
    this->path_output_dir =
        env<std::string>("GRAFT_OUTPUT_DIR", DEFAULT_GRAFT_OUTPUT_DIR);
    // Weight seed.
    this->seed = env<int>("GRAFT_SEED", DEFAULT_GRAFT_SEED);
    // If `GRAFT_DUMP_JSON=1`, JSON dumps are written with the artifacts.
    this->dump_json = env<bool>("GRAFT_DUMP_JSON", DEFAULT_GRAFT_DUMP_JSON);
}

// Global Env.
static std::shared_ptr<Env> _GRAFT_ENV_GLOBAL = nullptr;
static std::mutex _GRAFT_ENV_MUTEX;

// Get the global Env.
const Env &get_env(bool reset) {
    std::lock_guard<std::mutex> lock(_GRAFT_ENV_MUTEX);
    if (reset || (_GRAFT_ENV_GLOBAL.get() == nullptr)) {
        _GRAFT_ENV_GLOBAL.reset(new Env);
    }
    return *_GRAFT_ENV_GLOBAL;
}

}  // namespace graft
