// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "unittest/unittest_utils.hpp"

#include <unistd.h>

#include <atomic>
#include <ctime>
#include <filesystem>
#include <vector>

#include "file_io.hpp"

namespace graft {
namespace unittest {

// Temporal unittest states.
struct TempStates {
    std::vector<std::thread *> threads;
};

TempStates GLOBAL_TEMP_STATES_;

// Spawn a thread that runs the given function.
std::thread *spawn_thread(std::function<State()> func) {
    std::thread *t = new std::thread([func]() {
        State ret = func();
        if (ret != SUCCESS) {
            UNITTEST_EXIT(ret, "thread failed");
        }
    });
    GLOBAL_TEMP_STATES_.threads.emplace_back(t);
    return t;
}

// Wait for all threads to finish.
void wait_all_threads() {
    for (std::thread *t : GLOBAL_TEMP_STATES_.threads) {
        if (t->joinable()) {
            t->join();
        }
        delete t;
    }
    GLOBAL_TEMP_STATES_.threads.clear();
}

// Run the given test function.
State test(std::function<State()> test_func) { return test_func(); }

double now() {
    struct timespec tspec;
    if (clock_gettime(CLOCK_MONOTONIC, &tspec) == -1) {
        return -1;
    }
    return static_cast<double>(tspec.tv_sec) +
           static_cast<double>(tspec.tv_nsec) / 1e9;
}

std::string temp_dir(const std::string &prefix) {
    static std::atomic<int> counter{0};
    std::string dir = join_path(
        std::filesystem::temp_directory_path().string(),
        prefix + "_" + std::to_string(getpid()) + "_" +
            std::to_string(counter++));
    create_dir(dir);
    return dir;
}

}  // namespace unittest
}  // namespace graft
