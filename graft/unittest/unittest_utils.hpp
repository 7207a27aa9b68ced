// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_UNITTEST_UNITTEST_UTILS_HPP_
#define GRAFT_UNITTEST_UNITTEST_UTILS_HPP_

#include <cstdlib>
#include <functional>
#include <iomanip>
#include <string>
#include <thread>
#include <type_traits>

#include "graft/init.hpp"
#include "logging.hpp"

namespace graft {
namespace unittest {

typedef enum { SUCCESS = 0, FAILURE, UNEXPECTED } State;

std::thread *spawn_thread(std::function<State()> func);
void wait_all_threads();

State test(std::function<State()> test_func);

/// Monotonic time in seconds.
double now();

/// A fresh directory under the system temporary directory.
std::string temp_dir(const std::string &prefix);

}  // namespace unittest
}  // namespace graft

// Run the given test function.
#define UNITTEST(test_func)                                             \
    do {                                                                \
        graft::init();                                                  \
        LOG(graft::INFO, "unittest start: " #test_func);                \
        double _s = graft::unittest::now();                             \
        graft::unittest::State _ret;                                    \
        _ret = graft::unittest::test(test_func);                        \
        double _e = graft::unittest::now() - _s;                        \
        if (_ret != graft::unittest::SUCCESS) {                         \
            UNITTEST_EXIT(_ret, "unittest failed");                     \
        }                                                               \
        LOG(graft::INFO, "unittest succeed: " #test_func " (elapsed ",  \
            std::setprecision(4), _e, "s)");                            \
    } while (0)

// Exit with proper error messages and return values.
#define UNITTEST_EXIT(state, ...)                                       \
    do {                                                                \
        if ((state) == graft::unittest::FAILURE) {                      \
            ERR(graft::UnitTestError, "unittest failed: ", __VA_ARGS__); \
        } else if ((state) == graft::unittest::UNEXPECTED) {            \
            ERR(graft::UnitTestError,                                   \
                "Unexpected error during unittest: \"", __VA_ARGS__,    \
                "\"");                                                  \
        } else if ((state) == graft::unittest::SUCCESS) {               \
            LOG(graft::INFO, "unittest succeed");                       \
        }                                                               \
        std::exit(state);                                               \
    } while (0)

// Fail the test.
#define UNITTEST_FEXIT(...) \
    UNITTEST_EXIT(graft::unittest::FAILURE, __VA_ARGS__)

// Unexpected error during test.
#define UNITTEST_UEXIT(...) \
    UNITTEST_EXIT(graft::unittest::UNEXPECTED, __VA_ARGS__)

// Check if the given condition is true.
#define UNITTEST_TRUE(cond)                             \
    do {                                                \
        if (cond) {                                     \
            break;                                      \
        }                                               \
        UNITTEST_FEXIT("condition `" #cond "` failed"); \
    } while (0)

// Check if the given condition is false.
#define UNITTEST_FALSE(cond)                                \
    do {                                                    \
        if (cond) {                                         \
            UNITTEST_FEXIT("condition `" #cond "` failed"); \
        }                                                   \
        break;                                              \
    } while (0)

// Check if the given expressions are equal.
#define UNITTEST_EQ(exp0, exp1)                                \
    do {                                                       \
        auto _v0 = (exp0);                                     \
        auto _v1 = (exp1);                                     \
        if (_v0 == static_cast<decltype(_v0)>(_v1)) {          \
            break;                                             \
        }                                                      \
        UNITTEST_FEXIT("`" #exp0 "` (value: ", _v0,            \
                       ") != `" #exp1 "` (value: ", _v1, ")"); \
    } while (0)

// Check if the given expressions are not equal.
#define UNITTEST_NE(exp0, exp1)                                \
    do {                                                       \
        auto _v0 = (exp0);                                     \
        auto _v1 = (exp1);                                     \
        if (_v0 != static_cast<decltype(_v0)>(_v1)) {          \
            break;                                             \
        }                                                      \
        UNITTEST_FEXIT("`" #exp0 "` (value: ", _v0,            \
                       ") == `" #exp1 "` (value: ", _v1, ")"); \
    } while (0)

// Check if the `exp0` is less than `exp1`.
#define UNITTEST_LT(exp0, exp1)                                \
    do {                                                       \
        auto _v0 = (exp0);                                     \
        auto _v1 = (exp1);                                     \
        if (_v0 < static_cast<decltype(_v0)>(_v1)) {           \
            break;                                             \
        }                                                      \
        UNITTEST_FEXIT("`" #exp0 "` (value: ", _v0,            \
                       ") >= `" #exp1 "` (value: ", _v1, ")"); \
    } while (0)

// Check if the given expression throws the given exception or a subclass of
// it.
#define UNITTEST_THROW(exp, _exception)                                  \
    do {                                                                \
        try {                                                           \
            (exp);                                                      \
        } catch (const _exception &) {                                  \
            break;                                                      \
        } catch (const graft::BaseError &e) {                           \
            UNITTEST_FEXIT("`" #exp "` unexpectedly throws: ", e.what()); \
        } catch (const std::exception &e) {                             \
            UNITTEST_FEXIT("`" #exp "` throws an unknown exception: ",  \
                           e.what());                                   \
        }                                                               \
        UNITTEST_FEXIT("`" #exp "` does not throw");                    \
    } while (0)

// Log a message.
#define UNITTEST_LOG(...) LOG(graft::INFO, __VA_ARGS__)

#endif  // GRAFT_UNITTEST_UNITTEST_UTILS_HPP_
