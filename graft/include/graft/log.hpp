// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_LOG_HPP
#define GRAFT_LOG_HPP

#include <string>

namespace graft {

typedef enum { DEBUG, INFO, WARN, ERROR } LogLevel;

void log(LogLevel level, const std::string &file, int line,
         const std::string &msg);

void set_log_level(LogLevel lv);

LogLevel get_log_level();

}  // namespace graft

#endif  // GRAFT_LOG_HPP
