// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/log.hpp"

#include "logging.hpp"

namespace graft {

void log(LogLevel level, const std::string &file, int line,
         const std::string &msg) {
    _log(level, file, line, msg);
}

void set_log_level(LogLevel lv) { get_logging().set_level(lv); }

LogLevel get_log_level() { return get_logging().get_level(); }

}  // namespace graft
