// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "logging.hpp"

#include <unistd.h>

#include <iomanip>
#include <iostream>

#include "env.hpp"

namespace graft {

LogLevel parse_log_level(const std::string &name) {
    if (name == "DEBUG") return DEBUG;
    if (name == "WARN") return WARN;
    if (name == "ERROR") return ERROR;
    return INFO;
}

static const char *level_name(LogLevel level) {
    switch (level) {
        case DEBUG:
            return "DEBUG";
        case INFO:
            return "INFO";
        case WARN:
            return "WARN";
        case ERROR:
            return "ERROR";
    }
    return "?";
}

Logging::Logging(LogLevel level) : pid_{::getpid()}, level_{level} {}

std::string Logging::header(LogLevel level, const std::string &file,
                            int line) const {
    // Paths are shown relative to the source root.
    size_t pos = file.rfind("graft/");
    std::string file_name =
        pos == std::string::npos ? file : file.substr(pos + 6);
    std::stringstream ss;
    ss << "GRAFT " << std::setw(5) << pid_ << ' ' << level_name(level) << ' '
       << file_name << ':' << line << ' ';
    return ss.str();
}

void Logging::write(const std::string &record) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::clog << record << std::endl;
}

Logging &get_logging() {
    static Logging graft_logging(parse_log_level(get_env().log_level));
    return graft_logging;
}

}  // namespace graft
