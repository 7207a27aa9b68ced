// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_LOGGING_HPP_
#define GRAFT_LOGGING_HPP_

#include <sys/types.h>

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

#include "graft/error.hpp"
#include "graft/log.hpp"

namespace graft {

/// Parse a `GRAFT_LOG_LEVEL` value. Unknown or empty values mean INFO.
LogLevel parse_log_level(const std::string &name);

/// Process-wide log sink. Graphs may be built on several threads, so each
/// record is written to `std::clog` as a whole line.
class Logging {
   public:
    Logging(LogLevel level);

    LogLevel get_level() const { return level_.load(); }
    void set_level(LogLevel level) { level_.store(level); }

    bool enabled(LogLevel level) const { return level >= get_level(); }

    /// `GRAFT <pid> <LEVEL> <file>:<line> ` in front of every record.
    std::string header(LogLevel level, const std::string &file,
                       int line) const;

    void write(const std::string &record);

   private:
    const pid_t pid_;
    std::atomic<LogLevel> level_;
    std::mutex mutex_;
};

Logging &get_logging();

template <typename... Args>
std::string _log_msg(LogLevel level, const std::string &file, int line,
                     const Args &...args) {
    std::stringstream ss;
    ss << get_logging().header(level, file, line);
    (ss << ... << args);
    return ss.str();
}

template <typename... Args>
inline void _log(LogLevel level, const std::string &file, int line,
                 const Args &...args) {
    Logging &logging = get_logging();
    if (logging.enabled(level)) {
        logging.write(_log_msg(level, file, line, args...));
    }
}

template <typename Exception, typename... Args>
[[noreturn]] inline void _err(const std::string &file, int line,
                              const Args &...args) {
    throw Exception(_log_msg(ERROR, file, line, args...));
}

// Logging.
#define LOG(level, ...)                                      \
    do {                                                     \
        graft::_log(level, __FILE__, __LINE__, __VA_ARGS__); \
        break;                                               \
    } while (0)

// Throw `exception` with a located message.
#define ERR(exception, ...)                                      \
    do {                                                         \
        graft::_err<exception>(__FILE__, __LINE__, __VA_ARGS__); \
        break;                                                   \
    } while (0)

}  // namespace graft

#endif  // GRAFT_LOGGING_HPP_
