// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_FILE_IO_HPP_
#define GRAFT_FILE_IO_HPP_

#include <string>

namespace graft {

bool is_exist(const std::string &path);

bool is_file(const std::string &path);

/// Create `path` and its parents. Throws SystemError on failure.
void create_dir(const std::string &path);

/// Read the whole file as bytes. Throws SystemError on failure.
std::string read_file(const std::string &path);

/// Replace the file with `data`. Throws SystemError on failure.
void write_file(const std::string &path, const std::string &data);

void remove_file(const std::string &path);

std::string get_dir(const std::string &path);

std::string join_path(const std::string &dir, const std::string &file);

}  // namespace graft

#endif  // GRAFT_FILE_IO_HPP_
