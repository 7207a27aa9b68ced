// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_UTILS_STRING_HPP_
#define GRAFT_UTILS_STRING_HPP_

#include <string>
#include <vector>

namespace graft {

bool is_pascal(const std::string &str);

std::string pascal_to_snake(const std::string &str);

std::string join(const std::vector<std::string> &items,
                 const std::string &sep);

}  // namespace graft

#endif  // GRAFT_UTILS_STRING_HPP_
