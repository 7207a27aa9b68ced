// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/version.hpp"

#include <sstream>
#include <string>

namespace graft {

std::string version() {
    std::stringstream ss;
    ss << GRAFT_MAJOR << "." << GRAFT_MINOR << "." << GRAFT_PATCH;
    return ss.str();
}

}  // namespace graft
