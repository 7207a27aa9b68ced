// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_VERSION_HPP
#define GRAFT_VERSION_HPP

#include <string>

#define GRAFT_MAJOR 0
#define GRAFT_MINOR 1
#define GRAFT_PATCH 0
#define GRAFT_VERSION (GRAFT_MAJOR * 10000 + GRAFT_MINOR * 100 + GRAFT_PATCH)

namespace graft {

/// Return a version string.
std::string version();

}  // namespace graft

#endif  // GRAFT_VERSION_HPP
