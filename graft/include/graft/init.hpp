// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_INIT_HPP
#define GRAFT_INIT_HPP

namespace graft {

/// Initialize GRAFT.
///
/// Reloads the `GRAFT_*` environment variables and applies the log level.
/// It is safe to call this function multiple times.
void init();

}  // namespace graft

#endif  // GRAFT_INIT_HPP
