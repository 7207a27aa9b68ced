// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_NAMED_TYPE_HPP_
#define GRAFT_NAMED_TYPE_HPP_

#include <string>

namespace graft {

class NamedT {
   public:
    NamedT(const std::string &type_name) : type_name_(type_name) {}
    NamedT &operator=(const NamedT &) = default;

    const std::string &type_name() const { return type_name_; }

   private:
    std::string type_name_;
};

}  // namespace graft

#endif  // GRAFT_NAMED_TYPE_HPP_
