// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "utils_string.hpp"

#include <cctype>

#include "logging.hpp"

namespace graft {

bool is_pascal(const std::string &str) {
    if (str.empty()) {
        return false;
    }
    if (!std::isupper(static_cast<unsigned char>(str[0]))) {
        return false;
    }
    for (size_t i = 1; i < str.size(); ++i) {
        if (!std::isalnum(static_cast<unsigned char>(str[i]))) {
            return false;
        }
    }
    return true;
}

std::string pascal_to_snake(const std::string &str) {
    if (!is_pascal(str)) {
        ERR(InvalidUsageError, "given string (", str,
            ") is not in Pascal case");
    }
    std::string ret;
    for (size_t i = 0; i < str.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (i > 0 && std::isupper(c)) {
            ret.push_back('_');
        }
        ret.push_back(static_cast<char>(std::tolower(c)));
    }
    return ret;
}

std::string join(const std::vector<std::string> &items,
                 const std::string &sep) {
    std::string ret;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            ret += sep;
        }
        ret += items[i];
    }
    return ret;
}

}  // namespace graft
