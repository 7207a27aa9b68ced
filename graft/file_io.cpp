// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "file_io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "logging.hpp"

namespace fs = std::filesystem;

namespace graft {

bool is_exist(const std::string &path) {
    return fs::directory_entry{path}.exists();
}

bool is_file(const std::string &path) {
    return fs::is_regular_file(fs::status(path));
}

void create_dir(const std::string &path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        ERR(SystemError, "failed to create directory ", path, ": ",
            ec.message());
    }
}

std::string read_file(const std::string &path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        ERR(SystemError, "failed to open ", path, " for reading");
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        ERR(SystemError, "failed to read ", path);
    }
    return ss.str();
}

void write_file(const std::string &path, const std::string &data) {
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file) {
        ERR(SystemError, "failed to open ", path, " for writing");
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        ERR(SystemError, "failed to write ", data.size(), " bytes to ", path);
    }
    LOG(DEBUG, "wrote ", data.size(), " bytes to ", path);
}

void remove_file(const std::string &path) {
    LOG(DEBUG, "remove file: ", path);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        ERR(SystemError, "failed to remove ", path, ": ", ec.message());
    }
}

std::string get_dir(const std::string &path) {
    return fs::path(path).parent_path().string();
}

std::string join_path(const std::string &dir, const std::string &file) {
    return (fs::path(dir) / file).string();
}

}  // namespace graft
