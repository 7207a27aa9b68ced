// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "env.hpp"
#include "file_io.hpp"
#include "graft.hpp"
#include "logging.hpp"

using namespace std;
using namespace graft;

static string dims_string(const vector<int64_t> &dims) {
    stringstream ss;
    ss << Dims(dims);
    return ss.str();
}

int main(int argc, const char **argv) {
    init();
    string prog = argv[0];
    vector<string> args(argv + 1, argv + argc);
    string dir = get_env().path_output_dir;
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (*it == "-h" || *it == "--help") {
            cerr << "Usage: " << prog << " [options]\n"
                 << "Options:\n"
                 << "  -h, --help\t\t\tPrint this help message\n"
                 << "  -d, --dir <path>\t\tArtifact directory\n";
            return 0;
        } else if (*it == "-d" || *it == "--dir") {
            if (++it == args.end()) {
                cerr << "Error: missing argument for " << *(it - 1) << endl;
                return 1;
            }
            dir = *it;
        } else {
            cerr << "Error: unknown option " << *it << endl;
            return 1;
        }
    }

    int state = 0;
    for (const ModelContract *contract :
         {&decision_contract(), &embedding_contract()}) {
        string path = join_path(dir, contract->file_name);
        try {
            auto summary = onnx::check_artifact(path, *contract);
            cout << "[OK] " << contract->file_name << " is valid" << endl
                 << "  Input:  " << summary.inputs[0].name << " "
                 << dims_string(summary.inputs[0].dims) << endl
                 << "  Output: " << summary.outputs[0].name << " "
                 << dims_string(summary.outputs[0].dims) << endl;
        } catch (const BaseError &e) {
            LOG(ERROR, e.what());
            cout << "[FAIL] " << contract->file_name << endl;
            state = 1;
        }
    }
    return state;
}
