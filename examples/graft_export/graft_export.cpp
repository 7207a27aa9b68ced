// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "env.hpp"
#include "file_io.hpp"
#include "graft.hpp"
#include "logging.hpp"

using namespace std;
using namespace graft;

struct Args {
    string output_dir;
    int seed;
    int jobs;
    bool dump_json;
    bool verbose;
};

Args parse_args(int argc, const char **argv) {
    string prog = argv[0];
    vector<string> args(argv + 1, argv + argc);

    auto print_help = [&prog](int code) {
        cerr << "Usage: " << prog << " [options]\n"
             << "Options:\n"
             << "  -h, --help\t\t\tPrint this help message\n"
             << "  -o, --output-dir <path>\tArtifact directory\n"
             << "  -s, --seed <int>\t\tWeight seed\n"
             << "  -j, --jobs <int>\t\tGraphs built concurrently (1 or 2)\n"
             << "  --json\t\t\tAlso write JSON dumps of the graphs\n"
             << "  -v, --verbose\t\t\tVerbose output\n";
        exit(code);
    };

    auto parse_int = [&print_help](const string &opt, const string &val) {
        size_t pos = 0;
        int v = 0;
        try {
            v = stoi(val, &pos);
        } catch (const logic_error &) {
            // Not a number, or out of the int range.
            pos = 0;
        }
        if (pos == 0 || pos != val.size()) {
            cerr << "Error: invalid integer for " << opt << ": " << val
                 << endl;
            print_help(1);
        }
        return v;
    };

    const Env &env = get_env();
    Args ret;

    // Defaults come from the environment.
    ret.output_dir = env.path_output_dir;
    ret.seed = env.seed;
    ret.jobs = 1;
    ret.dump_json = env.dump_json;
    ret.verbose = false;

    for (auto it = args.begin(); it != args.end(); ++it) {
        if (*it == "-h" || *it == "--help") {
            print_help(0);
        } else if (*it == "-o" || *it == "--output-dir") {
            if (++it == args.end()) {
                cerr << "Error: missing argument for " << *(it - 1) << endl;
                exit(1);
            }
            ret.output_dir = *it;
        } else if (*it == "-s" || *it == "--seed") {
            if (++it == args.end()) {
                cerr << "Error: missing argument for " << *(it - 1) << endl;
                exit(1);
            }
            ret.seed = parse_int(*(it - 1), *it);
        } else if (*it == "-j" || *it == "--jobs") {
            if (++it == args.end()) {
                cerr << "Error: missing argument for " << *(it - 1) << endl;
                exit(1);
            }
            ret.jobs = parse_int(*(it - 1), *it);
            if (ret.jobs < 1 || ret.jobs > 2) {
                cerr << "Error: --jobs must be 1 or 2" << endl;
                exit(1);
            }
        } else if (*it == "--json") {
            ret.dump_json = true;
        } else if (*it == "-v" || *it == "--verbose") {
            ret.verbose = true;
        } else {
            cerr << "Error: unknown option " << *it << endl;
            print_help(1);
        }
    }

    return ret;
}

struct ExportJob {
    const ModelContract &contract;
    function<Graph(Random &)> build;
};

// Build one graph with its own generator and write its artifacts.
static void export_graph(const ExportJob &job, const Args &args) {
    Random random(static_cast<uint32_t>(args.seed));
    Graph graph = job.build(random);
    string path = join_path(args.output_dir, job.contract.file_name);
    onnx::save(graph, path);
    if (args.dump_json) {
        string json_path = path.substr(0, path.rfind('.')) + ".json";
        write_file(json_path, graph.serialize());
        LOG(INFO, "wrote ", json_path);
    }
    auto summary = onnx::check_artifact(path, job.contract);
    LOG(INFO, job.contract.name, ": ", summary.num_nodes, " nodes, ",
        summary.num_initializers, " initializers");
}

int main(int argc, const char **argv) {
    init();
    Args args = parse_args(argc, argv);
    if (args.verbose) {
        set_log_level(DEBUG);
    }
    LOG(INFO, "graft ", version(), " output_dir=", args.output_dir,
        " seed=", args.seed, " jobs=", args.jobs);

    // Both graphs draw from a generator seeded the same way, so the
    // artifacts do not depend on the order they are built in.
    vector<ExportJob> jobs{{decision_contract(), build_decision_graph},
                           {embedding_contract(), build_embedding_graph}};
    try {
        if (!is_exist(args.output_dir)) {
            create_dir(args.output_dir);
        }
        if (args.jobs == 1) {
            for (auto &job : jobs) {
                export_graph(job, args);
            }
        } else {
            vector<string> errors(jobs.size());
            vector<thread> threads;
            for (size_t i = 0; i < jobs.size(); ++i) {
                threads.emplace_back([&, i]() {
                    try {
                        export_graph(jobs[i], args);
                    } catch (const BaseError &e) {
                        errors[i] = e.what();
                    }
                });
            }
            for (auto &t : threads) {
                t.join();
            }
            int state = 0;
            for (auto &err : errors) {
                if (!err.empty()) {
                    LOG(ERROR, err);
                    state = 1;
                }
            }
            if (state != 0) {
                return state;
            }
        }
    } catch (const BaseError &e) {
        LOG(ERROR, e.what());
        return 1;
    }
    cout << "Exported " << jobs.size() << " models to " << args.output_dir
         << endl;
    return 0;
}
