#include <iomanip>
#include <iostream>
#include <string>
#include <unistd.h>

#include "hash_config.h"
#include "result_writer.h"
#include "search_coordinator.h"
#include "search_errors.h"
#include "search_log.h"
#include "search_worker.h"

using namespace std;
using namespace hash_search;

struct Arguments {
    string hash_file;
    int num_threads = 0;
    string output_file;
    string log_file = "worker_log.txt";
};

static void usage(const char *program) {
    cerr << "Usage: " << program << " <hash_file> [--nt=<workers>] [--out=<results.csv>] [--log=<log_file>]" << endl;
}

static Arguments parse_arguments(int argc, char *argv[]) {
    Arguments args;
    args.hash_file = argv[1];
    for (int i = 2; i < argc; ++i) {
        string arg = argv[i];
        if (arg.find("--nt=") == 0) {
            try {
                args.num_threads = stoi(arg.substr(5));
            } catch (const logic_error &) {
                throw ConfigurationError("Invalid worker count: " + arg.substr(5));
            }
            if (args.num_threads < 1) {
                throw ConfigurationError("Worker count must be at least 1");
            }
        } else if (arg.find("--out=") == 0) {
            args.output_file = arg.substr(6);
        } else if (arg.find("--log=") == 0) {
            args.log_file = arg.substr(6);
        } else {
            throw ConfigurationError("Unknown argument: " + arg);
        }
    }
    return args;
}

int main(int argc, char *argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    try {
        Arguments args = parse_arguments(argc, argv);
        const HashFileConfig file = load_hash_file(args.hash_file);

        const int num_threads = resolve_worker_count(args.num_threads, file.workers,
                                                     static_cast<int>(sysconf(_SC_NPROCESSORS_ONLN)));

        const string algo = algorithm_name(file.algorithm);
        if (args.output_file.empty()) {
            args.output_file = default_output_name(file, num_threads);
        }

        SearchLog log(args.log_file);
        LoggingObserver observer(log, cout);
        SearchCoordinator coordinator(make_search_config(file, num_threads), &observer);

        const uint64_t chunk_size = coordinator.chunks().front().size();
        log.write("Main process started at " + timestamp_now());
        log.write("Hash values file: " + args.hash_file);
        log.write("Configuration: charset = " + file.charset + ", length = " + to_string(file.length) +
                  ", algorithm = " + algo + ", workers = " + to_string(num_threads) +
                  ", progress report interval = " + to_string(progress_interval_for(chunk_size)) +
                  ", stop check interval = " + to_string(kCancelPollInterval));

        cout << "Using " << num_threads << " workers, charset " << file.charset << ", length " << file.length
             << " and algorithm " << algo << endl;

        const SearchResult result = coordinator.run();
        write_results_csv(args.output_file, result);

        cout << fixed << setprecision(2);
        cout << "\nTotal elapsed time: " << result.elapsed_seconds << " seconds." << endl;
        cout << "Search complete! Total pre-images found: " << result.found_count() << "/" << result.target_count
             << endl;
        cout << "Results written to: " << args.output_file << endl;
        cout << "Worker logs can be found in: " << log.path() << endl;

        return result.found_count() == result.target_count ? 0 : 2;
    } catch (const WorkerFailure &e) {
        cerr << "Search aborted: " << e.what() << endl;
        return 3;
    } catch (const ConfigurationError &e) {
        cerr << "Configuration error: " << e.what() << endl;
        usage(argv[0]);
        return 1;
    } catch (const SearchError &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    } catch (const exception &e) {
        cerr << "Fatal error: " << e.what() << endl;
        return 1;
    }
}
