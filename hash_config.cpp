#include "hash_config.h"

#include <cctype>
#include <fstream>
#include <vector>

#include "search_errors.h"

using namespace std;

namespace hash_search {

namespace {

string trim(const string &s) {
    const size_t first = s.find_first_not_of(" \t\r\n");
    if (first == string::npos) {
        return "";
    }
    const size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool starts_with(const string &s, const string &prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

int parse_int(const string &value, const string &source, int line_no) {
    size_t used = 0;
    int result = 0;
    try {
        result = stoi(value, &used);
    } catch (const logic_error &) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw ConfigurationError(source + ":" + to_string(line_no) + ": expected a number, got '" + value + "'");
    }
    return result;
}

} // namespace

string charset_option(int charset_id) {
    switch (charset_id) {
        case 2:
            return "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
        case 3:
            return "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
        case 4:
            return "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ!@#$%^&*()-_=+[]{}|;:\",.<>?/~`";
        default:
            return "0123456789";
    }
}

string normalize_digest(const string &raw, HashAlgorithm algorithm) {
    string digest = trim(raw);
    for (char &c : digest) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        if (!isxdigit(static_cast<unsigned char>(c))) {
            throw ConfigurationError("Digest '" + raw + "' is not hexadecimal");
        }
    }
    if (digest.size() != digest_hex_length(algorithm)) {
        throw ConfigurationError("Digest '" + raw + "' has " + to_string(digest.size()) + " hex digits, " +
                                 algorithm_name(algorithm) + " needs " + to_string(digest_hex_length(algorithm)));
    }
    return digest;
}

HashFileConfig parse_hash_config(istream &in, const string &source) {
    HashFileConfig config;
    string explicit_charset;
    vector<string> raw_digests;

    string line;
    int line_no = 0;
    while (getline(in, line)) {
        ++line_no;
        // An explicit charset may contain spaces, so it is taken untrimmed
        if (starts_with(line, "#charset_chars:")) {
            explicit_charset = line.substr(15);
            if (!explicit_charset.empty() && explicit_charset.back() == '\r') {
                explicit_charset.pop_back();
            }
            continue;
        }

        const string text = trim(line);
        if (text.empty()) {
            continue;
        }
        if (starts_with(text, "#charset:")) {
            config.charset_id = parse_int(trim(text.substr(9)), source, line_no);
        } else if (starts_with(text, "#algorithm:")) {
            config.algorithm = parse_algorithm(trim(text.substr(11)));
        } else if (starts_with(text, "#length:")) {
            config.length = parse_int(trim(text.substr(8)), source, line_no);
        } else if (starts_with(text, "#workers:")) {
            config.workers = parse_int(trim(text.substr(9)), source, line_no);
        } else if (text[0] != '#') {
            raw_digests.push_back(text);
        }
    }

    for (char c : explicit_charset) {
        if (static_cast<unsigned char>(c) > 0x7f) {
            throw ConfigurationError(source + ": #charset_chars must contain only ASCII symbols");
        }
    }
    config.custom_charset = !explicit_charset.empty();
    config.charset = config.custom_charset ? explicit_charset : charset_option(config.charset_id);

    // The algorithm line may follow the digests
    for (const string &raw : raw_digests) {
        config.targets.insert(normalize_digest(raw, config.algorithm));
    }
    if (config.targets.empty()) {
        throw ConfigurationError(source + ": no target digests");
    }
    return config;
}

HashFileConfig load_hash_file(const string &path) {
    ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open hash file '" + path + "'");
    }
    return parse_hash_config(file, path);
}

SearchConfig make_search_config(const HashFileConfig &file, int num_workers) {
    SearchConfig config;
    config.charset = file.charset;
    config.length = file.length;
    config.algorithm = file.algorithm;
    config.targets = file.targets;
    config.num_workers = num_workers;
    return config;
}

int resolve_worker_count(int requested, int from_file, int online_cpus) {
    int workers = requested > 0 ? requested : (from_file > 0 ? from_file : online_cpus);
    if (workers < 1) {
        workers = 1;
    }
    if (workers > kMaxWorkers) {
        throw ConfigurationError("Worker count must be between 1 and " + to_string(kMaxWorkers) + ", got " +
                                 to_string(workers));
    }
    return workers;
}

string default_output_name(const HashFileConfig &file, int num_workers) {
    const string charset = file.custom_charset ? string("custom") : to_string(file.charset_id);
    return "output_workers_" + to_string(num_workers) + "_charset_" + charset + "_algo_" +
           algorithm_name(file.algorithm) + "_length_" + to_string(file.length) + ".csv";
}

} // namespace hash_search
