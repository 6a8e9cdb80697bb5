#ifndef HASH_SEARCH_HASH_CONFIG_H
#define HASH_SEARCH_HASH_CONFIG_H

#include <istream>
#include <string>

#include "hash_digest.h"
#include "search_coordinator.h"

namespace hash_search {

// Contents of a hash file:
//   #charset:<id>            built-in charset, see charset_option()
//   #charset_chars:<symbols> explicit charset, overrides the id
//   #algorithm:<name>        MD5, SHA-1 or SHA-256 (default MD5)
//   #length:<n>              pre-image length (default 4)
//   #workers:<n>             default worker count
//   <hex digest>             one target per line
struct HashFileConfig {
    int charset_id = 1;
    std::string charset;
    bool custom_charset = false;    // set by #charset_chars
    HashAlgorithm algorithm = HashAlgorithm::MD5;
    int length = 4;
    int workers = 0;    // 0 = not given
    TargetSet targets;
};

// 1 digits, 2 digits + upper case, 3 digits + both cases, 4 = 3 + punctuation.
// Unknown ids fall back to digits.
std::string charset_option(int charset_id);

// Trims and lower-cases `raw`; throws ConfigurationError unless the result is
// hex of the algorithm's digest width.
std::string normalize_digest(const std::string &raw, HashAlgorithm algorithm);

HashFileConfig parse_hash_config(std::istream &in, const std::string &source);

// Throws ConfigurationError if the file cannot be opened
HashFileConfig load_hash_file(const std::string &path);

SearchConfig make_search_config(const HashFileConfig &file, int num_workers);

// Upper bound for --nt and #workers
const int kMaxWorkers = 4096;

// First positive of `requested` (command line), `from_file` (#workers) and
// `online_cpus`, else 1. Throws ConfigurationError above kMaxWorkers.
int resolve_worker_count(int requested, int from_file, int online_cpus);

// output_workers_<n>_charset_<id|custom>_algo_<name>_length_<len>.csv
std::string default_output_name(const HashFileConfig &file, int num_workers);

} // namespace hash_search

#endif // HASH_SEARCH_HASH_CONFIG_H
