#ifndef HASH_SEARCH_RESULT_WRITER_H
#define HASH_SEARCH_RESULT_WRITER_H

#include <ostream>
#include <string>

#include "search_coordinator.h"

namespace hash_search {

// Header row, then one "digest,pre-image,seconds" line per result in discovery order
void write_results(std::ostream &out, const SearchResult &result);

// Throws ConfigurationError if `path` cannot be written
void write_results_csv(const std::string &path, const SearchResult &result);

} // namespace hash_search

#endif // HASH_SEARCH_RESULT_WRITER_H
