#ifndef HASH_SEARCH_KEYSPACE_H
#define HASH_SEARCH_KEYSPACE_H

#include <cstdint>
#include <string>

namespace hash_search {

// All strings of `length` symbols over `charset`; total = charset.size() ^ length
struct SearchSpace {
    std::string charset;
    int length = 0;
    uint64_t total = 0;
};

// Throws ConfigurationError on an empty, non-ASCII or repeating charset, a length below 1,
// or a total that does not fit in uint64_t.
SearchSpace make_search_space(const std::string &charset, int length);

// Mixed-radix expansion of `index`, most significant symbol first.
// Throws IndexOutOfRange unless index < space.total.
std::string decode(const SearchSpace &space, uint64_t index);

// Same as decode() but writes into `candidate` to avoid reallocating per index.
void decode_into(const SearchSpace &space, uint64_t index, std::string &candidate);

// Inverse of decode(). Throws IndexOutOfRange for a string outside the keyspace.
uint64_t encode(const SearchSpace &space, const std::string &candidate);

} // namespace hash_search

#endif // HASH_SEARCH_KEYSPACE_H
