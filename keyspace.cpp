#include "keyspace.h"

#include <limits>
#include <unordered_set>

#include "search_errors.h"

using namespace std;

namespace hash_search {

SearchSpace make_search_space(const string &charset, int length) {
    if (charset.empty()) {
        throw ConfigurationError("Charset must not be empty");
    }
    if (length < 1) {
        throw ConfigurationError("Pre-image length must be positive, got " + to_string(length));
    }

    // Candidates are built byte by byte, so a multi-byte symbol would be split
    for (char c : charset) {
        if (static_cast<unsigned char>(c) > 0x7f) {
            throw ConfigurationError("Charset must contain only ASCII symbols");
        }
    }

    unordered_set<char> seen;
    for (char c : charset) {
        if (!seen.insert(c).second) {
            throw ConfigurationError(string("Charset contains '") + c + "' more than once");
        }
    }

    const uint64_t base = charset.size();
    uint64_t total = 1;
    for (int i = 0; i < length; ++i) {
        if (total > numeric_limits<uint64_t>::max() / base) {
            throw ConfigurationError("Keyspace " + to_string(base) + "^" + to_string(length) +
                                     " overflows the 64-bit index");
        }
        total *= base;
    }

    SearchSpace space;
    space.charset = charset;
    space.length = length;
    space.total = total;
    return space;
}

void decode_into(const SearchSpace &space, uint64_t index, string &candidate) {
    if (index >= space.total) {
        throw IndexOutOfRange(index, space.total);
    }

    const uint64_t base = space.charset.size();
    candidate.assign(static_cast<size_t>(space.length), space.charset[0]);

    uint64_t quotient = index;
    for (int p = space.length - 1; p >= 0 && quotient > 0; --p) {
        candidate[p] = space.charset[quotient % base];
        quotient /= base;
    }
}

string decode(const SearchSpace &space, uint64_t index) {
    string candidate;
    decode_into(space, index, candidate);
    return candidate;
}

uint64_t encode(const SearchSpace &space, const string &candidate) {
    if (candidate.size() != static_cast<size_t>(space.length)) {
        throw IndexOutOfRange(numeric_limits<uint64_t>::max(), space.total);
    }

    const uint64_t base = space.charset.size();
    uint64_t index = 0;
    for (char c : candidate) {
        const size_t digit = space.charset.find(c);
        if (digit == string::npos) {
            throw IndexOutOfRange(numeric_limits<uint64_t>::max(), space.total);
        }
        index = index * base + digit;
    }
    return index;
}

} // namespace hash_search
