#ifndef HASH_SEARCH_HASH_DIGEST_H
#define HASH_SEARCH_HASH_DIGEST_H

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>

namespace hash_search {

enum class HashAlgorithm { MD5, SHA1, SHA256 };

// Lower-case hex digest of the candidate
typedef std::string (*DigestFunction)(const std::string &input);

// Normalized (lower-case hex) digests being searched for
typedef std::unordered_set<std::string> TargetSet;

std::string md5_hash(const std::string &input);
std::string sha1_hash(const std::string &input);
std::string sha256_hash(const std::string &input);

std::string to_hex(const unsigned char *data, size_t len);

// Accepts "MD5", "SHA-1"/"SHA1", "SHA-256"/"SHA256", any case.
// Throws UnsupportedAlgorithm for anything else.
HashAlgorithm parse_algorithm(const std::string &name);

// Canonical name, as written to logs and output file names
const char *algorithm_name(HashAlgorithm algorithm);

// Number of hex characters in a digest of this algorithm
size_t digest_hex_length(HashAlgorithm algorithm);

DigestFunction resolve_digest(HashAlgorithm algorithm);

std::string digest(const std::string &candidate, HashAlgorithm algorithm);

bool is_match(const std::string &hex_digest, const TargetSet &targets);

// Pairs a resolved digest function with the read-only target set.
// Copies share the same target set; safe to use from several threads.
class DigestMatcher {
public:
    DigestMatcher(DigestFunction fn, std::shared_ptr<const TargetSet> targets)
        : fn_(fn), targets_(std::move(targets)) {}

    // Computes the digest of `candidate` into `hex_digest` and tests membership
    bool test(const std::string &candidate, std::string &hex_digest) const {
        hex_digest = fn_(candidate);
        return is_match(hex_digest, *targets_);
    }

    const TargetSet &targets() const { return *targets_; }

private:
    DigestFunction fn_;
    std::shared_ptr<const TargetSet> targets_;
};

} // namespace hash_search

#endif // HASH_SEARCH_HASH_DIGEST_H
