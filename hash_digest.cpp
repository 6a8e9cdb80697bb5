#include "hash_digest.h"

#include <algorithm>
#include <cctype>

#include <openssl/md5.h>
#include <openssl/sha.h>

#include "search_errors.h"

using namespace std;

namespace hash_search {

string to_hex(const unsigned char *data, size_t len) {
    static const char digits[] = "0123456789abcdef";

    string hex(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        hex[i * 2] = digits[data[i] >> 4];
        hex[i * 2 + 1] = digits[data[i] & 0x0f];
    }
    return hex;
}

string md5_hash(const string &input) {
    unsigned char hash[MD5_DIGEST_LENGTH];
    MD5(reinterpret_cast<const unsigned char *>(input.data()), input.size(), hash);
    return to_hex(hash, MD5_DIGEST_LENGTH);
}

string sha1_hash(const string &input) {
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char *>(input.data()), input.size(), hash);
    return to_hex(hash, SHA_DIGEST_LENGTH);
}

string sha256_hash(const string &input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char *>(input.data()), input.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

HashAlgorithm parse_algorithm(const string &name) {
    string key;
    for (char c : name) {
        if (c != '-' && c != '_') {
            key += static_cast<char>(toupper(static_cast<unsigned char>(c)));
        }
    }

    if (key == "MD5") {
        return HashAlgorithm::MD5;
    }
    if (key == "SHA1") {
        return HashAlgorithm::SHA1;
    }
    if (key == "SHA256") {
        return HashAlgorithm::SHA256;
    }
    throw UnsupportedAlgorithm(name);
}

const char *algorithm_name(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5:
            return "MD5";
        case HashAlgorithm::SHA1:
            return "SHA-1";
        case HashAlgorithm::SHA256:
            return "SHA-256";
    }
    return "unknown";
}

size_t digest_hex_length(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5:
            return MD5_DIGEST_LENGTH * 2;
        case HashAlgorithm::SHA1:
            return SHA_DIGEST_LENGTH * 2;
        case HashAlgorithm::SHA256:
            return SHA256_DIGEST_LENGTH * 2;
    }
    return 0;
}

DigestFunction resolve_digest(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5:
            return &md5_hash;
        case HashAlgorithm::SHA1:
            return &sha1_hash;
        case HashAlgorithm::SHA256:
            return &sha256_hash;
    }
    throw UnsupportedAlgorithm(to_string(static_cast<int>(algorithm)));
}

string digest(const string &candidate, HashAlgorithm algorithm) {
    return resolve_digest(algorithm)(candidate);
}

bool is_match(const string &hex_digest, const TargetSet &targets) {
    return targets.find(hex_digest) != targets.end();
}

} // namespace hash_search
