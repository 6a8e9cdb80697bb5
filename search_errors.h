#ifndef HASH_SEARCH_SEARCH_ERRORS_H
#define HASH_SEARCH_SEARCH_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace hash_search {

class SearchError : public std::runtime_error {
public:
    explicit SearchError(const std::string &what) : std::runtime_error(what) {}
};

// Rejected before any worker is started
class ConfigurationError : public SearchError {
public:
    explicit ConfigurationError(const std::string &what) : SearchError(what) {}
};

class UnsupportedAlgorithm : public ConfigurationError {
public:
    explicit UnsupportedAlgorithm(const std::string &name)
        : ConfigurationError("Unsupported hash algorithm: " + name), name_(name) {}

    const std::string &name() const { return name_; }

private:
    std::string name_;
};

// Index outside [0, total): a chunking bug, never a user error
class IndexOutOfRange : public SearchError {
public:
    IndexOutOfRange(uint64_t index, uint64_t total)
        : SearchError("Index " + std::to_string(index) + " outside keyspace of " + std::to_string(total)),
          index_(index), total_(total) {}

    uint64_t index() const { return index_; }
    uint64_t total() const { return total_; }

private:
    uint64_t index_;
    uint64_t total_;
};

class WorkerFailure : public SearchError {
public:
    WorkerFailure(int worker_id, uint64_t start_index, uint64_t end_index, const std::string &reason)
        : SearchError("Worker " + std::to_string(worker_id) + " failed on chunk [" +
                      std::to_string(start_index) + ", " + std::to_string(end_index) + "): " + reason),
          worker_id_(worker_id), start_index_(start_index), end_index_(end_index), reason_(reason) {}

    int worker_id() const { return worker_id_; }
    uint64_t start_index() const { return start_index_; }
    uint64_t end_index() const { return end_index_; }
    const std::string &reason() const { return reason_; }

private:
    int worker_id_;
    uint64_t start_index_;
    uint64_t end_index_;
    std::string reason_;
};

} // namespace hash_search

#endif // HASH_SEARCH_SEARCH_ERRORS_H
