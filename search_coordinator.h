#ifndef HASH_SEARCH_SEARCH_COORDINATOR_H
#define HASH_SEARCH_SEARCH_COORDINATOR_H

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "hash_digest.h"
#include "keyspace.h"
#include "search_events.h"

namespace hash_search {

// How long the aggregation loop waits for an event before checking worker liveness
constexpr std::chrono::milliseconds kEventWaitTimeout(100);

struct SearchConfig {
    std::string charset;
    int length = 0;
    HashAlgorithm algorithm = HashAlgorithm::MD5;
    TargetSet targets;
    int num_workers = 1;

    // 0 selects the defaults: progress_interval_for(chunk size) and kCancelPollInterval respectively
    uint64_t progress_interval = 0;
    uint64_t cancel_poll_interval = 0;

    // Replaces the algorithm's digest when set; targets are then only checked for lower-case hex
    DigestFunction custom_digest = nullptr;
};

struct FoundPreImage {
    std::string digest;
    std::string pre_image;
    double elapsed_seconds = 0.0;
};

struct SearchResult {
    std::vector<FoundPreImage> found;   // in discovery order
    uint64_t total_combinations = 0;
    uint64_t total_processed = 0;
    size_t target_count = 0;
    double elapsed_seconds = 0.0;
    bool cancelled = false;
    int workers_completed = 0;
    int workers_cancelled = 0;

    size_t found_count() const { return found.size(); }
    double average_seconds_per_pre_image() const {
        return found.empty() ? 0.0 : elapsed_seconds / static_cast<double>(found.size());
    }
};

// Receives lifecycle and progress notifications on the coordinator's thread.
// The core never writes anywhere itself.
class SearchObserver {
public:
    virtual ~SearchObserver() = default;

    virtual void on_search_started(const SearchSpace &, const std::vector<Chunk> &, size_t /*targets*/) {}
    virtual void on_worker_started(const Chunk &) {}
    virtual void on_progress(int /*worker_id*/, uint64_t /*delta*/, uint64_t /*chunk_size*/,
                             uint64_t /*processed*/, uint64_t /*total*/) {}
    virtual void on_match(const FoundPreImage &, size_t /*found*/, size_t /*targets*/) {}
    virtual void on_worker_finished(const Chunk &, WorkerState, uint64_t /*processed*/) {}
    virtual void on_worker_failed(const Chunk &, const std::string & /*error*/) {}
    virtual void on_cancellation_raised(const std::string & /*reason*/) {}
    virtual void on_search_finished(const SearchResult &) {}
};

// Splits [0, total) into exactly num_workers contiguous chunks; the last one takes
// the remainder. With num_workers > total all but the last chunk are empty.
std::vector<Chunk> partition(uint64_t total, int num_workers);

class SearchCoordinator {
public:
    // Validates the configuration; throws ConfigurationError / UnsupportedAlgorithm
    explicit SearchCoordinator(SearchConfig config, SearchObserver *observer = nullptr);

    const SearchSpace &space() const { return space_; }
    const std::vector<Chunk> &chunks() const { return chunks_; }

    // Runs the search to exhaustion or until every target is found.
    // Throws WorkerFailure if any worker ended abnormally.
    SearchResult run();

private:
    SearchConfig config_;
    SearchObserver *observer_;
    SearchSpace space_;
    DigestFunction digest_fn_;
    std::vector<Chunk> chunks_;
};

// Convenience wrapper around SearchCoordinator
SearchResult run_search(const SearchConfig &config, SearchObserver *observer = nullptr);

} // namespace hash_search

#endif // HASH_SEARCH_SEARCH_COORDINATOR_H
