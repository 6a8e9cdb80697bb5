#ifndef HASH_SEARCH_SEARCH_LOG_H
#define HASH_SEARCH_SEARCH_LOG_H

#include <chrono>
#include <fstream>
#include <ostream>
#include <string>

#include "search_coordinator.h"

namespace hash_search {

// Appends "[YYYY-mm-dd HH:MM:SS] message" lines to a log file
class SearchLog {
public:
    // Throws ConfigurationError if the file cannot be opened for appending
    explicit SearchLog(const std::string &path);

    const std::string &path() const { return path_; }

    void write(const std::string &message);

private:
    std::string path_;
    std::ofstream file_;
};

std::string timestamp_now();

// Worker lifecycle goes to the log; matches and throttled progress go to the console
class LoggingObserver : public SearchObserver {
public:
    LoggingObserver(SearchLog &log, std::ostream &console,
                    std::chrono::milliseconds progress_period = std::chrono::seconds(2));

    void on_search_started(const SearchSpace &space, const std::vector<Chunk> &chunks, size_t targets) override;
    void on_worker_started(const Chunk &chunk) override;
    void on_progress(int worker_id, uint64_t delta, uint64_t chunk_size, uint64_t processed,
                     uint64_t total) override;
    void on_match(const FoundPreImage &found, size_t found_count, size_t targets) override;
    void on_worker_finished(const Chunk &chunk, WorkerState state, uint64_t processed) override;
    void on_worker_failed(const Chunk &chunk, const std::string &error) override;
    void on_cancellation_raised(const std::string &reason) override;
    void on_search_finished(const SearchResult &result) override;

private:
    void print_progress(uint64_t processed, uint64_t total);

    SearchLog &log_;
    std::ostream &console_;
    std::chrono::milliseconds progress_period_;
    std::chrono::steady_clock::time_point last_progress_;
    size_t found_ = 0;
    size_t targets_ = 0;
};

} // namespace hash_search

#endif // HASH_SEARCH_SEARCH_LOG_H
