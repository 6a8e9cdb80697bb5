#ifndef HASH_SEARCH_SEARCH_EVENTS_H
#define HASH_SEARCH_SEARCH_EVENTS_H

#include <atomic>
#include <cstdint>
#include <string>

namespace hash_search {

struct Chunk {
    int worker_id = 0;
    uint64_t start_index = 0;
    uint64_t end_index = 0;

    uint64_t size() const { return end_index - start_index; }
    bool empty() const { return start_index == end_index; }
};

enum class WorkerState { Running, Completed, Cancelled, Failed };

const char *worker_state_name(WorkerState state);

// Worker -> coordinator message. A worker's last event is always
// Finished or Failed, and nothing follows it.
struct WorkerEvent {
    enum Kind { Started, Progress, Match, Finished, Failed };

    Kind kind = Progress;
    int worker_id = 0;

    // Progress: candidates processed since the previous report; Finished: total processed
    uint64_t count = 0;
    uint64_t chunk_size = 0;

    // Match
    std::string digest;
    std::string candidate;
    double elapsed_seconds = 0.0;

    // Finished: Completed or Cancelled
    WorkerState state = WorkerState::Running;

    // Failed
    std::string error;
};

// Raised once by the coordinator, polled by every worker, never reset
class CancellationSignal {
public:
    // Returns true only for the call that actually raised the signal
    bool raise() { return !raised_.exchange(true, std::memory_order_acq_rel); }

    bool is_raised() const { return raised_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> raised_{false};
};

} // namespace hash_search

#endif // HASH_SEARCH_SEARCH_EVENTS_H
