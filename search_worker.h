#ifndef HASH_SEARCH_SEARCH_WORKER_H
#define HASH_SEARCH_SEARCH_WORKER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include "event_channel.h"
#include "hash_digest.h"
#include "keyspace.h"
#include "search_events.h"

namespace hash_search {

// Candidates between two looks at the cancellation signal. After the signal is
// raised a worker may still test up to kCancelPollInterval - 1 candidates.
constexpr uint64_t kCancelPollInterval = 10000;

// Progress batching: about kProgressReportsPerChunk reports per chunk,
// each covering [kMinProgressInterval, kMaxProgressInterval] candidates.
constexpr uint64_t kProgressReportsPerChunk = 100;
constexpr uint64_t kMinProgressInterval = 1000;
constexpr uint64_t kMaxProgressInterval = 2000000;

uint64_t progress_interval_for(uint64_t chunk_size);

// Everything a worker needs, fixed at spawn time
struct WorkerContext {
    Chunk chunk;
    std::shared_ptr<const SearchSpace> space;
    DigestMatcher matcher;
    std::chrono::steady_clock::time_point start_time;
    uint64_t progress_interval = kMinProgressInterval;
    uint64_t cancel_poll_interval = kCancelPollInterval;
};

typedef EventChannel<WorkerEvent> WorkerChannel;

// Tests every index of ctx.chunk, emitting Started, Progress and Match events
// and finally one Finished event. Returns Completed or Cancelled.
// Exceptions (e.g. from the digest function) propagate to the caller.
WorkerState run_worker(const WorkerContext &ctx, WorkerChannel &events, const CancellationSignal &cancel);

// Thread entry point: runs run_worker() and turns any exception into a
// Failed event, then sets `exited`. Always emits exactly one terminal event.
void worker_main(WorkerContext ctx, WorkerChannel &events, const CancellationSignal &cancel,
                 std::atomic<bool> &exited);

} // namespace hash_search

#endif // HASH_SEARCH_SEARCH_WORKER_H
