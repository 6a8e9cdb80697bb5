#include "search_worker.h"

#include <algorithm>
#include <exception>
#include <string>

using namespace std;

namespace hash_search {

const char *worker_state_name(WorkerState state) {
    switch (state) {
        case WorkerState::Running:
            return "running";
        case WorkerState::Completed:
            return "completed";
        case WorkerState::Cancelled:
            return "cancelled";
        case WorkerState::Failed:
            return "failed";
    }
    return "unknown";
}

uint64_t progress_interval_for(uint64_t chunk_size) {
    return min(max(chunk_size / kProgressReportsPerChunk, kMinProgressInterval), kMaxProgressInterval);
}

namespace {

WorkerEvent make_event(WorkerEvent::Kind kind, const Chunk &chunk) {
    WorkerEvent event;
    event.kind = kind;
    event.worker_id = chunk.worker_id;
    event.chunk_size = chunk.size();
    return event;
}

void report_progress(const Chunk &chunk, uint64_t &pending, WorkerChannel &events) {
    if (pending == 0) {
        return;
    }
    WorkerEvent event = make_event(WorkerEvent::Progress, chunk);
    event.count = pending;
    events.push(move(event));
    pending = 0;
}

void report_finished(const Chunk &chunk, WorkerState state, uint64_t processed, WorkerChannel &events) {
    WorkerEvent event = make_event(WorkerEvent::Finished, chunk);
    event.state = state;
    event.count = processed;
    events.push(move(event));
}

} // namespace

WorkerState run_worker(const WorkerContext &ctx, WorkerChannel &events, const CancellationSignal &cancel) {
    const Chunk &chunk = ctx.chunk;
    const uint64_t poll = max<uint64_t>(ctx.cancel_poll_interval, 1);
    const uint64_t batch = max<uint64_t>(ctx.progress_interval, 1);

    events.push(make_event(WorkerEvent::Started, chunk));

    string candidate;
    string hex_digest;
    uint64_t pending = 0;
    uint64_t processed = 0;

    for (uint64_t index = chunk.start_index; index < chunk.end_index; ++index) {
        if (processed % poll == 0 && cancel.is_raised()) {
            report_progress(chunk, pending, events);
            report_finished(chunk, WorkerState::Cancelled, processed, events);
            return WorkerState::Cancelled;
        }

        decode_into(*ctx.space, index, candidate);
        ++processed;

        if (ctx.matcher.test(candidate, hex_digest)) {
            WorkerEvent match = make_event(WorkerEvent::Match, chunk);
            match.digest = hex_digest;
            match.candidate = candidate;
            match.elapsed_seconds =
                chrono::duration<double>(chrono::steady_clock::now() - ctx.start_time).count();
            events.push(move(match));

            // The matching candidate is reported on its own so the count
            // never waits in an unflushed batch
            WorkerEvent progress = make_event(WorkerEvent::Progress, chunk);
            progress.count = 1;
            events.push(move(progress));
        } else if (++pending >= batch) {
            report_progress(chunk, pending, events);
        }
    }

    report_progress(chunk, pending, events);
    report_finished(chunk, WorkerState::Completed, processed, events);
    return WorkerState::Completed;
}

void worker_main(WorkerContext ctx, WorkerChannel &events, const CancellationSignal &cancel,
                 atomic<bool> &exited) {
    try {
        run_worker(ctx, events, cancel);
    } catch (const exception &e) {
        WorkerEvent failed = make_event(WorkerEvent::Failed, ctx.chunk);
        failed.error = e.what();
        events.push(move(failed));
    } catch (...) {
        WorkerEvent failed = make_event(WorkerEvent::Failed, ctx.chunk);
        failed.error = "unknown exception";
        events.push(move(failed));
    }
    exited.store(true, memory_order_release);
}

} // namespace hash_search
