#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "search_worker.h"

using namespace hash_search;

namespace {

std::vector<WorkerEvent> drain(WorkerChannel &channel) {
    std::vector<WorkerEvent> events;
    WorkerEvent event;
    while (channel.try_pop(event)) {
        events.push_back(event);
    }
    return events;
}

uint64_t progress_total(const std::vector<WorkerEvent> &events) {
    uint64_t total = 0;
    for (const WorkerEvent &e : events) {
        if (e.kind == WorkerEvent::Progress) {
            total += e.count;
        }
    }
    return total;
}

WorkerContext make_context(const Chunk &chunk, const TargetSet &targets, DigestFunction fn = &md5_hash) {
    WorkerContext ctx{chunk,
                      std::make_shared<const SearchSpace>(make_search_space("0123456789", 4)),
                      DigestMatcher(fn, std::make_shared<const TargetSet>(targets)),
                      std::chrono::steady_clock::now(),
                      1000,
                      kCancelPollInterval};
    return ctx;
}

Chunk make_chunk(int id, uint64_t start, uint64_t end) {
    Chunk chunk;
    chunk.worker_id = id;
    chunk.start_index = start;
    chunk.end_index = end;
    return chunk;
}

// Raises g_cancel once g_calls reaches g_raise_at
CancellationSignal *g_cancel = nullptr;
std::atomic<uint64_t> g_calls(0);
uint64_t g_raise_at = 0;

std::string cancelling_digest(const std::string &input) {
    if (++g_calls == g_raise_at) {
        g_cancel->raise();
    }
    return md5_hash(input);
}

std::string failing_digest(const std::string &input) {
    if (input == "0005") {
        throw std::runtime_error("digest backend unavailable");
    }
    return md5_hash(input);
}

} // namespace

TEST(SearchWorkerTest, ProgressIntervalStaysBounded) {
    EXPECT_EQ(progress_interval_for(0), kMinProgressInterval);
    EXPECT_EQ(progress_interval_for(10000), kMinProgressInterval);
    EXPECT_EQ(progress_interval_for(1000000), 10000u);
    EXPECT_EQ(progress_interval_for(uint64_t(1) << 40), kMaxProgressInterval);
}

TEST(SearchWorkerTest, CompletesChunkAndReportsMatches) {
    WorkerChannel channel;
    CancellationSignal cancel;
    const WorkerContext ctx = make_context(make_chunk(0, 0, 10000), {md5_hash("0042"), md5_hash("7777")});

    EXPECT_EQ(run_worker(ctx, channel, cancel), WorkerState::Completed);

    const std::vector<WorkerEvent> events = drain(channel);
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events.front().kind, WorkerEvent::Started);
    EXPECT_EQ(events.back().kind, WorkerEvent::Finished);
    EXPECT_EQ(events.back().state, WorkerState::Completed);
    EXPECT_EQ(events.back().count, 10000u);
    EXPECT_EQ(progress_total(events), 10000u);

    std::vector<std::string> matches;
    size_t progress_events = 0;
    for (const WorkerEvent &e : events) {
        if (e.kind == WorkerEvent::Match) {
            matches.push_back(e.candidate);
            EXPECT_EQ(e.digest, md5_hash(e.candidate));
            EXPECT_GE(e.elapsed_seconds, 0.0);
        } else if (e.kind == WorkerEvent::Progress) {
            EXPECT_EQ(e.chunk_size, 10000u);
            ++progress_events;
        }
    }
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0], "0042");
    EXPECT_EQ(matches[1], "7777");
    // 10 full batches, one tail flush, one single-unit report per match
    EXPECT_LE(progress_events, 13u);
}

TEST(SearchWorkerTest, MatchIsFollowedBySingleUnitProgress) {
    WorkerChannel channel;
    CancellationSignal cancel;
    const WorkerContext ctx = make_context(make_chunk(2, 7770, 7780), {md5_hash("7777")});

    EXPECT_EQ(run_worker(ctx, channel, cancel), WorkerState::Completed);

    const std::vector<WorkerEvent> events = drain(channel);
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].worker_id, 2);
        if (events[i].kind == WorkerEvent::Match) {
            EXPECT_EQ(events[i].candidate, "7777");
            ASSERT_LT(i + 1, events.size());
            EXPECT_EQ(events[i + 1].kind, WorkerEvent::Progress);
            EXPECT_EQ(events[i + 1].count, 1u);
        }
    }
    EXPECT_EQ(progress_total(events), 10u);
}

TEST(SearchWorkerTest, EmptyChunkCompletesImmediately) {
    WorkerChannel channel;
    CancellationSignal cancel;
    const WorkerContext ctx = make_context(make_chunk(1, 0, 0), {md5_hash("0042")});

    EXPECT_EQ(run_worker(ctx, channel, cancel), WorkerState::Completed);

    const std::vector<WorkerEvent> events = drain(channel);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, WorkerEvent::Started);
    EXPECT_EQ(events[1].kind, WorkerEvent::Finished);
    EXPECT_EQ(events[1].count, 0u);
}

TEST(SearchWorkerTest, StopsBeforeWorkWhenAlreadyCancelled) {
    WorkerChannel channel;
    CancellationSignal cancel;
    cancel.raise();
    const WorkerContext ctx = make_context(make_chunk(0, 0, 10000), {md5_hash("0042")});

    EXPECT_EQ(run_worker(ctx, channel, cancel), WorkerState::Cancelled);

    const std::vector<WorkerEvent> events = drain(channel);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, WorkerEvent::Finished);
    EXPECT_EQ(events[1].state, WorkerState::Cancelled);
    EXPECT_EQ(events[1].count, 0u);
}

TEST(SearchWorkerTest, OvershootIsBoundedByPollInterval) {
    WorkerChannel channel;
    CancellationSignal cancel;
    g_cancel = &cancel;
    g_calls = 0;
    g_raise_at = 250;

    WorkerContext ctx = make_context(make_chunk(0, 0, 10000), {md5_hash("9999")}, &cancelling_digest);
    ctx.cancel_poll_interval = 100;

    EXPECT_EQ(run_worker(ctx, channel, cancel), WorkerState::Cancelled);

    const std::vector<WorkerEvent> events = drain(channel);
    const WorkerEvent &finished = events.back();
    EXPECT_EQ(finished.kind, WorkerEvent::Finished);
    EXPECT_GE(finished.count, 250u);
    EXPECT_LT(finished.count, 250u + 100u);
    EXPECT_EQ(progress_total(events), finished.count);
}

TEST(SearchWorkerTest, WorkerMainReportsExceptionAsFailure) {
    WorkerChannel channel;
    CancellationSignal cancel;
    std::atomic<bool> exited(false);

    worker_main(make_context(make_chunk(3, 0, 100), {md5_hash("0042")}, &failing_digest), channel, cancel,
                exited);

    EXPECT_TRUE(exited.load());
    const std::vector<WorkerEvent> events = drain(channel);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, WorkerEvent::Failed);
    EXPECT_EQ(events.back().worker_id, 3);
    EXPECT_EQ(events.back().error, "digest backend unavailable");
}
