#include "search_coordinator.h"

#include <algorithm>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>

#include "search_errors.h"
#include "search_worker.h"

using namespace std;

namespace hash_search {

vector<Chunk> partition(uint64_t total, int num_workers) {
    if (num_workers < 1) {
        throw ConfigurationError("Worker count must be at least 1, got " + to_string(num_workers));
    }

    const uint64_t n = static_cast<uint64_t>(num_workers);
    const uint64_t chunk_size = total / n;

    vector<Chunk> chunks(n);
    for (uint64_t i = 0; i < n; ++i) {
        chunks[i].worker_id = static_cast<int>(i);
        chunks[i].start_index = i * chunk_size;
        chunks[i].end_index = (i == n - 1) ? total : chunks[i].start_index + chunk_size;
    }
    return chunks;
}

namespace {

SearchObserver silent_observer;

bool is_lower_hex(const string &digest) {
    if (digest.empty()) {
        return false;
    }
    for (char c : digest) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

// Folds worker events into the SearchResult. Lives on the coordinator's thread only.
class EventAggregator {
public:
    EventAggregator(const vector<Chunk> &chunks, const TargetSet &targets, CancellationSignal &cancel,
                    SearchObserver &observer, SearchResult &result)
        : chunks_(chunks), targets_(targets), cancel_(cancel), observer_(observer), result_(result),
          states_(chunks.size(), WorkerState::Running) {}

    void handle(const WorkerEvent &event) {
        const Chunk &chunk = chunks_[event.worker_id];
        if (states_[event.worker_id] != WorkerState::Running) {
            return;
        }

        switch (event.kind) {
            case WorkerEvent::Started:
                observer_.on_worker_started(chunk);
                break;
            case WorkerEvent::Progress:
                result_.total_processed += event.count;
                observer_.on_progress(event.worker_id, event.count, event.chunk_size,
                                      result_.total_processed, result_.total_combinations);
                break;
            case WorkerEvent::Match:
                record_match(event);
                break;
            case WorkerEvent::Finished:
                states_[event.worker_id] = event.state;
                ++terminal_;
                if (event.state == WorkerState::Cancelled) {
                    ++result_.workers_cancelled;
                } else {
                    ++result_.workers_completed;
                }
                observer_.on_worker_finished(chunk, event.state, event.count);
                break;
            case WorkerEvent::Failed:
                states_[event.worker_id] = WorkerState::Failed;
                ++terminal_;
                if (failed_worker_ < 0) {
                    failed_worker_ = event.worker_id;
                    failure_ = event.error;
                }
                observer_.on_worker_failed(chunk, event.error);
                raise_cancel("worker " + to_string(event.worker_id) + " failed");
                break;
        }
    }

    bool is_running(int worker_id) const { return states_[worker_id] == WorkerState::Running; }
    size_t terminal() const { return terminal_; }

    void throw_if_failed() const {
        if (failed_worker_ >= 0) {
            const Chunk &chunk = chunks_[failed_worker_];
            throw WorkerFailure(chunk.worker_id, chunk.start_index, chunk.end_index, failure_);
        }
    }

private:
    void record_match(const WorkerEvent &event) {
        // Equal digests from different candidates count once
        if (!is_match(event.digest, targets_) || !found_digests_.insert(event.digest).second) {
            return;
        }

        FoundPreImage found;
        found.digest = event.digest;
        found.pre_image = event.candidate;
        found.elapsed_seconds = event.elapsed_seconds;
        result_.found.push_back(found);
        observer_.on_match(found, result_.found.size(), targets_.size());

        if (result_.found.size() >= targets_.size()) {
            raise_cancel("all " + to_string(targets_.size()) + " target digests found");
        }
    }

    void raise_cancel(const string &reason) {
        if (cancel_.raise()) {
            result_.cancelled = true;
            observer_.on_cancellation_raised(reason);
        }
    }

    const vector<Chunk> &chunks_;
    const TargetSet &targets_;
    CancellationSignal &cancel_;
    SearchObserver &observer_;
    SearchResult &result_;

    vector<WorkerState> states_;
    unordered_set<string> found_digests_;
    size_t terminal_ = 0;
    int failed_worker_ = -1;
    string failure_;
};

// Owns the worker threads. If run() unwinds early, cancels and joins them
// before the channel and signal they reference are destroyed.
class WorkerThreads {
public:
    WorkerThreads(CancellationSignal &cancel, size_t n) : cancel_(cancel) { threads_.reserve(n); }

    ~WorkerThreads() {
        if (any_of(threads_.begin(), threads_.end(), [](const thread &t) { return t.joinable(); })) {
            cancel_.raise();
            join();
        }
    }

    WorkerThreads(const WorkerThreads &) = delete;
    WorkerThreads &operator=(const WorkerThreads &) = delete;

    template <typename... Args>
    void start(Args &&...args) {
        threads_.emplace_back(forward<Args>(args)...);
    }

    void join() {
        for (auto &t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    size_t size() const { return threads_.size(); }

private:
    CancellationSignal &cancel_;
    vector<thread> threads_;
};

} // namespace

SearchCoordinator::SearchCoordinator(SearchConfig config, SearchObserver *observer)
    : config_(move(config)), observer_(observer ? observer : &silent_observer), digest_fn_(nullptr) {
    if (config_.num_workers < 1) {
        throw ConfigurationError("Worker count must be at least 1, got " + to_string(config_.num_workers));
    }

    space_ = make_search_space(config_.charset, config_.length);
    digest_fn_ = config_.custom_digest ? config_.custom_digest : resolve_digest(config_.algorithm);

    if (config_.targets.empty()) {
        throw ConfigurationError("No target digests to search for");
    }
    for (const string &target : config_.targets) {
        if (!is_lower_hex(target)) {
            throw ConfigurationError("Target digest is not lower-case hex: '" + target + "'");
        }
        if (!config_.custom_digest && target.size() != digest_hex_length(config_.algorithm)) {
            throw ConfigurationError("Target digest '" + target + "' is not a " +
                                     algorithm_name(config_.algorithm) + " digest");
        }
    }

    chunks_ = partition(space_.total, config_.num_workers);
}

SearchResult SearchCoordinator::run() {
    const size_t n = chunks_.size();

    auto space = make_shared<const SearchSpace>(space_);
    auto targets = make_shared<const TargetSet>(config_.targets);
    const DigestMatcher matcher(digest_fn_, targets);

    SearchResult result;
    result.total_combinations = space_.total;
    result.target_count = targets->size();

    WorkerChannel events;
    CancellationSignal cancel;
    deque<atomic<bool>> exited;
    for (size_t i = 0; i < n; ++i) {
        exited.emplace_back(false);
    }

    EventAggregator aggregator(chunks_, *targets, cancel, *observer_, result);
    observer_->on_search_started(space_, chunks_, targets->size());

    const auto start = chrono::steady_clock::now();
    WorkerThreads threads(cancel, n);

    try {
        for (const Chunk &chunk : chunks_) {
            const uint64_t progress = config_.progress_interval ? config_.progress_interval
                                                                : progress_interval_for(chunk.size());
            const uint64_t poll = config_.cancel_poll_interval ? config_.cancel_poll_interval
                                                               : kCancelPollInterval;
            WorkerContext ctx{chunk, space, matcher, start, progress, poll};
            threads.start(worker_main, move(ctx), ref(events), cref(cancel), ref(exited[chunk.worker_id]));
        }
    } catch (const system_error &e) {
        cancel.raise();
        threads.join();
        const Chunk &chunk = chunks_[threads.size()];
        throw WorkerFailure(chunk.worker_id, chunk.start_index, chunk.end_index,
                            string("could not start worker thread: ") + e.what());
    }

    WorkerEvent event;
    while (aggregator.terminal() < n) {
        if (events.pop_for(event, kEventWaitTimeout)) {
            aggregator.handle(event);
            continue;
        }

        // A worker always pushes its terminal event before setting `exited`,
        // so an exited worker still marked running never reported one
        for (const Chunk &chunk : chunks_) {
            if (!aggregator.is_running(chunk.worker_id) || !exited[chunk.worker_id].load(memory_order_acquire)) {
                continue;
            }
            while (events.try_pop(event)) {
                aggregator.handle(event);
            }
            if (aggregator.is_running(chunk.worker_id)) {
                WorkerEvent lost;
                lost.kind = WorkerEvent::Failed;
                lost.worker_id = chunk.worker_id;
                lost.chunk_size = chunk.size();
                lost.error = "worker exited without reporting a terminal state";
                aggregator.handle(lost);
            }
        }
    }

    threads.join();
    while (events.try_pop(event)) {
        aggregator.handle(event);
    }

    result.elapsed_seconds = chrono::duration<double>(chrono::steady_clock::now() - start).count();
    aggregator.throw_if_failed();

    observer_->on_search_finished(result);
    return result;
}

SearchResult run_search(const SearchConfig &config, SearchObserver *observer) {
    SearchCoordinator coordinator(config, observer);
    return coordinator.run();
}

} // namespace hash_search
