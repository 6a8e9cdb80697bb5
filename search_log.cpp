#include "search_log.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "search_errors.h"

using namespace std;

namespace hash_search {

string timestamp_now() {
    const time_t now = chrono::system_clock::to_time_t(chrono::system_clock::now());
    tm local{};
    localtime_r(&now, &local);

    ostringstream ss;
    ss << put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

SearchLog::SearchLog(const string &path) : path_(path), file_(path, ios::app) {
    if (!file_.is_open()) {
        throw ConfigurationError("Cannot open log file '" + path + "'");
    }
}

void SearchLog::write(const string &message) {
    file_ << '[' << timestamp_now() << "] " << message << '\n';
    file_.flush();
}

LoggingObserver::LoggingObserver(SearchLog &log, ostream &console, chrono::milliseconds progress_period)
    : log_(log), console_(console), progress_period_(progress_period), last_progress_() {}

void LoggingObserver::on_search_started(const SearchSpace &space, const vector<Chunk> &chunks, size_t targets) {
    last_progress_ = chrono::steady_clock::now();
    targets_ = targets;
    found_ = 0;
    console_ << "Searching " << space.total << " combinations with " << chunks.size() << " workers" << endl;
}

void LoggingObserver::on_worker_started(const Chunk &chunk) {
    log_.write("Worker " + to_string(chunk.worker_id) + " started processing [" +
               to_string(chunk.start_index) + ", " + to_string(chunk.end_index) + ").");
}

void LoggingObserver::on_progress(int, uint64_t, uint64_t, uint64_t processed, uint64_t total) {
    const auto now = chrono::steady_clock::now();
    if (now - last_progress_ < progress_period_) {
        return;
    }
    last_progress_ = now;
    print_progress(processed, total);
}

void LoggingObserver::print_progress(uint64_t processed, uint64_t total) {
    const double percent = total ? 100.0 * static_cast<double>(processed) / static_cast<double>(total) : 100.0;
    console_ << "Progress: " << processed << "/" << total << " (" << fixed << setprecision(1) << percent
             << "%), pre-images found: " << found_ << "/" << targets_ << endl;
}

void LoggingObserver::on_match(const FoundPreImage &found, size_t found_count, size_t targets) {
    found_ = found_count;
    targets_ = targets;
    console_ << "Pre-image found: " << found.pre_image << "\thash: " << found.digest << "\t(" << fixed
             << setprecision(2) << found.elapsed_seconds << " s)" << endl;
}

void LoggingObserver::on_worker_finished(const Chunk &chunk, WorkerState state, uint64_t processed) {
    if (state == WorkerState::Cancelled) {
        log_.write("Worker " + to_string(chunk.worker_id) + " received stop signal and is stopping after " +
                   to_string(processed) + " candidates.");
    } else {
        log_.write("Worker " + to_string(chunk.worker_id) + " finished processing " + to_string(processed) +
                   " candidates.");
    }
}

void LoggingObserver::on_worker_failed(const Chunk &chunk, const string &error) {
    log_.write("Worker " + to_string(chunk.worker_id) + " failed on [" + to_string(chunk.start_index) + ", " +
               to_string(chunk.end_index) + "): " + error);
    console_ << "Worker " << chunk.worker_id << " failed: " << error << endl;
}

void LoggingObserver::on_cancellation_raised(const string &reason) {
    log_.write("Stop signal raised: " + reason + ".");
}

void LoggingObserver::on_search_finished(const SearchResult &result) {
    targets_ = result.target_count;
    found_ = result.found_count();
    print_progress(result.total_processed, result.total_combinations);

    ostringstream elapsed;
    elapsed << fixed << setprecision(2) << result.elapsed_seconds;
    ostringstream average;
    average << fixed << setprecision(2) << result.average_seconds_per_pre_image();

    log_.write("Search completed at " + timestamp_now());
    log_.write("Total elapsed time: " + elapsed.str() + " seconds");
    log_.write("Average time per pre-image: " + average.str() + " seconds");
    log_.write("--------------------------------------------");
}

} // namespace hash_search
