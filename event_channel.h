#ifndef HASH_SEARCH_EVENT_CHANNEL_H
#define HASH_SEARCH_EVENT_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace hash_search {

// Unbounded multi-producer, single-consumer FIFO.
// Items from one producer come out in the order they were pushed.
template <typename T>
class EventChannel {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    // Waits at most `timeout` for an item. Returns false on timeout.
    template <typename Rep, typename Period>
    bool pop_for(T &item, const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!ready_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    bool try_pop(T &item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
};

} // namespace hash_search

#endif // HASH_SEARCH_EVENT_CHANNEL_H
