#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "event_channel.h"
#include "search_events.h"

using namespace hash_search;

TEST(EventChannelTest, PopForTimesOutWhenEmpty) {
    EventChannel<int> channel;
    int value = 0;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop_for(value, std::chrono::milliseconds(20)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
    EXPECT_FALSE(channel.try_pop(value));
}

TEST(EventChannelTest, KeepsPerProducerOrder) {
    EventChannel<std::pair<int, int>> channel;
    const int per_producer = 1000;

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&channel, p] {
            for (int i = 0; i < per_producer; ++i) {
                channel.push(std::make_pair(p, i));
            }
        });
    }

    std::vector<int> next(4, 0);
    int received = 0;
    std::pair<int, int> item;
    while (received < 4 * per_producer) {
        ASSERT_TRUE(channel.pop_for(item, std::chrono::seconds(5)));
        EXPECT_EQ(item.second, next[item.first]);
        next[item.first] = item.second + 1;
        ++received;
    }
    for (auto &t : producers) {
        t.join();
    }
    EXPECT_EQ(channel.size(), 0u);
}

TEST(EventChannelTest, WakesWaitingConsumer) {
    EventChannel<int> channel;
    std::thread producer([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        channel.push(7);
    });
    int value = 0;
    EXPECT_TRUE(channel.pop_for(value, std::chrono::seconds(5)));
    EXPECT_EQ(value, 7);
    producer.join();
}

TEST(CancellationSignalTest, RaisesOnlyOnce) {
    CancellationSignal cancel;
    EXPECT_FALSE(cancel.is_raised());
    EXPECT_TRUE(cancel.raise());
    EXPECT_TRUE(cancel.is_raised());
    EXPECT_FALSE(cancel.raise());
    EXPECT_TRUE(cancel.is_raised());
}
