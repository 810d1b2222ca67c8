// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "../Cancellation.h"
#include "../watcher/EventChannel.h"

using namespace FsIndex;

TEST(CancellationTest, NoopToken_IsNeverCancelled) {
    const CancellationToken token = CancellationToken::noop();
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.isCancelledSparse(0));
}

TEST(CancellationTest, NewerVersion_CancelsOlderTokens) {
    SearchVersionTracker tracker;
    const CancellationToken first = tracker.nextToken();
    EXPECT_FALSE(first.isCancelled());

    const std::uint64_t v2 = tracker.nextVersion();
    EXPECT_EQ(tracker.currentVersion(), v2);
    EXPECT_TRUE(first.isCancelled());

    const CancellationToken second = tracker.tokenForVersion(v2);
    EXPECT_FALSE(second.isCancelled());
    EXPECT_EQ(second.version(), v2);
}

TEST(CancellationTest, Sparse_OnlyChecksAtInterval) {
    SearchVersionTracker tracker;
    const CancellationToken token = tracker.nextToken();
    (void)tracker.nextVersion();

    EXPECT_FALSE(token.isCancelledSparse(1));
    EXPECT_FALSE(token.isCancelledSparse(kCancelCheckInterval - 1));
    EXPECT_TRUE(token.isCancelledSparse(0));
    EXPECT_TRUE(token.isCancelledSparse(kCancelCheckInterval * 3));
}

TEST(EventChannelTest, Fifo_AcrossProducers) {
    EventChannel<int> channel;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&channel, p] {
            for (int i = 0; i < 100; ++i) channel.send(p * 1000 + i);
        });
    }
    for (auto& t : producers) t.join();

    std::vector<int> lastPerProducer(4, -1);
    int received = 0;
    while (auto value = channel.tryReceive()) {
        const int producer = *value / 1000;
        const int seq = *value % 1000;
        EXPECT_GT(seq, lastPerProducer[producer]);
        lastPerProducer[producer] = seq;
        ++received;
    }
    EXPECT_EQ(received, 400);
}

TEST(EventChannelTest, Close_DrainsThenEnds) {
    EventChannel<int> channel;
    EXPECT_TRUE(channel.send(1));
    channel.close();
    EXPECT_TRUE(channel.isClosed());
    EXPECT_FALSE(channel.send(2));

    EXPECT_EQ(channel.receive(), 1);
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(EventChannelTest, Receive_BlocksUntilSend) {
    EventChannel<int> channel;
    std::thread producer([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.send(42);
    });
    EXPECT_EQ(channel.receive(), 42);
    producer.join();

    EXPECT_FALSE(channel.receiveFor(std::chrono::milliseconds(5)).has_value());
}
