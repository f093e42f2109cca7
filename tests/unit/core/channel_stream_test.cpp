#include <gtest/gtest.h>
#include <flocker/core/channel_stream.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace flocker;
using namespace std::chrono_literals;

TEST(ChannelStreamTest, DeliversItemsInOrder) {
    ChannelStream<int> stream;
    EXPECT_TRUE(stream.push(1));
    EXPECT_TRUE(stream.push(2));

    EXPECT_EQ(stream.next(10ms), 1);
    EXPECT_EQ(stream.next(10ms), 2);
    EXPECT_FALSE(stream.closed());
}

TEST(ChannelStreamTest, NextTimesOutWhenEmpty) {
    ChannelStream<int> stream;
    EXPECT_FALSE(stream.next(5ms).has_value());
    EXPECT_FALSE(stream.closed());
}

TEST(ChannelStreamTest, FinishDrainsBufferedItemsFirst) {
    ChannelStream<std::string> stream;
    stream.push("last line");
    stream.finish();

    EXPECT_FALSE(stream.closed());
    EXPECT_EQ(stream.next(10ms), "last line");
    EXPECT_TRUE(stream.closed());
    EXPECT_FALSE(stream.failure().has_value());
}

TEST(ChannelStreamTest, FinishWithFailureIsReported) {
    ChannelStream<int> stream;
    stream.finish(Error{ErrorCode::DaemonUnreachable, "socket closed"});

    EXPECT_TRUE(stream.closed());
    ASSERT_TRUE(stream.failure().has_value());
    EXPECT_EQ(stream.failure()->code, ErrorCode::DaemonUnreachable);
}

TEST(ChannelStreamTest, PushAfterFinishIsRejected) {
    ChannelStream<int> stream;
    stream.finish();
    EXPECT_FALSE(stream.push(3));
}

TEST(ChannelStreamTest, CancelDropsPendingItemsAndStopsProducer) {
    ChannelStream<int> stream;
    stream.push(1);
    stream.push(2);
    stream.cancel();

    EXPECT_TRUE(stream.cancelled());
    EXPECT_TRUE(stream.closed());
    EXPECT_FALSE(stream.next(1ms).has_value());
    EXPECT_FALSE(stream.push(3));
}

TEST(ChannelStreamTest, CancelRunsHookOnce) {
    ChannelStream<int> stream;
    int calls = 0;
    stream.onCancel([&] { ++calls; });

    stream.cancel();
    stream.cancel();
    EXPECT_EQ(calls, 1);
}

TEST(ChannelStreamTest, CancelIsNotAFailure) {
    ChannelStream<int> stream;
    stream.cancel();
    stream.finish(Error{ErrorCode::OperationCancelled, "aborted"});
    EXPECT_FALSE(stream.failure().has_value());
}

TEST(ChannelStreamTest, FullBufferDropsOldest) {
    ChannelStream<int> stream(2);
    stream.push(1);
    stream.push(2);
    stream.push(3);

    EXPECT_EQ(stream.next(1ms), 2);
    EXPECT_EQ(stream.next(1ms), 3);
}

TEST(ChannelStreamTest, ConsumerWakesForProducerThread) {
    ChannelStream<int> stream;
    std::thread producer([&] {
        for (int i = 0; i < 5; ++i)
            stream.push(i);
        stream.finish();
    });

    int received = 0;
    while (!stream.closed()) {
        if (auto v = stream.next(100ms)) {
            EXPECT_EQ(*v, received);
            ++received;
        }
    }
    producer.join();
    EXPECT_EQ(received, 5);
}
