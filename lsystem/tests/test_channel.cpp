#include <gtest/gtest.h>
#include <lsystem/channel.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using lsystem::Channel;

TEST(ChannelTest, FifoOrder) {
    Channel<int> channel;
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(channel.send(i));
    }
    EXPECT_EQ(channel.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        auto value = channel.receive();
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
}

TEST(ChannelTest, TryReceiveOnEmpty) {
    Channel<std::string> channel;
    EXPECT_FALSE(channel.try_receive().has_value());
    channel.send("x");
    EXPECT_EQ(channel.try_receive().value(), "x");
}

TEST(ChannelTest, ReceiveForTimesOut) {
    Channel<int> channel;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.receive_for(std::chrono::milliseconds(20)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(15));
}

TEST(ChannelTest, ReceiveBlocksUntilSend) {
    Channel<int> channel;
    std::atomic<bool> received{false};

    std::thread consumer([&]() {
        auto value = channel.receive();
        received.store(value.has_value() && *value == 42);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_FALSE(received.load());
    channel.send(42);
    consumer.join();
    EXPECT_TRUE(received.load());
}

TEST(ChannelTest, CloseDrainsThenEnds) {
    Channel<int> channel;
    channel.send(1);
    channel.send(2);
    channel.close();

    EXPECT_TRUE(channel.is_closed());
    EXPECT_FALSE(channel.send(3));
    EXPECT_EQ(channel.receive().value(), 1);
    EXPECT_EQ(channel.receive().value(), 2);
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
    Channel<int> channel;
    std::thread consumer([&]() {
        EXPECT_FALSE(channel.receive().has_value());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    channel.close();
    consumer.join();
}

TEST(ChannelTest, ManyProducersDeliverEverything) {
    Channel<int> channel;
    const int producers = 4;
    const int per_producer = 1000;
    std::vector<std::thread> threads;

    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&channel, p]() {
            for (int i = 0; i < per_producer; ++i) {
                channel.send(p * per_producer + i);
            }
        });
    }

    std::vector<int> last_seen(producers, -1);
    for (int n = 0; n < producers * per_producer; ++n) {
        int value = channel.receive().value();
        int producer = value / per_producer;
        // Per-producer order is preserved
        EXPECT_GT(value, last_seen[producer]);
        last_seen[producer] = value;
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(channel.size(), 0u);
}
